#pragma once
#include "common.hpp"

// A std::mutex that runs a consistency check right after every acquisition
// and right before every release, while the lock is held. Satisfies Lockable,
// so std::lock_guard and std::unique_lock work unchanged.
class InvariantMutex
{
public:
	explicit InvariantMutex(std::function<void()> check) : check_(std::move(check)) {}
	InvariantMutex(const InvariantMutex &) = delete;
	InvariantMutex &operator=(const InvariantMutex &) = delete;

	void lock()
	{
		m_.lock();
		check_();
	}

	bool try_lock()
	{
		if (!m_.try_lock())
			return false;
		check_();
		return true;
	}

	void unlock()
	{
		check_();
		m_.unlock();
	}

private:
	std::mutex m_;
	std::function<void()> check_;
};
