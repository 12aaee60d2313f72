#pragma once
#include "common.hpp"

struct InodeAttributes
{
	uint32_t nlink{0};
	mode_t mode{0};
	uint64_t size{0};
};

struct Inode
{
	InodeAttributes attributes;

	// Outstanding references the kernel holds.
	uint64_t lookup_count{0};

	// true if lookup_count has ever been positive.
	bool looked_up{false};

	explicit Inode(const InodeAttributes &attrs) : attributes(attrs) {}
	Inode(const Inode &) = delete;
	Inode &operator=(const Inode &) = delete;

	[[nodiscard]] bool forgotten() const { return looked_up && lookup_count == 0; }

	void increment_lookup_count()
	{
		lookup_count++;
		looked_up = true;
	}

	void decrement_lookup_count(uint64_t n)
	{
		if (n > lookup_count)
		{
			error_print("INTERNAL ERROR: Overly large decrement: {}, {}", lookup_count, n);
			abort();
		}
		lookup_count -= n;
	}
};
