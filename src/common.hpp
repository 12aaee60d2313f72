#pragma once

#include <sys/stat.h>
#include <sys/types.h>
#include <errno.h>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using InodeId = uint64_t;

// Matches FUSE_ROOT_ID; operations.cpp asserts the two agree.
constexpr InodeId kRootInodeId = 1;

// Set once from the command line before any request is served.
inline std::atomic<bool> debug_enabled{false};

template <typename... Args>
void debug_print(std::format_string<Args...> fmt, Args &&...args)
{
	if (debug_enabled.load(std::memory_order_relaxed))
		std::println(stderr, "DEBUG: {}", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error_print(std::format_string<Args...> fmt, Args &&...args)
{
	std::println(stderr, "ERROR: {}", std::format(fmt, std::forward<Args>(args)...));
}
