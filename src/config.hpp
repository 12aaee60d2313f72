#pragma once
#include "common.hpp"

// Linux frequently skips forgets for live inodes at unmount and never sends
// destroy, so the drained-count check is only meaningful elsewhere.
#ifdef __linux__
constexpr bool kDefaultForgetDeliveryReliable = false;
#else
constexpr bool kDefaultForgetDeliveryReliable = true;
#endif

struct Config
{
	bool help{false};
	std::string help_text;

	bool debug{false};
	bool debug_fuse{false};
	bool foreground{false};
	bool single{false};
	int num_threads{-1};
	bool clone_fd{false};

	std::string mountpoint;
	std::string fuse_mount_options;

	bool forget_delivery_reliable{kDefaultForgetDeliveryReliable};
	bool run_check{true};
};

// Throws cxxopts::exceptions::exception for malformed options and
// std::invalid_argument for inconsistent ones. A missing mountpoint is only
// an error when help was not requested.
Config parse_config(int argc, const char *const *argv);
