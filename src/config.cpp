#include "config.hpp"
#include <stdexcept>
#include <cxxopts.hpp>

Config parse_config(int argc, const char *const *argv) {
    cxxopts::Options opt_parser(argv[0], "FUSE file system that audits lookup counts");
    std::vector<std::string> mount_options;
    std::vector<std::string> positional_args;

    opt_parser.add_options()("debug", "Enable filesystem debug messages")(
        "debug-fuse", "Enable libfuse debug messages")("foreground", "Run in foreground")(
        "help", "Print help")("single", "Run single-threaded")(
        "o", "Mount options", cxxopts::value(mount_options))(
        "num-threads", "Number of threads", cxxopts::value<int>()->default_value("-1"))(
        "clone-fd", "Separate fuse device fd per thread")(
        "reliable-forgets", "Require all lookup counts to drain at unmount")(
        "unreliable-forgets", "Skip the drained-count check at unmount")(
        "no-check", "Do not check lookup counts after unmounting")(
        "mountpoint", "Positional arguments",
        cxxopts::value<std::vector<std::string>>(positional_args));

    opt_parser.parse_positional({"mountpoint"});
    opt_parser.positional_help("<mountpoint>");
    auto options = opt_parser.parse(argc, argv);

    Config config;
    if (options.count("help")) {
        config.help = true;
        config.help_text = opt_parser.help();
        return config;
    }

    if (positional_args.empty())
        throw std::invalid_argument("Missing mountpoint");
    if (positional_args.size() > 1)
        throw std::invalid_argument(std::format("Unexpected argument: {}", positional_args[1]));
    config.mountpoint = positional_args[0];

    config.debug = options.count("debug");
    config.debug_fuse = options.count("debug-fuse");
    config.foreground = options.count("foreground") || config.debug || config.debug_fuse;
    config.single = options.count("single");
    config.num_threads = options["num-threads"].as<int>();
    config.clone_fd = options.count("clone-fd");
    config.run_check = options.count("no-check") == 0;

    if (options.count("reliable-forgets") && options.count("unreliable-forgets"))
        throw std::invalid_argument(
            "--reliable-forgets and --unreliable-forgets are mutually exclusive");
    if (options.count("reliable-forgets"))
        config.forget_delivery_reliable = true;
    else if (options.count("unreliable-forgets"))
        config.forget_delivery_reliable = false;

    std::string final_opts;
    for (const auto &opt : mount_options)
        final_opts += opt + ",";
    final_opts += "fsname=forgetfs";
    config.fuse_mount_options = final_opts;

    return config;
}
