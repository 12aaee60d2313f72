#include <stdexcept>
#include <cxxopts.hpp>
#include "common.hpp"
#include "config.hpp"
#include "forget_fs.hpp"

int main(int argc, char *argv[]) {
    Config config;
    try {
        config = parse_config(argc, argv);
    } catch (const cxxopts::exceptions::exception &e) {
        error_print("{}", e.what());
        exit(2);
    } catch (const std::invalid_argument &e) {
        error_print("{}", e.what());
        exit(2);
    }

    if (config.help) {
        std::println("Usage: {} [options] <mountpoint>", argv[0]);
        std::println("{}", config.help_text);
        exit(0);
    }

    debug_enabled = config.debug;
    debug_print("forget delivery reliable: {}", config.forget_delivery_reliable);

    ForgetFs forget_fs{config.forget_delivery_reliable};

    fuse_args args = FUSE_ARGS_INIT(0, nullptr);
    fuse_opt_add_arg(&args, argv[0]);
    fuse_opt_add_arg(&args, "-o");
    fuse_opt_add_arg(&args, config.fuse_mount_options.c_str());
    if (config.debug_fuse)
        fuse_opt_add_arg(&args, "-odebug");
    auto args_guard = std::unique_ptr<fuse_args, decltype(&fuse_opt_free_args)>(
        &args, &fuse_opt_free_args);

    struct fuse_session *se = forget_fs.new_session(&args);
    if (!se)
        return 1;

    auto se_guard =
        std::unique_ptr<fuse_session, decltype(&fuse_session_destroy)>(se, &fuse_session_destroy);

    if (fuse_set_signal_handlers(se) != 0)
        return 1;
    if (fuse_set_fail_signal_handlers(se) != 0) {
        fuse_remove_signal_handlers(se);
        return 1;
    }

    if (fuse_session_mount(se, config.mountpoint.c_str()) != 0) {
        fuse_remove_signal_handlers(se);
        return 1;
    }

    if (fuse_daemonize(config.foreground) != 0) {
        error_print("Failed to daemonize process");
        fuse_session_unmount(se);
        fuse_remove_signal_handlers(se);
        return 1;
    }

    struct fuse_loop_config *loop_config = fuse_loop_cfg_create();
    auto loop_guard = std::unique_ptr<fuse_loop_config, decltype(&fuse_loop_cfg_destroy)>(
        loop_config, &fuse_loop_cfg_destroy);

    if (config.num_threads != -1)
        fuse_loop_cfg_set_max_threads(loop_config, config.num_threads);
    fuse_loop_cfg_set_clone_fd(loop_config, config.clone_fd);

    int ret = config.single ? fuse_session_loop(se) : fuse_session_loop_mt(se, loop_config);

    fuse_session_unmount(se);
    fuse_remove_signal_handlers(se);
    se_guard.reset();

    // No more requests can arrive once the session is gone.
    if (config.run_check)
        forget_fs.check();

    return ret;
}
