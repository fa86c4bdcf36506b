#include "button_edge.hpp"
#include "command_runner.hpp"
#include "device_monitor.hpp"
#include "log.hpp"
#include "mode_loop.hpp"
#include "mode_switch.hpp"
#include "options.hpp"
#include "reconcile.hpp"
#include "service_restarter.hpp"
#include "session_guard.hpp"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>

namespace {
std::atomic<bool> running{true};

void sigint_handler(int) { running = false; }
}  // namespace

int main(int argc, char** argv) {
    using namespace gamemode;

    Options opts;
    std::string error;
    if (!parse_options(argc, argv, opts, error)) {
        std::cerr << error << std::endl;
        usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (opts.help) {
        usage(argv[0]);
        return EXIT_SUCCESS;
    }

    if (opts.list_devices) {
        DeviceMonitor monitor(opts.input_dir);
        if (!monitor.start()) return EXIT_FAILURE;
        auto pads = monitor.list_devices();
        std::cout << "[scan] " << opts.input_dir << ": " << pads.size() << " gamepads" << std::endl;
        for (const auto& p : pads) {
            std::cout << "  [" << p.handle << "] " << p.path << "  name='" << p.name << "'" << std::endl;
        }
        return EXIT_SUCCESS;
    }

    if (!init_logging(opts.log_path())) return EXIT_FAILURE;
    log_info("main") << "game mode service starting";

    if (geteuid() == 0 && opts.restart.use_sudo) {
        log_debug("main") << "running as root, sudo not needed";
        opts.restart.use_sudo = false;
    }

    signal(SIGINT, sigint_handler);
    signal(SIGTERM, sigint_handler);

    SystemCommandRunner runner;
    ServiceRestarter restarter(runner, opts.restart);
    ModeSwitch modes(opts.paths, restarter);
    if (!reconcile(modes)) return EXIT_FAILURE;

    DeviceMonitor monitor(opts.input_dir);
    if (!monitor.start()) {
        log_error("main") << "cannot access input devices in " << opts.input_dir;
        return EXIT_FAILURE;
    }
    for (const auto& p : monitor.list_devices()) {
        log_info("main") << "- pad " << p.handle << ": " << p.name;
    }

    std::unique_ptr<UtmpSessionGuard> guard;
    if (opts.restart.vt > 0) {
        guard = std::make_unique<UtmpSessionGuard>(opts.restart.vt, opts.greeter_user);
        log_info("main") << "greeter runs on " << guard->tty();
    }

    ButtonEdgeDetector detector(opts.mode_button);
    ModeLoop loop(monitor, detector, modes, guard.get());
    loop.run(running, opts.poll_ms);

    log_info("main") << "game mode service exiting";
    return EXIT_SUCCESS;
}
