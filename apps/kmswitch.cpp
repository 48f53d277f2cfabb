#include "kmswitch/config.hpp"
#include "kmswitch/control_server.hpp"
#include "kmswitch/device_scan.hpp"
#include "kmswitch/errors.hpp"
#include "kmswitch/router.hpp"
#include "kmswitch/uinput_device.hpp"

#include <signal.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <system_error>

using namespace kmswitch;

namespace {

Router* g_router = nullptr;

void sigint_handler(int) {
    if (g_router) g_router->stop();
}

bool is_auto(const std::string& path) { return path.empty() || path == "auto"; }

}  // namespace

int main(int argc, char** argv) {
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n" << std::endl;
        print_usage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }
    if (config.help) {
        print_usage(std::cout, argv[0]);
        return 0;
    }

    if (config.list_devices) {
        print_candidates(std::cout, "/dev/input/by-id", scan_symlinks("/dev/input/by-id"));
        print_candidates(std::cout, "/dev/input/by-path", scan_symlinks("/dev/input/by-path"));
        return 0;
    }

    if (is_auto(config.kbd_path)) {
        config.kbd_path = autodetect(false, config.kbd_matches);
    }
    if (!config.no_mouse && is_auto(config.mouse_path)) {
        config.mouse_path = autodetect(true, config.mouse_matches);
    }
    if (config.kbd_path.empty() || (!config.no_mouse && config.mouse_path.empty())) {
        std::cerr << "autodetect failed; please pass --kbd and --mouse or connect devices." << std::endl;
        return EXIT_FAILURE;
    }
    if (geteuid() != 0) {
        std::cerr << "warning: not running as root; /dev/uinput and grabs may be denied" << std::endl;
    }

    std::string token;
    if (config.listen_port > 0) {
        try {
            token = ControlServer::read_auth_file(config.auth_file);
        } catch (const ConfigError& e) {
            std::cerr << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    UinputFactory factory(config.kbd_path, config.no_mouse ? std::string() : config.mouse_path, config.devnode_dir);
    Router router(factory);
    std::unique_ptr<ControlServer> control;

    try {
        router.set_source_opener(
            [](const std::string& path) -> std::unique_ptr<InputSource> { return EvdevSource::open(path); },
            std::chrono::milliseconds(config.reconnect_ms));
        router.add_source(EvdevSource::open(config.kbd_path), SourceKind::Keyboard);
        if (!config.no_mouse) {
            router.add_source(EvdevSource::open(config.mouse_path), SourceKind::Mouse);
        }

        configure_router(router, config);
        if (!config.active.empty()) router.set_active(config.active);

        if (config.listen_port > 0) {
            ControlServer::Options options;
            options.port = config.listen_port;
            options.auth_token = token;
            options.nudges = config.nudges;
            control = std::make_unique<ControlServer>(router, options);
            control->start();
        }
    } catch (const KmSwitchError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::system_error& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    g_router = &router;
    signal(SIGINT, sigint_handler);
    signal(SIGTERM, sigint_handler);

    int status = 0;
    try {
        router.run_loop();
    } catch (const SinkWriteFailed& e) {
        std::cerr << "[sink] " << e.what() << std::endl;
        status = EXIT_FAILURE;
    } catch (const std::system_error& e) {
        std::cerr << e.what() << std::endl;
        status = EXIT_FAILURE;
    }
    g_router = nullptr;

    if (control) {
        control->stop();
        if (control->failed()) status = EXIT_FAILURE;
    }
    std::cout << "Shutting down..." << std::endl;
    return status;
}
