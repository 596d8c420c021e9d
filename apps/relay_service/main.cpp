#include <common/config.hpp>
#include <encode/mjpeg_server.hpp>
#include <ingest/source_descriptor.hpp>
#include <relay/relay_system.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "configs/relay.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    fr::AppConfig cfg;
    try {
        cfg = fr::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    fr::RelaySystem relay(cfg);

    fr::MJPEGServer server(cfg.server, relay);
    if (!server.start()) {
        std::cerr << "Failed to start HTTP server on port " << cfg.server.port << "\n";
        return 1;
    }

    if (cfg.source.autostart) {
        const auto desc = fr::SourceDescriptor::parse(cfg.source.url);
        const auto r = relay.controller().start(desc);
        if (!r.ok) {
            std::cerr << "Autostart of " << desc.to_string() << " failed: " << r.message << "\n";
        }
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "Shutting down...\n";
    server.stop();
    relay.controller().shutdown();

    return 0;
}
