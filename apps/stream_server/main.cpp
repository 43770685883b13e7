#include <common/config.hpp>
#include <media/media_source_factory.hpp>
#include <session/session_controller.hpp>
#include <signaling/signaling_server.hpp>
#include <transport/gst_webrtc_transport.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

static std::unique_ptr<pv::SessionController> make_session(const pv::AppConfig& cfg, const std::string& id) {
    auto source = pv::make_media_source(cfg.source, id);

    auto transport = std::make_unique<pv::GstWebRtcTransport>(cfg.transport, id);
    if (!transport->open()) {
        std::cerr << "[worker:" << id << "] Failed to open peer connection.\n";
        return nullptr;
    }

    auto session = pv::SessionController::make_sender(id, std::move(transport), std::move(source));
    session->set_closed_handler([id](const std::string& reason) {
        std::cout << "[worker:" << id << "] closed: " << reason << "\n";
    });
    return session;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "../configs/peerview.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    pv::AppConfig cfg;
    try {
        cfg = pv::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    pv::apply_env_overrides(cfg);

    if (cfg.source.type == "file") {
        try {
            std::cout << "Serving " << pv::resolve_media_path(cfg.source.file.path) << "\n";
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    pv::SignalingServer server(cfg.server, [&cfg](const std::string& id) {
        return make_session(cfg, id);
    });
    if (!server.start()) return 1;

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        server.reap_closed();
    }

    std::cerr << "Shutting down...\n";
    server.stop();

    return 0;
}
