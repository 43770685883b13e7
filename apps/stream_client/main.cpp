#include <common/config.hpp>
#include <common/errors.hpp>
#include <media/gst_decoder_sink.hpp>
#include <pipeline/cv_window_display.hpp>
#include <pipeline/render_loop.hpp>
#include <session/session_controller.hpp>
#include <signaling/offer_client.hpp>
#include <signaling/ws_offer_server.hpp>
#include <transport/gst_webrtc_transport.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

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

    const pv::Codec codec = pv::codec_from_str(cfg.client.codec);
    const pv::PixelFormat decode_format = pv::pixel_format_from_str(cfg.client.decode_format);
    auto make_session = [&](const std::string& id) -> std::unique_ptr<pv::SessionController> {
        auto transport = std::make_unique<pv::GstWebRtcTransport>(cfg.transport, id);
        if (!transport->open()) {
            throw pv::TransportFailure("failed to open peer connection");
        }
        auto sink = std::make_unique<pv::GstDecoderSink>(std::vector<pv::Codec>{codec}, decode_format, id);
        return pv::SessionController::make_receiver(id, std::move(transport), std::move(sink));
    };

    pv::CancellationToken token;
    auto on_closed = [&token](const std::string& reason) {
        std::cout << "Session closed: " << reason << "\n";
        token.cancel();
    };

    std::mutex session_mtx;
    std::condition_variable session_cv;
    std::unique_ptr<pv::SessionController> session;
    std::unique_ptr<pv::WsOfferServer> ws;

    if (cfg.client.signaling == "websocket") {
        // One session at a time: the remote peer offers, we answer receive-only.
        ws = std::make_unique<pv::WsOfferServer>(cfg.client.ws_port, [&](const std::string& sdp) {
            {
                std::lock_guard lk(session_mtx);
                if (session) throw pv::NegotiationError("client already has a session");
            }
            auto s = make_session("client");
            s->set_closed_handler(on_closed);
            std::string answer = s->begin_negotiation(pv::SessionDescription{pv::SdpType::Offer, sdp});
            {
                std::lock_guard lk(session_mtx);
                session = std::move(s);
            }
            session_cv.notify_all();
            return answer;
        });
        if (!ws->start()) {
            std::cerr << "Failed to start WebSocket signaling on port " << cfg.client.ws_port << ".\n";
            return 1;
        }

        std::unique_lock lk(session_mtx);
        while (!session && g_running) {
            session_cv.wait_for(lk, std::chrono::milliseconds(100));
        }
        if (!session) {
            lk.unlock();
            ws->stop();
            std::cout << "Client exiting.\n";
            return 0;
        }
    } else {
        try {
            session = make_session("client");
            session->set_closed_handler(on_closed);

            const std::string offer = session->create_offer();
            std::cout << "Requesting " << pv::to_string(codec) << " stream from " << cfg.client.offer_url << "\n";
            const std::string answer = pv::post_offer(cfg.client.offer_url, offer, cfg.client.http_timeout_ms);
            session->begin_negotiation(pv::SessionDescription{pv::SdpType::Answer, answer});
        } catch (const pv::SessionError& e) {
            std::cerr << "Negotiation failed: " << e.what() << "\n";
            if (session) session->close("negotiation-failed");
            std::cout << "Client exiting.\n";
            return 1;
        }
    }

    std::thread sig_watch([&token] {
        while (!token.cancelled()) {
            if (!g_running) {
                token.cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    {
        pv::CvWindowDisplay display(cfg.display);
        pv::RenderLoop::Options opt;
        opt.interval = std::chrono::milliseconds(cfg.display.interval_ms);
        pv::RenderLoop loop(session->frame_buffer(), display, opt);
        loop.run(token);
        std::cout << "Rendered " << loop.frames_shown() << " frames\n";
    }

    token.cancel();
    if (sig_watch.joinable()) sig_watch.join();

    if (ws) ws->stop();
    session->close("client-exit");
    session.reset();
    std::cout << "Client exiting.\n";
    return 0;
}
