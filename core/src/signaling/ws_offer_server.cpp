#include <signaling/ws_offer_server.hpp>

#include <common/errors.hpp>

#include <libwebsockets.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <vector>

using json = nlohmann::json;

namespace pv {
    namespace {
        constexpr size_t kMaxMessageBytes = 1 << 20;

        int callback_wrapper(lws* wsi, lws_callback_reasons reason, void*, void* in, size_t len) {
            auto* server = static_cast<WsOfferServer*>(lws_context_user(lws_get_context(wsi)));
            if (!server) return 0;
            return server->callback(wsi, static_cast<int>(reason), in, len);
        }

        lws_protocols protocols[] = {
            {"peerview-signaling", callback_wrapper, 0, 65536, 0, nullptr, 0},
            {nullptr, nullptr, 0, 0, 0, nullptr, 0}
        };

        std::string error_json(const std::string& message) {
            json msg = {{"type", "error"}, {"message", message}};
            return msg.dump();
        }

        bool blank(const std::string& s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        }
    }

    WsOfferServer::WsOfferServer(int port, OfferHandler handler)
        : port_(port),
          handler_(std::move(handler)) {}

    WsOfferServer::~WsOfferServer() {
        stop();
    }

    std::string WsOfferServer::handle_text(const std::string& text) {
        json msg;
        try {
            msg = json::parse(text);
        } catch (const json::parse_error& e) {
            std::cerr << "[WsSignaling] malformed message: " << e.what() << "\n";
            return error_json("malformed JSON message");
        }
        if (!msg.is_object()) return error_json("expected a JSON object");

        if (msg.contains("candidate")) {
            std::cout << "[WsSignaling] ignoring trickled candidate: " << msg["candidate"].dump() << "\n";
            return "";
        }

        std::string type;
        std::string sdp;
        try {
            type = msg.value("type", std::string());
            sdp = msg.value("sdp", std::string());
        } catch (const json::type_error&) {
            return error_json("type and sdp must be strings");
        }

        if (type != "offer") return error_json("unsupported message type '" + type + "'");
        if (blank(sdp)) return error_json("SDP offer was empty.");

        std::string answer;
        try {
            answer = handler_(sdp);
        } catch (const SessionError& e) {
            std::cerr << "[WsSignaling] offer rejected: " << e.what() << "\n";
            return error_json(e.what());
        } catch (const std::exception& e) {
            std::cerr << "[WsSignaling] offer handling failed: " << e.what() << "\n";
            return error_json("Failed to create session.");
        }
        if (answer.empty()) return error_json("Failed to create SDP answer.");

        json reply = {{"type", "answer"}, {"sdp", answer}};
        return reply.dump();
    }

    void WsOfferServer::queue_reply_(lws* wsi, std::string reply) {
        if (reply.empty()) return;
        conns_[wsi].tx.push_back(std::move(reply));
        lws_callback_on_writable(wsi);
    }

    int WsOfferServer::callback(lws* wsi, int reason, void* in, size_t len) {
        switch (static_cast<lws_callback_reasons>(reason)) {
            case LWS_CALLBACK_ESTABLISHED:
                conns_[wsi] = Connection{};
                std::cout << "[WsSignaling] peer connected (" << conns_.size() << " open)\n";
                break;

            case LWS_CALLBACK_CLOSED:
                conns_.erase(wsi);
                std::cout << "[WsSignaling] peer disconnected\n";
                break;

            case LWS_CALLBACK_RECEIVE: {
                if (lws_frame_is_binary(wsi)) {
                    queue_reply_(wsi, error_json("binary messages are not supported"));
                    break;
                }
                Connection& c = conns_[wsi];
                if (in && len > 0) c.rx.append(static_cast<const char*>(in), len);
                if (c.rx.size() > kMaxMessageBytes) {
                    c.rx.clear();
                    queue_reply_(wsi, error_json("message too large"));
                    break;
                }
                if (!lws_is_final_fragment(wsi) || lws_remaining_packet_payload(wsi) > 0) break;

                std::string text;
                text.swap(c.rx);
                queue_reply_(wsi, handle_text(text));
                break;
            }

            case LWS_CALLBACK_SERVER_WRITEABLE: {
                auto it = conns_.find(wsi);
                if (it == conns_.end() || it->second.tx.empty()) break;

                const std::string& msg = it->second.tx.front();
                std::vector<unsigned char> buf(LWS_PRE + msg.size());
                std::memcpy(buf.data() + LWS_PRE, msg.data(), msg.size());
                const int written = lws_write(wsi, buf.data() + LWS_PRE, msg.size(), LWS_WRITE_TEXT);
                if (written < static_cast<int>(msg.size())) {
                    std::cerr << "[WsSignaling] write failed, closing connection\n";
                    return -1;
                }
                it->second.tx.pop_front();
                if (!it->second.tx.empty()) lws_callback_on_writable(wsi);
                break;
            }

            default:
                break;
        }
        return 0;
    }

    bool WsOfferServer::start() {
        if (running_) return true;

        lws_context_creation_info info;
        std::memset(&info, 0, sizeof(info));
        info.port = port_;
        info.protocols = protocols;
        info.gid = -1;
        info.uid = -1;
        info.user = this;

        context_ = lws_create_context(&info);
        if (!context_) {
            std::cerr << "[WsSignaling] failed to create context on port " << port_ << "\n";
            return false;
        }

        running_ = true;
        service_thread_ = std::thread([this] {
            std::cout << "[WsSignaling] waiting for offers on ws://0.0.0.0:" << port_ << "/\n";
            while (running_) {
                lws_service(context_, 50);
            }
        });
        return true;
    }

    void WsOfferServer::stop() {
        if (!running_) return;

        running_ = false;
        lws_cancel_service(context_);
        if (service_thread_.joinable()) service_thread_.join();

        lws_context_destroy(context_);
        context_ = nullptr;
        conns_.clear();
        std::cout << "[WsSignaling] stopped\n";
    }
}
