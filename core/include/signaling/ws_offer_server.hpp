#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <string>
#include <thread>
#include <unordered_map>

struct lws;
struct lws_context;

namespace pv {
    // WebSocket offer endpoint for the receiving client. The remote peer connects,
    // sends {"type":"offer","sdp":...} and gets {"type":"answer","sdp":...} back.
    // Candidates are gathered into the SDP, so trickled ones are logged and dropped.
    class WsOfferServer {
    public:
        // Returns the answer SDP. SessionError subclasses are reported to the peer.
        using OfferHandler = std::function<std::string(const std::string& sdp)>;

        WsOfferServer(int port, OfferHandler handler);
        ~WsOfferServer();

        WsOfferServer(const WsOfferServer&) = delete;
        WsOfferServer& operator=(const WsOfferServer&) = delete;

        // Start lws service in bg thread
        bool start();
        void stop();

        // One text message in, the reply to send (empty for none). No socket involved.
        std::string handle_text(const std::string& text);

        int callback(lws* wsi, int reason, void* in, size_t len);

    private:
        struct Connection {
            std::string rx;
            std::deque<std::string> tx;
        };

        void queue_reply_(lws* wsi, std::string reply);

        int port_;
        OfferHandler handler_;

        lws_context* context_ = nullptr;
        std::thread service_thread_;
        std::atomic<bool> running_{false};

        // Only touched on the service thread.
        std::unordered_map<lws*, Connection> conns_;
    };
}
