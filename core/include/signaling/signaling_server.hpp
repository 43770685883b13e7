#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <common/config.hpp>
#include <session/session_controller.hpp>

namespace pv {
    struct OfferResult {
        int status = 200;
        std::string body;
        std::string content_type = "text/plain";
        std::string session_id; // empty unless a session was kept
    };

    struct SessionInfo {
        std::string id;
        SessionState state = SessionState::Negotiating;
    };

    // HTTP offer/answer endpoint and registry of live sessions.
    class SignalingServer {
    public:
        // Builds an unnegotiated sender session. May throw; nullptr is a failure too.
        using SessionFactory = std::function<std::unique_ptr<SessionController>(const std::string& id)>;

        SignalingServer(ServerConfig cfg, SessionFactory factory);
        ~SignalingServer();

        // Start http server in bg thread
        bool start();
        void stop();

        // POST /offer without the HTTP layer.
        OfferResult handle_offer(const std::string& sdp);

        // Destroys sessions that reached Closed. Must not be called from a
        // session's closed handler.
        size_t reap_closed();

        std::vector<SessionInfo> list_sessions() const;
        std::string sessions_json() const;
        size_t session_count() const;

    private:
        std::string new_session_id_();

        struct Impl;
        std::unique_ptr<Impl> impl_;

        ServerConfig cfg_;
        SessionFactory factory_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};
        std::atomic<bool> stopping_{false};

        mutable std::mutex sessions_mtx_;
        std::unordered_map<std::string, std::shared_ptr<SessionController>> sessions_;
        int pending_ = 0;
    };
}
