#include <signaling/signaling_server.hpp>

#include <common/errors.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace pv {
    struct SignalingServer::Impl {
        httplib::Server svr;
        std::mutex rng_mtx;
        std::mt19937_64 rng{std::random_device{}()};
    };

    namespace {
        bool blank(const std::string& s) {
            return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        }

        OfferResult error_result(int status, std::string text) {
            OfferResult r;
            r.status = status;
            r.body = std::move(text);
            r.content_type = "text/plain";
            return r;
        }
    }

    SignalingServer::SignalingServer(ServerConfig cfg, SessionFactory factory)
        : impl_(std::make_unique<Impl>()),
          cfg_(std::move(cfg)),
          factory_(std::move(factory)) {}

    SignalingServer::~SignalingServer() {
        stop();
    }

    std::string SignalingServer::new_session_id_() {
        std::lock_guard lk(impl_->rng_mtx);
        std::ostringstream oss;
        oss << std::hex << std::setw(16) << std::setfill('0') << impl_->rng();
        return oss.str();
    }

    OfferResult SignalingServer::handle_offer(const std::string& sdp) {
        if (blank(sdp)) return error_result(400, "SDP offer body was empty.");
        if (stopping_) return error_result(503, "Server is shutting down.");

        {
            std::lock_guard lk(sessions_mtx_);
            if (static_cast<int>(sessions_.size()) + pending_ >= cfg_.max_sessions) {
                std::cerr << "[Signaling] rejecting offer, " << cfg_.max_sessions << " sessions active\n";
                return error_result(503, "Session limit reached.");
            }
            ++pending_;
        }

        const std::string id = new_session_id_();
        std::shared_ptr<SessionController> session;
        try {
            session = factory_(id);
        } catch (const std::exception& e) {
            std::cerr << "[Signaling] session " << id << " creation failed: " << e.what() << "\n";
        }

        {
            std::lock_guard lk(sessions_mtx_);
            --pending_;
            if (session) sessions_[id] = session;
        }
        if (!session) return error_result(500, "Failed to create session.");

        std::cout << "[Signaling] offer received, session " << id << "\n";

        OfferResult r;
        try {
            r.body = session->begin_negotiation(SessionDescription{SdpType::Offer, sdp});
            if (r.body.empty()) {
                session->close("empty answer");
                r = error_result(500, "Failed to create SDP answer.");
            } else {
                r.status = 200;
                r.content_type = "application/sdp";
                r.session_id = id;
            }
        } catch (const FormatError& e) {
            r = error_result(400, e.what());
        } catch (const NegotiationError& e) {
            r = error_result(400, e.what());
        } catch (const std::exception& e) {
            session->close("negotiation error");
            r = error_result(500, e.what());
        }

        if (r.status != 200) {
            std::cerr << "[Signaling] session " << id << " rejected (" << r.status << "): " << r.body << "\n";
            std::lock_guard lk(sessions_mtx_);
            sessions_.erase(id);
        } else {
            std::cout << "[Signaling] session " << id << " answered\n";
        }
        return r;
    }

    size_t SignalingServer::reap_closed() {
        std::vector<std::shared_ptr<SessionController>> dead;
        {
            std::lock_guard lk(sessions_mtx_);
            for (auto it = sessions_.begin(); it != sessions_.end();) {
                if (it->second->state() == SessionState::Closed) {
                    dead.push_back(std::move(it->second));
                    it = sessions_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (const auto& s : dead) {
            std::cout << "[Signaling] session " << s->id() << " removed (" << s->close_reason() << ")\n";
        }
        return dead.size();
    }

    std::vector<SessionInfo> SignalingServer::list_sessions() const {
        std::lock_guard lk(sessions_mtx_);
        std::vector<SessionInfo> out;
        out.reserve(sessions_.size());
        for (const auto& kv : sessions_) out.push_back({kv.first, kv.second->state()});
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
        return out;
    }

    std::string SignalingServer::sessions_json() const {
        auto sessions = list_sessions();
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < sessions.size(); ++i) {
            oss << R"({"id":")" << sessions[i].id << R"(","state":")" << to_string(sessions[i].state) << "\"}";
            if (i + 1 < sessions.size()) oss << ",";
        }
        oss << "]";
        return oss.str();
    }

    size_t SignalingServer::session_count() const {
        std::lock_guard lk(sessions_mtx_);
        return sessions_.size();
    }

    bool SignalingServer::start() {
        if (running_) return true;

        impl_->svr.Post("/offer", [this](const httplib::Request& req, httplib::Response& res) {
            OfferResult r = handle_offer(req.body);
            res.status = r.status;
            res.set_content(r.body, r.content_type.c_str());
            if (!r.session_id.empty()) res.set_header("X-Session-Id", r.session_id);
            res.set_header("Cache-Control", "no-cache");
        });

        // /sessions -> JSON list of {id, state}
        impl_->svr.Get("/sessions", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(sessions_json(), "application/json");
            res.set_header("Cache-Control", "no-cache");
        });

        impl_->svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });

        if (!impl_->svr.bind_to_port(cfg_.host.c_str(), cfg_.port)) {
            std::cerr << "[Signaling] cannot bind " << cfg_.host << ":" << cfg_.port << "\n";
            return false;
        }

        running_ = true;
        server_thread_ = std::thread([this] {
            std::cout << "[Signaling] POST offers to http://" << cfg_.host << ":" << cfg_.port << "/offer\n";
            impl_->svr.listen_after_bind();
        });
        return true;
    }

    void SignalingServer::stop() {
        bool expected = false;
        if (!stopping_.compare_exchange_strong(expected, true)) return;

        if (running_) {
            impl_->svr.stop();
            if (server_thread_.joinable()) server_thread_.join();
            running_ = false;
        }

        std::vector<std::shared_ptr<SessionController>> all;
        {
            std::lock_guard lk(sessions_mtx_);
            for (auto& kv : sessions_) all.push_back(std::move(kv.second));
            sessions_.clear();
        }
        for (const auto& s : all) s->close("server-stopping");
        if (!all.empty()) std::cout << "[Signaling] closed " << all.size() << " session(s)\n";
    }
}
