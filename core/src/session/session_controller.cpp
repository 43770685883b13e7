#include <session/session_controller.hpp>

#include <common/errors.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace pv {
    SessionController::SessionController(std::string id, std::unique_ptr<IPeerTransport> transport)
        : id_(std::move(id)),
          transport_(std::move(transport)) {
        if (!transport_) {
            throw std::invalid_argument("SessionController requires a transport");
        }
    }

    std::unique_ptr<SessionController> SessionController::make_sender(std::string id,
                                                                      std::unique_ptr<IPeerTransport> transport,
                                                                      std::unique_ptr<IMediaSource> source) {
        if (!source) {
            throw std::invalid_argument("sender session requires a media source");
        }
        std::unique_ptr<SessionController> s(new SessionController(std::move(id), std::move(transport)));
        s->source_ = std::move(source);

        IPeerTransport* t = s->transport_.get();
        s->bridge_ = std::make_unique<MediaBridge>(
            *s->source_,
            [t](MediaKind kind, uint32_t duration, const uint8_t* data, size_t size) {
                return kind == MediaKind::Audio ? t->send_audio(duration, data, size)
                                                : t->send_video(duration, data, size);
            });
        s->wire_();
        return s;
    }

    std::unique_ptr<SessionController> SessionController::make_receiver(std::string id,
                                                                        std::unique_ptr<IPeerTransport> transport,
                                                                        std::unique_ptr<IMediaSink> sink) {
        if (!sink) {
            throw std::invalid_argument("receiver session requires a media sink");
        }
        std::unique_ptr<SessionController> s(new SessionController(std::move(id), std::move(transport)));
        s->sink_ = std::move(sink);
        s->bridge_ = std::make_unique<MediaBridge>(*s->sink_, s->frame_buffer_);
        s->wire_();
        return s;
    }

    SessionController::~SessionController() {
        close("destroyed");

        std::unique_lock lk(state_mtx_);
        closed_cv_.wait(lk, [&] { return finished_; });
    }

    void SessionController::wire_() {
        transport_->set_state_handler([this](TransportState s) { on_transport_state(s); });
        transport_->set_candidate_handler([this](const IceCandidate& c) {
            std::cout << "[Session:" << id_ << "] ICE candidate (mline " << c.mline_index << "): "
                      << c.candidate << "\n";
        });
        if (bridge_->role() == MediaBridge::Role::Receive) {
            MediaBridge* bridge = bridge_.get();
            transport_->set_frame_handler([bridge](MediaKind kind, const uint8_t* data, size_t size, int64_t pts_ns) {
                bridge->on_encoded_frame_received(kind, data, size, pts_ns);
            });
        }
        bridge_->set_terminate_handler([this](const std::string& reason, bool failed) {
            teardown_(reason, failed);
        });
    }

    SessionState SessionController::state() const {
        std::lock_guard lk(state_mtx_);
        return state_;
    }

    bool SessionController::failed() const {
        std::lock_guard lk(state_mtx_);
        return failed_;
    }

    std::string SessionController::close_reason() const {
        std::lock_guard lk(state_mtx_);
        return close_reason_;
    }

    std::optional<MediaFormat> SessionController::selected_format() const {
        std::lock_guard lk(state_mtx_);
        return selected_;
    }

    bool SessionController::transition_(SessionState to) {
        std::lock_guard lk(state_mtx_);
        return transition_locked_(to);
    }

    bool SessionController::transition_locked_(SessionState to) {
        if (state_ == to) return false;
        if (!can_transition(state_, to)) {
            std::cerr << "[Session:" << id_ << "] ignored transition "
                      << to_string(state_) << " -> " << to_string(to) << "\n";
            return false;
        }
        std::cout << "[Session:" << id_ << "] " << to_string(state_) << " -> " << to_string(to) << "\n";
        state_ = to;
        return true;
    }

    std::string SessionController::create_offer() {
        {
            std::lock_guard lk(state_mtx_);
            if (state_ != SessionState::Negotiating) {
                throw NegotiationError("session " + id_ + " is " + to_string(state_) + ", not negotiating");
            }
        }

        try {
            std::lock_guard mk(media_mtx_);
            if (teardown_started_) throw NegotiationError("session closed during negotiation");
            if (offer_pending_) throw NegotiationError("offer already created");

            std::vector<MediaFormat> video;
            for (const auto& f : bridge_->capabilities().formats) {
                if (f.kind == MediaKind::Video) video.push_back(f);
            }
            if (video.empty()) throw FormatError("local endpoint has no video formats");

            if (!transport_->add_track(video, TrackDirection::RecvOnly)) {
                throw NegotiationError("failed to add receive track");
            }
            std::string offer = transport_->create_offer();
            if (offer.empty()) throw NegotiationError("failed to create offer");

            offer_pending_ = true;
            std::cout << "[Session:" << id_ << "] created offer for " << describe(video) << "\n";
            return offer;
        } catch (const FormatError& e) {
            abort_negotiation_(e, true);
            throw;
        } catch (const NegotiationError& e) {
            abort_negotiation_(e, false);
            throw;
        } catch (const std::exception& e) {
            abort_negotiation_(e, false);
            throw NegotiationError(e.what());
        }
    }

    std::string SessionController::begin_negotiation(const SessionDescription& desc) {
        {
            std::lock_guard lk(state_mtx_);
            if (state_ != SessionState::Negotiating) {
                throw NegotiationError("session " + id_ + " is " + to_string(state_) + ", not negotiating");
            }
        }

        std::string answer;
        try {
            std::lock_guard mk(media_mtx_);
            try {
                if (teardown_started_) throw NegotiationError("session closed during negotiation");
                if (desc.sdp.empty()) throw NegotiationError("empty session description");

                if (desc.type == SdpType::Offer) {
                    answer = answer_offer_(desc.sdp);
                } else {
                    apply_answer_(desc.sdp);
                }
            } catch (...) {
                // Connecting may already be visible; keep start_media_ out until teardown runs.
                negotiation_failed_ = true;
                throw;
            }
        } catch (const FormatError& e) {
            abort_negotiation_(e, true);
            throw;
        } catch (const NegotiationError& e) {
            abort_negotiation_(e, false);
            throw;
        } catch (const std::exception& e) {
            abort_negotiation_(e, false);
            throw NegotiationError(e.what());
        }
        return answer;
    }

    // Runs under media_mtx_, right before the remote description is applied: the
    // transport may report Connected as soon as it has both descriptions, and that
    // event has to find the session in Connecting.
    void SessionController::enter_connecting_() {
        if (!transition_(SessionState::Connecting)) {
            throw NegotiationError("session " + id_ + " closed during negotiation");
        }
    }

    std::string SessionController::answer_offer_(const std::string& sdp) {
        if (offer_pending_) throw NegotiationError("remote offer while a local offer is pending");

        const bool sending = bridge_->role() == MediaBridge::Role::Send;
        const TrackDirection dir = sending ? TrackDirection::SendOnly : TrackDirection::RecvOnly;

        const auto remote = transport_->remote_formats(sdp);
        std::cout << "[Session:" << id_ << "] offered formats: " << describe(remote) << "\n";

        const auto caps = bridge_->capabilities();
        auto video = select_common_format(caps.formats, remote, MediaKind::Video);
        if (!video) {
            throw FormatError("no common video format (local: " + describe(caps.formats) +
                              "; remote: " + describe(remote) + ")");
        }

        bridge_->on_format_negotiated(*video);
        if (!transport_->add_track({*video}, dir)) {
            throw NegotiationError("failed to add video track");
        }

        if (sending && caps.has_audio) {
            auto audio = select_common_format(caps.formats, remote, MediaKind::Audio);
            if (audio) {
                bridge_->on_format_negotiated(*audio);
                if (!transport_->add_track({*audio}, dir)) {
                    throw NegotiationError("failed to add audio track");
                }
            } else {
                std::cout << "[Session:" << id_ << "] no common audio format, sending video only\n";
            }
        }

        enter_connecting_();
        if (!transport_->set_remote_description({SdpType::Offer, sdp})) {
            throw NegotiationError("failed to set remote description");
        }

        std::string answer = transport_->create_answer();
        if (answer.empty()) throw NegotiationError("failed to create answer");

        {
            std::lock_guard lk(state_mtx_);
            selected_ = *video;
        }
        std::cout << "[Session:" << id_ << "] answer ready, length=" << answer.size() << "\n";
        return answer;
    }

    void SessionController::apply_answer_(const std::string& sdp) {
        if (!offer_pending_) throw NegotiationError("answer received without a local offer");

        const auto remote = transport_->remote_formats(sdp);
        const auto caps = bridge_->capabilities();
        auto video = select_common_format(caps.formats, remote, MediaKind::Video);
        if (!video) {
            throw FormatError("no common video format (local: " + describe(caps.formats) +
                              "; remote: " + describe(remote) + ")");
        }

        bridge_->on_format_negotiated(*video);
        enter_connecting_();
        if (!transport_->set_remote_description({SdpType::Answer, sdp})) {
            throw NegotiationError("failed to set remote description");
        }

        std::lock_guard lk(state_mtx_);
        selected_ = *video;
    }

    void SessionController::abort_negotiation_(const std::exception& e, bool format_error) {
        std::cerr << "[Session:" << id_ << "] " << (format_error ? "FormatError: " : "NegotiationError: ")
                  << e.what() << "\n";
        teardown_(format_error ? "format-error" : "negotiation-failed", true);
    }

    void SessionController::on_transport_state(TransportState state) {
        std::cout << "[Session:" << id_ << "] peer state: " << to_string(state) << "\n";

        switch (state) {
            case TransportState::Connected:
                start_media_();
                break;
            case TransportState::Failed:
            case TransportState::Disconnected: {
                const TransportFailure failure(std::string("peer connection ") + to_string(state));
                std::cerr << "[Session:" << id_ << "] TransportFailure: " << failure.what() << "\n";
                teardown_(std::string("pc-") + to_string(state), true);
                break;
            }
            case TransportState::Closed:
                teardown_("pc-closed", false);
                break;
            default:
                break;
        }
    }

    void SessionController::start_media_() {
        bool ok = true;
        std::string error;
        {
            std::lock_guard mk(media_mtx_);
            if (teardown_started_ || negotiation_failed_) return;
            {
                std::lock_guard lk(state_mtx_);
                if (state_ == SessionState::Active) return;
                if (state_ != SessionState::Connecting) {
                    std::cerr << "[Session:" << id_ << "] connected while " << to_string(state_) << ", ignored\n";
                    return;
                }
                transition_locked_(SessionState::Active);
            }

            try {
                ok = bridge_->start();
                if (!ok) error = "media endpoint failed to start";
            } catch (const std::exception& e) {
                ok = false;
                error = e.what();
            }
        }

        if (!ok) {
            const MediaSourceError err(error);
            std::cerr << "[Session:" << id_ << "] MediaSourceError: " << err.what() << "\n";
            teardown_("media-start-failed", true);
        }
    }

    void SessionController::close(const std::string& reason) {
        teardown_(reason, false);
    }

    void SessionController::teardown_(const std::string& reason, bool failed) {
        bool expected = false;
        if (!teardown_started_.compare_exchange_strong(expected, true)) return;

        std::cout << "[Session:" << id_ << "] Cleaning up: " << reason << "\n";
        {
            std::lock_guard lk(state_mtx_);
            close_reason_ = reason;
            failed_ = failed;
            if (failed) transition_locked_(SessionState::Failed);
            transition_locked_(SessionState::Closing);
        }

        {
            std::lock_guard mk(media_mtx_);
            bridge_->detach();
            try {
                bridge_->stop();
            } catch (const std::exception& e) {
                std::cerr << "[Session:" << id_ << "] media stop threw: " << e.what() << "\n";
            }
        }

        frame_buffer_.clear();

        try {
            transport_->close(reason);
        } catch (const std::exception& e) {
            std::cerr << "[Session:" << id_ << "] transport close threw: " << e.what() << "\n";
        }

        ClosedHandler fn;
        {
            std::lock_guard lk(state_mtx_);
            transition_locked_(SessionState::Closed);
            fn = on_closed_;
        }

        if (fn) {
            try {
                fn(reason);
            } catch (const std::exception& e) {
                std::cerr << "[Session:" << id_ << "] closed handler threw: " << e.what() << "\n";
            }
        }

        std::lock_guard lk(state_mtx_);
        finished_ = true;
        closed_cv_.notify_all();
    }

    bool SessionController::wait_closed(std::chrono::milliseconds timeout) const {
        std::unique_lock lk(state_mtx_);
        return closed_cv_.wait_for(lk, timeout, [&] { return finished_; });
    }

    void SessionController::set_closed_handler(ClosedHandler fn) {
        bool run_now = false;
        std::string reason;
        {
            std::lock_guard lk(state_mtx_);
            if (state_ == SessionState::Closed) {
                run_now = true;
                reason = close_reason_;
            } else {
                on_closed_ = fn;
            }
        }
        if (!run_now || !fn) return;
        try {
            fn(reason);
        } catch (const std::exception& e) {
            std::cerr << "[Session:" << id_ << "] closed handler threw: " << e.what() << "\n";
        }
    }
}
