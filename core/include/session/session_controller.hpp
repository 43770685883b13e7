#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <media/media_bridge.hpp>
#include <media/media_endpoint.hpp>
#include <pipeline/frame_buffer.hpp>
#include <session/session_state.hpp>
#include <transport/peer_transport.hpp>

namespace pv {
    // One peer connection from negotiation to teardown. Every shutdown path
    // (transport failure, media error, close(), destructor) funnels into a single
    // guarded teardown that runs once.
    class SessionController {
    public:
        using ClosedHandler = std::function<void(const std::string&)>;

        // Stream server side: answers a remote offer and sends encoded media.
        static std::unique_ptr<SessionController> make_sender(std::string id,
                                                              std::unique_ptr<IPeerTransport> transport,
                                                              std::unique_ptr<IMediaSource> source);

        // Stream client side: decodes into the frame buffer. Either sends the offer
        // (create_offer + answer) or answers a remote offer with a receive-only track.
        static std::unique_ptr<SessionController> make_receiver(std::string id,
                                                                std::unique_ptr<IPeerTransport> transport,
                                                                std::unique_ptr<IMediaSink> sink);

        ~SessionController();

        SessionController(const SessionController&) = delete;
        SessionController& operator=(const SessionController&) = delete;

        // Offerer only. Throws NegotiationError / FormatError.
        std::string create_offer();

        // Offer in -> answer out, or answer in -> empty string. Connecting is entered
        // before the remote description reaches the transport. On failure the
        // session is torn down and the error rethrown.
        std::string begin_negotiation(const SessionDescription& desc);

        // Safe from any thread, concurrently with everything else.
        void on_transport_state(TransportState state);

        // Only the first caller does the work. Later callers return immediately.
        void close(const std::string& reason);

        bool wait_closed(std::chrono::milliseconds timeout) const;

        // Runs once, on the thread that completed teardown.
        void set_closed_handler(ClosedHandler fn);

        const std::string& id() const { return id_; }
        SessionState state() const;
        bool failed() const;
        std::string close_reason() const;
        std::optional<MediaFormat> selected_format() const;

        FrameBuffer& frame_buffer() { return frame_buffer_; }
        const MediaBridge& bridge() const { return *bridge_; }

    private:
        SessionController(std::string id, std::unique_ptr<IPeerTransport> transport);

        void wire_();
        std::string answer_offer_(const std::string& sdp);
        void apply_answer_(const std::string& sdp);
        void enter_connecting_();
        void abort_negotiation_(const std::exception& e, bool format_error);

        bool transition_(SessionState to);
        bool transition_locked_(SessionState to);
        void start_media_();
        void teardown_(const std::string& reason, bool failed);

        std::string id_;

        mutable std::mutex state_mtx_;
        mutable std::condition_variable closed_cv_;
        SessionState state_ = SessionState::Negotiating;
        bool failed_ = false;
        bool finished_ = false;
        std::string close_reason_;
        std::optional<MediaFormat> selected_;
        ClosedHandler on_closed_;

        std::atomic<bool> teardown_started_{false};

        // Serializes negotiation and media start against teardown.
        std::mutex media_mtx_;
        bool offer_pending_ = false;
        bool negotiation_failed_ = false;

        // Declaration order is destruction order in reverse: the bridge goes
        // first, then the transport, then the codec endpoint and the buffer.
        FrameBuffer frame_buffer_;
        std::unique_ptr<IMediaSource> source_;
        std::unique_ptr<IMediaSink> sink_;
        std::unique_ptr<IPeerTransport> transport_;
        std::unique_ptr<MediaBridge> bridge_;
    };
}
