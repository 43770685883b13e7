#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <media/media_endpoint.hpp>
#include <media/media_format.hpp>
#include <media/video_frame.hpp>

namespace pv {
    class FrameBuffer;

    // Sits between a codec endpoint and the transport / FrameBuffer so the session
    // only ever has one object to start, stop and unsubscribe.
    class MediaBridge : public ISampleSink, public IFrameSink, public IMediaEventSink {
    public:
        enum class Role {
            Send,
            Receive
        };

        struct Capabilities {
            bool has_audio = false;
            std::vector<MediaFormat> formats;
        };

        using SendFn = std::function<bool(MediaKind, uint32_t, const uint8_t*, size_t)>;
        // reason, failed
        using TerminateFn = std::function<void(const std::string&, bool)>;

        MediaBridge(IMediaSource& source, SendFn send);
        MediaBridge(IMediaSink& sink, FrameBuffer& buffer);
        ~MediaBridge() override;

        MediaBridge(const MediaBridge&) = delete;
        MediaBridge& operator=(const MediaBridge&) = delete;

        Role role() const { return role_; }
        Capabilities capabilities() const;

        void set_terminate_handler(TerminateFn fn);

        void on_format_negotiated(const MediaFormat& format);
        std::optional<MediaFormat> video_format() const;
        std::optional<MediaFormat> audio_format() const;

        // Subscribes to the endpoint and starts it. Idempotent.
        bool start();

        // Unsubscribes every hook. No bridge callback is running when this returns.
        void detach();

        // detach() + endpoint stop. Idempotent, fine to call when start() never ran.
        // Exceptions from the endpoint propagate to the caller.
        void stop();

        bool started() const { return started_.load(); }

        // Transport -> decoder (receive side).
        void on_encoded_frame_received(MediaKind kind, const uint8_t* data, size_t size, int64_t pts_ns);

        // ISampleSink
        void on_encoded_sample(MediaKind kind, uint32_t duration, const uint8_t* data, size_t size) override;

        // IFrameSink
        void on_raw_frame(const RawFrameView& frame) override;

        // IMediaEventSink
        void on_media_error(const std::string& message) override;
        void on_media_ended() override;

        uint64_t samples_sent() const { return samples_sent_.load(); }
        uint64_t send_failures() const { return send_failures_.load(); }
        uint64_t frames_published() const { return frames_published_.load(); }
        uint64_t unsupported_frames() const { return unsupported_frames_.load(); }
        uint64_t invalid_frames() const { return invalid_frames_.load(); }

    private:
        IMediaEndpoint& endpoint_();
        void subscribe_();
        void unsubscribe_();
        void count_frame_(const RawFrameView& frame);
        void terminate_(const std::string& reason, bool failed);

        Role role_;
        IMediaSource* source_ = nullptr;
        IMediaSink* sink_ = nullptr;
        SendFn send_;
        FrameBuffer* buffer_ = nullptr;

        // Held while forwarding so that detach() waits out in-flight callbacks.
        mutable std::mutex cb_mtx_;
        bool attached_ = false;
        TerminateFn on_terminate_;

        mutable std::mutex fmt_mtx_;
        std::optional<MediaFormat> video_format_;
        std::optional<MediaFormat> audio_format_;

        std::atomic<bool> started_{false};
        std::atomic<bool> stopped_{false};

        std::atomic<uint64_t> samples_sent_{0};
        std::atomic<uint64_t> send_failures_{0};
        std::atomic<uint64_t> frames_published_{0};
        std::atomic<uint64_t> unsupported_frames_{0};
        std::atomic<uint64_t> invalid_frames_{0};

        // frame-rate window, touched only by the decoder thread
        std::chrono::steady_clock::time_point window_start_{};
        uint64_t window_frames_ = 0;
        int64_t next_frame_id_ = 0;
    };

    // Copies a raw decoded picture into an owned BGR frame.
    // Throws UnsupportedFrameFormat for tags it cannot convert.
    VideoFrame to_bgr_frame(const RawFrameView& raw);
}
