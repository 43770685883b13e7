#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include <media/video_frame.hpp>

namespace pv {
    class FrameBuffer;

    class CancellationToken {
    public:
        void cancel() { cancelled_.store(true); }
        bool cancelled() const { return cancelled_.load(); }
    private:
        std::atomic<bool> cancelled_{false};
    };

    struct IFrameDisplay {
        virtual ~IFrameDisplay() = default;
        virtual void show(const VideoFrame& frame) = 0;
        // True when the user asked to quit.
        virtual bool poll_exit() = 0;
    };

    class RenderLoop {
    public:
        struct Options {
            std::chrono::milliseconds interval{15};
            std::chrono::seconds stats_window{5};
        };

        RenderLoop(FrameBuffer& buffer, IFrameDisplay& display, Options opt);

        // Blocks until `token` is cancelled, either by another thread or by the
        // display reporting an exit request.
        void run(CancellationToken& token);

        uint64_t frames_shown() const { return frames_shown_.load(); }
        uint64_t polls() const { return polls_.load(); }

    private:
        void count_frame_(const VideoFrame& frame);

        FrameBuffer& buffer_;
        IFrameDisplay& display_;
        Options opt_;

        std::atomic<uint64_t> frames_shown_{0};
        std::atomic<uint64_t> polls_{0};
        bool first_frame_logged_ = false;
        std::chrono::steady_clock::time_point window_start_{};
        uint64_t window_frames_ = 0;
    };
}
