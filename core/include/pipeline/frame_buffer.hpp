#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

#include <media/video_frame.hpp>

namespace pv {
    // Single slot, latest wins. The producer never waits for the consumer and an
    // unread frame is replaced, not queued.
    class FrameBuffer {
    public:
        FrameBuffer() = default;

        FrameBuffer(const FrameBuffer&) = delete;
        FrameBuffer& operator=(const FrameBuffer&) = delete;

        void publish(VideoFrame frame) {
            std::lock_guard lk(m_);
            if (pending_) ++overwritten_;
            slot_.reset();
            slot_ = std::move(frame);
            pending_ = true;
            ++published_;
        }

        std::optional<VideoFrame> try_take() {
            std::lock_guard lk(m_);
            if (!pending_ || !slot_) return std::nullopt;
            pending_ = false;
            std::optional<VideoFrame> out = std::move(slot_);
            slot_.reset();
            return out;
        }

        void clear() {
            std::lock_guard lk(m_);
            slot_.reset();
            pending_ = false;
        }

        bool pending() const {
            std::lock_guard lk(m_);
            return pending_;
        }

        uint64_t published() const {
            std::lock_guard lk(m_);
            return published_;
        }

        uint64_t overwritten() const {
            std::lock_guard lk(m_);
            return overwritten_;
        }

    private:
        mutable std::mutex m_;
        std::optional<VideoFrame> slot_;
        bool pending_ = false;
        uint64_t published_ = 0;
        uint64_t overwritten_ = 0;
    };
}
