#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <media/media_endpoint.hpp>

struct _GstElement;
using GstElement = _GstElement;

namespace pv {
    // appsrc (encoded) ! decoder ! videoconvert ! appsink (raw `output` format).
    class GstDecoderSink : public IMediaSink {
    public:
        GstDecoderSink(std::vector<Codec> codecs, PixelFormat output, std::string id);
        ~GstDecoderSink() override;

        std::vector<MediaFormat> formats() const override;
        bool has_audio() const override { return false; }
        void set_format(const MediaFormat& format) override;

        bool start() override;
        void stop() override;

        void set_event_sink(IMediaEventSink* sink) override;
        void set_frame_sink(IFrameSink* sink) override;
        bool push_encoded(const uint8_t* data, size_t size, int64_t pts_ns) override;
        const std::string& id() const override { return id_; }

        uint64_t frames_decoded() const { return decoded_; }

    private:
        void worker_loop_();
        bool pull_(int timeout_ms);
        bool poll_bus_();
        void release_();
        void notify_error_(const std::string& message);

        std::vector<Codec> codecs_;
        PixelFormat output_;
        std::string id_;

        mutable std::mutex fmt_mtx_;
        std::optional<MediaFormat> video_fmt_;

        std::mutex life_mtx_;
        GstElement* pipeline_ = nullptr;
        GstElement* appsink_ = nullptr;
        std::thread worker_;
        std::atomic<bool> running_{false};

        std::mutex src_mtx_;
        GstElement* appsrc_ = nullptr;

        std::mutex sink_mtx_;
        IFrameSink* frame_sink_ = nullptr;
        IMediaEventSink* event_sink_ = nullptr;

        std::atomic<uint64_t> decoded_{0};
    };
}
