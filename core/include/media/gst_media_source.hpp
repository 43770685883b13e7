#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <common/config.hpp>
#include <media/media_endpoint.hpp>

struct _GstElement;
using GstElement = _GstElement;

namespace pv {
    // Decodes a file (or a test pattern), re-encodes it to the negotiated codec
    // and hands compressed samples to the sample sink from a worker thread.
    class GstMediaSource : public IMediaSource {
    public:
        GstMediaSource(SourceConfig cfg, std::string id);
        ~GstMediaSource() override;

        std::vector<MediaFormat> formats() const override;
        bool has_audio() const override { return cfg_.audio; }
        void set_format(const MediaFormat& format) override;

        bool start() override;
        void stop() override;

        void set_event_sink(IMediaEventSink* sink) override;
        void set_sample_sink(ISampleSink* sink) override;
        const std::string& id() const override { return id_; }

    private:
        void worker_loop_();
        bool pull_(GstElement* appsink, MediaKind kind, int clock_rate, int timeout_ms);
        bool poll_bus_();
        bool rewind_();
        void release_();

        void notify_error_(const std::string& message);
        void notify_ended_();

        SourceConfig cfg_;
        std::string id_;

        mutable std::mutex fmt_mtx_;
        std::optional<MediaFormat> video_fmt_;
        std::optional<MediaFormat> audio_fmt_;

        std::mutex life_mtx_;
        GstElement* pipeline_ = nullptr;
        GstElement* video_sink_ = nullptr;
        GstElement* audio_sink_ = nullptr;
        std::thread worker_;
        std::atomic<bool> running_{false};

        std::mutex sink_mtx_;
        ISampleSink* sample_sink_ = nullptr;
        IMediaEventSink* event_sink_ = nullptr;

        uint64_t samples_ = 0;
    };
}
