#include <media/gst_media_source.hpp>

#include <media/gst_codecs.hpp>
#include <media/media_source_factory.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>

#include <iostream>

namespace pv {
    namespace {
        constexpr const char* VIDEO_SINK = "vsink";
        constexpr const char* AUDIO_SINK = "asink";
    }

    GstMediaSource::GstMediaSource(SourceConfig cfg, std::string id)
        : cfg_(std::move(cfg)), id_(std::move(id)) {}

    GstMediaSource::~GstMediaSource() {
        stop();
        if (worker_.joinable()) worker_.join();
    }

    std::vector<MediaFormat> GstMediaSource::formats() const {
        std::vector<MediaFormat> out;
        for (const auto& name : cfg_.codecs) {
            const Codec c = codec_from_str(name);
            if (c == Codec::Unknown || kind_of(c) != MediaKind::Video) continue;
            MediaFormat f = default_format(c);
            if (cfg_.type == "testsrc") {
                f.width = cfg_.testsrc.width;
                f.height = cfg_.testsrc.height;
            }
            out.push_back(f);
        }
        if (cfg_.audio) out.push_back(default_format(Codec::Opus));
        return out;
    }

    void GstMediaSource::set_format(const MediaFormat& format) {
        std::lock_guard lk(fmt_mtx_);
        if (format.kind == MediaKind::Audio) audio_fmt_ = format;
        else video_fmt_ = format;
    }

    void GstMediaSource::set_event_sink(IMediaEventSink* sink) {
        std::lock_guard lk(sink_mtx_);
        event_sink_ = sink;
    }

    void GstMediaSource::set_sample_sink(ISampleSink* sink) {
        std::lock_guard lk(sink_mtx_);
        sample_sink_ = sink;
    }

    bool GstMediaSource::start() {
        std::lock_guard lk(life_mtx_);
        if (running_) return true;
        if (worker_.joinable()) {
            std::cerr << "[Source:" << id_ << "] cannot restart a stopped source\n";
            return false;
        }

        std::optional<MediaFormat> video, audio;
        {
            std::lock_guard fl(fmt_mtx_);
            video = video_fmt_;
            audio = audio_fmt_;
        }
        if (!video) {
            std::cerr << "[Source:" << id_ << "] no video format selected\n";
            return false;
        }

        ensure_gst_init();

        std::string desc;
        try {
            desc = source_pipeline(cfg_, *video, audio, VIDEO_SINK, AUDIO_SINK);
        } catch (const std::exception& e) {
            std::cerr << "[Source:" << id_ << "] " << e.what() << "\n";
            return false;
        }

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(desc.c_str(), &err);
        if (!pipeline_) {
            if (err) {
                std::cerr << "[GStreamer] parse_launch error: " << err->message << "\n";
                g_error_free(err);
            } else {
                std::cerr << "[GStreamer] parse_launch failed (unk error)\n";
            }
            return false;
        }
        if (err) {
            std::cerr << "[GStreamer] parse_launch warning: " << err->message << "\n";
            g_error_free(err);
        }

        video_sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), VIDEO_SINK);
        if (audio) audio_sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), AUDIO_SINK);
        if (!video_sink_ || (audio && !audio_sink_)) {
            std::cerr << "[GStreamer] appsink not found in source pipeline\n";
            release_();
            return false;
        }

        GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer] Failed to set pipeline to PLAYING\n";
            release_();
            return false;
        }

        running_ = true;
        worker_ = std::thread(&GstMediaSource::worker_loop_, this);
        std::cout << "[Source:" << id_ << "] started " << to_string(video->codec)
                  << (audio ? " + OPUS" : "") << "\n";
        return true;
    }

    void GstMediaSource::stop() {
        std::thread worker;
        {
            std::lock_guard lk(life_mtx_);
            running_ = false;
            // Called from the worker itself when an error or end of stream tears the
            // session down; the worker returns right after and the destructor joins it.
            if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
                worker = std::move(worker_);
            }
        }
        if (worker.joinable()) worker.join();

        std::lock_guard lk(life_mtx_);
        release_();
    }

    void GstMediaSource::release_() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (video_sink_) {
                gst_object_unref(video_sink_);
                video_sink_ = nullptr;
            }
            if (audio_sink_) {
                gst_object_unref(audio_sink_);
                audio_sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
            std::cout << "[Source:" << id_ << "] stopped after " << samples_ << " samples\n";
        }
    }

    void GstMediaSource::worker_loop_() {
        int video_clock = 90000;
        int audio_clock = 48000;
        {
            std::lock_guard lk(fmt_mtx_);
            if (video_fmt_) video_clock = video_fmt_->clock_rate;
            if (audio_fmt_) audio_clock = audio_fmt_->clock_rate;
        }

        while (running_) {
            if (!poll_bus_()) return;

            const bool got_video = pull_(video_sink_, MediaKind::Video, video_clock, 20);
            if (audio_sink_) {
                while (pull_(audio_sink_, MediaKind::Audio, audio_clock, 0)) {}
            }

            if (!got_video && gst_app_sink_is_eos(GST_APP_SINK(video_sink_))) {
                if (cfg_.type == "file" && cfg_.file.loop) {
                    if (rewind_()) continue;
                    notify_error_("failed to rewind " + cfg_.file.path);
                    return;
                }
                std::cout << "[Source:" << id_ << "] end of stream\n";
                notify_ended_();
                return;
            }
        }
    }

    bool GstMediaSource::pull_(GstElement* appsink, MediaKind kind, int clock_rate, int timeout_ms) {
        GstSample* sample = gst_app_sink_try_pull_sample(
            GST_APP_SINK(appsink), static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);
        if (!sample) return false;

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        if (!buffer) {
            gst_sample_unref(sample);
            return false;
        }

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ) || !map.data || map.size == 0) {
            gst_sample_unref(sample);
            return false;
        }

        // RTP timestamp units
        uint32_t duration = 0;
        if (GST_BUFFER_DURATION_IS_VALID(buffer)) {
            duration = static_cast<uint32_t>(
                gst_util_uint64_scale(GST_BUFFER_DURATION(buffer), clock_rate, GST_SECOND));
        } else if (kind == MediaKind::Video) {
            duration = static_cast<uint32_t>(clock_rate / (cfg_.fps > 0 ? cfg_.fps : 30));
        } else {
            duration = static_cast<uint32_t>(clock_rate / 50);
        }

        {
            std::lock_guard lk(sink_mtx_);
            if (sample_sink_) {
                try {
                    sample_sink_->on_encoded_sample(kind, duration, map.data, map.size);
                } catch (const std::exception& e) {
                    std::cerr << "[Source:" << id_ << "] sample sink threw: " << e.what() << "\n";
                }
            }
        }
        ++samples_;

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return true;
    }

    bool GstMediaSource::poll_bus_() {
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return true;

        while (GstMessage* msg = gst_bus_pop_filtered(
                   bus, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_WARNING))) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
                gst_message_parse_error(msg, &err, &dbg);
                const std::string text = err ? err->message : "unknown pipeline error";
                std::cerr << "[GStreamer] source " << id_ << " error: " << text << "\n";
                if (dbg) std::cerr << "[GStreamer]   " << dbg << "\n";
                g_clear_error(&err);
                g_free(dbg);
                gst_message_unref(msg);
                gst_object_unref(bus);
                notify_error_(text);
                return false;
            }
            gst_message_parse_warning(msg, &err, &dbg);
            std::cerr << "[GStreamer] source " << id_ << " warning: " << (err ? err->message : "?") << "\n";
            g_clear_error(&err);
            g_free(dbg);
            gst_message_unref(msg);
        }
        gst_object_unref(bus);
        return true;
    }

    bool GstMediaSource::rewind_() {
        std::cout << "[Source:" << id_ << "] looping " << cfg_.file.path << "\n";
        return gst_element_seek_simple(pipeline_, GST_FORMAT_TIME,
                                       static_cast<GstSeekFlags>(GST_SEEK_FLAG_FLUSH | GST_SEEK_FLAG_KEY_UNIT),
                                       0);
    }

    void GstMediaSource::notify_error_(const std::string& message) {
        IMediaEventSink* sink = nullptr;
        {
            std::lock_guard lk(sink_mtx_);
            sink = event_sink_;
        }
        if (sink) sink->on_media_error(message);
    }

    void GstMediaSource::notify_ended_() {
        IMediaEventSink* sink = nullptr;
        {
            std::lock_guard lk(sink_mtx_);
            sink = event_sink_;
        }
        if (sink) sink->on_media_ended();
    }
}
