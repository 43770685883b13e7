#include <media/gst_decoder_sink.hpp>

#include <media/gst_codecs.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/app/gstappsrc.h>
#include <gst/video/video.h>

#include <cstring>
#include <iostream>
#include <sstream>

namespace pv {
    GstDecoderSink::GstDecoderSink(std::vector<Codec> codecs, PixelFormat output, std::string id)
        : codecs_(std::move(codecs)), output_(output), id_(std::move(id)) {}

    GstDecoderSink::~GstDecoderSink() {
        stop();
        if (worker_.joinable()) worker_.join();
    }

    std::vector<MediaFormat> GstDecoderSink::formats() const {
        std::vector<MediaFormat> out;
        for (Codec c : codecs_) {
            if (kind_of(c) == MediaKind::Video) out.push_back(default_format(c));
        }
        return out;
    }

    void GstDecoderSink::set_format(const MediaFormat& format) {
        if (format.kind != MediaKind::Video) return;
        std::lock_guard lk(fmt_mtx_);
        video_fmt_ = format;
    }

    void GstDecoderSink::set_event_sink(IMediaEventSink* sink) {
        std::lock_guard lk(sink_mtx_);
        event_sink_ = sink;
    }

    void GstDecoderSink::set_frame_sink(IFrameSink* sink) {
        std::lock_guard lk(sink_mtx_);
        frame_sink_ = sink;
    }

    bool GstDecoderSink::start() {
        std::lock_guard lk(life_mtx_);
        if (running_) return true;
        if (worker_.joinable()) {
            std::cerr << "[Decoder:" << id_ << "] cannot restart a stopped sink\n";
            return false;
        }

        std::optional<MediaFormat> video;
        {
            std::lock_guard fl(fmt_mtx_);
            video = video_fmt_;
        }
        if (!video) {
            std::cerr << "[Decoder:" << id_ << "] no video format selected\n";
            return false;
        }

        ensure_gst_init();

        std::ostringstream ss;
        try {
            const CodecElements el = codec_elements(video->codec);
            ss << "appsrc name=src is-live=true format=time do-timestamp=true caps=\"" << el.encoded_caps << "\""
               << " ! queue ! " << el.decoder
               << " ! videoconvert ! video/x-raw,format=" << to_string(output_)
               << " ! appsink name=sink sync=false";
        } catch (const std::exception& e) {
            std::cerr << "[Decoder:" << id_ << "] " << e.what() << "\n";
            return false;
        }
        const std::string desc = ss.str();

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

        appsink_ = gst_bin_get_by_name(GST_BIN(pipeline_), "sink");
        GstElement* appsrc = gst_bin_get_by_name(GST_BIN(pipeline_), "src");
        if (!appsink_ || !appsrc) {
            std::cerr << "[GStreamer] appsrc/appsink not found in decoder pipeline\n";
            if (appsrc) gst_object_unref(appsrc);
            release_();
            return false;
        }

        GstAppSink* sink = GST_APP_SINK(appsink_);
        gst_app_sink_set_drop(sink, TRUE);
        gst_app_sink_set_max_buffers(sink, 2);
        gst_app_sink_set_emit_signals(sink, FALSE);

        GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer] Failed to set decoder pipeline to PLAYING\n";
            gst_object_unref(appsrc);
            release_();
            return false;
        }

        {
            std::lock_guard sl(src_mtx_);
            appsrc_ = appsrc;
        }
        running_ = true;
        worker_ = std::thread(&GstDecoderSink::worker_loop_, this);
        std::cout << "[Decoder:" << id_ << "] " << to_string(video->codec)
                  << " -> " << to_string(output_) << "\n";
        return true;
    }

    bool GstDecoderSink::push_encoded(const uint8_t* data, size_t size, int64_t pts_ns) {
        if (!data || size == 0) return false;

        std::lock_guard lk(src_mtx_);
        if (!appsrc_) return false;

        GstBuffer* buf = gst_buffer_new_allocate(nullptr, size, nullptr);
        if (!buf) return false;

        GstMapInfo map;
        if (!gst_buffer_map(buf, &map, GST_MAP_WRITE)) {
            gst_buffer_unref(buf);
            return false;
        }
        std::memcpy(map.data, data, size);
        gst_buffer_unmap(buf, &map);

        // do-timestamp stamps on arrival; keep the sender's time as the offset.
        GST_BUFFER_OFFSET(buf) = static_cast<guint64>(pts_ns);

        GstFlowReturn ret = gst_app_src_push_buffer(GST_APP_SRC(appsrc_), buf);
        if (ret != GST_FLOW_OK) {
            std::cerr << "[Decoder:" << id_ << "] Failed to push buffer. ret: " << ret << "\n";
            return false;
        }
        return true;
    }

    void GstDecoderSink::stop() {
        {
            std::lock_guard lk(src_mtx_);
            if (appsrc_) {
                gst_app_src_end_of_stream(GST_APP_SRC(appsrc_));
                gst_object_unref(appsrc_);
                appsrc_ = nullptr;
            }
        }

        std::thread worker;
        {
            std::lock_guard lk(life_mtx_);
            running_ = false;
            if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
                worker = std::move(worker_);
            }
        }
        if (worker.joinable()) worker.join();

        std::lock_guard lk(life_mtx_);
        release_();
    }

    void GstDecoderSink::release_() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (appsink_) {
                gst_object_unref(appsink_);
                appsink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
            std::cout << "[Decoder:" << id_ << "] stopped after " << decoded_ << " frames\n";
        }
    }

    void GstDecoderSink::worker_loop_() {
        while (running_) {
            if (!poll_bus_()) return;
            pull_(50);
        }
    }

    bool GstDecoderSink::pull_(int timeout_ms) {
        GstSample* sample = gst_app_sink_try_pull_sample(
            GST_APP_SINK(appsink_), static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);
        if (!sample) return false;

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            return false;
        }

        GstStructure* st = gst_caps_get_structure(caps, 0);
        int width = 0, height = 0;
        gst_structure_get_int(st, "width", &width);
        gst_structure_get_int(st, "height", &height);
        const gchar* fmt = gst_structure_get_string(st, "format");
        if (width <= 0 || height <= 0) {
            gst_sample_unref(sample);
            return false;
        }

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ) || !map.data || map.size == 0) {
            gst_sample_unref(sample);
            return false;
        }

        RawFrameView view;
        view.width = width;
        view.height = height;
        view.format = pixel_format_from_str(fmt ? fmt : "");
        view.stride = view.format == PixelFormat::I420 ? width : width * 3;
        GstVideoInfo vinfo;
        if (gst_video_info_from_caps(&vinfo, caps)) {
            int s0 = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
            if (s0 > 0) view.stride = s0;
        }
        view.data = map.data;
        view.size = map.size;
        view.pts_ns = (buffer->pts == GST_CLOCK_TIME_NONE) ? 0 : static_cast<int64_t>(buffer->pts);

        {
            std::lock_guard lk(sink_mtx_);
            if (frame_sink_) {
                try {
                    frame_sink_->on_raw_frame(view);
                } catch (const std::exception& e) {
                    std::cerr << "[Decoder:" << id_ << "] frame sink threw: " << e.what() << "\n";
                }
            }
        }
        ++decoded_;

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return true;
    }

    bool GstDecoderSink::poll_bus_() {
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return true;

        while (GstMessage* msg = gst_bus_pop_filtered(bus, GST_MESSAGE_ERROR)) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);
            const std::string text = err ? err->message : "unknown decoder error";
            std::cerr << "[GStreamer] decoder " << id_ << " error: " << text << "\n";
            g_clear_error(&err);
            g_free(dbg);
            gst_message_unref(msg);
            gst_object_unref(bus);
            notify_error_(text);
            return false;
        }
        gst_object_unref(bus);
        return true;
    }

    void GstDecoderSink::notify_error_(const std::string& message) {
        IMediaEventSink* sink = nullptr;
        {
            std::lock_guard lk(sink_mtx_);
            sink = event_sink_;
        }
        if (sink) sink->on_media_error(message);
    }
}
