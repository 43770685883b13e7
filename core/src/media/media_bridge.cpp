#include <media/media_bridge.hpp>

#include <common/errors.hpp>
#include <pipeline/frame_buffer.hpp>

#include <opencv2/imgproc.hpp>

#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace pv {
    constexpr auto FPS_WINDOW = std::chrono::seconds(5);

    MediaBridge::MediaBridge(IMediaSource& source, SendFn send)
        : role_(Role::Send),
          source_(&source),
          send_(std::move(send)) {}

    MediaBridge::MediaBridge(IMediaSink& sink, FrameBuffer& buffer)
        : role_(Role::Receive),
          sink_(&sink),
          buffer_(&buffer) {}

    MediaBridge::~MediaBridge() {
        detach();
    }

    IMediaEndpoint& MediaBridge::endpoint_() {
        if (source_) return *source_;
        return *sink_;
    }

    MediaBridge::Capabilities MediaBridge::capabilities() const {
        const IMediaEndpoint& ep = source_ ? static_cast<const IMediaEndpoint&>(*source_)
                                           : static_cast<const IMediaEndpoint&>(*sink_);
        Capabilities caps;
        caps.has_audio = ep.has_audio();
        caps.formats = ep.formats();
        return caps;
    }

    void MediaBridge::set_terminate_handler(TerminateFn fn) {
        std::lock_guard lk(cb_mtx_);
        on_terminate_ = std::move(fn);
    }

    void MediaBridge::on_format_negotiated(const MediaFormat& format) {
        {
            std::lock_guard lk(fmt_mtx_);
            if (format.kind == MediaKind::Audio) audio_format_ = format;
            else video_format_ = format;
        }
        endpoint_().set_format(format);
        std::cout << "[Bridge] negotiated " << to_string(format.kind) << " format "
                  << format.payload_type << ":" << to_string(format.codec) << "\n";
    }

    std::optional<MediaFormat> MediaBridge::video_format() const {
        std::lock_guard lk(fmt_mtx_);
        return video_format_;
    }

    std::optional<MediaFormat> MediaBridge::audio_format() const {
        std::lock_guard lk(fmt_mtx_);
        return audio_format_;
    }

    void MediaBridge::subscribe_() {
        {
            std::lock_guard lk(cb_mtx_);
            attached_ = true;
        }
        endpoint_().set_event_sink(this);
        if (source_) source_->set_sample_sink(this);
        if (sink_) sink_->set_frame_sink(this);
    }

    void MediaBridge::unsubscribe_() {
        {
            std::lock_guard lk(cb_mtx_);
            attached_ = false;
        }
        if (source_) source_->set_sample_sink(nullptr);
        if (sink_) sink_->set_frame_sink(nullptr);
        endpoint_().set_event_sink(nullptr);
    }

    bool MediaBridge::start() {
        if (stopped_) {
            std::cerr << "[Bridge] start() after stop() ignored\n";
            return false;
        }
        if (started_) return true;
        if (!video_format()) {
            std::cerr << "[Bridge] start() before format negotiation\n";
            return false;
        }

        subscribe_();
        if (!endpoint_().start()) {
            std::cerr << "[Bridge] endpoint " << endpoint_().id() << " failed to start\n";
            unsubscribe_();
            return false;
        }

        started_ = true;
        return true;
    }

    void MediaBridge::detach() {
        unsubscribe_();
    }

    void MediaBridge::stop() {
        detach();

        bool expected = false;
        if (!stopped_.compare_exchange_strong(expected, true)) return;
        endpoint_().stop();
    }

    void MediaBridge::on_encoded_sample(MediaKind kind, uint32_t duration, const uint8_t* data, size_t size) {
        if (!data || size == 0) return;

        std::lock_guard lk(cb_mtx_);
        if (!attached_ || !send_) return;

        try {
            if (send_(kind, duration, data, size)) {
                ++samples_sent_;
            } else {
                ++send_failures_;
            }
        } catch (const std::exception& e) {
            if (++send_failures_ == 1) {
                std::cerr << "[Bridge] send failed: " << e.what() << "\n";
            }
        }
    }

    void MediaBridge::on_encoded_frame_received(MediaKind kind, const uint8_t* data, size_t size, int64_t pts_ns) {
        if (kind != MediaKind::Video || !data || size == 0) return;

        std::lock_guard lk(cb_mtx_);
        if (!attached_ || !sink_) return;

        try {
            sink_->push_encoded(data, size, pts_ns);
        } catch (const std::exception& e) {
            std::cerr << "[Bridge] decoder rejected frame: " << e.what() << "\n";
        }
    }

    void MediaBridge::on_raw_frame(const RawFrameView& raw) {
        std::lock_guard lk(cb_mtx_);
        if (!attached_ || !buffer_) return;

        VideoFrame frame;
        try {
            frame = to_bgr_frame(raw);
        } catch (const UnsupportedFrameFormat& e) {
            const uint64_t n = ++unsupported_frames_;
            if (n == 1 || n % 100 == 0) {
                std::cerr << "[Bridge] " << e.what() << " (stride=" << raw.stride
                          << ", dropped=" << n << ")\n";
            }
            return;
        } catch (const std::exception& e) {
            if (++invalid_frames_ == 1) {
                std::cerr << "[Bridge] failed to convert raw frame: " << e.what() << "\n";
            }
            return;
        }

        frame.frame_id = next_frame_id_++;
        buffer_->publish(std::move(frame));
        ++frames_published_;
        count_frame_(raw);
    }

    void MediaBridge::count_frame_(const RawFrameView& raw) {
        const auto now = std::chrono::steady_clock::now();
        if (window_frames_ == 0 && window_start_ == std::chrono::steady_clock::time_point{}) {
            window_start_ = now;
        }
        ++window_frames_;

        const auto elapsed = now - window_start_;
        if (elapsed < FPS_WINDOW) return;

        const double secs = std::chrono::duration<double>(elapsed).count();
        std::cout << "[Bridge] decoded " << to_string(raw.format) << " frame "
                  << raw.width << "x" << raw.height << " stride=" << raw.stride
                  << ", frame rate " << std::fixed << std::setprecision(2)
                  << (static_cast<double>(window_frames_) / secs) << "fps\n";
        std::cout.unsetf(std::ios_base::floatfield);
        window_start_ = now;
        window_frames_ = 0;
    }

    void MediaBridge::terminate_(const std::string& reason, bool failed) {
        TerminateFn fn;
        {
            std::lock_guard lk(cb_mtx_);
            if (!attached_) return;
            fn = on_terminate_;
        }
        if (fn) fn(reason, failed);
    }

    void MediaBridge::on_media_error(const std::string& message) {
        std::cerr << "[Bridge] media source error: " << message << "\n";
        terminate_("media-error: " + message, true);
    }

    void MediaBridge::on_media_ended() {
        std::cout << "[Bridge] media source ended\n";
        terminate_("video-source-stopped", false);
    }

    VideoFrame to_bgr_frame(const RawFrameView& raw) {
        if (raw.width <= 0 || raw.height <= 0 || !raw.data || raw.size == 0) {
            throw std::invalid_argument("empty raw frame");
        }

        VideoFrame out;
        out.width = raw.width;
        out.height = raw.height;
        out.pts_ns = raw.pts_ns;
        out.format = PixelFormat::Bgr;

        // cv::Mat has no const-data constructor. The headers below are const and
        // only ever read from; the pixels are copied or converted into out.pixels.
        auto* data = const_cast<uint8_t*>(raw.data);

        switch (raw.format) {
            case PixelFormat::Bgr:
            case PixelFormat::Rgb: {
                const int stride = raw.stride > 0 ? raw.stride : raw.width * 3;
                const size_t need = static_cast<size_t>(stride) * static_cast<size_t>(raw.height);
                if (stride < raw.width * 3 || raw.size < need) {
                    throw std::invalid_argument("raw frame shorter than " + std::to_string(need) + " bytes");
                }
                const cv::Mat view(raw.height, raw.width, CV_8UC3, data, static_cast<size_t>(stride));
                if (raw.format == PixelFormat::Bgr) {
                    out.pixels = view.clone();
                } else {
                    cv::cvtColor(view, out.pixels, cv::COLOR_RGB2BGR);
                }
                break;
            }
            case PixelFormat::I420: {
                if (raw.stride > 0 && raw.stride != raw.width) {
                    throw UnsupportedFrameFormat("I420 with padded stride " + std::to_string(raw.stride));
                }
                if (raw.width % 2 != 0 || raw.height % 2 != 0) {
                    throw std::invalid_argument("I420 frame with odd dimensions");
                }
                const size_t need = static_cast<size_t>(raw.width) * static_cast<size_t>(raw.height) * 3 / 2;
                if (raw.size < need) {
                    throw std::invalid_argument("I420 frame shorter than " + std::to_string(need) + " bytes");
                }
                const cv::Mat yuv(raw.height + raw.height / 2, raw.width, CV_8UC1, data);
                cv::cvtColor(yuv, out.pixels, cv::COLOR_YUV2BGR_I420);
                break;
            }
            default:
                throw UnsupportedFrameFormat(std::string("unhandled raw pixel format ") + to_string(raw.format));
        }
        return out;
    }
}
