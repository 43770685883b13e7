#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <media/media_format.hpp>

namespace pv {
    struct RawFrameView {
        int width = 0;
        int height = 0;
        int stride = 0; // bytes per row of the first plane
        PixelFormat format = PixelFormat::Unknown;
        const uint8_t* data = nullptr;
        size_t size = 0;
        int64_t pts_ns = 0;
    };

    // Receives compressed samples produced by an encoder.
    struct ISampleSink {
        virtual ~ISampleSink() = default;
        virtual void on_encoded_sample(MediaKind kind,
                                       uint32_t duration,
                                       const uint8_t* data,
                                       size_t size) = 0;
    };

    // Receives decoded pictures produced by a decoder.
    struct IFrameSink {
        virtual ~IFrameSink() = default;
        virtual void on_raw_frame(const RawFrameView& frame) = 0;
    };

    struct IMediaEventSink {
        virtual ~IMediaEventSink() = default;
        virtual void on_media_error(const std::string& message) = 0;
        virtual void on_media_ended() = 0;
    };

    // Codec endpoint owned outside the bridge. Sink pointers may be swapped to
    // nullptr at any time; once set_*_sink returns, the previous sink is no longer
    // being called.
    struct IMediaEndpoint {
        virtual ~IMediaEndpoint() = default;

        virtual std::vector<MediaFormat> formats() const = 0;
        virtual bool has_audio() const = 0;
        virtual void set_format(const MediaFormat& format) = 0;

        virtual bool start() = 0;
        virtual void stop() = 0;

        virtual void set_event_sink(IMediaEventSink* sink) = 0;
        virtual const std::string& id() const = 0;
    };

    struct IMediaSource : IMediaEndpoint {
        virtual void set_sample_sink(ISampleSink* sink) = 0;
    };

    struct IMediaSink : IMediaEndpoint {
        virtual void set_frame_sink(IFrameSink* sink) = 0;

        // Depayloaded compressed frame from the network.
        virtual bool push_encoded(const uint8_t* data, size_t size, int64_t pts_ns) = 0;
    };
}
