#include <media/gst_codecs.hpp>

#include <common/errors.hpp>

#include <gst/gst.h>

#include <mutex>

namespace pv {
    CodecElements codec_elements(Codec codec) {
        switch (codec) {
            case Codec::VP8:
                return {"video/x-vp8", "rtpvp8pay", "rtpvp8depay", "vp8dec", "VP8"};
            case Codec::H264:
                return {"video/x-h264,stream-format=byte-stream,alignment=au",
                        "rtph264pay config-interval=1",
                        "rtph264depay ! h264parse",
                        "avdec_h264",
                        "H264"};
            case Codec::Opus:
                return {"audio/x-opus", "rtpopuspay", "rtpopusdepay", "opusdec", "OPUS"};
            default:
                throw FormatError("no GStreamer elements for codec " + std::string(to_string(codec)));
        }
    }

    std::string encoder_description(Codec codec, int bitrate_kbps, int fps) {
        const int key_int = fps > 0 ? fps : 30;
        switch (codec) {
            case Codec::VP8:
                return "vp8enc deadline=1 cpu-used=8 error-resilient=partitions"
                       " keyframe-max-dist=" + std::to_string(key_int) +
                       " target-bitrate=" + std::to_string(bitrate_kbps * 1000);
            case Codec::H264:
                return "x264enc tune=zerolatency speed-preset=ultrafast bitrate=" + std::to_string(bitrate_kbps) +
                       " key-int-max=" + std::to_string(key_int) + " ! h264parse";
            case Codec::Opus:
                return "opusenc";
            default:
                throw FormatError("no encoder for codec " + std::string(to_string(codec)));
        }
    }

    std::string rtp_caps(const MediaFormat& f) {
        return "application/x-rtp,media=" + std::string(to_string(f.kind)) +
               ",encoding-name=" + codec_elements(f.codec).encoding_name +
               ",payload=" + std::to_string(f.payload_type) +
               ",clock-rate=" + std::to_string(f.clock_rate);
    }

    void ensure_gst_init() {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });
    }
}
