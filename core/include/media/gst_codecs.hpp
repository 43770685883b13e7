#pragma once

#include <string>

#include <media/media_format.hpp>

namespace pv {
    struct CodecElements {
        std::string encoded_caps;  // compressed elementary stream
        std::string payloader;
        std::string depayloader;   // RTP -> encoded_caps
        std::string decoder;
        std::string encoding_name; // SDP rtpmap name
    };

    // Throws FormatError for Codec::Unknown.
    CodecElements codec_elements(Codec codec);

    // Raw I420 (video) or S16 48k stereo (audio) in, encoded_caps out.
    std::string encoder_description(Codec codec, int bitrate_kbps, int fps);

    std::string rtp_caps(const MediaFormat& format);

    void ensure_gst_init();
}
