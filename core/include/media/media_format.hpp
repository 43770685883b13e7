#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pv {
    enum class MediaKind {
        Video,
        Audio
    };

    enum class Codec {
        VP8,
        H264,
        Opus,
        Unknown
    };

    enum class PixelFormat {
        Bgr,
        Rgb,
        I420,
        Unknown
    };

    struct MediaFormat {
        MediaKind kind = MediaKind::Video;
        Codec codec = Codec::Unknown;
        int payload_type = 96;
        int clock_rate = 90000;
        int width = 0;  // 0 when the descriptor carries no dimensions
        int height = 0;
        int channels = 0;
    };

    const char* to_string(MediaKind kind);
    const char* to_string(Codec codec);
    const char* to_string(PixelFormat fmt);

    // Case-insensitive, "VP8" / "H264" / "OPUS". Anything else is Codec::Unknown.
    Codec codec_from_str(const std::string& s);
    PixelFormat pixel_format_from_str(const std::string& s);

    MediaKind kind_of(Codec codec);

    // Default descriptor used when we are the offering side.
    MediaFormat default_format(Codec codec);

    // Walks `local` in preference order and returns the first entry of `kind` whose
    // codec also appears in `remote`. The remote payload type and clock rate win,
    // local dimensions are kept.
    std::optional<MediaFormat> select_common_format(const std::vector<MediaFormat>& local,
                                                    const std::vector<MediaFormat>& remote,
                                                    MediaKind kind);

    std::string describe(const std::vector<MediaFormat>& formats);
}
