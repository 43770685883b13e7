#include <media/media_format.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace pv {
    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    const char* to_string(MediaKind kind) {
        return kind == MediaKind::Audio ? "audio" : "video";
    }

    const char* to_string(Codec codec) {
        switch (codec) {
            case Codec::VP8: return "VP8";
            case Codec::H264: return "H264";
            case Codec::Opus: return "OPUS";
            default: return "unknown";
        }
    }

    const char* to_string(PixelFormat fmt) {
        switch (fmt) {
            case PixelFormat::Bgr: return "BGR";
            case PixelFormat::Rgb: return "RGB";
            case PixelFormat::I420: return "I420";
            default: return "unknown";
        }
    }

    Codec codec_from_str(const std::string& s) {
        const std::string u = upper(s);
        if (u == "VP8") return Codec::VP8;
        if (u == "H264") return Codec::H264;
        if (u == "OPUS") return Codec::Opus;
        return Codec::Unknown;
    }

    PixelFormat pixel_format_from_str(const std::string& s) {
        const std::string u = upper(s);
        if (u == "BGR") return PixelFormat::Bgr;
        if (u == "RGB") return PixelFormat::Rgb;
        if (u == "I420") return PixelFormat::I420;
        return PixelFormat::Unknown;
    }

    MediaKind kind_of(Codec codec) {
        return codec == Codec::Opus ? MediaKind::Audio : MediaKind::Video;
    }

    MediaFormat default_format(Codec codec) {
        MediaFormat f;
        f.codec = codec;
        f.kind = kind_of(codec);
        switch (codec) {
            case Codec::VP8:
                f.payload_type = 96;
                break;
            case Codec::H264:
                f.payload_type = 102;
                break;
            case Codec::Opus:
                f.payload_type = 111;
                f.clock_rate = 48000;
                f.channels = 2;
                break;
            default:
                break;
        }
        return f;
    }

    std::optional<MediaFormat> select_common_format(const std::vector<MediaFormat>& local,
                                                    const std::vector<MediaFormat>& remote,
                                                    MediaKind kind) {
        for (const auto& l : local) {
            if (l.kind != kind || l.codec == Codec::Unknown) continue;
            for (const auto& r : remote) {
                if (r.kind != kind || r.codec != l.codec) continue;
                MediaFormat out = l;
                out.payload_type = r.payload_type;
                out.clock_rate = r.clock_rate > 0 ? r.clock_rate : l.clock_rate;
                if (r.channels > 0) out.channels = r.channels;
                return out;
            }
        }
        return std::nullopt;
    }

    std::string describe(const std::vector<MediaFormat>& formats) {
        std::ostringstream oss;
        for (size_t i = 0; i < formats.size(); ++i) {
            const auto& f = formats[i];
            oss << f.payload_type << ":" << to_string(f.codec) << "/" << f.clock_rate;
            if (i + 1 < formats.size()) oss << ", ";
        }
        return oss.str();
    }
}
