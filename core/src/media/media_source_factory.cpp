#include <media/media_source_factory.hpp>

#include <common/errors.hpp>
#include <media/gst_codecs.hpp>
#include <media/gst_media_source.hpp>

#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace pv {
    namespace {
        std::string appsink_description(const std::string& name, bool sync) {
            return "appsink name=" + name + " sync=" + (sync ? std::string("true") : std::string("false")) +
                   " max-buffers=4 drop=false emit-signals=false";
        }

        std::string video_branch(const SourceConfig& cfg, const MediaFormat& video, const std::string& sink, bool sync) {
            const CodecElements el = codec_elements(video.codec);
            std::ostringstream ss;
            ss << "videoconvert ! videoscale ! videorate ! video/x-raw,format=I420,framerate=" << cfg.fps << "/1"
               << " ! " << encoder_description(video.codec, cfg.bitrate_kbps, cfg.fps)
               << " ! " << el.encoded_caps
               << " ! " << appsink_description(sink, sync);
            return ss.str();
        }

        std::string audio_branch(const MediaFormat& audio, const std::string& sink, bool sync) {
            const CodecElements el = codec_elements(audio.codec);
            std::ostringstream ss;
            ss << "audioconvert ! audioresample ! audio/x-raw,rate=" << audio.clock_rate
               << ",channels=" << (audio.channels > 0 ? audio.channels : 2)
               << " ! " << encoder_description(audio.codec, 0, 0)
               << " ! " << el.encoded_caps
               << " ! " << appsink_description(sink, sync);
            return ss.str();
        }

        fs::path executable_dir() {
            std::error_code ec;
            const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
            if (ec) return {};
            return exe.parent_path();
        }
    }

    std::string resolve_media_path(const std::string& path) {
        if (path.empty()) {
            throw MediaSourceError("no media file configured. Set WEBRTC_FILE to a valid mp4");
        }

        std::error_code ec;
        std::vector<fs::path> candidates;
        const fs::path p(path);
        candidates.push_back(p);
        if (p.is_relative()) {
            candidates.push_back(fs::current_path(ec) / p);
            fs::path dir = executable_dir();
            for (int up = 0; up <= 3 && !dir.empty(); ++up) {
                candidates.push_back(dir / p);
                if (!dir.has_parent_path() || dir.parent_path() == dir) break;
                dir = dir.parent_path();
            }
        }

        for (const auto& c : candidates) {
            if (fs::is_regular_file(c, ec)) {
                return fs::absolute(c, ec).lexically_normal().string();
            }
        }

        throw MediaSourceError("media file not found: " + path + ". Set WEBRTC_FILE to a valid mp4");
    }

    std::string source_pipeline(const SourceConfig& cfg,
                                const MediaFormat& video,
                                const std::optional<MediaFormat>& audio,
                                const std::string& video_sink,
                                const std::string& audio_sink) {
        std::ostringstream ss;
        if (cfg.type == "file") {
            // Paced to real time by the sinks.
            ss << "filesrc location=\"" << cfg.file.path << "\" ! decodebin name=dec "
               << "dec. ! queue ! " << video_branch(cfg, video, video_sink, true);
            if (audio) {
                ss << " dec. ! queue ! " << audio_branch(*audio, audio_sink, true);
            }
        } else if (cfg.type == "testsrc") {
            ss << "videotestsrc is-live=true pattern=" << cfg.testsrc.pattern
               << " ! video/x-raw,width=" << cfg.testsrc.width
               << ",height=" << cfg.testsrc.height
               << ",framerate=" << cfg.fps << "/1"
               << " ! " << video_branch(cfg, video, video_sink, false);
            if (audio) {
                ss << " audiotestsrc is-live=true wave=sine ! " << audio_branch(*audio, audio_sink, false);
            }
        } else {
            throw MediaSourceError("unknown source type: " + cfg.type);
        }
        return ss.str();
    }

    std::unique_ptr<IMediaSource> make_media_source(const SourceConfig& cfg, const std::string& id) {
        SourceConfig resolved = cfg;
        if (resolved.type == "file") {
            resolved.file.path = resolve_media_path(cfg.file.path);
            std::cout << "[Source:" << id << "] file " << resolved.file.path << "\n";
        } else if (resolved.type != "testsrc") {
            throw MediaSourceError("unknown source type: " + cfg.type);
        }
        return std::make_unique<GstMediaSource>(std::move(resolved), id);
    }
}
