#include <common/config.hpp>
#include <media/media_format.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace pv {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static ServerConfig parse_server_config(const YAML::Node& s) {
        ServerConfig c;
        c.host = get_str(s, "host", c.host);
        c.port = get_int(s, "port", c.port);
        c.max_sessions = get_int(s, "max_sessions", c.max_sessions);
        if (c.port <= 0 || c.port > 65535) {
            throw std::runtime_error("[Config] server.port out of range: " + std::to_string(c.port));
        }
        if (c.max_sessions < 1) c.max_sessions = 1;
        return c;
    }

    static TransportConfig parse_transport_config(const YAML::Node& t) {
        TransportConfig c;
        c.stun_server = get_str(t, "stun_server", c.stun_server);
        c.sdp_timeout_ms = get_int(t, "sdp_timeout_ms", c.sdp_timeout_ms);
        c.ice_gather_timeout_ms = get_int(t, "ice_gather_timeout_ms", c.ice_gather_timeout_ms);
        if (c.sdp_timeout_ms <= 0 || c.ice_gather_timeout_ms <= 0) {
            throw std::runtime_error("[Config] transport timeouts must be > 0");
        }
        return c;
    }

    static FileConfig parse_file_config(const YAML::Node& fc) {
        FileConfig c;
        if (!fc) return c;
        c.path = get_str(fc, "path", c.path);
        c.loop = get_bool(fc, "loop", c.loop);
        return c;
    }

    static TestSrcConfig parse_testsrc_config(const YAML::Node& tc) {
        TestSrcConfig c;
        if (!tc) return c;
        c.pattern = get_str(tc, "pattern", c.pattern);
        c.width = get_int(tc, "width", c.width);
        c.height = get_int(tc, "height", c.height);
        return c;
    }

    static SourceConfig parse_source_config(const YAML::Node& s) {
        SourceConfig c;
        c.type = get_str(s, "type", c.type);
        c.audio = get_bool(s, "audio", c.audio);
        c.fps = get_int(s, "fps", c.fps);
        c.bitrate_kbps = get_int(s, "bitrate_kbps", c.bitrate_kbps);
        if (s && s["codecs"]) {
            if (!s["codecs"].IsSequence()) {
                throw std::runtime_error("[Config] source.codecs must be a list!");
            }
            c.codecs = s["codecs"].as<std::vector<std::string>>();
        }
        c.file = parse_file_config(s ? s["file"] : YAML::Node());
        c.testsrc = parse_testsrc_config(s ? s["testsrc"] : YAML::Node());

        if (c.type != "file" && c.type != "testsrc") {
            throw std::runtime_error("[Config] unknown source type: " + c.type);
        }
        if (c.codecs.empty()) {
            throw std::runtime_error("[Config] source.codecs is empty!");
        }
        for (const auto& name : c.codecs) {
            const Codec codec = codec_from_str(name);
            if (codec == Codec::Unknown || kind_of(codec) != MediaKind::Video) {
                throw std::runtime_error("[Config] unsupported video codec: " + name);
            }
        }
        if (c.fps <= 0) {
            throw std::runtime_error("[Config] source.fps must be > 0");
        }
        if (c.type == "file" && c.file.path.empty()) {
            throw std::runtime_error("[Config] file source has empty path!");
        }
        return c;
    }

    static ClientConfig parse_client_config(const YAML::Node& cl) {
        ClientConfig c;
        c.offer_url = get_str(cl, "offer_url", c.offer_url);
        c.codec = get_str(cl, "codec", c.codec);
        c.decode_format = get_str(cl, "decode_format", c.decode_format);
        c.http_timeout_ms = get_int(cl, "http_timeout_ms", c.http_timeout_ms);
        c.signaling = get_str(cl, "signaling", c.signaling);
        c.ws_port = get_int(cl, "ws_port", c.ws_port);

        const Codec codec = codec_from_str(c.codec);
        if (codec == Codec::Unknown || kind_of(codec) != MediaKind::Video) {
            throw std::runtime_error("[Config] unsupported client codec: " + c.codec);
        }
        if (pixel_format_from_str(c.decode_format) == PixelFormat::Unknown) {
            throw std::runtime_error("[Config] unsupported decode_format: " + c.decode_format);
        }
        if (c.signaling != "http" && c.signaling != "websocket") {
            throw std::runtime_error("[Config] client.signaling must be http or websocket, got: " + c.signaling);
        }
        if (c.ws_port <= 0 || c.ws_port > 65535) {
            throw std::runtime_error("[Config] client.ws_port out of range");
        }
        return c;
    }

    static DisplayConfig parse_display_config(const YAML::Node& d) {
        DisplayConfig c;
        c.window_name = get_str(d, "window_name", c.window_name);
        c.interval_ms = get_int(d, "interval_ms", c.interval_ms);
        c.width = get_int(d, "width", c.width);
        c.height = get_int(d, "height", c.height);
        c.keep_aspect = get_bool(d, "keep_aspect", c.keep_aspect);
        c.interp = get_str(d, "interp", c.interp);
        if (c.interval_ms <= 0) {
            throw std::runtime_error("[Config] display.interval_ms must be > 0");
        }
        return c;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        cfg.server = parse_server_config(root["server"]);
        cfg.transport = parse_transport_config(root["transport"]);
        cfg.source = parse_source_config(root["source"]);
        cfg.client = parse_client_config(root["client"]);
        cfg.display = parse_display_config(root["display"]);
        return cfg;
    }

    static const char* env_or_null(const char* name) {
        const char* v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    }

    void apply_env_overrides(AppConfig& cfg) {
        if (const char* file = env_or_null("WEBRTC_FILE")) {
            cfg.source.file.path = file;
        }
        if (const char* url = env_or_null("WEBRTC_OFFER_URL")) {
            cfg.client.offer_url = url;
        }
        if (const char* codec = env_or_null("WEBRTC_VIDEO_CODEC")) {
            const Codec c = codec_from_str(codec);
            if (c == Codec::VP8 || c == Codec::H264) {
                cfg.client.codec = to_string(c);
            } else {
                std::cerr << "[Config] WEBRTC_VIDEO_CODEC=" << codec << " not supported, using H264\n";
                cfg.client.codec = "H264";
            }
        }
    }
}
