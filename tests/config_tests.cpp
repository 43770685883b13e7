#include <common/config.hpp>
#include <media/media_format.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    std::string write_yaml_file(const std::string& prefix, const std::string& body) {
        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path path = fs::temp_directory_path() /
                              (prefix + "_" + std::to_string(stamp) + ".yaml");

        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::runtime_error("failed to open temp config file: " + path.string());
        }
        out << body;
        out.close();
        return path.string();
    }

    pv::AppConfig load(const std::string& yaml) {
        const std::string path = write_yaml_file("pv_cfg", yaml);
        try {
            auto cfg = pv::load_config_yaml(path);
            std::filesystem::remove(path);
            return cfg;
        } catch (...) {
            std::filesystem::remove(path);
            throw;
        }
    }

    bool load_throws(const std::string& yaml) {
        try {
            (void)load(yaml);
            return false;
        } catch (const std::exception&) {
            return true;
        }
    }

    void test_defaults_when_sections_missing() {
        const auto cfg = load("server:\n  port: 9000\n");

        check(cfg.server.port == 9000, "server.port should be read");
        check(cfg.server.host == "127.0.0.1", "server.host should default to loopback");
        check(cfg.source.type == "file", "source.type should default to file");
        check(cfg.source.codecs.size() == 2 && cfg.source.codecs[0] == "VP8",
              "source.codecs should default to [VP8, H264]");
        check(!cfg.source.audio, "audio should be off by default");
        check(cfg.client.codec == "H264", "client.codec should default to H264");
        check(cfg.client.decode_format == "BGR", "client.decode_format should default to BGR");
        check(cfg.client.signaling == "http" && cfg.client.ws_port == 8081, "client posts offers over HTTP by default");
        check(cfg.display.interval_ms == 15, "display.interval_ms should default to 15");
        check(cfg.display.window_name == "WebRTC Client", "display.window_name default");
    }

    void test_full_config_is_parsed() {
        const std::string yaml =
            "server:\n"
            "  host: \"0.0.0.0\"\n"
            "  port: 8443\n"
            "  max_sessions: 2\n"
            "transport:\n"
            "  stun_server: \"stun://stun.l.google.com:19302\"\n"
            "  sdp_timeout_ms: 3000\n"
            "source:\n"
            "  type: \"testsrc\"\n"
            "  codecs: [\"h264\"]\n"
            "  audio: true\n"
            "  fps: 25\n"
            "  testsrc:\n"
            "    pattern: \"smpte\"\n"
            "    width: 320\n"
            "    height: 240\n"
            "client:\n"
            "  offer_url: \"http://10.0.0.2:8080/offer\"\n"
            "  codec: \"VP8\"\n"
            "  decode_format: \"I420\"\n"
            "  signaling: \"websocket\"\n"
            "  ws_port: 9001\n"
            "display:\n"
            "  width: 1280\n"
            "  height: 720\n"
            "  interp: \"area\"\n";

        const auto cfg = load(yaml);
        check(cfg.server.max_sessions == 2, "server.max_sessions should be read");
        check(cfg.transport.stun_server == "stun://stun.l.google.com:19302", "stun_server should be read");
        check(cfg.transport.sdp_timeout_ms == 3000, "sdp_timeout_ms should be read");
        check(cfg.transport.ice_gather_timeout_ms == 5000, "ice_gather_timeout_ms should keep its default");
        check(cfg.source.type == "testsrc", "source.type should be read");
        check(cfg.source.codecs.size() == 1 && cfg.source.codecs[0] == "h264", "codec names are kept as written");
        check(cfg.source.audio, "source.audio should be read");
        check(cfg.source.testsrc.width == 320 && cfg.source.testsrc.height == 240, "testsrc size should be read");
        check(cfg.client.codec == "VP8", "client.codec should be read");
        check(cfg.client.decode_format == "I420", "client.decode_format should be read");
        check(cfg.client.signaling == "websocket" && cfg.client.ws_port == 9001, "websocket signaling should be read");
        check(cfg.display.width == 1280 && cfg.display.interp == "area", "display section should be read");
    }

    void test_rejects_invalid_values() {
        check(load_throws("server:\n  port: 70000\n"), "port above 65535 should be rejected");
        check(load_throws("source:\n  type: \"webcam\"\n"), "unknown source type should be rejected");
        check(load_throws("source:\n  codecs: []\n"), "empty codec list should be rejected");
        check(load_throws("source:\n  codecs: \"VP8\"\n"), "scalar codecs should be rejected");
        check(load_throws("source:\n  codecs: [\"VP9\"]\n"), "unknown codec should be rejected");
        check(load_throws("source:\n  codecs: [\"OPUS\"]\n"), "audio codec in video list should be rejected");
        check(load_throws("source:\n  fps: 0\n"), "fps 0 should be rejected");
        check(load_throws("client:\n  codec: \"OPUS\"\n"), "audio client codec should be rejected");
        check(load_throws("client:\n  decode_format: \"NV12\"\n"), "unknown decode format should be rejected");
        check(load_throws("client:\n  signaling: \"mqtt\"\n"), "unknown signaling mode should be rejected");
        check(load_throws("client:\n  ws_port: 0\n"), "ws_port 0 should be rejected");
        check(load_throws("display:\n  interval_ms: 0\n"), "display interval 0 should be rejected");
        check(load_throws("transport:\n  sdp_timeout_ms: -1\n"), "negative timeout should be rejected");
    }

    void test_max_sessions_is_clamped() {
        const auto cfg = load("server:\n  max_sessions: 0\n");
        check(cfg.server.max_sessions == 1, "max_sessions below 1 should be clamped to 1");
    }

    void test_env_overrides() {
        pv::AppConfig cfg;
        ::setenv("WEBRTC_FILE", "/media/clip.mp4", 1);
        ::setenv("WEBRTC_OFFER_URL", "http://example.test:9000/offer", 1);
        ::setenv("WEBRTC_VIDEO_CODEC", "vp8", 1);
        pv::apply_env_overrides(cfg);
        check(cfg.source.file.path == "/media/clip.mp4", "WEBRTC_FILE should override source.file.path");
        check(cfg.client.offer_url == "http://example.test:9000/offer", "WEBRTC_OFFER_URL should override offer_url");
        check(cfg.client.codec == "VP8", "WEBRTC_VIDEO_CODEC should be normalized");

        ::setenv("WEBRTC_VIDEO_CODEC", "AV1", 1);
        pv::apply_env_overrides(cfg);
        check(cfg.client.codec == "H264", "unsupported WEBRTC_VIDEO_CODEC should fall back to H264");

        ::unsetenv("WEBRTC_FILE");
        ::unsetenv("WEBRTC_OFFER_URL");
        ::unsetenv("WEBRTC_VIDEO_CODEC");

        pv::AppConfig untouched;
        pv::apply_env_overrides(untouched);
        check(untouched.source.file.path == "sample.mp4", "unset env should leave the config alone");
    }

    void test_format_helpers() {
        check(pv::codec_from_str("h264") == pv::Codec::H264, "codec names are case-insensitive");
        check(pv::codec_from_str("av1") == pv::Codec::Unknown, "unknown codec name");
        check(pv::pixel_format_from_str("rgb") == pv::PixelFormat::Rgb, "pixel format names are case-insensitive");

        const auto vp8 = pv::default_format(pv::Codec::VP8);
        check(vp8.payload_type == 96 && vp8.clock_rate == 90000, "VP8 defaults to 96/90000");
        const auto opus = pv::default_format(pv::Codec::Opus);
        check(opus.kind == pv::MediaKind::Audio && opus.clock_rate == 48000, "Opus is audio at 48 kHz");

        std::vector<pv::MediaFormat> local = {pv::default_format(pv::Codec::VP8),
                                              pv::default_format(pv::Codec::H264)};
        pv::MediaFormat remote_h264 = pv::default_format(pv::Codec::H264);
        remote_h264.payload_type = 109;
        auto picked = pv::select_common_format(local, {remote_h264}, pv::MediaKind::Video);
        check(picked && picked->codec == pv::Codec::H264, "common format should be H264");
        check(picked && picked->payload_type == 109, "remote payload type should win");

        auto none = pv::select_common_format({pv::default_format(pv::Codec::VP8)},
                                             {pv::default_format(pv::Codec::H264)},
                                             pv::MediaKind::Video);
        check(!none, "disjoint codec sets should have no common format");
    }
}

int main() {
    test_defaults_when_sections_missing();
    test_full_config_is_parsed();
    test_rejects_invalid_values();
    test_max_sessions_is_clamped();
    test_env_overrides();
    test_format_helpers();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all config tests passed\n";
    return 0;
}
