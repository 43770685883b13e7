#pragma once

#include <string>
#include <vector>

namespace pv {
    struct ServerConfig {
        std::string host = "127.0.0.1";
        int port = 8080;
        int max_sessions = 4;
    };

    struct TransportConfig {
        std::string stun_server; // stun://host:port, empty for host candidates only
        int sdp_timeout_ms = 5000;
        int ice_gather_timeout_ms = 5000;
    };

    struct FileConfig {
        std::string path = "sample.mp4";
        bool loop = true;
    };

    struct TestSrcConfig {
        std::string pattern = "ball";
        int width = 640;
        int height = 480;
    };

    struct SourceConfig {
        std::string type = "file"; // file|testsrc
        std::vector<std::string> codecs = {"VP8", "H264"};
        bool audio = false;
        int fps = 30;
        int bitrate_kbps = 1500;

        FileConfig file;
        TestSrcConfig testsrc;
    };

    struct ClientConfig {
        std::string offer_url = "http://127.0.0.1:8080/offer";
        std::string codec = "H264";
        std::string decode_format = "BGR"; // BGR|RGB|I420
        int http_timeout_ms = 10000;

        // http: post our offer to offer_url. websocket: wait for a remote offer on ws_port.
        std::string signaling = "http";
        int ws_port = 8081;
    };

    struct DisplayConfig {
        std::string window_name = "WebRTC Client";
        int interval_ms = 15;
        int width = 0;
        int height = 0;
        bool keep_aspect = true;
        std::string interp = "linear"; // nearest|cubic|linear|area
    };

    struct AppConfig {
        ServerConfig server;
        TransportConfig transport;
        SourceConfig source;
        ClientConfig client;
        DisplayConfig display;
    };

    AppConfig load_config_yaml(const std::string& path);

    // WEBRTC_FILE, WEBRTC_OFFER_URL, WEBRTC_VIDEO_CODEC
    void apply_env_overrides(AppConfig& cfg);
}
