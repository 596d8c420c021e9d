#pragma once

#include <string>

namespace fr {
    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 5001;
        std::string cors_origin = "http://localhost:8080"; // empty disables CORS headers
        int worker_threads = 32; // each connected viewer holds one
        int max_viewers = 0; // 0: worker_threads - 1, so control requests always get a worker
    };

    struct RelayConfig {
        int pacing_ms = 33;
        int retry_backoff_ms = 2000;
        int stop_timeout_ms = 2000;
        int read_timeout_ms = 1000;
        int jpeg_quality = 80;
        bool skip_duplicates = false;
    };

    struct SourceConfig {
        bool autostart = false;
        std::string url = "0"; // device index or URI, used by autostart
        int open_timeout_ms = 5000;
        int rtsp_latency_ms = 200;
        bool rtsp_tcp = true;
        bool webcam_mjpg = false;
    };

    struct AppConfig {
        ServerConfig server;
        RelayConfig relay;
        SourceConfig source;
    };

    AppConfig load_config_yaml(const std::string& path);
    AppConfig parse_config_yaml(const std::string& text);

    // throws std::runtime_error on the first invalid field
    void validate_config(const AppConfig& cfg);
}
