#include <common/config.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fr {
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
        if (!s) return c;
        c.host = get_str(s, "host", c.host);
        c.port = get_int(s, "port", c.port);
        c.cors_origin = get_str(s, "cors_origin", c.cors_origin);
        c.worker_threads = get_int(s, "worker_threads", c.worker_threads);
        c.max_viewers = get_int(s, "max_viewers", c.max_viewers);
        return c;
    }

    static RelayConfig parse_relay_config(const YAML::Node& r) {
        RelayConfig c;
        if (!r) return c;
        c.pacing_ms = get_int(r, "pacing_ms", c.pacing_ms);
        c.retry_backoff_ms = get_int(r, "retry_backoff_ms", c.retry_backoff_ms);
        c.stop_timeout_ms = get_int(r, "stop_timeout_ms", c.stop_timeout_ms);
        c.read_timeout_ms = get_int(r, "read_timeout_ms", c.read_timeout_ms);
        c.jpeg_quality = get_int(r, "jpeg_quality", c.jpeg_quality);
        c.skip_duplicates = get_bool(r, "skip_duplicates", c.skip_duplicates);
        return c;
    }

    static SourceConfig parse_source_config(const YAML::Node& s) {
        SourceConfig c;
        if (!s) return c;
        c.autostart = get_bool(s, "autostart", c.autostart);
        c.url = get_str(s, "url", c.url);
        c.open_timeout_ms = get_int(s, "open_timeout_ms", c.open_timeout_ms);
        c.rtsp_latency_ms = get_int(s, "rtsp_latency_ms", c.rtsp_latency_ms);
        c.rtsp_tcp = get_bool(s, "rtsp_tcp", c.rtsp_tcp);
        c.webcam_mjpg = get_bool(s, "webcam_mjpg", get_bool(s, "webcam_mjpeg", c.webcam_mjpg));
        return c;
    }

    static AppConfig parse_root(const YAML::Node& root) {
        if (root && !root.IsMap() && !root.IsNull()) {
            throw std::runtime_error("[Config] top level must be a map!");
        }

        AppConfig cfg;
        cfg.server = parse_server_config(root["server"]);
        cfg.relay = parse_relay_config(root["relay"]);
        cfg.source = parse_source_config(root["source"]);

        validate_config(cfg);
        return cfg;
    }

    AppConfig load_config_yaml(const std::string& path) {
        return parse_root(YAML::LoadFile(path));
    }

    AppConfig parse_config_yaml(const std::string& text) {
        return parse_root(YAML::Load(text));
    }

    void validate_config(const AppConfig& cfg) {
        if (cfg.server.host.empty()) {
            throw std::runtime_error("[Config] server.host is empty!");
        }
        if (cfg.server.port < 1 || cfg.server.port > 65535) {
            throw std::runtime_error("[Config] server.port out of range: " + std::to_string(cfg.server.port));
        }
        if (cfg.server.worker_threads < 2) {
            throw std::runtime_error("[Config] server.worker_threads must be >= 2!");
        }
        if (cfg.server.max_viewers < 0 || cfg.server.max_viewers >= cfg.server.worker_threads) {
            throw std::runtime_error("[Config] server.max_viewers must be in 0..worker_threads-1!");
        }

        const auto& r = cfg.relay;
        if (r.pacing_ms <= 0) throw std::runtime_error("[Config] relay.pacing_ms must be > 0!");
        if (r.retry_backoff_ms <= 0) throw std::runtime_error("[Config] relay.retry_backoff_ms must be > 0!");
        if (r.stop_timeout_ms <= 0) throw std::runtime_error("[Config] relay.stop_timeout_ms must be > 0!");
        if (r.read_timeout_ms <= 0) throw std::runtime_error("[Config] relay.read_timeout_ms must be > 0!");
        if (r.jpeg_quality < 1 || r.jpeg_quality > 100) {
            throw std::runtime_error("[Config] relay.jpeg_quality must be in 1..100!");
        }

        if (cfg.source.open_timeout_ms <= 0) {
            throw std::runtime_error("[Config] source.open_timeout_ms must be > 0!");
        }
        if (cfg.source.autostart && cfg.source.url.empty()) {
            throw std::runtime_error("[Config] source.autostart requires source.url!");
        }
    }
}
