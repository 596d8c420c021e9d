#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>

#include <atomic>

namespace fr {
    static const char* kBgrSink = "videoconvert ! video/x-raw,format=BGR ! ";

    static std::string quote(const std::string& s) {
        std::string out = "\"";
        for (char c : s) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
        return out;
    }

    static std::string appsink(const std::string& sink_name) {
        return "appsink name=" + sink_name + " max-buffers=2 drop=true sync=false";
    }

    static bool starts_with(const std::string& s, const char* prefix) {
        return s.rfind(prefix, 0) == 0;
    }

    static std::string device_pipeline(int index, const SourceConfig& c, const std::string& sink_name) {
        const std::string dev = "v4l2src device=/dev/video" + std::to_string(index) + " ! ";
        if (c.webcam_mjpg) {
            return dev + "image/jpeg ! jpegdec ! " + kBgrSink + appsink(sink_name);
        }
        return dev + kBgrSink + appsink(sink_name);
    }

    static std::string rtsp_pipeline(const std::string& url, const SourceConfig& c, const std::string& sink_name) {
        std::string proto = c.rtsp_tcp ? "tcp" : "udp";
        return "rtspsrc location=" + quote(url) +
               " latency=" + std::to_string(c.rtsp_latency_ms) +
               " protocols=" + proto + " drop-on-latency=true ! "
               "decodebin ! " + kBgrSink + appsink(sink_name);
    }

    static std::string uri_pipeline(const std::string& uri, const std::string& sink_name) {
        return "uridecodebin uri=" + quote(uri) + " ! " + kBgrSink + appsink(sink_name);
    }

    static std::string file_pipeline(const std::string& path, const std::string& sink_name) {
        return "filesrc location=" + quote(path) + " ! "
               "decodebin ! " + kBgrSink + appsink(sink_name);
    }

    std::string build_gst_pipeline(const SourceDescriptor& desc, const SourceConfig& cfg, const std::string& sink_name) {
        if (desc.is_device()) {
            return device_pipeline(desc.device_index, cfg, sink_name);
        }
        if (starts_with(desc.uri, "rtsp://") || starts_with(desc.uri, "rtsps://")) {
            return rtsp_pipeline(desc.uri, cfg, sink_name);
        }
        if (desc.uri.find("://") != std::string::npos) {
            return uri_pipeline(desc.uri, sink_name);
        }
        return file_pipeline(desc.uri, sink_name);
    }

    std::unique_ptr<IFrameSource> make_frame_source(const SourceDescriptor& desc, const SourceConfig& cfg) {
        // appsink names must be unique per process while an old pipeline lingers
        static std::atomic<int> next_sink{0};
        const std::string sink_name = "relay_sink_" + std::to_string(next_sink++);

        return std::make_unique<GstFrameSource>(build_gst_pipeline(desc, cfg, sink_name),
                                                desc.to_string(),
                                                sink_name,
                                                cfg.open_timeout_ms);
    }

    FrameSourceFactory gst_source_factory(SourceConfig cfg) {
        return [cfg](const SourceDescriptor& desc) { return make_frame_source(desc, cfg); };
    }
}
