#pragma once

#include <ingest/frame_source.hpp>
#include <atomic>
#include <string>

struct _GstElement;
using GstElement = _GstElement;

namespace fr {
    class GstFrameSource: public IFrameSource {
    public:
        GstFrameSource(std::string pipeline, std::string src_id, std::string sink_name, int open_timeout_ms);

        GstFrameSource(const GstFrameSource&) = delete;
        GstFrameSource& operator=(const GstFrameSource&) = delete;

        bool open() override;
        void close() override;
        bool is_open() const override { return opened_ && !closed_; }
        ReadStatus read(FramePacket& out, int timeout_ms = 1000) override;
        const std::string& id() const override { return id_ ;};

        ~GstFrameSource() override;

    private:
        void log_bus_errors_();
        void release_();

        std::string pipeline_str_;
        std::string id_;
        std::string sink_name_;
        int open_timeout_ms_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        std::atomic<bool> opened_{false};
        std::atomic<bool> closed_{false};

        int64_t frame_id_ = 0;
    };
}
