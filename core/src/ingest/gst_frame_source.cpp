#include <ingest/gst_frame_source.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>
#include <iostream>
#include <mutex>

namespace fr {
    GstFrameSource::GstFrameSource(std::string pipeline, std::string id, std::string sink_name, int open_timeout_ms)
        : pipeline_str_(std::move(pipeline)),
          id_(std::move(id)),
          sink_name_(std::move(sink_name)),
          open_timeout_ms_(open_timeout_ms) {}

    bool GstFrameSource::open() {
        if (opened_) return is_open();

        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &err);
        if (!pipeline_) {
            if (err) {
                std::cerr << "[GStreamer] parse_launch error: " << err->message << "\n";
                g_error_free(err);
            } else {
                std::cerr << "[GStreamer] parse_launch failed (unk error)\n";
            }
            return false;
        }
        if (err) {
            // recoverable parse warning, pipeline is still usable
            std::cerr << "[GStreamer] parse_launch warning: " << err->message << "\n";
            g_error_free(err);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) {
            std::cerr << "[GStreamer] appsink named " << sink_name_ <<" not found.\n";
            release_();
            return false;
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, TRUE);
        gst_app_sink_set_max_buffers(appsink, 2);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer] Failed to set pipeline to PLAYING for " << id_ << "\n";
            log_bus_errors_();
            release_();
            return false;
        }

        // async sources (files, network) only fail once prerolling resolves
        if (ret == GST_STATE_CHANGE_ASYNC) {
            ret = gst_element_get_state(pipeline_, nullptr, nullptr,
                                        static_cast<GstClockTime>(open_timeout_ms_) * GST_MSECOND);
            if (ret == GST_STATE_CHANGE_FAILURE || ret == GST_STATE_CHANGE_ASYNC) {
                std::cerr << "[GStreamer] Source " << id_ << " did not preroll ("
                          << (ret == GST_STATE_CHANGE_ASYNC ? "timeout" : "failure") << ")\n";
                log_bus_errors_();
                release_();
                return false;
            }
        }

        opened_ = true;
        return true;
    }

    ReadStatus GstFrameSource::read(FramePacket& out, int timeout_ms) {
        if (!sink_ || closed_) return ReadStatus::Error;

        GstSample* sample = gst_app_sink_try_pull_sample(
            GST_APP_SINK(sink_), static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);

        if (!sample) {
            if (closed_) return ReadStatus::Error;
            if (gst_app_sink_is_eos(GST_APP_SINK(sink_))) return ReadStatus::EndOfStream;
            log_bus_errors_();
            return ReadStatus::Error;
        }

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            return ReadStatus::Error;
        }

        GstStructure* st = gst_caps_get_structure(caps, 0);
        int width = 0, height = 0;
        gst_structure_get_int(st, "width", &width);
        gst_structure_get_int(st, "height", &height);
        if (width <= 0 || height <= 0) {
            gst_sample_unref(sample);
            return ReadStatus::Error;
        }

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ) || !map.data || map.size == 0) {
            gst_sample_unref(sample);
            return ReadStatus::Error;
        }

        GstVideoInfo vinfo;
        int stride = width * 3;
        if (gst_video_info_from_caps(&vinfo, caps)) {
            int s0 = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
            if (s0 > 0) stride = s0;
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.size < min_bytes) {
            gst_buffer_unmap(buffer, &map);
            gst_sample_unref(sample);
            return ReadStatus::Error;
        }

        cv::Mat tmp(height, width, CV_8UC3, (void*)map.data, stride);
        out.bgr = tmp.clone();

        out.pts_ns = (buffer->pts == GST_CLOCK_TIME_NONE) ? 0 : static_cast<int64_t>(buffer->pts);
        out.frame_id = frame_id_++;

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return ReadStatus::Frame;
    }

    void GstFrameSource::close() {
        if (closed_.exchange(true)) return;
        // Elements stay referenced until destruction so a reader blocked in
        // try_pull_sample never touches a freed sink; NULL state flushes it.
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);
        }
    }

    void GstFrameSource::log_bus_errors_() {
        if (!pipeline_) return;
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return;

        while (GstMessage* msg = gst_bus_pop_filtered(bus, GST_MESSAGE_ERROR)) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);
            std::cerr << "[GStreamer] " << id_ << ": " << (err ? err->message : "unk error");
            if (dbg) std::cerr << " (" << dbg << ")";
            std::cerr << "\n";
            if (err) g_error_free(err);
            g_free(dbg);
            gst_message_unref(msg);
        }
        gst_object_unref(bus);
    }

    void GstFrameSource::release_() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

    GstFrameSource::~GstFrameSource() {
        close();
        release_();
    }
}
