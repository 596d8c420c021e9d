#include <encode/jpeg_encoder.hpp>
#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>
#include <ingest/source_descriptor.hpp>

#include "fake_frame_source.hpp"

#include <opencv2/core.hpp>

using fr::test::check;

namespace {
    bool contains(const std::string& s, const std::string& needle) {
        return s.find(needle) != std::string::npos;
    }

    void test_descriptor_parse() {
        check(fr::SourceDescriptor::parse("0") == fr::SourceDescriptor::device(0), "\"0\" is device 0");
        check(fr::SourceDescriptor::parse("12") == fr::SourceDescriptor::device(12), "\"12\" is device 12");
        check(!fr::SourceDescriptor::parse("0x1").is_device(), "non-decimal text is a URI");
        check(!fr::SourceDescriptor::parse("/dev/video0").is_device(), "a path is a URI");
        check(fr::SourceDescriptor::device(3).to_string() == "3", "device prints as its index");

        const auto padded = fr::SourceDescriptor::parse("007");
        check(padded == fr::SourceDescriptor::device(7), "\"007\" is device 7");
        check(padded.to_string() == "007", "parsed text prints as requested");
    }

    void test_pipeline_for_device() {
        fr::SourceConfig c;
        const auto p = fr::build_gst_pipeline(fr::SourceDescriptor::device(2), c, "sink_a");
        check(contains(p, "v4l2src device=/dev/video2"), "device index maps to a v4l2 node");
        check(contains(p, "video/x-raw,format=BGR"), "pipeline should deliver BGR");
        check(contains(p, "appsink name=sink_a"), "pipeline should end in the named appsink");
        check(!contains(p, "jpegdec"), "raw capture by default");

        c.webcam_mjpg = true;
        check(contains(fr::build_gst_pipeline(fr::SourceDescriptor::device(0), c, "s"), "image/jpeg ! jpegdec"),
              "mjpg webcams decode on the way in");
    }

    void test_pipeline_for_uris() {
        fr::SourceConfig c;
        c.rtsp_latency_ms = 150;
        c.rtsp_tcp = false;

        const auto rtsp = fr::build_gst_pipeline(fr::SourceDescriptor::from_uri("rtsp://cam/live"), c, "s");
        check(contains(rtsp, "rtspsrc location=\"rtsp://cam/live\""), "rtsp uses rtspsrc");
        check(contains(rtsp, "latency=150") && contains(rtsp, "protocols=udp"), "rtsp options are applied");

        const auto http = fr::build_gst_pipeline(fr::SourceDescriptor::from_uri("http://cam/video.mjpg"), c, "s");
        check(contains(http, "uridecodebin uri=\"http://cam/video.mjpg\""), "other schemes use uridecodebin");

        const auto file = fr::build_gst_pipeline(fr::SourceDescriptor::from_uri("/tmp/clip \"1\".mp4"), c, "s");
        check(contains(file, "filesrc location=\"/tmp/clip \\\"1\\\".mp4\""), "paths use filesrc with escaped quotes");
    }

    void test_unopened_gst_source() {
        fr::GstFrameSource src("videotestsrc ! appsink name=x", "test", "x", 100);
        check(!src.is_open(), "a new source is not open");
        fr::FramePacket fp;
        check(src.read(fp, 1) == fr::ReadStatus::Error, "reading an unopened source is an error");
        src.close();
        src.close();
        check(!src.is_open(), "close is idempotent");
    }

    void test_jpeg_encoder() {
        cv::Mat img(16, 16, CV_8UC3, cv::Scalar(10, 20, 30));
        std::vector<uint8_t> out;
        check(fr::encode_jpeg(img, 80, out), "BGR frame should encode");
        check(out.size() > 4 && out[0] == 0xFF && out[1] == 0xD8, "output should start with a JPEG SOI marker");

        check(!fr::encode_jpeg(cv::Mat(), 80, out), "empty frame should fail to encode");
        check(out.empty(), "failed encode leaves no bytes");

        cv::Mat f32(4, 4, CV_32FC3, cv::Scalar(0.5, 0.5, 0.5));
        check(!fr::encode_jpeg(f32, 80, out), "float frames are rejected");

        auto enc = fr::jpeg_encoder(50);
        check(enc(img, out) && !out.empty(), "encoder functor should wrap encode_jpeg");
    }
}

int main() {
    test_descriptor_parse();
    test_pipeline_for_device();
    test_pipeline_for_uris();
    test_unopened_gst_source();
    test_jpeg_encoder();
    return fr::test::finish("ingest/encode");
}
