#include <encode/mjpeg_server.hpp>
#include <relay/relay_system.hpp>

#include "fake_frame_source.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using fr::test::check;
using fr::test::wait_until;
using namespace std::chrono_literals;

namespace {
    constexpr int kPort = 18931;
    constexpr int kSmallPoolPort = 18932;

    fr::RelayConfig fast_relay() {
        fr::RelayConfig c;
        c.pacing_ms = 5;
        c.retry_backoff_ms = 20;
        c.stop_timeout_ms = 500;
        c.read_timeout_ms = 10;
        return c;
    }

    std::string message_of(const httplib::Result& res) {
        if (!res) return {};
        const auto j = nlohmann::json::parse(res->body, nullptr, false);
        if (j.is_discarded() || !j.contains("message")) return {};
        return j["message"].get<std::string>();
    }

    void run_server_tests() {
        fr::test::FakeSourceFactory sources;
        fr::test::FakeBehavior a; a.marker = 'A';
        fr::test::FakeBehavior b; b.marker = 'B';
        sources.add("0", a);
        sources.add("rtsp://cam-b", b);

        fr::RelaySystem relay(fast_relay(), sources.factory(), fr::test::marker_encoder());

        fr::ServerConfig scfg;
        scfg.host = "127.0.0.1";
        scfg.port = kPort;
        scfg.worker_threads = 8;
        fr::MJPEGServer server(scfg, relay);
        check(server.start(), "server should bind its port");

        httplib::Client cli("127.0.0.1", kPort);
        cli.set_read_timeout(5, 0);

        auto health = cli.Get("/health");
        check(health && health->status == 200 && health->body == "ok", "/health should answer ok");

        auto empty = cli.Get("/snapshot");
        check(empty && empty->status == 204, "/snapshot before any frame should be 204");

        auto bad = cli.Post("/start_stream", R"({"stream_url": "bad://nowhere"})", "application/json");
        check(bad && bad->status == 400, "unopenable source should answer 400");
        check(message_of(bad) == "Could not open video source.", "400 body should carry the open error");
        check(relay.controller().state() == fr::RelayState::Idle, "failed start leaves the relay Idle");

        auto malformed = cli.Post("/start_stream", "{oops", "application/json");
        check(malformed && malformed->status == 400, "malformed body should answer 400");

        auto ok = cli.Post("/start_stream", "{}", "application/json");
        check(ok && ok->status == 200, "default device should start");
        check(message_of(ok) == "Stream started from 0", "success body should name the source");
        check(ok && ok->get_header_value("Access-Control-Allow-Origin") == "http://localhost:8080",
              "responses should carry the configured CORS origin");

        auto preflight = cli.Options("/start_stream");
        check(preflight && preflight->status == 204, "CORS preflight should be answered");

        check(wait_until([&] { return !relay.buffer().snapshot().empty(); }, 2000ms), "frames should flow");

        std::string content_type;
        std::string body;
        cli.Get("/video_feed",
                [&](const httplib::Response& res) {
                    content_type = res.get_header_value("Content-Type");
                    return res.status == 200;
                },
                [&](const char* data, size_t len) {
                    body.append(data, len);
                    return body.find(std::string(16, 'A') + "\r\n") == std::string::npos;
                });
        check(content_type == "multipart/x-mixed-replace; boundary=frame", "feed should be multipart");
        check(body.rfind("--frame\r\nContent-Type: image/jpeg\r\n\r\n", 0) == 0, "feed should open with a part header");

        auto switched = cli.Post("/start_stream", R"({"stream_url": "rtsp://cam-b"})", "application/json");
        check(switched && switched->status == 200, "switch to a second source should succeed");
        check(wait_until([&] {
                  const auto s = relay.buffer().snapshot();
                  return !s.empty() && (*s.jpeg)[0] == 'B';
              }, 2000ms), "buffer should follow the new source");

        auto snap = cli.Get("/snapshot");
        check(snap && snap->status == 200 && snap->body == std::string(16, 'B'), "/snapshot should return the latest frame");

        auto status = cli.Get("/status");
        const auto sj = nlohmann::json::parse(status ? status->body : std::string("{}"), nullptr, false);
        check(!sj.is_discarded() && sj.value("state", "") == "running", "/status should report running");
        check(!sj.is_discarded() && sj.value("source", "") == "rtsp://cam-b", "/status should report the source");

        auto stopped = cli.Post("/stop_stream", "", "application/json");
        check(stopped && stopped->status == 200, "/stop_stream should succeed");
        check(relay.controller().state() == fr::RelayState::Idle, "relay should be Idle after stop");

        check(wait_until([&] { return server.active_viewers() == 0; }, 2000ms), "closed viewers should be released");

        server.stop();
        check(!server.is_running(), "server should stop");
        check(sources.probe().max_open == 1, "never two sources open at once through the HTTP API");
    }

    void run_viewer_limit_tests() {
        fr::test::FakeSourceFactory sources;
        fr::test::FakeBehavior a; a.marker = 'A';
        sources.add("0", a);

        fr::RelaySystem relay(fast_relay(), sources.factory(), fr::test::marker_encoder());

        fr::ServerConfig scfg;
        scfg.host = "127.0.0.1";
        scfg.port = kSmallPoolPort;
        scfg.worker_threads = 2;
        fr::MJPEGServer server(scfg, relay);
        check(server.viewer_limit() == 1, "two workers leave room for one viewer");
        check(server.start(), "small-pool server should bind its port");

        httplib::Client cli("127.0.0.1", kSmallPoolPort);
        cli.set_read_timeout(3, 0);

        auto first = cli.Post("/start_stream", "{}", "application/json");
        check(first && first->status == 200, "stream should start");

        std::atomic<bool> release{false};
        std::atomic<bool> got_data{false};
        std::thread viewer([&] {
            httplib::Client vc("127.0.0.1", kSmallPoolPort);
            vc.set_read_timeout(5, 0);
            vc.Get("/video_feed",
                   [](const httplib::Response& res) { return res.status == 200; },
                   [&](const char*, size_t) {
                       got_data = true;
                       return !release.load();
                   });
        });

        check(wait_until([&] { return server.active_viewers() == 1 && got_data.load(); }, 3000ms),
              "first viewer should be streaming");

        auto again = cli.Post("/start_stream", "{}", "application/json");
        check(again && again->status == 200, "control requests should still be served while a viewer holds a worker");

        auto status = cli.Get("/status");
        check(status && status->status == 200, "/status should still answer");

        auto second = cli.Get("/video_feed");
        check(second && second->status == 503, "a viewer beyond the limit should get 503");
        check(message_of(second) == "Too many viewers.", "503 body should explain the refusal");
        check(server.active_viewers() == 1, "a refused viewer is not counted");

        release = true;
        viewer.join();
        check(wait_until([&] { return server.active_viewers() == 0; }, 2000ms), "held viewer should be released");

        server.stop();
    }

    void run_failed_bind_tests() {
        fr::test::FakeSourceFactory sources;
        fr::RelaySystem relay(fast_relay(), sources.factory(), fr::test::marker_encoder());

        fr::ServerConfig scfg;
        scfg.host = "256.0.0.1";
        scfg.port = kSmallPoolPort;
        fr::MJPEGServer server(scfg, relay);
        check(!server.start(), "an unusable host should fail to bind");
        check(!server.start(), "retrying start after a failed bind should fail cleanly");
        check(!server.is_running(), "server should not run after failed binds");
        server.stop();
    }
}

int main() {
    run_server_tests();
    run_viewer_limit_tests();
    run_failed_bind_tests();
    return fr::test::finish("mjpeg server");
}
