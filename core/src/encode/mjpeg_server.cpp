#include <encode/mjpeg_server.hpp>
#include <encode/api_json.hpp>
#include <relay/relay_system.hpp>

#include <iostream>
#include <httplib.h>

namespace fr {
    struct MJPEGServer::Impl {
        httplib::Server svr;
    };

    static void no_cache(httplib::Response& res) {
        res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
        res.set_header("Pragma", "no-cache");
    }

    MJPEGServer::MJPEGServer(ServerConfig cfg, RelaySystem& relay)
        : impl_(std::make_unique<Impl>()),
          cfg_(std::move(cfg)),
          relay_(relay) {
        const int threads = cfg_.worker_threads;
        impl_->svr.new_task_queue = [threads] { return new httplib::ThreadPool(static_cast<size_t>(threads)); };
        register_routes_();
    }

    size_t MJPEGServer::viewer_limit() const {
        if (cfg_.max_viewers > 0) return static_cast<size_t>(cfg_.max_viewers);
        return cfg_.worker_threads > 1 ? static_cast<size_t>(cfg_.worker_threads - 1) : 0;
    }

    MJPEGServer::~MJPEGServer() {
        stop();
    }

    void MJPEGServer::register_routes_() {
        auto& svr = impl_->svr;

        if (!cfg_.cors_origin.empty()) {
            svr.set_default_headers({{"Access-Control-Allow-Origin", cfg_.cors_origin}});

            // preflight for the JSON POST from the configured front end
            svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
                res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
                res.set_header("Access-Control-Allow-Headers", "Content-Type");
                res.set_header("Access-Control-Max-Age", "600");
                res.status = 204;
            });
        }

        // /start_stream {"stream_url": 0 | "rtsp://..."} -> (re)start the relay
        svr.Post("/start_stream", [this](const httplib::Request& req, httplib::Response& res) {
            const StartRequest sr = parse_start_request(req.body);
            if (!sr.valid) {
                std::cerr << "[HTTP] /start_stream rejected: " << sr.error << "\n";
                res.status = 400;
                res.set_content(make_result_json("error", "Invalid request body."), "application/json");
                return;
            }

            const StartResult r = relay_.controller().start(sr.source);
            res.status = r.ok ? 200 : 400;
            res.set_content(make_result_json(r.ok ? "success" : "error", r.message), "application/json");
        });

        svr.Post("/stop_stream", [this](const httplib::Request&, httplib::Response& res) {
            relay_.controller().shutdown();
            res.set_content(make_result_json("success", "Stream stopped."), "application/json");
        });

        svr.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
            const auto st = relay_.controller().status();
            res.set_content(make_status_json(st, relay_.buffer().sequence()), "application/json");
            no_cache(res);
        });

        // /snapshot -> latest jpeg once
        svr.Get("/snapshot", [this](const httplib::Request&, httplib::Response& res) {
            const auto snap = relay_.buffer().snapshot();
            if (snap.empty()) { res.status = 204; return; }
            res.set_content(reinterpret_cast<const char *>(snap.jpeg->data()), snap.jpeg->size(), "image/jpeg");
            no_cache(res);
        });

        // /video_feed -> MJPEG
        svr.Get("/video_feed", [this](const httplib::Request& req, httplib::Response& res) {
            no_cache(res);
            res.set_header("Connection", "close");

            // every viewer pins a worker; keep at least one free for the control routes
            const size_t n = ++viewers_;
            if (n > viewer_limit()) {
                --viewers_;
                std::cerr << "[HTTP] viewer from " << req.remote_addr << " refused, "
                          << viewer_limit() << " already connected\n";
                res.status = 503;
                res.set_content(make_result_json("error", "Too many viewers."), "application/json");
                return;
            }

            const StreamSession::Options opt = relay_.session_options();
            std::cerr << "[HTTP] viewer connected from " << req.remote_addr << " (" << n << " active)\n";

            res.set_chunked_content_provider(
                StreamSession::content_type(opt.boundary),
                [this, opt, session = std::shared_ptr<StreamSession>()](size_t /*offset*/,
                                                                        httplib::DataSink& sink) mutable {
                    if (!session) {
                        // the sink outlives every provider call for this response
                        session = std::make_shared<StreamSession>(
                            relay_.buffer(), opt,
                            [this, &sink] { return running_.load() && sink.is_writable(); });
                    }

                    std::string chunk;
                    if (!session->next(chunk)) {
                        sink.done();
                        return true;
                    }
                    return sink.write(chunk.data(), chunk.size());
                },
                [this](bool /*success*/) {
                    const size_t left = --viewers_;
                    std::cerr << "[HTTP] viewer disconnected (" << left << " active)\n";
                });
        });

        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
    }

    bool MJPEGServer::start() {
        if (running_) return true;

        if (!impl_->svr.bind_to_port(cfg_.host, cfg_.port)) {
            std::cerr << "[HTTP] Failed to bind " << cfg_.host << ":" << cfg_.port << "\n";
            return false;
        }

        running_ = true;
        server_thread_ = std::thread([this] {
            std::cout << "[HTTP] Control: POST http://" << cfg_.host << ":" << cfg_.port << "/start_stream\n";
            std::cout << "[HTTP] Video: http://" << cfg_.host << ":" << cfg_.port << "/video_feed\n";
            if (!impl_->svr.listen_after_bind()) {
                std::cerr << "[HTTP] listen loop ended with an error\n";
            }
        });

        return true;
    }

    void MJPEGServer::stop() {
        if (!running_) return;
        running_ = false;

        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}
