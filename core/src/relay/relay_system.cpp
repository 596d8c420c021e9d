#include <relay/relay_system.hpp>

#include <chrono>
#include <utility>

namespace fr {
    static RelayController::Options make_controller_options(const RelayConfig& cfg) {
        RelayController::Options opt;
        opt.stop_timeout = std::chrono::milliseconds(cfg.stop_timeout_ms);
        opt.loop.pacing = std::chrono::milliseconds(cfg.pacing_ms);
        opt.loop.retry_backoff = std::chrono::milliseconds(cfg.retry_backoff_ms);
        opt.loop.read_timeout_ms = cfg.read_timeout_ms;
        return opt;
    }

    static StreamSession::Options make_session_options(const RelayConfig& cfg) {
        StreamSession::Options opt;
        opt.pacing = std::chrono::milliseconds(cfg.pacing_ms);
        opt.skip_duplicates = cfg.skip_duplicates;
        return opt;
    }

    RelaySystem::RelaySystem(const AppConfig& cfg)
        : RelaySystem(cfg.relay, gst_source_factory(cfg.source), jpeg_encoder(cfg.relay.jpeg_quality)) {}

    RelaySystem::RelaySystem(const RelayConfig& cfg, FrameSourceFactory factory, FrameEncoder encoder)
        : buffer_(std::make_shared<FrameBuffer>()),
          controller_(std::make_unique<RelayController>(buffer_,
                                                        std::move(factory),
                                                        std::move(encoder),
                                                        make_controller_options(cfg))),
          session_opt_(make_session_options(cfg)) {}
}
