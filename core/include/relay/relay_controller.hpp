#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <encode/jpeg_encoder.hpp>
#include <ingest/frame_source_factory.hpp>
#include <ingest/source_descriptor.hpp>
#include <relay/capture_loop.hpp>
#include <relay/frame_buffer.hpp>
#include <relay/run_token.hpp>

namespace fr {
    enum class RelayState {
        Idle,
        Starting,
        Running,
        Stopping
    };

    const char* to_string(RelayState s);

    struct StartResult {
        bool ok = false;
        std::string message;
    };

    struct RelayStatus {
        RelayState state = RelayState::Idle;
        std::optional<SourceDescriptor> source;
        uint64_t generation = 0;
        uint64_t stop_timeouts = 0;
        CaptureStats capture;
    };

    // Owns the single capture loop. Every start() first stops the running loop
    // (bounded wait), closes its source, and only then opens the next source.
    class RelayController {
    public:
        struct Options {
            std::chrono::milliseconds stop_timeout{2000};
            CaptureLoop::Options loop;
            bool restore_previous_on_failure = true;
        };

        RelayController(std::shared_ptr<FrameBuffer> buffer,
                        FrameSourceFactory factory,
                        FrameEncoder encoder,
                        Options opt);
        ~RelayController();

        RelayController(const RelayController&) = delete;
        RelayController& operator=(const RelayController&) = delete;

        StartResult start(const SourceDescriptor& desc);
        void shutdown();

        RelayState state() const;
        std::optional<SourceDescriptor> active_source() const;
        RelayStatus status() const;

    private:
        void stop_locked_();
        bool launch_locked_(const SourceDescriptor& desc);
        std::unique_ptr<IFrameSource> open_source_(const SourceDescriptor& desc);
        void set_state_(RelayState s);

        std::shared_ptr<FrameBuffer> buffer_;
        FrameSourceFactory factory_;
        FrameEncoder encoder_;
        Options opt_;

        // serializes start()/shutdown(); held across the whole stop/open/spawn sequence
        std::mutex control_mtx_;

        // guards everything below for concurrent status readers
        mutable std::mutex state_mtx_;
        RelayState state_ = RelayState::Idle;
        std::optional<SourceDescriptor> active_;
        std::shared_ptr<IFrameSource> source_;
        std::shared_ptr<RunToken> token_;
        std::shared_ptr<CaptureLoop> loop_;
        uint64_t next_generation_ = 0;
        uint64_t stop_timeouts_ = 0;

        std::thread loop_thread_;
    };
}
