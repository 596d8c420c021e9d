#pragma once

#include <memory>

#include <common/config.hpp>
#include <encode/jpeg_encoder.hpp>
#include <ingest/frame_source_factory.hpp>
#include <relay/frame_buffer.hpp>
#include <relay/relay_controller.hpp>
#include <relay/stream_session.hpp>

namespace fr {
    // Everything the relay shares between the producer and the viewers: the
    // latest-frame slot and the controller that owns the producer.
    class RelaySystem {
    public:
        // GStreamer sources + OpenCV JPEG encoding
        explicit RelaySystem(const AppConfig& cfg);

        RelaySystem(const RelayConfig& cfg, FrameSourceFactory factory, FrameEncoder encoder);

        RelaySystem(const RelaySystem&) = delete;
        RelaySystem& operator=(const RelaySystem&) = delete;

        FrameBuffer& buffer() { return *buffer_; }
        const FrameBuffer& buffer() const { return *buffer_; }
        RelayController& controller() { return *controller_; }
        const RelayController& controller() const { return *controller_; }

        StreamSession::Options session_options() const { return session_opt_; }

    private:
        std::shared_ptr<FrameBuffer> buffer_;
        std::unique_ptr<RelayController> controller_;
        StreamSession::Options session_opt_;
    };
}
