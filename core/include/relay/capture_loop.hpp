#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include <encode/jpeg_encoder.hpp>
#include <ingest/frame_source.hpp>
#include <relay/frame_buffer.hpp>
#include <relay/run_token.hpp>

namespace fr {
    struct CaptureStats {
        uint64_t frames_read = 0;
        uint64_t frames_published = 0;
        uint64_t publishes_dropped = 0;
        uint64_t read_failures = 0;
        uint64_t encode_failures = 0;
    };

    // Reads, encodes and publishes frames from one opened source until its run
    // token is cancelled. Read and encode failures never end the loop.
    class CaptureLoop {
    public:
        struct Options {
            std::chrono::milliseconds pacing{33};
            std::chrono::milliseconds retry_backoff{2000};
            int read_timeout_ms = 1000;
            uint64_t log_every_n_failures = 30; // after the first one
        };

        CaptureLoop(std::shared_ptr<IFrameSource> src,
                    std::shared_ptr<FrameBuffer> buffer,
                    std::shared_ptr<RunToken> token,
                    FrameEncoder encoder,
                    Options opt);

        // Blocks the calling thread; marks the token exited on return.
        void run();

        CaptureStats stats() const;

    private:
        ReadStatus read_once_(FramePacket& fp);
        bool encode_once_(const FramePacket& fp, std::vector<uint8_t>& jpeg);
        void handle_frame_(const FramePacket& fp);

        std::shared_ptr<IFrameSource> src_;
        std::shared_ptr<FrameBuffer> buffer_;
        std::shared_ptr<RunToken> token_;
        FrameEncoder encoder_;
        Options opt_;

        std::atomic<uint64_t> frames_read_{0};
        std::atomic<uint64_t> frames_published_{0};
        std::atomic<uint64_t> publishes_dropped_{0};
        std::atomic<uint64_t> read_failures_{0};
        std::atomic<uint64_t> encode_failures_{0};
    };
}
