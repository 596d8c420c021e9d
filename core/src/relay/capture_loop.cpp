#include <relay/capture_loop.hpp>

#include <iostream>
#include <utility>

namespace fr {
    static bool should_log(uint64_t n, uint64_t every) {
        return n == 1 || (every > 0 && n % every == 0);
    }

    CaptureLoop::CaptureLoop(std::shared_ptr<IFrameSource> src,
                             std::shared_ptr<FrameBuffer> buffer,
                             std::shared_ptr<RunToken> token,
                             FrameEncoder encoder,
                             Options opt)
        : src_(std::move(src)),
          buffer_(std::move(buffer)),
          token_(std::move(token)),
          encoder_(std::move(encoder)),
          opt_(opt) {}

    ReadStatus CaptureLoop::read_once_(FramePacket& fp) {
        try {
            return src_->read(fp, opt_.read_timeout_ms);
        } catch (const std::exception& e) {
            std::cerr << "[Capture:" << src_->id() << "] read threw: " << e.what() << "\n";
            return ReadStatus::Error;
        }
    }

    bool CaptureLoop::encode_once_(const FramePacket& fp, std::vector<uint8_t>& jpeg) {
        if (!encoder_) return false;
        try {
            return encoder_(fp.bgr, jpeg);
        } catch (const std::exception& e) {
            std::cerr << "[Capture:" << src_->id() << "] encode threw: " << e.what() << "\n";
            return false;
        }
    }

    void CaptureLoop::handle_frame_(const FramePacket& fp) {
        ++frames_read_;

        std::vector<uint8_t> jpeg;
        if (!encode_once_(fp, jpeg)) {
            const uint64_t n = ++encode_failures_;
            if (should_log(n, opt_.log_every_n_failures)) {
                std::cerr << "[Capture:" << src_->id() << "] encode failed for frame "
                          << fp.frame_id << " (" << n << " total), skipping\n";
            }
            return;
        }

        auto bytes = std::make_shared<const JpegBytes>(std::move(jpeg));
        if (buffer_->publish(std::move(bytes), token_->generation())) {
            ++frames_published_;
        } else {
            ++publishes_dropped_;
        }
    }

    void CaptureLoop::run() {
        const std::string id = src_->id();
        std::cerr << "[Capture:" << id << "] started (generation " << token_->generation() << ")\n";

        uint64_t consecutive_failures = 0;
        while (!token_->cancelled()) {
            FramePacket fp;
            const ReadStatus st = read_once_(fp);

            if (st == ReadStatus::Frame) {
                if (consecutive_failures > 0) {
                    std::cerr << "[Capture:" << id << "] recovered after "
                              << consecutive_failures << " failed reads\n";
                }
                consecutive_failures = 0;
                handle_frame_(fp);
            } else {
                ++read_failures_;
                ++consecutive_failures;
                if (should_log(consecutive_failures, opt_.log_every_n_failures)) {
                    std::cerr << "[Capture:" << id << "] Failed to read frame (" << to_string(st)
                              << "), retrying in " << opt_.retry_backoff.count() << " ms\n";
                }
                if (token_->wait_cancelled(opt_.retry_backoff)) break;
            }

            if (token_->wait_cancelled(opt_.pacing)) break;
        }

        std::cerr << "[Capture:" << id << "] stopped.\n";
        token_->mark_exited();
    }

    CaptureStats CaptureLoop::stats() const {
        CaptureStats s;
        s.frames_read = frames_read_.load();
        s.frames_published = frames_published_.load();
        s.publishes_dropped = publishes_dropped_.load();
        s.read_failures = read_failures_.load();
        s.encode_failures = encode_failures_.load();
        return s;
    }
}
