#include <relay/frame_buffer.hpp>

#include "fake_frame_source.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using fr::test::check;

namespace {
    fr::JpegPtr bytes(uint8_t v, size_t n = 32) {
        return std::make_shared<const fr::JpegBytes>(n, v);
    }

    void test_snapshot_empty_before_publish() {
        fr::FrameBuffer buf;
        const auto s = buf.snapshot();
        check(s.empty(), "snapshot before any publish should be empty");
        check(!s.jpeg, "snapshot before any publish should carry no bytes");
        check(buf.sequence() == 0, "sequence should start at 0");
    }

    void test_snapshot_returns_last_publish() {
        fr::FrameBuffer buf;
        auto a = bytes(7);
        buf.publish(a);

        const auto s1 = buf.snapshot();
        const auto s2 = buf.snapshot();
        check(!s1.empty() && *s1.jpeg == *a, "snapshot should return the published frame");
        check(s1.jpeg == s2.jpeg && s1.seq == s2.seq, "repeated snapshots should re-read the same frame");

        buf.publish(bytes(9));
        const auto s3 = buf.snapshot();
        check((*s3.jpeg)[0] == 9, "snapshot should follow the latest publish");
        check(s3.seq == s1.seq + 1, "each publish should advance the sequence");

        buf.publish(nullptr);
        check(buf.snapshot().seq == s3.seq, "null publish should be ignored");
    }

    void test_generation_fence() {
        fr::FrameBuffer buf;
        buf.set_owner(3);

        check(!buf.publish(bytes(1), 2), "publish from a superseded generation should be dropped");
        check(buf.snapshot().empty(), "dropped publish should leave the buffer empty");

        check(buf.publish(bytes(2), 3), "publish from the owning generation should be accepted");
        check((*buf.snapshot().jpeg)[0] == 2, "owner publish should be visible");

        buf.set_owner(0);
        check(!buf.publish(bytes(3), 3), "after the owner is revoked nobody may publish");
        check((*buf.snapshot().jpeg)[0] == 2, "revoking the owner keeps the last frame");
    }

    void test_wait_for_frame() {
        fr::FrameBuffer buf;

        const auto t0 = std::chrono::steady_clock::now();
        const auto s = buf.wait_for_frame(0, std::chrono::milliseconds(30));
        const auto waited = std::chrono::steady_clock::now() - t0;
        check(s.empty(), "wait_for_frame should time out with an empty snapshot");
        check(waited >= std::chrono::milliseconds(25), "wait_for_frame should honor its timeout");

        std::thread writer([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            buf.publish(bytes(5));
        });
        const auto got = buf.wait_for_frame(0, std::chrono::milliseconds(2000));
        writer.join();
        check(!got.empty() && (*got.jpeg)[0] == 5, "wait_for_frame should wake on publish");
    }

    void test_readers_never_see_partial_frames() {
        fr::FrameBuffer buf;
        std::atomic<bool> stop{false};
        std::atomic<int> torn{0};
        std::atomic<int> observed{0};

        std::thread writer([&] {
            for (int i = 0; i < 2000; ++i) {
                buf.publish(bytes(static_cast<uint8_t>(i % 251), 4096));
            }
            stop = true;
        });

        std::vector<std::thread> readers;
        for (int r = 0; r < 4; ++r) {
            readers.emplace_back([&] {
                while (!stop) {
                    const auto s = buf.snapshot();
                    if (s.empty()) continue;
                    ++observed;
                    const uint8_t first = (*s.jpeg)[0];
                    for (uint8_t b : *s.jpeg) {
                        if (b != first) { ++torn; break; }
                    }
                }
            });
        }

        writer.join();
        for (auto& t : readers) t.join();

        check(torn == 0, "readers should never observe a mixed frame");
        check(buf.sequence() == 2000, "every publish should be counted");
    }
}

int main() {
    test_snapshot_empty_before_publish();
    test_snapshot_returns_last_publish();
    test_generation_fence();
    test_wait_for_frame();
    test_readers_never_see_partial_frames();
    return fr::test::finish("frame buffer");
}
