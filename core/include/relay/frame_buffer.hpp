#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace fr {
    using JpegBytes = std::vector<uint8_t>;
    using JpegPtr = std::shared_ptr<const JpegBytes>;

    // Single-slot "latest encoded frame". Last write wins; readers copy a
    // shared pointer under the lock and never hold it across I/O.
    class FrameBuffer {
    public:
        struct Snapshot {
            JpegPtr jpeg;
            uint64_t seq = 0;

            bool empty() const { return !jpeg || jpeg->empty(); }
        };

        FrameBuffer() = default;
        FrameBuffer(const FrameBuffer&) = delete;
        FrameBuffer& operator=(const FrameBuffer&) = delete;

        void publish(JpegPtr jpeg);

        // Publishes only while `generation` owns the buffer. Returns false when
        // the write was dropped.
        bool publish(JpegPtr jpeg, uint64_t generation);

        void set_owner(uint64_t generation);

        Snapshot snapshot() const;
        uint64_t sequence() const;

        // Waits until a frame newer than `after_seq` is present or the timeout
        // expires, then returns the current snapshot (possibly unchanged).
        Snapshot wait_for_frame(uint64_t after_seq, std::chrono::milliseconds timeout) const;

    private:
        void store_(JpegPtr jpeg);

        mutable std::mutex mtx_;
        mutable std::condition_variable cv_;

        JpegPtr latest_;
        uint64_t seq_ = 0;
        uint64_t owner_ = 0;
    };
}
