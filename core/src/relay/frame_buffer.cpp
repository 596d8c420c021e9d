#include <relay/frame_buffer.hpp>

namespace fr {
    void FrameBuffer::store_(JpegPtr jpeg) {
        latest_ = std::move(jpeg);
        ++seq_;
    }

    void FrameBuffer::publish(JpegPtr jpeg) {
        if (!jpeg) return;
        {
            std::lock_guard lk(mtx_);
            store_(std::move(jpeg));
        }
        cv_.notify_all();
    }

    bool FrameBuffer::publish(JpegPtr jpeg, uint64_t generation) {
        if (!jpeg) return false;
        {
            std::lock_guard lk(mtx_);
            if (generation != owner_) return false;
            store_(std::move(jpeg));
        }
        cv_.notify_all();
        return true;
    }

    void FrameBuffer::set_owner(uint64_t generation) {
        std::lock_guard lk(mtx_);
        owner_ = generation;
    }

    FrameBuffer::Snapshot FrameBuffer::snapshot() const {
        std::lock_guard lk(mtx_);
        return Snapshot{latest_, seq_};
    }

    uint64_t FrameBuffer::sequence() const {
        std::lock_guard lk(mtx_);
        return seq_;
    }

    FrameBuffer::Snapshot FrameBuffer::wait_for_frame(uint64_t after_seq, std::chrono::milliseconds timeout) const {
        std::unique_lock lk(mtx_);
        cv_.wait_for(lk, timeout, [&] { return seq_ > after_seq && latest_ && !latest_->empty(); });
        return Snapshot{latest_, seq_};
    }
}
