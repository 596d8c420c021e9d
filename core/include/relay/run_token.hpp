#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace fr {
    // Cancellation signal + liveness flag for one capture loop run. The
    // controller cancels and waits; the loop waits on it instead of sleeping.
    class RunToken {
    public:
        explicit RunToken(uint64_t generation) : generation_(generation) {}

        RunToken(const RunToken&) = delete;
        RunToken& operator=(const RunToken&) = delete;

        uint64_t generation() const { return generation_; }

        void cancel() {
            {
                std::lock_guard lk(m_);
                cancelled_ = true;
            }
            cv_.notify_all();
        }

        bool cancelled() const {
            std::lock_guard lk(m_);
            return cancelled_;
        }

        // Interruptible sleep. true if cancelled before or during the wait.
        bool wait_cancelled(std::chrono::milliseconds d) const {
            std::unique_lock lk(m_);
            return cv_.wait_for(lk, d, [&] { return cancelled_; });
        }

        void mark_exited() {
            {
                std::lock_guard lk(m_);
                exited_ = true;
            }
            cv_.notify_all();
        }

        bool exited() const {
            std::lock_guard lk(m_);
            return exited_;
        }

        bool wait_exited(std::chrono::milliseconds d) const {
            std::unique_lock lk(m_);
            return cv_.wait_for(lk, d, [&] { return exited_; });
        }

    private:
        const uint64_t generation_;

        mutable std::mutex m_;
        mutable std::condition_variable cv_;
        bool cancelled_ = false;
        bool exited_ = false;
    };
}
