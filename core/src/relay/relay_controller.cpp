#include <relay/relay_controller.hpp>

#include <iostream>
#include <utility>

namespace fr {
    static const char* kOpenFailedMessage = "Could not open video source.";

    const char* to_string(RelayState s) {
        switch (s) {
            case RelayState::Idle: return "idle";
            case RelayState::Starting: return "starting";
            case RelayState::Running: return "running";
            case RelayState::Stopping: return "stopping";
        }
        return "unk";
    }

    RelayController::RelayController(std::shared_ptr<FrameBuffer> buffer,
                                     FrameSourceFactory factory,
                                     FrameEncoder encoder,
                                     Options opt)
        : buffer_(std::move(buffer)),
          factory_(std::move(factory)),
          encoder_(std::move(encoder)),
          opt_(opt) {}

    RelayController::~RelayController() {
        shutdown();
    }

    void RelayController::set_state_(RelayState s) {
        std::lock_guard lk(state_mtx_);
        state_ = s;
    }

    RelayState RelayController::state() const {
        std::lock_guard lk(state_mtx_);
        return state_;
    }

    std::optional<SourceDescriptor> RelayController::active_source() const {
        std::lock_guard lk(state_mtx_);
        return active_;
    }

    RelayStatus RelayController::status() const {
        std::lock_guard lk(state_mtx_);
        RelayStatus st;
        st.state = state_;
        st.source = active_;
        st.generation = token_ ? token_->generation() : 0;
        st.stop_timeouts = stop_timeouts_;
        if (loop_) st.capture = loop_->stats();
        return st;
    }

    StartResult RelayController::start(const SourceDescriptor& desc) {
        std::lock_guard ctl(control_mtx_);

        const std::optional<SourceDescriptor> previous = active_source();
        stop_locked_();

        if (launch_locked_(desc)) {
            std::cerr << "[Relay] Started video stream from: " << desc.to_string() << "\n";
            return {true, "Stream started from " + desc.to_string()};
        }

        std::cerr << "[Relay] Failed to open video source: " << desc.to_string() << "\n";

        if (previous && opt_.restore_previous_on_failure) {
            std::cerr << "[Relay] Restoring previous source: " << previous->to_string() << "\n";
            if (!launch_locked_(*previous)) {
                std::cerr << "[Relay] Previous source " << previous->to_string()
                          << " could not be reopened, relay is idle.\n";
            }
        }
        return {false, kOpenFailedMessage};
    }

    void RelayController::shutdown() {
        std::lock_guard ctl(control_mtx_);
        stop_locked_();
    }

    std::unique_ptr<IFrameSource> RelayController::open_source_(const SourceDescriptor& desc) {
        std::unique_ptr<IFrameSource> src;
        try {
            src = factory_(desc);
            if (!src) return nullptr;
            if (src->open()) return src;
        } catch (const std::exception& e) {
            std::cerr << "[Relay] open of " << desc.to_string() << " threw: " << e.what() << "\n";
        }
        if (src) src->close();
        return nullptr;
    }

    bool RelayController::launch_locked_(const SourceDescriptor& desc) {
        set_state_(RelayState::Starting);

        std::shared_ptr<IFrameSource> src = open_source_(desc);
        if (!src) {
            set_state_(RelayState::Idle);
            return false;
        }

        std::shared_ptr<RunToken> token;
        std::shared_ptr<CaptureLoop> loop;
        {
            std::lock_guard lk(state_mtx_);
            token = std::make_shared<RunToken>(++next_generation_);
            loop = std::make_shared<CaptureLoop>(src, buffer_, token, encoder_, opt_.loop);
        }

        // the buffer only accepts frames from the newest generation
        buffer_->set_owner(token->generation());
        loop_thread_ = std::thread([loop] { loop->run(); });

        std::lock_guard lk(state_mtx_);
        source_ = std::move(src);
        token_ = std::move(token);
        loop_ = std::move(loop);
        active_ = desc;
        state_ = RelayState::Running;
        return true;
    }

    void RelayController::stop_locked_() {
        std::shared_ptr<RunToken> token;
        std::shared_ptr<IFrameSource> source;
        {
            std::lock_guard lk(state_mtx_);
            if (!token_) {
                state_ = RelayState::Idle;
                return;
            }
            state_ = RelayState::Stopping;
            token = token_;
            source = source_;
        }

        token->cancel();
        buffer_->set_owner(0);

        if (token->wait_exited(opt_.stop_timeout)) {
            if (loop_thread_.joinable()) loop_thread_.join();
        } else {
            std::cerr << "[Relay] WARNING: capture loop (generation " << token->generation()
                      << ") did not exit within " << opt_.stop_timeout.count()
                      << " ms; closing its source anyway and detaching it.\n";
            // the detached loop keeps its own references; its late publishes are fenced out
            if (loop_thread_.joinable()) loop_thread_.detach();
            std::lock_guard lk(state_mtx_);
            ++stop_timeouts_;
        }

        if (source) source->close();

        std::lock_guard lk(state_mtx_);
        source_.reset();
        token_.reset();
        loop_.reset();
        active_.reset();
        state_ = RelayState::Idle;
    }
}
