#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include <common/config.hpp>

namespace fr {
    class RelaySystem;

    class MJPEGServer {
    public:
        MJPEGServer(ServerConfig cfg, RelaySystem& relay);
        ~MJPEGServer();

        MJPEGServer(const MJPEGServer&) = delete;
        MJPEGServer& operator=(const MJPEGServer&) = delete;

        // Binds synchronously, then serves on a background thread.
        bool start();
        void stop();

        bool is_running() const { return running_.load(); }
        size_t active_viewers() const { return viewers_.load(); }
        size_t viewer_limit() const;

    private:
        void register_routes_();

        struct Impl;
        std::unique_ptr<Impl> impl_;

        ServerConfig cfg_;
        RelaySystem& relay_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};
        std::atomic<size_t> viewers_{0};
    };
}
