#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include <relay/frame_buffer.hpp>

namespace fr {
    // One viewer's view of the relay: an endless, lazily produced sequence of
    // multipart chunks. Ends when `alive` turns false; never restarted.
    class StreamSession {
    public:
        struct Options {
            std::chrono::milliseconds pacing{33};
            std::string boundary = "frame";
            bool skip_duplicates = false;
        };

        using AlivePredicate = std::function<bool()>;

        StreamSession(const FrameBuffer& buffer, Options opt, AlivePredicate alive);

        // Blocks until the next chunk is due and a frame exists. false once the
        // session is no longer alive; `chunk` is untouched in that case.
        bool next(std::string& chunk);

        uint64_t chunks_sent() const { return chunks_sent_; }

        static std::string content_type(const std::string& boundary);
        static std::string make_chunk(const JpegBytes& jpeg, const std::string& boundary);

    private:
        bool alive_now_() const { return !alive_ || alive_(); }

        const FrameBuffer& buffer_;
        Options opt_;
        AlivePredicate alive_;

        uint64_t last_seq_ = 0;
        uint64_t chunks_sent_ = 0;
    };
}
