#pragma once

#include <string>

#include <ingest/frame_packet.hpp>

namespace fr {
    enum class ReadStatus {
        Frame,
        EndOfStream,
        Error
    };

    // One capture session. close() may be called from a thread other than the
    // one blocked in read(); read() must return promptly once closed.
    struct IFrameSource {
        virtual ~IFrameSource() = default;
        virtual bool open() = 0;
        virtual void close() = 0;
        virtual bool is_open() const = 0;
        virtual ReadStatus read(FramePacket& out, int timeout_ms) = 0;
        virtual const std::string& id() const = 0;
    };

    inline const char* to_string(ReadStatus s) {
        switch (s) {
            case ReadStatus::Frame: return "frame";
            case ReadStatus::EndOfStream: return "eos";
            case ReadStatus::Error: return "error";
        }
        return "unk";
    }
}
