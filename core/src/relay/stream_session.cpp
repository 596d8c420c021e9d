#include <relay/stream_session.hpp>

#include <thread>
#include <utility>

namespace fr {
    StreamSession::StreamSession(const FrameBuffer& buffer, Options opt, AlivePredicate alive)
        : buffer_(buffer), opt_(std::move(opt)), alive_(std::move(alive)) {}

    std::string StreamSession::content_type(const std::string& boundary) {
        return "multipart/x-mixed-replace; boundary=" + boundary;
    }

    std::string StreamSession::make_chunk(const JpegBytes& jpeg, const std::string& boundary) {
        std::string out;
        out.reserve(jpeg.size() + boundary.size() + 48U);
        out += "--" + boundary + "\r\n";
        out += "Content-Type: image/jpeg\r\n\r\n";
        out.append(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
        out += "\r\n";
        return out;
    }

    bool StreamSession::next(std::string& chunk) {
        if (chunks_sent_ > 0) std::this_thread::sleep_for(opt_.pacing);

        while (alive_now_()) {
            const FrameBuffer::Snapshot snap = buffer_.snapshot();
            const bool repeat = opt_.skip_duplicates && chunks_sent_ > 0 && snap.seq == last_seq_;

            // nothing published yet (or nothing new): wait, never send an empty part
            if (snap.empty() || repeat) {
                buffer_.wait_for_frame(snap.seq, opt_.pacing);
                continue;
            }

            chunk = make_chunk(*snap.jpeg, opt_.boundary);
            last_seq_ = snap.seq;
            ++chunks_sent_;
            return true;
        }
        return false;
    }
}
