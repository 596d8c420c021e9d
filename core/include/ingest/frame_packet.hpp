#pragma once

#include <cstdint>
#include <opencv2/core.hpp>

namespace fr {
    struct FramePacket {
        cv::Mat bgr;
        int64_t pts_ns = 0;
        int64_t frame_id = 0;
    };
}
