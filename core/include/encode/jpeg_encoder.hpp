#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include <opencv2/core.hpp>

namespace fr {
    using FrameEncoder = std::function<bool(const cv::Mat& bgr, std::vector<uint8_t>& out)>;

    // false on empty/unsupported input or codec failure; never throws
    bool encode_jpeg(const cv::Mat& bgr, int quality, std::vector<uint8_t>& out);

    FrameEncoder jpeg_encoder(int quality);
}
