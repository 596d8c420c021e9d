#include <encode/jpeg_encoder.hpp>

#include <iostream>
#include <opencv2/imgcodecs.hpp>

namespace fr {
    bool encode_jpeg(const cv::Mat& bgr, int quality, std::vector<uint8_t>& out) {
        out.clear();
        if (bgr.empty()) return false;
        if (bgr.depth() != CV_8U || (bgr.channels() != 1 && bgr.channels() != 3)) return false;

        std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
        try {
            if (!cv::imencode(".jpg", bgr, out, params)) {
                out.clear();
                return false;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "[Encode] imencode threw: " << e.what() << "\n";
            out.clear();
            return false;
        } catch (const std::exception& e) {
            std::cerr << "[Encode] imencode failed: " << e.what() << "\n";
            out.clear();
            return false;
        }
        return !out.empty();
    }

    FrameEncoder jpeg_encoder(int quality) {
        return [quality](const cv::Mat& bgr, std::vector<uint8_t>& out) {
            return encode_jpeg(bgr, quality, out);
        };
    }
}
