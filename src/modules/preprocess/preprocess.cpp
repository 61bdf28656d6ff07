#include "hzd/preprocess.hpp"
#include "hzd/logger.hpp"
#include <opencv2/imgproc.hpp>

namespace hzd {

PreprocessOptions PreprocessOptions::from_model(const ModelConfig& m) {
    PreprocessOptions o;
    o.normalization = m.normalization;
    if (m.normalization == Normalization::MeanStd) {
        o.mean = cv::Scalar(m.mean[0], m.mean[1], m.mean[2]);
        o.stddev = cv::Scalar(m.stddev[0], m.stddev[1], m.stddev[2]);
    }
    return o;
}

cv::Mat frame_view(const RawFrame& frame) {
    if (frame.width <= 0 || frame.height <= 0) return {};
    const int stride = frame.stride > 0 ? frame.stride : frame.width * 4;
    if (stride < frame.width * 4) return {};
    // The last row only needs width*4 bytes, padding after it is optional.
    const size_t needed = static_cast<size_t>(stride) * (frame.height - 1) + static_cast<size_t>(frame.width) * 4;
    if (frame.pixels.size() < needed) return {};
    return cv::Mat(frame.height, frame.width, CV_8UC4,
                   const_cast<std::uint8_t*>(frame.pixels.data()), static_cast<size_t>(stride));
}

bool FramePreprocessor::prepare(const RawFrame& frame, cv::Size target, Tensor& out) const {
    out.data.release();
    if (frame.width <= 0 || frame.height <= 0) {
        Logger::warn("preprocess: empty frame %dx%d", frame.width, frame.height);
        return false;
    }
    if (target.width <= 0 || target.height <= 0) {
        Logger::warn("preprocess: bad target size %dx%d", target.width, target.height);
        return false;
    }
    cv::Mat src = frame_view(frame);
    if (src.empty()) {
        Logger::warn("preprocess: frame %ld buffer too short (stride %d, %zu bytes)",
                     frame.id, frame.stride, frame.pixels.size());
        return false;
    }

    thread_local cv::Mat resized;
    cv::resize(src, resized, target, 0, 0, cv::INTER_LINEAR);

    thread_local cv::Mat rgb;
    cv::cvtColor(resized, rgb, frame.order == PixelOrder::RGBA ? cv::COLOR_RGBA2RGB : cv::COLOR_BGRA2RGB);

    cv::Mat f32;
    rgb.convertTo(f32, CV_32FC3, 1.0 / 255.0);
    if (opts_.normalization == Normalization::MeanStd) {
        cv::subtract(f32, opts_.mean, f32);
        cv::divide(f32, opts_.stddev, f32);
    }
    if (!f32.isContinuous()) f32 = f32.clone();
    out.data = f32;
    return true;
}

}  // namespace hzd
