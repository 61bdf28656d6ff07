#include "hzd/adapters.hpp"
#include "hzd/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace hzd {

bool VideoFrameSource::open() {
    close();
    // Allow numeric index or file/URL
    is_camera_ = !source_.empty() &&
                 std::all_of(source_.begin(), source_.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    if (is_camera_) cap_.open(std::stoi(source_));
    else cap_.open(source_);

    if (!cap_.isOpened()) {
        Logger::error("Unable to open video source: %s", source_.c_str());
        return false;
    }
    next_id_ = 0;
    Logger::info("Opened video source: %s", source_.c_str());
    return true;
}

FrameStatus VideoFrameSource::acquire_latest_frame(RawFrame& out) {
    if (!cap_.isOpened()) return FrameStatus::Ended;

    cv::Mat bgr;
    if (!cap_.read(bgr) || bgr.empty()) {
        // A camera may just have nothing yet; a file is done.
        return is_camera_ ? FrameStatus::NoFrame : FrameStatus::Ended;
    }

    cv::Mat bgra;
    cv::cvtColor(bgr, bgra, cv::COLOR_BGR2BGRA);
    out.width = bgra.cols;
    out.height = bgra.rows;
    out.stride = static_cast<int>(bgra.step[0]);
    out.order = PixelOrder::BGRA;
    out.pixels.resize(bgra.step[0] * bgra.rows);
    for (int y = 0; y < bgra.rows; ++y) {
        std::memcpy(out.pixels.data() + y * bgra.step[0], bgra.ptr(y), bgra.step[0]);
    }
    out.id = ++next_id_;
    return FrameStatus::Ready;
}

void VideoFrameSource::close() {
    if (cap_.isOpened()) cap_.release();
}

}  // namespace hzd
