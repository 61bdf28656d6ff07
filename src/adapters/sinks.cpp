#include "hzd/adapters.hpp"
#include "hzd/logger.hpp"
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace hzd {

bool PreviewOverlay::open() {
    updates_ = 0;
    if (show_window_) cv::namedWindow("hazard-vision", cv::WINDOW_AUTOSIZE);
    return true;
}

void PreviewOverlay::update(const Dets& dets) {
    ++updates_;
    for (const auto& d : dets) {
        Logger::debug("overlay: %s %.2f [%.0f,%.0f,%.0f,%.0f]", d.label.c_str(), d.score,
                      d.box.left, d.box.top, d.box.right, d.box.bottom);
    }
    if (!show_window_) return;

    if (!fixed_canvas_) {
        for (const auto& d : dets) {
            canvas_.width = std::max(canvas_.width, static_cast<int>(std::ceil(d.box.right)));
            canvas_.height = std::max(canvas_.height, static_cast<int>(std::ceil(d.box.bottom)));
        }
    }
    if (canvas_.area() <= 0) return;

    cv::Mat view(canvas_, CV_8UC3, cv::Scalar(0, 0, 0));
    for (const auto& d : dets) {
        cv::Rect r(d.box.rect());
        cv::rectangle(view, r, {0, 0, 255}, 2);
        std::string caption = d.label + " " + cv::format("%.2f", d.score);
        cv::putText(view, caption, cv::Point(r.x, std::max(0, r.y - 6)),
                    cv::FONT_HERSHEY_SIMPLEX, 0.55, {0, 0, 255}, 2);
    }
    cv::imshow("hazard-vision", view);
    cv::waitKey(1);
}

void PreviewOverlay::release() {
    if (show_window_) cv::destroyWindow("hazard-vision");
}

void LogAlertSink::speak(const std::string& message) {
    Logger::info("[speak] %s", message.c_str());
}

}  // namespace hzd
