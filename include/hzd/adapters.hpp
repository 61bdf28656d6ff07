#pragma once
#include "interfaces.hpp"
#include "model_config.hpp"
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/videoio.hpp>
#include <atomic>
#include <string>
#include <vector>

namespace hzd {
// Camera index or video file through cv::VideoCapture, delivered as BGRA
// frames. A file that runs out reports Ended.
class VideoFrameSource : public FrameSource {
public:
    explicit VideoFrameSource(std::string source) : source_(std::move(source)) {}
    ~VideoFrameSource() override { close(); }

    bool open() override;
    FrameStatus acquire_latest_frame(RawFrame& out) override;
    void close() override;

private:
    std::string source_;
    cv::VideoCapture cap_;
    bool is_camera_{false};
    long next_id_{0};
};

// OpenCV DNN runner producing the raw output layout the model declares.
class DnnRuntime : public InferenceRuntime {
public:
    bool load(const ModelConfig& model);
    bool infer(const Tensor& input, RawOutput& out) override;
    bool ready() const { return ready_; }

private:
    bool to_dense(const cv::Mat& pred, RawOutput& out) const;
    bool to_filtered(const std::vector<cv::Mat>& outs, RawOutput& out) const;

    cv::dnn::Net net_;
    OutputLayout layout_{OutputLayout::DenseGrid};
    bool ready_{false};
};

// Logs each published set; optionally draws the boxes in a window. With an
// empty canvas size the window grows to fit the boxes it has seen.
class PreviewOverlay : public OverlaySink {
public:
    PreviewOverlay(bool show_window, cv::Size canvas)
        : show_window_(show_window), fixed_canvas_(canvas.area() > 0), canvas_(canvas) {}

    bool open() override;
    void update(const Dets& dets) override;
    void release() override;

    unsigned long updates() const { return updates_; }

private:
    bool show_window_;
    bool fixed_canvas_;
    cv::Size canvas_;
    std::atomic<unsigned long> updates_{0};
};

class LogAlertSink : public AlertSink {
public:
    void speak(const std::string& message) override;
};
}  // namespace hzd
