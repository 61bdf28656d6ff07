#include "hzd/adapters.hpp"
#include "hzd/logger.hpp"

namespace hzd {

bool DnnRuntime::load(const ModelConfig& model) {
    ready_ = false;
    layout_ = model.layout;
    try {
        net_ = cv::dnn::readNet(model.model_path);
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    } catch (const cv::Exception& e) {
        Logger::error("Could not load model %s: %s", model.model_path.c_str(), e.what());
        return false;
    }
    if (net_.empty()) {
        Logger::error("Model %s loaded empty", model.model_path.c_str());
        return false;
    }
    ready_ = true;
    Logger::info("Loaded OpenCV DNN model: %s (%s)", model.model_path.c_str(), layout_name(layout_));
    return true;
}

bool DnnRuntime::infer(const Tensor& input, RawOutput& out) {
    if (!ready_ || input.data.empty()) return false;

    // Tensor is already RGB and normalized; only repack HWC -> NCHW.
    cv::Mat blob = cv::dnn::blobFromImage(input.data, 1.0, input.data.size(), cv::Scalar(), false, false, CV_32F);
    net_.setInput(blob);

    if (layout_ == OutputLayout::DenseGrid) {
        cv::Mat pred = net_.forward();
        return to_dense(pred, out);
    }
    std::vector<cv::Mat> outs;
    net_.forward(outs, net_.getUnconnectedOutLayersNames());
    return to_filtered(outs, out);
}

// Expects [1, C, B] or [C, B].
bool DnnRuntime::to_dense(const cv::Mat& pred, RawOutput& out) const {
    int channels = 0, anchors = 0;
    if (pred.dims == 3 && pred.size[0] == 1) {
        channels = pred.size[1];
        anchors = pred.size[2];
    } else if (pred.dims == 2) {
        channels = pred.size[0];
        anchors = pred.size[1];
    } else {
        Logger::warn("dnn: unexpected dense output rank %d", pred.dims);
        return false;
    }
    cv::Mat flat = pred.isContinuous() ? pred : pred.clone();
    const float* p = flat.ptr<float>();

    DenseGridOutput g;
    g.channels = channels;
    g.anchors = anchors;
    g.data.assign(p, p + static_cast<size_t>(channels) * anchors);
    out = std::move(g);
    return true;
}

// Expects boxes [1, N, 4], labels [1, N], scores [1, N] in that order.
bool DnnRuntime::to_filtered(const std::vector<cv::Mat>& outs, RawOutput& out) const {
    if (outs.size() < 3) {
        Logger::warn("dnn: filtered model returned %zu outputs, need 3", outs.size());
        return false;
    }
    auto floats = [](const cv::Mat& m) {
        cv::Mat f;
        m.convertTo(f, CV_32F);
        if (!f.isContinuous()) f = f.clone();
        const float* p = f.ptr<float>();
        return std::vector<float>(p, p + f.total());
    };

    FilteredOutput f;
    f.boxes = floats(outs[0]);
    for (float v : floats(outs[1])) f.labels.push_back(static_cast<std::int64_t>(v));
    f.scores = floats(outs[2]);
    out = std::move(f);
    return true;
}

}  // namespace hzd
