#pragma once
#include "model_config.hpp"
#include "types.hpp"
#include <opencv2/core.hpp>

namespace hzd {
struct PreprocessOptions {
    Normalization normalization = Normalization::UnitScale;
    cv::Scalar mean{0, 0, 0};
    cv::Scalar stddev{1, 1, 1};

    static PreprocessOptions from_model(const ModelConfig& m);
};

class FramePreprocessor {
public:
    explicit FramePreprocessor(PreprocessOptions opts = {}) : opts_(opts) {}

    // Stride-aware bilinear resample to `target`, RGB, normalized. Returns
    // false (and leaves `out` empty) when the frame cannot be read.
    bool prepare(const RawFrame& frame, cv::Size target, Tensor& out) const;

    const PreprocessOptions& options() const { return opts_; }

private:
    PreprocessOptions opts_;
};

// Wraps the frame's pixel buffer without copying; empty Mat if malformed.
cv::Mat frame_view(const RawFrame& frame);
}
