#pragma once

#include "model_config.hpp"
#include "types.hpp"

#include <opencv2/core.hpp>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace hzd {

// Turns one raw inference output into candidate detections in model input
// space, scaled to `target`. A false return is a frame-local error (wrong
// variant, inconsistent lengths, unusable shape) and leaves `out` empty.
class OutputDecoder {
public:
    virtual ~OutputDecoder() = default;

    virtual bool decode(const RawOutput& output, float conf_threshold,
                        cv::Size target, Dets& out) const = 0;
    virtual OutputLayout layout() const = 0;
};

class FilteredDecoder : public OutputDecoder {
public:
    FilteredDecoder(std::vector<std::string> class_names, int native_size);

    bool decode(const RawOutput& output, float conf_threshold,
                cv::Size target, Dets& out) const override;
    OutputLayout layout() const override { return OutputLayout::Filtered; }

private:
    std::vector<std::string> class_names_;
    int native_size_;
};

class DenseGridDecoder : public OutputDecoder {
public:
    DenseGridDecoder(std::vector<std::string> class_names, DenseGridOptions opts = {});

    bool decode(const RawOutput& output, float conf_threshold,
                cv::Size target, Dets& out) const override;
    OutputLayout layout() const override { return OutputLayout::DenseGrid; }

    const DenseGridOptions& options() const { return opts_; }

private:
    std::vector<std::string> class_names_;
    DenseGridOptions opts_;
};

std::unique_ptr<OutputDecoder> make_decoder(const ModelConfig& model);

inline float sigmoid(float x) { return 1.0f / (1.0f + std::exp(-x)); }

} // namespace hzd
