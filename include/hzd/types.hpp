#pragma once
#include "hazard.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace hzd {
struct Box {
    float left{0.f}, top{0.f}, right{0.f}, bottom{0.f};

    float width() const { return right - left; }
    float height() const { return bottom - top; }
    float area() const { return width() > 0.f && height() > 0.f ? width() * height() : 0.f; }
    bool valid() const { return right > left && bottom > top; }
    cv::Rect2f rect() const { return {left, top, width(), height()}; }
};

struct Detection {
    Box box;
    std::string label;
    int class_id{-1};
    HazardCategory category{HazardCategory::Unknown};
    float score{0.f};
};
using Dets = std::vector<Detection>;

enum class PixelOrder { RGBA, BGRA };

// One captured frame: 4 bytes per pixel, rows `stride` bytes apart
// (stride >= width * 4 when the producer pads rows).
struct RawFrame {
    int width{0};
    int height{0};
    int stride{0};
    PixelOrder order{PixelOrder::RGBA};
    std::vector<std::uint8_t> pixels;
    long id{0};
};

// HxWx3 float, RGB, continuous.
struct Tensor {
    cv::Mat data;

    int width() const { return data.cols; }
    int height() const { return data.rows; }
    const float* ptr() const { return data.ptr<float>(); }
    std::size_t size() const { return data.total() * 3; }
};

// Already confidence-filtered by the model: N entries of
// (xMin, yMin, xMax, yMax) in the model's native square space.
struct FilteredOutput {
    std::vector<float> boxes;
    std::vector<std::int64_t> labels;
    std::vector<float> scores;
};

// Channel-major [C][B]: data[c * anchors + b].
struct DenseGridOutput {
    int channels{0};
    int anchors{0};
    std::vector<float> data;

    float at(int c, int b) const { return data[static_cast<std::size_t>(c) * anchors + b]; }
};

using RawOutput = std::variant<FilteredOutput, DenseGridOutput>;
}  // namespace hzd
