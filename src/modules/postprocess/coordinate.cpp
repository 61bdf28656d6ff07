#include "hzd/coordinate.hpp"
#include <algorithm>

namespace hzd {
Box scale(const Box& b, cv::Size2f from, cv::Size2f to) {
    if (from.width <= 0.f || from.height <= 0.f) return b;
    const float sx = to.width / from.width;
    const float sy = to.height / from.height;
    return Box{b.left * sx, b.top * sy, b.right * sx, b.bottom * sy};
}

void scale_all(Dets& ds, cv::Size2f from, cv::Size2f to) {
    for (auto& d : ds) d.box = scale(d.box, from, to);
}

Box clamp(const Box& b, cv::Size2f bounds) {
    auto cx = [&](float v) { return std::min(std::max(v, 0.f), bounds.width); };
    auto cy = [&](float v) { return std::min(std::max(v, 0.f), bounds.height); };
    return Box{cx(b.left), cy(b.top), cx(b.right), cy(b.bottom)};
}
}
