#pragma once
#include "types.hpp"
#include <opencv2/core.hpp>

namespace hzd {
// Independent linear scaling per axis. The pipeline never letterboxes, so
// there is no offset or aspect correction.
Box scale(const Box& b, cv::Size2f from, cv::Size2f to);

void scale_all(Dets& ds, cv::Size2f from, cv::Size2f to);

// Clamps every edge into [0, bounds].
Box clamp(const Box& b, cv::Size2f bounds);
}
