#pragma once
#include "types.hpp"

namespace hzd {
constexpr float kIoUEpsilon = 1e-6f;

// Intersection over union of two axis-aligned boxes; 0 when disjoint.
float IoU(const Box& a, const Box& b);

// Greedy non-max suppression. Result is ordered by descending score, equal
// scores keep their input order.
Dets NMS(const Dets& ds, float iou_thr);
}
