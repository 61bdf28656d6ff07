#pragma once
#include "telemetry.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <deque>
#include <utility>

namespace hzd {
using Clock = std::chrono::steady_clock;

// Session-scoped telemetry. Owned by the detection loop and touched only from
// its thread; observers read the published copies.
class DetectionAggregator {
public:
    static constexpr std::size_t kWindow = 10;
    static constexpr std::size_t kRecentCapacity = 10;

    DetectionAggregator() { reset(Clock::now()); }

    void reset(Clock::time_point session_start);

    std::pair<PerformanceSnapshot, HazardStatsSnapshot>
    update(const Dets& dets, Clock::time_point frame_start, Clock::time_point now);

    // The frame about to be aggregated had an inference or decode failure.
    void mark_failed() { ++frames_failed_; }

    const PerformanceSnapshot& performance() const { return perf_; }
    const HazardStatsSnapshot& hazards() const { return hazards_; }
    RecentDetections recent() const { return RecentDetections(recent_.begin(), recent_.end()); }

private:
    Clock::time_point session_start_;
    std::uint64_t frames_{0};
    std::uint64_t frames_failed_{0};
    std::uint64_t total_detections_{0};
    double confidence_sum_{0.0};
    std::deque<float> processing_ms_;
    std::deque<Detection> recent_;
    PerformanceSnapshot perf_;
    HazardStatsSnapshot hazards_;
};
}
