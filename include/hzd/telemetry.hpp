#pragma once
#include "hazard.hpp"
#include "snapshot.hpp"
#include "types.hpp"
#include <array>
#include <cstdint>

namespace hzd {
struct PerformanceSnapshot {
    float fps{0.f};
    float processing_time_ms{0.f};   // mean of the rolling window
    std::uint64_t total_detections{0};
    float avg_confidence{0.f};
    std::int64_t session_duration_ms{0};
    std::uint64_t frames_processed{0};
    std::uint64_t frames_failed{0};
};

struct HazardStatsSnapshot {
    std::array<std::uint64_t, kHazardCategoryCount> counts{};

    std::uint64_t count(HazardCategory c) const {
        return c == HazardCategory::Unknown ? 0 : counts[static_cast<std::size_t>(c)];
    }
    std::uint64_t total() const {
        std::uint64_t t = 0;
        for (auto v : counts) t += v;
        return t;
    }
};

using RecentDetections = Dets;

// Everything a UI or overlay observer can read while a session runs.
struct TelemetryHub {
    SnapshotChannel<PerformanceSnapshot> performance;
    SnapshotChannel<HazardStatsSnapshot> hazards;
    SnapshotChannel<RecentDetections> recent;
    SnapshotChannel<Dets> detections;     // current frame, display space
    ThresholdControl confidence{0.25f};

    void reset() {
        performance.publish(PerformanceSnapshot{});
        hazards.publish(HazardStatsSnapshot{});
        recent.publish(RecentDetections{});
        detections.publish(Dets{});
    }
};
}
