#include "hzd/aggregator.hpp"
#include <numeric>

namespace hzd {

void DetectionAggregator::reset(Clock::time_point session_start) {
    session_start_ = session_start;
    frames_ = 0;
    frames_failed_ = 0;
    total_detections_ = 0;
    confidence_sum_ = 0.0;
    processing_ms_.clear();
    recent_.clear();
    perf_ = PerformanceSnapshot{};
    hazards_ = HazardStatsSnapshot{};
}

std::pair<PerformanceSnapshot, HazardStatsSnapshot>
DetectionAggregator::update(const Dets& dets, Clock::time_point frame_start, Clock::time_point now) {
    using ms = std::chrono::duration<double, std::milli>;

    ++frames_;
    total_detections_ += dets.size();

    processing_ms_.push_back(static_cast<float>(ms(now - frame_start).count()));
    while (processing_ms_.size() > kWindow) processing_ms_.pop_front();

    HazardStatsSnapshot hz = hazards_;
    for (const auto& d : dets) {
        confidence_sum_ += d.score;
        if (d.category != HazardCategory::Unknown) ++hz.counts[static_cast<std::size_t>(d.category)];
    }

    // Newest first; within a frame the best-scoring item ends up at the front.
    for (auto it = dets.rbegin(); it != dets.rend(); ++it) recent_.push_front(*it);
    while (recent_.size() > kRecentCapacity) recent_.pop_back();

    const double session_ms = ms(now - session_start_).count();

    PerformanceSnapshot p;
    p.fps = session_ms >= 1.0 ? static_cast<float>(frames_ * 1000.0 / session_ms) : 0.f;
    p.processing_time_ms = processing_ms_.empty()
        ? 0.f
        : std::accumulate(processing_ms_.begin(), processing_ms_.end(), 0.f) / processing_ms_.size();
    p.total_detections = total_detections_;
    p.avg_confidence = total_detections_ > 0 ? static_cast<float>(confidence_sum_ / total_detections_) : 0.f;
    p.session_duration_ms = static_cast<std::int64_t>(session_ms);
    p.frames_processed = frames_;
    p.frames_failed = frames_failed_;

    perf_ = p;
    hazards_ = hz;
    return {perf_, hazards_};
}

}  // namespace hzd
