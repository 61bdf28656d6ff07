#pragma once
#include "aggregator.hpp"
#include "alert.hpp"
#include "decoder.hpp"
#include "interfaces.hpp"
#include "metrics.hpp"
#include "model_config.hpp"
#include "preprocess.hpp"
#include "scheduler.hpp"
#include "telemetry.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace hzd {
struct LoopConfig {
    ModelConfig model;
    float iou_threshold = 0.45f;
    Millis target_interval{200};
    Millis floor{10};
    cv::Size display{0, 0};   // publish-target space; empty means the captured frame's size
    AlertConfig alert;
};

enum class StartStatus { Ok, AlreadyRunning, InvalidConfig, SourceRejected, OverlayRejected };
const char* start_status_name(StartStatus s);

enum class LoopState { Idle, Running };

// Orchestrates capture -> preprocess -> infer -> decode -> NMS -> map ->
// aggregate -> alert -> publish on a PeriodicTask. All references must
// outlive the loop.
class DetectionLoop {
public:
    DetectionLoop(FrameSource& source, InferenceRuntime& runtime, OverlaySink& overlay,
                  AlertSink& alerts, TelemetryHub& hub, StageMetrics* metrics = nullptr);
    ~DetectionLoop();

    DetectionLoop(const DetectionLoop&) = delete;
    DetectionLoop& operator=(const DetectionLoop&) = delete;

    StartStatus start(const LoopConfig& cfg);
    // Idempotent; safe from Idle, while a tick is in flight, and from a
    // collaborator callback on the loop thread.
    void stop();

    LoopState state() const { return state_; }
    bool running() const { return state_ == LoopState::Running; }
    bool stop_requested() const { return task_.cancelled(); }
    std::uint64_t idle_polls() const { return idle_polls_; }

private:
    std::optional<Millis> tick();
    bool run_model(const RawFrame& frame, long fid, float conf, Dets& out);
    bool run_stages(const RawFrame& frame, long fid, float conf, Dets& out);
    void publish(const Dets& mapped, const std::pair<PerformanceSnapshot, HazardStatsSnapshot>& snaps);
    void on_task_exit();
    void release_resources();

    FrameSource& source_;
    InferenceRuntime& runtime_;
    OverlaySink& overlay_;
    AlertSink& alerts_;
    TelemetryHub& hub_;
    StageMetrics* metrics_;

    LoopConfig cfg_;
    std::unique_ptr<OutputDecoder> decoder_;
    std::unique_ptr<FramePreprocessor> preprocessor_;
    std::unique_ptr<DetectionAggregator> aggregator_;
    std::unique_ptr<AlertPolicy> alert_policy_;

    PeriodicTask task_;
    std::mutex lifecycle_mu_;
    std::atomic<LoopState> state_{LoopState::Idle};
    std::atomic<bool> resources_held_{false};
    std::atomic<std::uint64_t> idle_polls_{0};
    long frame_seq_{0};
};
}  // namespace hzd
