#include "hzd/pipeline.hpp"
#include "hzd/coordinate.hpp"
#include "hzd/logger.hpp"
#include "hzd/postprocess.hpp"
#include "hzd/tracer.hpp"

#include <exception>

namespace hzd {

const char* start_status_name(StartStatus s) {
    switch (s) {
        case StartStatus::Ok: return "ok";
        case StartStatus::AlreadyRunning: return "already running";
        case StartStatus::InvalidConfig: return "invalid config";
        case StartStatus::SourceRejected: return "frame source rejected the session";
        case StartStatus::OverlayRejected: return "overlay could not be opened";
    }
    return "unknown";
}

DetectionLoop::DetectionLoop(FrameSource& source, InferenceRuntime& runtime, OverlaySink& overlay,
                             AlertSink& alerts, TelemetryHub& hub, StageMetrics* metrics)
    : source_(source), runtime_(runtime), overlay_(overlay), alerts_(alerts), hub_(hub), metrics_(metrics) {}

DetectionLoop::~DetectionLoop() {
    stop();
}

StartStatus DetectionLoop::start(const LoopConfig& cfg) {
    if (task_.on_task_thread()) {
        Logger::warn("loop: start ignored, called from the loop thread");
        return StartStatus::AlreadyRunning;
    }
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (state_ == LoopState::Running) {
        Logger::warn("loop: start ignored, session already running");
        return StartStatus::AlreadyRunning;
    }
    task_.join();   // a previous session may have ended on its own

    if (cfg.model.input_size <= 0 || cfg.model.class_names.empty() ||
        cfg.iou_threshold < 0.f || cfg.iou_threshold > 1.f || cfg.floor.count() < 1) {
        Logger::error("loop: invalid config (input %d, %zu classes, iou %.2f, floor %lld ms)",
                      cfg.model.input_size, cfg.model.class_names.size(), cfg.iou_threshold,
                      static_cast<long long>(cfg.floor.count()));
        return StartStatus::InvalidConfig;
    }

    cfg_ = cfg;
    decoder_ = make_decoder(cfg_.model);
    preprocessor_ = std::make_unique<FramePreprocessor>(PreprocessOptions::from_model(cfg_.model));
    aggregator_ = std::make_unique<DetectionAggregator>();
    alert_policy_ = std::make_unique<AlertPolicy>(cfg_.alert);
    frame_seq_ = 0;
    idle_polls_ = 0;

    if (!source_.open()) {
        Logger::error("loop: %s", start_status_name(StartStatus::SourceRejected));
        return StartStatus::SourceRejected;
    }
    if (!overlay_.open()) {
        source_.close();
        Logger::error("loop: %s", start_status_name(StartStatus::OverlayRejected));
        return StartStatus::OverlayRejected;
    }
    resources_held_ = true;
    hub_.reset();

    aggregator_->reset(Clock::now());
    state_ = LoopState::Running;
    if (!task_.start([this] { return tick(); }, [this] { on_task_exit(); })) {
        state_ = LoopState::Idle;
        release_resources();
        return StartStatus::AlreadyRunning;
    }
    Logger::info("loop: started model=%s layout=%s input=%d interval=%lldms",
                 cfg_.model.name.c_str(), layout_name(cfg_.model.layout), cfg_.model.input_size,
                 static_cast<long long>(cfg_.target_interval.count()));
    return StartStatus::Ok;
}

void DetectionLoop::stop() {
    // From a collaborator callback on the loop thread: the tick sees the
    // cancel, and the task's exit hook releases resources.
    if (task_.on_task_thread()) {
        task_.cancel();
        return;
    }
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    task_.cancel();
    task_.join();
    release_resources();
    if (state_.exchange(LoopState::Idle) == LoopState::Running) Logger::info("loop: stopped");
}

void DetectionLoop::on_task_exit() {
    release_resources();
    state_ = LoopState::Idle;
}

void DetectionLoop::release_resources() {
    if (!resources_held_.exchange(false)) return;
    try {
        overlay_.release();
    } catch (const std::exception& e) {
        Logger::warn("loop: overlay release failed: %s", e.what());
    } catch (...) {
        Logger::warn("loop: overlay release failed");
    }
    try {
        source_.close();
    } catch (const std::exception& e) {
        Logger::warn("loop: source close failed: %s", e.what());
    } catch (...) {
        Logger::warn("loop: source close failed");
    }
}

std::optional<Millis> DetectionLoop::tick() {
    const auto frame_start = Clock::now();

    RawFrame frame;
    FrameStatus status = FrameStatus::NoFrame;
    try {
        status = source_.acquire_latest_frame(frame);
    } catch (const std::exception& e) {
        Logger::warn("loop: frame acquire failed: %s", e.what());
    } catch (...) {
        Logger::warn("loop: frame acquire failed");
    }
    if (status == FrameStatus::Ended) {
        Logger::info("loop: frame source ended");
        return std::nullopt;
    }
    if (status == FrameStatus::NoFrame) {
        ++idle_polls_;
        return cfg_.floor;
    }

    const long fid = ++frame_seq_;
    HZD_TRACE_STAGE(metrics_, "frame", fid);

    Dets dets;
    if (!run_model(frame, fid, hub_.confidence.get(), dets)) aggregator_->mark_failed();

    const cv::Size2f model_space(static_cast<float>(cfg_.model.input_size),
                                 static_cast<float>(cfg_.model.input_size));
    const cv::Size2f display = cfg_.display.area() > 0
        ? cv::Size2f(cfg_.display)
        : cv::Size2f(static_cast<float>(frame.width), static_cast<float>(frame.height));
    scale_all(dets, model_space, display);

    const auto now = Clock::now();
    auto snaps = aggregator_->update(dets, frame_start, now);

    if (auto msg = alert_policy_->evaluate(dets, now)) {
        Logger::info("alert: %s", msg->c_str());
        try {
            alerts_.speak(*msg);
        } catch (const std::exception& e) {
            Logger::warn("loop: alert sink failed: %s", e.what());
        } catch (...) {
            Logger::warn("loop: alert sink failed");
        }
    }

    if (task_.cancelled()) return std::nullopt;
    publish(dets, snaps);

    const auto elapsed = std::chrono::duration_cast<Millis>(Clock::now() - frame_start);
    return next_tick_delay(cfg_.target_interval, elapsed, cfg_.floor);
}

bool DetectionLoop::run_model(const RawFrame& frame, long fid, float conf, Dets& out) {
    try {
        return run_stages(frame, fid, conf, out);
    } catch (const std::exception& e) {
        Logger::warn("loop: frame %ld failed, treating as no detections: %s", fid, e.what());
    } catch (...) {
        Logger::warn("loop: frame %ld failed, treating as no detections", fid);
    }
    out.clear();
    return false;
}

bool DetectionLoop::run_stages(const RawFrame& frame, long fid, float conf, Dets& out) {
    const cv::Size input(cfg_.model.input_size, cfg_.model.input_size);

    Tensor tensor;
    {
        HZD_TRACE_STAGE(metrics_, "preprocess", fid);
        if (!preprocessor_->prepare(frame, input, tensor)) return false;
    }

    RawOutput raw;
    {
        HZD_TRACE_STAGE(metrics_, "infer", fid);
        if (!runtime_.infer(tensor, raw)) {
            Logger::warn("loop: inference failed on frame %ld, treating as no detections", fid);
            return false;
        }
    }

    HZD_TRACE_STAGE(metrics_, "postprocess", fid);
    Dets candidates;
    if (!decoder_->decode(raw, conf, input, candidates)) return false;
    out = NMS(candidates, cfg_.iou_threshold);
    Logger::debug("frame %ld: %zu candidates, %zu after NMS", fid, candidates.size(), out.size());
    return true;
}

void DetectionLoop::publish(const Dets& mapped, const std::pair<PerformanceSnapshot, HazardStatsSnapshot>& snaps) {
    try {
        overlay_.update(mapped);
    } catch (const std::exception& e) {
        Logger::warn("loop: overlay update failed: %s", e.what());
    } catch (...) {
        Logger::warn("loop: overlay update failed");
    }
    hub_.detections.publish(mapped);
    hub_.performance.publish(snaps.first);
    hub_.hazards.publish(snaps.second);
    hub_.recent.publish(aggregator_->recent());
}

}  // namespace hzd
