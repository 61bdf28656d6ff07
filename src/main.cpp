#include <atomic>
#include <csignal>
#include <cstdio>
#include <chrono>
#include <thread>
#include "hzd/adapters.hpp"
#include "hzd/config.hpp"
#include "hzd/logger.hpp"
#include "hzd/pipeline.hpp"

using namespace hzd;

namespace {
std::atomic<bool> g_interrupted{false};
void on_signal(int) { g_interrupted = true; }
}

int main(int argc, char** argv) {
    AppConfig cfg = parse_args(argc, argv);
    if (cfg.show_help) { std::fputs(usage(), stdout); return 0; }
    Logger::set_level(cfg.log_level);

    ModelRegistry registry;
    LoopConfig lc;
    if (!registry.resolve(cfg.model, lc.model)) return 1;
    if (!cfg.model_path.empty()) lc.model.model_path = cfg.model_path;
    if (!cfg.class_names_path.empty() && !load_class_names(cfg.class_names_path, lc.model.class_names)) return 1;
    lc.iou_threshold = cfg.iou_threshold;
    lc.target_interval = Millis(cfg.interval_ms);
    lc.floor = Millis(cfg.floor_ms);
    lc.display = cv::Size(cfg.display_w, cfg.display_h);
    lc.alert.enabled = cfg.voice_alerts;
    lc.alert.strategy = cfg.alert_strategy;
    lc.alert.debounce = Millis(cfg.debounce_ms);

    DnnRuntime runtime;
    if (!runtime.load(lc.model)) return 1;

    VideoFrameSource source(cfg.source);
    PreviewOverlay overlay(cfg.show_window, lc.display);
    LogAlertSink alerts;
    TelemetryHub hub;
    hub.confidence.set(cfg.conf_threshold);
    StageMetrics metrics;

    hub.performance.subscribe([](const SnapshotChannel<PerformanceSnapshot>::Ptr& p) {
        Logger::debug("fps %.1f | proc %.1fms | dets %llu | conf %.2f", p->fps, p->processing_time_ms,
                      static_cast<unsigned long long>(p->total_detections), p->avg_confidence);
    });

    DetectionLoop loop(source, runtime, overlay, alerts, hub, &metrics);
    StartStatus st = loop.start(lc);
    if (st != StartStatus::Ok) {
        Logger::error("fail start: %s", start_status_name(st));
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (loop.running() && !g_interrupted) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    loop.stop();

    auto perf = hub.performance.get();
    auto hz = hub.hazards.get();
    Logger::info("session: %llu frames (%llu failed), %.1f fps, %llu detections",
                 static_cast<unsigned long long>(perf.frames_processed),
                 static_cast<unsigned long long>(perf.frames_failed), perf.fps,
                 static_cast<unsigned long long>(perf.total_detections));
    for (HazardCategory c : kHazardCategories) {
        Logger::info("  %-10s %llu", category_name(c), static_cast<unsigned long long>(hz.count(c)));
    }

    if (!cfg.metrics_csv.empty()) {
        if (metrics.dump_csv(cfg.metrics_csv)) Logger::info("done. %s saved", cfg.metrics_csv.c_str());
        else Logger::warn("could not write %s", cfg.metrics_csv.c_str());
    }
    return 0;
}
