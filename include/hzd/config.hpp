#pragma once

#include "alert.hpp"
#include "logger.hpp"

#include <string>

namespace hzd {

struct AppConfig {
    std::string source{"0"};            // camera index or video file
    std::string model{"FocusNet.tflite"};
    std::string model_path{};           // overrides the registry's file path
    std::string class_names_path{};     // optional, one name per line
    float conf_threshold{0.25f};
    float iou_threshold{0.45f};
    int interval_ms{200};
    int floor_ms{10};
    int display_w{0};                   // 0 = captured frame size
    int display_h{0};
    bool voice_alerts{true};
    AlertStrategy alert_strategy{AlertStrategy::HazardSet};
    int debounce_ms{3000};
    std::string metrics_csv{"latency.csv"};
    bool show_window{false};
    LogLevel log_level{LogLevel::Info};
    bool show_help{false};
};

// Environment first (HZD_*), then flags. Unknown flags are logged and skipped.
AppConfig parse_args(int argc, char** argv);

const char* usage();

}  // namespace hzd
