#include "hzd/config.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace hzd {

namespace {
bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

// "640x360" -> (640, 360); false on anything else.
bool parse_size(const char* s, int& w, int& h) {
    int pw = 0, ph = 0;
    char sep = 0;
    if (std::sscanf(s, "%d%c%d", &pw, &sep, &ph) != 3) return false;
    if ((sep != 'x' && sep != 'X') || pw <= 0 || ph <= 0) return false;
    w = pw;
    h = ph;
    return true;
}
}  // namespace

const char* usage() {
    return "Usage: hazard_vision [--source <index|file>] [--model <name>] [--model-path <file>]\n"
           "                     [--class-names <file>] [--conf <thresh>] [--iou <thresh>]\n"
           "                     [--interval-ms <ms>] [--floor-ms <ms>] [--display <WxH>]\n"
           "                     [--alert-strategy set|leading] [--debounce-ms <ms>] [--no-voice]\n"
           "                     [--metrics-csv <path>] [--show-window] [--log-level <level>]\n";
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* v = std::getenv("HZD_SOURCE")) cfg.source = v;
    if (const char* v = std::getenv("HZD_MODEL")) cfg.model = v;
    if (const char* v = std::getenv("HZD_MODEL_PATH")) cfg.model_path = v;
    if (const char* v = std::getenv("HZD_CONF")) cfg.conf_threshold = static_cast<float>(std::atof(v));
    if (const char* v = std::getenv("HZD_INTERVAL_MS")) cfg.interval_ms = std::atoi(v);
    if (const char* v = std::getenv("HZD_LOG_LEVEL")) cfg.log_level = parse_log_level(v, cfg.log_level);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            return i + 1 < argc ? argv[i + 1] : nullptr;
        };

        if (arg_eq(arg, "--source") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--model") && next()) {
            cfg.model = next();
            i++;
        } else if (arg_eq(arg, "--model-path") && next()) {
            cfg.model_path = next();
            i++;
        } else if (arg_eq(arg, "--class-names") && next()) {
            cfg.class_names_path = next();
            i++;
        } else if (arg_eq(arg, "--conf") && next()) {
            cfg.conf_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--iou") && next()) {
            cfg.iou_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--interval-ms") && next()) {
            cfg.interval_ms = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--floor-ms") && next()) {
            cfg.floor_ms = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--display") && next()) {
            if (!parse_size(next(), cfg.display_w, cfg.display_h)) {
                Logger::warn("Ignoring bad --display value: %s", next());
            }
            i++;
        } else if (arg_eq(arg, "--alert-strategy") && next()) {
            cfg.alert_strategy = parse_alert_strategy(next(), cfg.alert_strategy);
            i++;
        } else if (arg_eq(arg, "--debounce-ms") && next()) {
            cfg.debounce_ms = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--no-voice")) {
            cfg.voice_alerts = false;
        } else if (arg_eq(arg, "--metrics-csv") && next()) {
            cfg.metrics_csv = next();
            i++;
        } else if (arg_eq(arg, "--show-window")) {
            cfg.show_window = true;
        } else if (arg_eq(arg, "--log-level") && next()) {
            cfg.log_level = parse_log_level(next(), cfg.log_level);
            i++;
        } else if (arg_eq(arg, "--help") || arg_eq(arg, "-h")) {
            cfg.show_help = true;
        } else {
            Logger::warn("Ignoring unknown argument: %s", arg);
        }
    }

    if (cfg.interval_ms < 0) cfg.interval_ms = 0;
    if (cfg.floor_ms < 1) cfg.floor_ms = 1;
    if (cfg.debounce_ms < 0) cfg.debounce_ms = 0;
    return cfg;
}

}  // namespace hzd
