#pragma once
#include "aggregator.hpp"
#include "types.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace hzd {
enum class AlertStrategy {
    HazardSet,     // announce when the distinct category set changes, debounced
    LeadingLabel,  // announce the first hazard when its category changes or the interval passed
};

struct AlertConfig {
    bool enabled = true;
    AlertStrategy strategy = AlertStrategy::HazardSet;
    std::chrono::milliseconds debounce{3000};
};

inline const char* const kMultipleHazardsMessage = "Multiple hazards detected";

class AlertPolicy {
public:
    explicit AlertPolicy(AlertConfig cfg = {}) : cfg_(cfg) {}

    // Returns the phrase to speak, if any, and records the announcement.
    // Detections outside the hazard categories are ignored.
    std::optional<std::string> evaluate(const Dets& dets, Clock::time_point now);

    void reset();
    const AlertConfig& config() const { return cfg_; }

private:
    std::optional<std::string> evaluate_set(const Dets& dets, Clock::time_point now);
    std::optional<std::string> evaluate_leading(const Dets& dets, Clock::time_point now);
    bool within_debounce(Clock::time_point now) const;

    AlertConfig cfg_;
    std::mutex mu_;
    std::set<HazardCategory> last_set_;
    std::optional<HazardCategory> last_leading_;
    std::optional<Clock::time_point> last_time_;
};

AlertStrategy parse_alert_strategy(const std::string& s, AlertStrategy fallback = AlertStrategy::HazardSet);
}  // namespace hzd
