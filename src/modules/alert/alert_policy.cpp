#include "hzd/alert.hpp"
#include "hzd/hazard.hpp"
#include <algorithm>

namespace hzd {

AlertStrategy parse_alert_strategy(const std::string& s, AlertStrategy fallback) {
    if (s == "set" || s == "hazard-set") return AlertStrategy::HazardSet;
    if (s == "leading" || s == "leading-label") return AlertStrategy::LeadingLabel;
    return fallback;
}

void AlertPolicy::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    last_set_.clear();
    last_leading_.reset();
    last_time_.reset();
}

std::optional<std::string> AlertPolicy::evaluate(const Dets& dets, Clock::time_point now) {
    if (!cfg_.enabled) return std::nullopt;
    if (std::none_of(dets.begin(), dets.end(),
                     [](const Detection& d) { return d.category != HazardCategory::Unknown; }))
        return std::nullopt;
    std::lock_guard<std::mutex> lk(mu_);
    return cfg_.strategy == AlertStrategy::HazardSet ? evaluate_set(dets, now)
                                                     : evaluate_leading(dets, now);
}

bool AlertPolicy::within_debounce(Clock::time_point now) const {
    return last_time_ && now - *last_time_ < cfg_.debounce;
}

std::optional<std::string> AlertPolicy::evaluate_set(const Dets& dets, Clock::time_point now) {
    if (within_debounce(now)) return std::nullopt;

    std::set<HazardCategory> current;
    for (const auto& d : dets) {
        if (d.category != HazardCategory::Unknown) current.insert(d.category);
    }
    if (current == last_set_) return std::nullopt;

    std::string msg = current.size() > 1 ? std::string(kMultipleHazardsMessage)
                                         : alert_phrase(category_name(*current.begin()));
    last_set_ = std::move(current);
    last_time_ = now;
    return msg;
}

std::optional<std::string> AlertPolicy::evaluate_leading(const Dets& dets, Clock::time_point now) {
    auto lead = std::find_if(dets.begin(), dets.end(),
                             [](const Detection& d) { return d.category != HazardCategory::Unknown; });
    const HazardCategory c = lead->category;
    if (last_leading_ == c && within_debounce(now)) return std::nullopt;

    last_leading_ = c;
    last_set_ = {c};
    last_time_ = now;
    return alert_phrase(category_name(c));
}

}  // namespace hzd
