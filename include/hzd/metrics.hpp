#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace hzd {
struct Stamp { std::string name; double ms; long frame; };

// Per-stage timestamps of the detection loop. Written from the loop thread
// only; read (size/dump) after the loop has stopped.
class StageMetrics {
public:
    explicit StageMetrics(std::size_t max_stamps = 100000) : max_stamps_(max_stamps) {}

    void mark(const std::string& name, long frame) {
        using clk = std::chrono::steady_clock;
        double ms = std::chrono::duration<double, std::milli>(clk::now().time_since_epoch()).count();
        stamps_.push_back({name, ms, frame});
        while (stamps_.size() > max_stamps_) stamps_.pop_front();
    }

    bool dump_csv(const std::string& path) const;

    std::size_t size() const { return stamps_.size(); }
    const std::deque<Stamp>& stamps() const { return stamps_; }
    void clear() { stamps_.clear(); }

private:
    std::size_t max_stamps_;
    std::deque<Stamp> stamps_;
};
}   // namespace hzd
