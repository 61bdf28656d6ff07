#pragma once
#include "metrics.hpp"
#include <string>
#include <utility>

#define HZD_CONCAT_(a, b) a##b
#define HZD_CONCAT(a, b) HZD_CONCAT_(a, b)

#define HZD_TRACE_STAGE(metrics, stage, frame) \
    hzd::ScopeStamp HZD_CONCAT(_scope_stamp_, __LINE__)(metrics, stage, frame)

namespace hzd {
struct ScopeStamp {
    StageMetrics* m;
    std::string stage;
    long frame;

    // `met` may be null when stage tracing is disabled.
    ScopeStamp(StageMetrics* met, std::string s, long f) : m(met), stage(std::move(s)), frame(f) {
        if (m) m->mark(stage + ":in", frame);
    }

    ~ScopeStamp() { if (m) m->mark(stage + ":out", frame); }

    ScopeStamp(const ScopeStamp&) = delete;
    ScopeStamp& operator=(const ScopeStamp&) = delete;
};
}
