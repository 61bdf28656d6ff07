#include "hzd/metrics.hpp"
#include <fstream>

namespace hzd {
bool StageMetrics::dump_csv(const std::string& path) const {
    std::ofstream f(path);
    if (!f) return false;
    f << "frame,stage,timestamp_ms\n";
    for (auto& s : stamps_) f << s.frame << "," << s.name << "," << s.ms << "\n";
    return static_cast<bool>(f);
}
}
