#pragma once
#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

namespace hzd {
enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// "debug" | "info" | "warn" | "error"; anything else keeps `fallback`.
inline LogLevel parse_log_level(const std::string& s, LogLevel fallback = LogLevel::Info) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return fallback;
}

class Logger {
public:
    static void set_level(LogLevel lv) { level_.store(static_cast<int>(lv)); }
    static LogLevel level() { return static_cast<LogLevel>(level_.load()); }

    template <typename... Args>
    static void debug(const char* fmt, Args... args) {
        write(LogLevel::Debug, stdout, "[D] ", fmt, args...);
    }

    template <typename... Args>
    static void info(const char* fmt, Args... args) {
        write(LogLevel::Info, stdout, "[I] ", fmt, args...);
    }

    template <typename... Args>
    static void warn(const char* fmt, Args... args) {
        write(LogLevel::Warn, stdout, "[W] ", fmt, args...);
    }

    template <typename... Args>
    static void error(const char* fmt, Args... args) {
        write(LogLevel::Error, stderr, "[E] ", fmt, args...);
    }

private:
    template <typename... Args>
    static void write(LogLevel lv, FILE* out, const char* tag, const char* fmt, Args... args) {
        if (static_cast<int>(lv) < level_.load()) return;
        std::lock_guard<std::mutex> lk(mu_);
        std::fprintf(out, (std::string(tag) + fmt + "\n").c_str(), args...);
        std::fflush(out);
    }

    static inline std::mutex mu_{};
    static inline std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
};
}  // namespace hzd
