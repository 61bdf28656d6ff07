#pragma once
#include "logger.hpp"
#include <algorithm>
#include <exception>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace hzd {
// Single-value channel with atomic replace. Readers get a shared pointer to an
// immutable value, so they never see a half-written snapshot. Subscribers are
// called on the publishing thread, after the swap and outside the lock; one
// that throws is logged and does not stop the others.
template <typename T>
class SnapshotChannel {
public:
    using Ptr = std::shared_ptr<const T>;
    using Subscriber = std::function<void(const Ptr&)>;

    SnapshotChannel() : value_(std::make_shared<const T>()) {}

    SnapshotChannel(const SnapshotChannel&) = delete;
    SnapshotChannel& operator=(const SnapshotChannel&) = delete;

    void publish(T v) {
        Ptr next = std::make_shared<const T>(std::move(v));
        std::vector<Subscriber> subs;
        {
            std::lock_guard<std::mutex> lk(mu_);
            value_ = next;
            ++version_;
            subs.reserve(subs_.size());
            for (auto& kv : subs_) subs.push_back(kv.second);
        }
        for (auto& s : subs) {
            try {
                s(next);
            } catch (const std::exception& e) {
                Logger::warn("snapshot: subscriber threw: %s", e.what());
            } catch (...) {
                Logger::warn("snapshot: subscriber threw");
            }
        }
    }

    Ptr latest() const {
        std::lock_guard<std::mutex> lk(mu_);
        return value_;
    }

    T get() const { return *latest(); }

    std::uint64_t version() const {
        std::lock_guard<std::mutex> lk(mu_);
        return version_;
    }

    int subscribe(Subscriber s) {
        std::lock_guard<std::mutex> lk(mu_);
        int id = next_id_++;
        subs_.emplace(id, std::move(s));
        return id;
    }

    void unsubscribe(int id) {
        std::lock_guard<std::mutex> lk(mu_);
        subs_.erase(id);
    }

private:
    mutable std::mutex mu_;
    Ptr value_;
    std::uint64_t version_{0};
    std::map<int, Subscriber> subs_;
    int next_id_{1};
};

// Operator-adjustable confidence threshold, clamped to [0, 1]. Read by the
// loop at the top of every decode.
class ThresholdControl {
public:
    explicit ThresholdControl(float initial) : value_(clamp(initial)) {}

    float get() const { return value_.load(std::memory_order_relaxed); }
    float set(float v) {
        float c = clamp(v);
        value_.store(c, std::memory_order_relaxed);
        return c;
    }

private:
    static float clamp(float v) { return std::min(1.0f, std::max(0.0f, v)); }

    std::atomic<float> value_;
};
}  // namespace hzd
