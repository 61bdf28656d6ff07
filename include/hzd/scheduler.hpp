#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace hzd {
using Millis = std::chrono::milliseconds;

// max(target - elapsed, floor): paces toward the target cadence without ever
// busy-looping.
Millis next_tick_delay(Millis target_interval, Millis elapsed, Millis floor);

// One background thread calling `tick` until it returns nullopt or the task is
// cancelled. The returned delay is slept on a condition variable so cancel()
// wakes it immediately.
class PeriodicTask {
public:
    using Tick = std::function<std::optional<Millis>()>;
    using OnExit = std::function<void()>;

    PeriodicTask() = default;
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    // False if a previous run is still alive.
    bool start(Tick tick, OnExit on_exit = {});
    void cancel();
    void join();

    bool running() const { return running_; }
    bool cancelled() const { return cancelled_; }
    bool on_task_thread() const { return std::this_thread::get_id() == worker_id_; }

private:
    void run();

    Tick tick_;
    OnExit on_exit_;
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_{};
    std::mutex mu_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
};
}  // namespace hzd
