#include "hzd/scheduler.hpp"
#include "hzd/logger.hpp"
#include <algorithm>
#include <exception>

namespace hzd {

Millis next_tick_delay(Millis target_interval, Millis elapsed, Millis floor) {
    return std::max(target_interval - elapsed, floor);
}

PeriodicTask::~PeriodicTask() {
    cancel();
    if (!on_task_thread()) join();
    else if (worker_.joinable()) worker_.detach();
}

bool PeriodicTask::start(Tick tick, OnExit on_exit) {
    if (running_) return false;
    if (worker_.joinable()) worker_.join();   // previous run finished on its own

    tick_ = std::move(tick);
    on_exit_ = std::move(on_exit);
    cancelled_ = false;
    running_ = true;
    worker_ = std::thread(&PeriodicTask::run, this);
    return true;
}

void PeriodicTask::cancel() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void PeriodicTask::join() {
    if (on_task_thread()) return;
    if (worker_.joinable()) worker_.join();
}

void PeriodicTask::run() {
    worker_id_ = std::this_thread::get_id();
    while (!cancelled_) {
        std::optional<Millis> delay;
        try {
            delay = tick_();
        } catch (const std::exception& e) {
            Logger::error("periodic task: tick threw, stopping: %s", e.what());
            break;
        } catch (...) {
            Logger::error("periodic task: tick threw a non-standard exception, stopping");
            break;
        }
        if (!delay) break;

        std::unique_lock<std::mutex> lk(mu_);
        if (cv_.wait_for(lk, *delay, [this] { return cancelled_.load(); })) break;
    }
    if (on_exit_) on_exit_();
    worker_id_ = std::thread::id{};
    running_ = false;
}

}  // namespace hzd
