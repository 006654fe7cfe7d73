/**
 * @file periodic_task.cpp
 * @brief Implementation of the background interval runner
 *
 * @date 2025
 */

#include "sandpool/utils/periodic_task.hpp"

#include <spdlog/spdlog.h>

namespace sandpool {
namespace utils {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> callback)
    : name_(std::move(name)), interval_(interval), callback_(std::move(callback)) {
}

PeriodicTask::~PeriodicTask() {
    Stop();
}

void PeriodicTask::Start(bool run_immediately) {
    if (running_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }

    spdlog::debug("Starting periodic task '{}' (interval {} ms)", name_, interval_.count());
    thread_ = std::thread(&PeriodicTask::Run, this, run_immediately);
}

void PeriodicTask::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        spdlog::debug("Periodic task '{}' stopped after {} ticks", name_, ticks_.load());
    }
    running_ = false;
}

void PeriodicTask::Run(bool run_immediately) {
    if (run_immediately) {
        Tick();
    }

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        Tick();
        lock.lock();
    }
}

void PeriodicTask::Tick() {
    try {
        callback_();
    }
    catch (const std::exception& e) {
        spdlog::error("Periodic task '{}' failed: {}", name_, e.what());
    }
    ++ticks_;
}

} // namespace utils
} // namespace sandpool
