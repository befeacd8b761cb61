/**
 * @file periodic_task.hpp
 * @brief Background tick with explicit start/stop
 */

#pragma once

#include <utils/logger.hpp>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <string>

namespace Synod {

/**
 * @brief Runs a callback every `interval` on a dedicated thread.
 *
 * stop() wakes the thread immediately and joins it; the destructor stops.
 * Exceptions escaping the callback are logged and the loop continues.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> tick)
        : name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {}

    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (thread_.joinable()) return;
        stop_ = false;
        thread_ = std::thread(&PeriodicTask::loop, this);
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!thread_.joinable()) return;
            stop_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return thread_.joinable() && !stop_;
    }

    void set_interval(std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lock(mutex_);
        interval_ = interval;
    }

private:
    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_) {
            if (cv_.wait_for(lock, interval_, [this] { return stop_; })) break;
            lock.unlock();
            try {
                tick_();
            } catch (const std::exception& e) {
                Logger::error("[" + name_ + "] tick failed: " + e.what());
            }
            lock.lock();
        }
    }

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> tick_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool stop_ = false;
};

} // namespace Synod
