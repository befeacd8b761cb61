/**
 * @file dispatch_pool.hpp
 * @brief Elastic worker threads running node calls concurrently
 */

#pragma once

#include <utils/logger.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>

namespace Synod {

/**
 * @brief Multi-worker job queue that never lets a job wait behind a busy worker.
 *
 * A fixed set of core workers stays warm. When a job arrives and no worker is
 * idle, an extra worker is started for it; extras exit as soon as the queue
 * is empty. A job that blocks forever therefore costs one thread and never
 * delays another job.
 *
 * Workers are detached and share their state through a shared_ptr, so
 * shutdown() may stop waiting on a job that does not return. Such a job keeps
 * running on its own thread until it returns; jobs must not capture anything
 * that dies with the pool's owner.
 */
class DispatchPool {
public:
    explicit DispatchPool(size_t core_workers = 8)
        : state_(std::make_shared<State>()),
          core_workers_(core_workers == 0 ? 1 : core_workers) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (size_t i = 0; i < core_workers_; ++i) spawn(true);
    }

    ~DispatchPool() {
        bool stopped;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            stopped = state_->stop;
        }
        if (!stopped) shutdown();
    }

    DispatchPool(const DispatchPool&) = delete;
    DispatchPool& operator=(const DispatchPool&) = delete;

    /**
     * @throws std::runtime_error after shutdown()
     * @throws std::system_error when no thread can be started for the job
     */
    void submit(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->stop) throw std::runtime_error("DispatchPool is shut down");
            if (state_->idle <= state_->queue.size()) spawn(false);
            state_->queue.push(std::move(job));
        }
        state_->cv.notify_one();
    }

    /**
     * @brief Block until every queued job has run.
     */
    void wait_all() {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->idle_cv.wait(lock, [this] { return state_->queue.empty() && state_->busy == 0; });
    }

    /**
     * @brief Refuse new work, let queued jobs run and wait for every worker.
     */
    void shutdown() { shutdown(std::nullopt); }

    /**
     * @brief As shutdown(), but give up waiting after `grace`.
     * @return Number of workers that had not exited when waiting stopped
     */
    size_t shutdown(std::optional<std::chrono::milliseconds> grace) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->stop = true;
        state_->cv.notify_all();

        auto finished = [this] { return state_->live == 0; };
        if (grace) state_->done_cv.wait_for(lock, *grace, finished);
        else state_->done_cv.wait(lock, finished);

        if (state_->live > 0 && !state_->abandoned_reported) {
            state_->abandoned_reported = true;
            Logger::warn("DispatchPool stopped waiting on " + std::to_string(state_->live) +
                         " unfinished job(s)");
        }
        return state_->live;
    }

    size_t core_workers() const { return core_workers_; }

    size_t worker_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->live;
    }

    size_t busy() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->busy;
    }

private:
    struct State {
        std::queue<std::function<void()>> queue;
        std::mutex mutex;
        std::condition_variable cv;
        std::condition_variable idle_cv;
        std::condition_variable done_cv;
        size_t live = 0;        // Started and not yet exited
        size_t idle = 0;        // Live and not running a job
        size_t busy = 0;
        bool stop = false;
        bool abandoned_reported = false;
    };

    // Caller holds state_->mutex
    void spawn(bool core) {
        std::thread(&DispatchPool::worker, state_, core).detach();
        ++state_->live;
        ++state_->idle;
    }

    static void worker(std::shared_ptr<State> s, bool core) {
        std::unique_lock<std::mutex> lock(s->mutex);
        while (true) {
            if (s->queue.empty()) {
                if (s->stop || !core) break;
                s->cv.wait(lock, [&] { return !s->queue.empty() || s->stop; });
                continue;
            }

            auto job = std::move(s->queue.front());
            s->queue.pop();
            --s->idle;
            ++s->busy;
            lock.unlock();

            try {
                job();
            } catch (const std::exception& e) {
                Logger::error(std::string("Dispatch job failed: ") + e.what());
            }

            lock.lock();
            --s->busy;
            ++s->idle;
            s->idle_cv.notify_all();
        }

        --s->idle;
        --s->live;
        s->done_cv.notify_all();
    }

    std::shared_ptr<State> state_;
    size_t core_workers_;
};

} // namespace Synod
