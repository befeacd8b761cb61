/**
 * @file events.hpp
 * @brief Publish/subscribe channel for coordinator events
 */

#pragma once

#include <distributed/types.hpp>
#include <utils/logger.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Synod {

/**
 * @brief Handle for a subscription; unsubscribes when destroyed.
 *
 * Holds only a weak reference to the signal, so it may outlive it.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) { other.cancel_ = nullptr; }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    explicit operator bool() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

/**
 * @brief Typed signal. Handlers run synchronously on the emitting thread,
 * outside the signal's lock; a throwing handler is logged and skipped.
 */
template <typename... Args>
class Signal {
public:
    using Handler = std::function<void(const Args&...)>;

    Signal() : state_(std::make_shared<State>()) {}

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    [[nodiscard]] Subscription subscribe(Handler handler) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->handlers.emplace(id, std::make_shared<Handler>(std::move(handler)));
        }
        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id] {
            if (auto state = weak.lock()) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->handlers.erase(id);
            }
        });
    }

    void emit(const Args&... args) const {
        std::vector<std::shared_ptr<Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            snapshot.reserve(state_->handlers.size());
            for (const auto& [id, h] : state_->handlers) snapshot.push_back(h);
        }
        for (const auto& h : snapshot) {
            try {
                (*h)(args...);
            } catch (const std::exception& e) {
                Logger::warn(std::string("Event handler threw: ") + e.what());
            }
        }
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->handlers.size();
    }

private:
    struct State {
        std::mutex mutex;
        uint64_t next_id = 0;
        std::map<uint64_t, std::shared_ptr<Handler>> handlers;
    };

    std::shared_ptr<State> state_;
};

/**
 * @brief Every event the coordinator publishes.
 */
struct CoordinatorEvents {
    Signal<ReasoningNode> node_registered;
    Signal<std::string> node_deregistered;
    Signal<std::string, NodeStatus> node_status_changed;
    Signal<DistributedReasoningTask> task_created;
    Signal<std::string, std::vector<std::string>> task_assigned;
    Signal<DistributedReasoningResult> task_completed;
    Signal<std::string, std::string> task_failed;        // task id, reason
    Signal<std::string, double> consensus_reached;       // task id, consensus level
    Signal<size_t, size_t> system_overloaded;            // running, limit
};

} // namespace Synod
