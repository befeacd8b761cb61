/**
 * @file task_queue.hpp
 * @brief Submitted tasks, their priority order and state machine
 */

#pragma once

#include <distributed/types.hpp>
#include <utils/time.hpp>
#include <export.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Synod {

/**
 * @brief Partial task patch. Absent fields are left alone.
 */
struct TaskUpdate {
    std::optional<TaskStatus> status;
    std::optional<std::vector<std::string>> assigned_nodes;
    std::optional<std::string> error;
    std::optional<DistributedReasoningResult> result;
};

struct TaskQueueStats {
    std::map<TaskStatus, size_t> counts;
    size_t total = 0;

    size_t count(TaskStatus s) const {
        auto it = counts.find(s);
        return it == counts.end() ? 0 : it->second;
    }
};

/**
 * @brief Owns every task until it is evicted by cleanup().
 *
 * Pending tasks are ordered by priority (highest first), then created_at,
 * then submission sequence. Each task has its own mutex; the id -> task map
 * is locked exclusively only to insert or evict, and the pending order has a
 * mutex of its own.
 */
class SYNOD_API TaskQueue {
public:
    explicit TaskQueue(NowFn now = system_now());

    /**
     * @brief Add a pending task. Capabilities are not checked here.
     *
     * Fills in created_at/updated_at (when unset) and the sequence number.
     * @throws std::invalid_argument for an empty or duplicate id, or a task
     *         that is not pending
     */
    void enqueue(DistributedReasoningTask task);

    /**
     * @brief Remove and return the head of the pending order.
     *
     * The task stays in the queue (still pending) for status tracking.
     */
    std::optional<DistributedReasoningTask> dequeue();

    /**
     * @brief dequeue() only if `task_id` is currently at the head.
     */
    std::optional<DistributedReasoningTask> dequeue_if(const std::string& task_id);

    std::optional<std::string> front_id() const;
    size_t pending_count() const;

    /**
     * @brief Apply a patch. Returns false for unknown ids and for status
     *        changes the state machine forbids (nothing is applied then).
     */
    bool update_task(const std::string& task_id, const TaskUpdate& update);

    std::optional<DistributedReasoningTask> get_task(const std::string& task_id) const;
    std::vector<DistributedReasoningTask> all_tasks() const;

    /**
     * @brief Non-terminal tasks holding `node_id` among their assigned nodes.
     */
    std::vector<std::string> tasks_assigned_to(const std::string& node_id) const;

    /**
     * @brief Evict terminal tasks last updated more than `retention_ms` ago.
     * @return Number of evicted tasks
     */
    size_t cleanup(int64_t retention_ms);

    TaskQueueStats get_stats() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        DistributedReasoningTask task;
    };

    struct PendingKey {
        TaskPriority priority;
        TimePoint created_at;
        uint64_t sequence;
        std::string id;

        bool operator<(const PendingKey& o) const {
            if (priority != o.priority) return priority > o.priority;
            if (created_at != o.created_at) return created_at < o.created_at;
            return sequence < o.sequence;
        }
    };

    std::shared_ptr<Entry> find(const std::string& task_id) const;
    std::vector<std::shared_ptr<Entry>> snapshot() const;
    void drop_pending(const std::string& task_id);

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> tasks_;

    mutable std::mutex pending_mutex_;
    std::set<PendingKey> pending_;
    std::unordered_map<std::string, std::set<PendingKey>::iterator> pending_index_;

    std::atomic<uint64_t> next_seq_{0};
    NowFn now_;
};

} // namespace Synod
