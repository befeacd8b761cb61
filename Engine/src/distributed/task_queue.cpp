#include <distributed/task_queue.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <stdexcept>

namespace Synod {

TaskQueue::TaskQueue(NowFn now) : now_(std::move(now)) {}

void TaskQueue::enqueue(DistributedReasoningTask task) {
    if (task.id.empty()) throw std::invalid_argument("Task id must not be empty");
    if (task.status != TaskStatus::Pending)
        throw std::invalid_argument("Only pending tasks can be enqueued (" + task.id + " is " + to_string(task.status) + ")");

    if (task.created_at == TimePoint{}) task.created_at = now_();
    task.updated_at = task.created_at;
    task.sequence = next_seq_.fetch_add(1);

    PendingKey key{task.priority, task.created_at, task.sequence, task.id};
    auto entry = std::make_shared<Entry>();
    entry->task = std::move(task);

    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        if (!tasks_.emplace(key.id, entry).second)
            throw std::invalid_argument("Duplicate task id " + key.id);
    }
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_index_[key.id] = pending_.insert(key).first;
    }

    Logger::debug("Enqueued task " + key.id + " (" + to_string(key.priority) + ")");
}

std::optional<DistributedReasoningTask> TaskQueue::dequeue() {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.empty()) return std::nullopt;
        id = pending_.begin()->id;
        pending_index_.erase(id);
        pending_.erase(pending_.begin());
    }
    return get_task(id);
}

std::optional<DistributedReasoningTask> TaskQueue::dequeue_if(const std::string& task_id) {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.empty() || pending_.begin()->id != task_id) return std::nullopt;
        pending_index_.erase(task_id);
        pending_.erase(pending_.begin());
    }
    return get_task(task_id);
}

std::optional<std::string> TaskQueue::front_id() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (pending_.empty()) return std::nullopt;
    return pending_.begin()->id;
}

size_t TaskQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void TaskQueue::drop_pending(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_index_.find(task_id);
    if (it == pending_index_.end()) return;
    pending_.erase(it->second);
    pending_index_.erase(it);
}

std::shared_ptr<TaskQueue::Entry> TaskQueue::find(const std::string& task_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<TaskQueue::Entry>> TaskQueue::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    std::vector<std::shared_ptr<Entry>> out;
    out.reserve(tasks_.size());
    for (const auto& [id, e] : tasks_) out.push_back(e);
    return out;
}

bool TaskQueue::update_task(const std::string& task_id, const TaskUpdate& update) {
    auto entry = find(task_id);
    if (!entry) return false;

    bool left_pending = false;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& task = entry->task;

        if (update.status && !can_transition(task.status, *update.status)) {
            Logger::debug("Rejected transition " + to_string(task.status) + " -> " +
                          to_string(*update.status) + " for task " + task_id);
            return false;
        }

        if (update.status) {
            left_pending = task.status == TaskStatus::Pending;
            task.status = *update.status;
        }
        if (update.assigned_nodes) task.assigned_nodes = *update.assigned_nodes;
        if (update.error) task.error = *update.error;
        if (update.result) task.result = *update.result;
        task.updated_at = now_();
    }

    if (left_pending) drop_pending(task_id);
    return true;
}

std::optional<DistributedReasoningTask> TaskQueue::get_task(const std::string& task_id) const {
    auto entry = find(task_id);
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->task;
}

std::vector<DistributedReasoningTask> TaskQueue::all_tasks() const {
    std::vector<DistributedReasoningTask> out;
    for (const auto& e : snapshot()) {
        std::lock_guard<std::mutex> lock(e->mutex);
        out.push_back(e->task);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
    return out;
}

std::vector<std::string> TaskQueue::tasks_assigned_to(const std::string& node_id) const {
    std::vector<std::pair<uint64_t, std::string>> found;
    for (const auto& e : snapshot()) {
        std::lock_guard<std::mutex> lock(e->mutex);
        const auto& t = e->task;
        if (is_terminal(t.status)) continue;
        if (std::find(t.assigned_nodes.begin(), t.assigned_nodes.end(), node_id) != t.assigned_nodes.end())
            found.emplace_back(t.sequence, t.id);
    }
    std::sort(found.begin(), found.end());

    std::vector<std::string> ids;
    ids.reserve(found.size());
    for (auto& [seq, id] : found) ids.push_back(std::move(id));
    return ids;
}

size_t TaskQueue::cleanup(int64_t retention_ms) {
    const auto now = now_();
    std::vector<std::string> expired;
    for (const auto& e : snapshot()) {
        std::lock_guard<std::mutex> lock(e->mutex);
        if (is_terminal(e->task.status) && ms_between(e->task.updated_at, now) > retention_ms)
            expired.push_back(e->task.id);
    }

    if (!expired.empty()) {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        for (const auto& id : expired) tasks_.erase(id);
        Logger::debug("Evicted " + std::to_string(expired.size()) + " finished tasks");
    }
    return expired.size();
}

TaskQueueStats TaskQueue::get_stats() const {
    TaskQueueStats stats;
    for (const auto& e : snapshot()) {
        std::lock_guard<std::mutex> lock(e->mutex);
        ++stats.counts[e->task.status];
        ++stats.total;
    }
    return stats;
}

} // namespace Synod
