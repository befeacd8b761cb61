/**
 * @file node_registry.hpp
 * @brief Registered reasoning workers, their liveness and rolling performance
 */

#pragma once

#include <distributed/types.hpp>
#include <utils/time.hpp>
#include <export.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Synod {

/**
 * @brief Tracks every registered node.
 *
 * The id -> entry map is locked exclusively only to insert or erase; each
 * entry carries its own mutex, so heartbeats and bookkeeping for different
 * nodes never contend. Lookups return copies.
 *
 * A node is live while `now - last_heartbeat < node_timeout_threshold`, and
 * active when live with status online or busy.
 */
class SYNOD_API NodeRegistry {
public:
    using StatusCallback = std::function<void(const std::string& node_id, NodeStatus status)>;

    explicit NodeRegistry(int64_t node_timeout_threshold_ms, NowFn now = system_now());

    /**
     * @brief Register a node; every call yields a fresh id.
     * @throws std::invalid_argument without an endpoint or capabilities
     */
    std::string register_node(const NodeRegistration& registration);

    bool deregister(const std::string& node_id);

    /**
     * @brief Apply a heartbeat. Unknown ids are ignored (returns false).
     */
    bool process_heartbeat(const NodeHeartbeat& heartbeat);

    std::optional<ReasoningNode> get_node(const std::string& node_id) const;
    std::vector<ReasoningNode> all_nodes() const;
    std::vector<ReasoningNode> get_active_nodes() const;

    /**
     * @brief Active nodes advertising `capability`.
     */
    std::vector<ReasoningNode> find_nodes_by_capability(Capability capability) const;

    /**
     * @brief Demote every node whose heartbeat lapsed to offline.
     * @return Ids that changed to offline in this call
     */
    std::vector<std::string> cleanup_inactive_nodes();

    bool is_live(const std::string& node_id) const;
    bool is_active(const std::string& node_id) const;

    bool update_status(const std::string& node_id, NodeStatus status);

    /**
     * @brief Fold one execution into the node's performance record.
     *
     * Response time is an exponential moving average (0.9 old, 0.1 new);
     * reliability is completed / (completed + errored).
     */
    bool record_execution(const std::string& node_id, double execution_time_ms, bool success);

    /**
     * @brief Count assignments handed to a node (delta may be negative).
     */
    bool adjust_in_flight(const std::string& node_id, int delta);

    size_t size() const;

    void set_timeout_threshold(int64_t ms) { timeout_threshold_ms_.store(ms); }
    int64_t timeout_threshold() const { return timeout_threshold_ms_.load(); }

    /**
     * @brief Invoked (outside any registry lock) whenever a status changes.
     */
    void on_status_change(StatusCallback callback);

    TimePoint now() const { return now_(); }

private:
    struct Entry {
        mutable std::mutex mutex;
        ReasoningNode node;
    };

    std::shared_ptr<Entry> find(const std::string& node_id) const;
    bool live_locked(const ReasoningNode& node, TimePoint now) const;
    void notify(const std::string& node_id, NodeStatus status) const;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> nodes_;

    std::atomic<int64_t> timeout_threshold_ms_;
    NowFn now_;
    std::atomic<uint64_t> next_seq_{1};

    mutable std::mutex callback_mutex_;
    StatusCallback on_status_;
};

} // namespace Synod
