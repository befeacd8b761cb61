/**
 * @file fault_tolerance.hpp
 * @brief Failure detection, redistribution and outlier screening
 */

#pragma once

#include <consensus/similarity.hpp>
#include <distributed/config.hpp>
#include <distributed/node_registry.hpp>
#include <distributed/task_queue.hpp>
#include <distributed/types.hpp>
#include <utils/periodic_task.hpp>
#include <export.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace Synod {

struct ValidationReport {
    bool valid = true;                          // A strict majority agrees
    std::vector<std::string> disagreeing_nodes; // This round
    std::vector<std::string> suspicious_nodes;  // Cumulative, after this round
};

/**
 * @brief Watches node liveness and result quality.
 *
 * Each tick demotes nodes whose heartbeats lapsed and redistributes the
 * tasks they were holding. Redistribution asks the top-up handler (the
 * coordinator) for a replacement node so only the missing share of a
 * fan-out is re-run.
 *
 * Under `high` or `byzantine` levels, nodes that disagree with the majority
 * `suspicion_strikes` times in a row become suspicious: half weight under
 * `high`, excluded under `byzantine`. They stay registered.
 */
class SYNOD_API FaultToleranceManager {
public:
    /**
     * @brief Replace `failed_node` in `task_id`'s execution.
     * @return true if a replacement node was dispatched
     */
    using TopUpHandler = std::function<bool(const std::string& task_id, const std::string& failed_node)>;

    FaultToleranceManager(NodeRegistry& registry, TaskQueue& queue, const DistributedConfig& config);
    ~FaultToleranceManager();

    FaultToleranceManager(const FaultToleranceManager&) = delete;
    FaultToleranceManager& operator=(const FaultToleranceManager&) = delete;

    void update_config(const DistributedConfig& config);
    void set_top_up_handler(TopUpHandler handler);

    /**
     * @brief Registry cleanup; returns the nodes that just went offline.
     */
    std::vector<std::string> detect_failures();

    /**
     * @brief Mark a node failed and redistribute its tasks.
     * @return Number of tasks topped up with a replacement
     */
    size_t handle_failure(const std::string& node_id);

    /**
     * @brief Top up every non-terminal task holding `node_id`.
     *
     * Tasks the handler cannot top up just lose the node from their
     * assigned_nodes.
     * @return Number of tasks topped up with a replacement
     */
    size_t redistribute_tasks(const std::string& node_id);

    /**
     * @brief Compare results with their majority and update strike counts.
     */
    ValidationReport validate_results(const std::vector<NodeReasoningResult>& results);

    /**
     * @brief Aggregation weight multiplier for a node.
     */
    double weight_for(const std::string& node_id) const;
    bool is_suspicious(const std::string& node_id) const;
    bool is_excluded(const std::string& node_id) const { return weight_for(node_id) <= 0.0; }
    size_t strikes(const std::string& node_id) const;

    /**
     * @brief Forget failure state of failed nodes that are active again.
     * @return Ids recovered in this call
     */
    std::vector<std::string> recover();

    /**
     * @brief Drop all state held for a node (after deregistration).
     */
    void forget(const std::string& node_id);

    /**
     * @brief One maintenance pass: detect, redistribute, recover.
     */
    void run_once();

    void start();
    void stop();
    bool running() const { return ticker_.running(); }

private:
    NodeRegistry& registry_;
    TaskQueue& queue_;

    mutable std::mutex mutex_;
    FaultToleranceLevel level_;
    SimilarityThresholds thresholds_;
    size_t suspicion_strikes_;
    TopUpHandler top_up_;
    std::unordered_map<std::string, size_t> strikes_;
    std::set<std::string> suspicious_;
    std::set<std::string> failed_;

    PeriodicTask ticker_;
};

} // namespace Synod
