/**
 * @file load_balancer.hpp
 * @brief Pluggable node selection for task fan-out
 */

#pragma once

#include <distributed/config.hpp>
#include <distributed/node_registry.hpp>
#include <distributed/types.hpp>
#include <export.hpp>
#include <mutex>
#include <random>
#include <set>
#include <vector>

namespace Synod {

/**
 * @brief Picks which active nodes run a task.
 *
 * Filtering happens in a fixed order: excluded nodes, inactive nodes, then
 * nodes lacking the required capabilities (capability-optimized also keeps
 * partial-coverage nodes, behind every full-coverage one). Surviving
 * preferred nodes go first in the order given; the strategy orders the rest.
 */
class SYNOD_API LoadBalancer {
public:
    explicit LoadBalancer(const NodeRegistry& registry);
    LoadBalancer(const NodeRegistry& registry, uint32_t seed);

    /**
     * @brief Select up to `requested` active nodes.
     *
     * Returns fewer when fewer qualify, and none at all when
     * `constraints.require_all_nodes` is set and the request cannot be met.
     */
    std::vector<ReasoningNode> select_nodes(const std::set<Capability>& required,
                                            const TaskConstraints& constraints,
                                            LoadBalancingStrategy strategy,
                                            size_t requested);

    /**
     * @brief Selection for a task under the deployment config.
     */
    std::vector<ReasoningNode> select_nodes(const DistributedReasoningTask& task,
                                            const DistributedConfig& config);

    /**
     * @brief Filter and order an explicit candidate list (no registry access).
     */
    std::vector<ReasoningNode> rank(std::vector<ReasoningNode> candidates,
                                    const std::set<Capability>& required,
                                    const TaskConstraints& constraints,
                                    LoadBalancingStrategy strategy);

    /**
     * @brief max_nodes from the constraints, else the configured fan-out;
     *        never above config.max_nodes.
     */
    static size_t requested_count(const TaskConstraints& constraints, const DistributedConfig& config);

private:
    void order_by_strategy(std::vector<ReasoningNode>& nodes, const std::set<Capability>& required,
                           LoadBalancingStrategy strategy);

    const NodeRegistry& registry_;

    std::mutex mutex_;   // Guards the cursor and the generator
    size_t rr_cursor_ = 0;
    std::mt19937 rng_;
};

} // namespace Synod
