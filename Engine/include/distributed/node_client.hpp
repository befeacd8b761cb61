/**
 * @file node_client.hpp
 * @brief What the coordinator needs from a reasoning worker
 */

#pragma once

#include <distributed/types.hpp>
#include <reasoning/types.hpp>
#include <set>

namespace Synod {

struct NodeStatusReport {
    NodeStatus status = NodeStatus::Online;
    double workload = 0.0;
    NodePerformance performance;
};

/**
 * @brief Worker-side contract.
 *
 * execute_task() reports failure by throwing; the coordinator records the
 * message as that node's error.
 */
class ReasoningNodeClient {
public:
    virtual ~ReasoningNodeClient() = default;

    virtual ReasoningResult execute_task(const ReasoningQuery& query, const TaskConstraints& constraints) = 0;
    virtual std::set<Capability> get_capabilities() const = 0;
    virtual NodeStatusReport get_status() const = 0;
    virtual void shutdown() = 0;
};

} // namespace Synod
