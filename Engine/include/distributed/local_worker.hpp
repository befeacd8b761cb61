/**
 * @file local_worker.hpp
 * @brief In-process reasoning node backed by the local engines
 */

#pragma once

#include <distributed/node_client.hpp>
#include <knowledge/atom_space.hpp>
#include <reasoning/engine_router.hpp>
#include <export.hpp>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>

namespace Synod {

/**
 * @brief Runs queries through an EngineRouter over a shared AtomSpace.
 *
 * Accepts at most `max_concurrent` tasks at once (busy at capacity);
 * workload is active / max. shutdown() refuses new work, waits for the
 * tasks in flight, then reports offline.
 */
class SYNOD_API LocalReasoningWorker : public ReasoningNodeClient {
public:
    static constexpr size_t DEFAULT_MAX_CONCURRENT = 5;

    LocalReasoningWorker(const AtomSpace* store, std::set<Capability> capabilities,
                         size_t max_concurrent = DEFAULT_MAX_CONCURRENT);

    ReasoningResult execute_task(const ReasoningQuery& query, const TaskConstraints& constraints) override;
    std::set<Capability> get_capabilities() const override { return capabilities_; }
    NodeStatusReport get_status() const override;
    void shutdown() override;

    /**
     * @brief Heartbeat carrying this worker's current status report.
     */
    NodeHeartbeat heartbeat(const std::string& node_id) const;

    /**
     * @brief Put the worker in or out of maintenance (no new work accepted).
     */
    void set_maintenance(bool on);

private:
    EngineRouter router_;
    std::set<Capability> capabilities_;
    size_t max_concurrent_;
    TimePoint started_at_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    bool maintenance_ = false;
    bool shut_down_ = false;
    NodePerformance performance_;
};

} // namespace Synod
