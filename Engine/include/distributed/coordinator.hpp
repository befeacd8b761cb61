/**
 * @file coordinator.hpp
 * @brief Top-level orchestration of distributed reasoning tasks
 */

#pragma once

#include <distributed/config.hpp>
#include <distributed/dispatch_pool.hpp>
#include <distributed/errors.hpp>
#include <distributed/events.hpp>
#include <distributed/fault_tolerance.hpp>
#include <distributed/load_balancer.hpp>
#include <distributed/node_connector.hpp>
#include <distributed/node_registry.hpp>
#include <distributed/result_aggregator.hpp>
#include <distributed/task_queue.hpp>
#include <distributed/types.hpp>
#include <utils/periodic_task.hpp>
#include <export.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace Synod {

/**
 * @brief Turns one reasoning query into a fan-out over nodes and a merged answer.
 *
 * submit_task() blocks the caller for the life of the task:
 *   1. the task is enqueued (pending) and admitted in priority order once
 *      fewer than max_concurrent_tasks tasks are executing;
 *   2. the load balancer picks nodes (assigned);
 *   3. every node is called concurrently on the dispatch pool, which starts
 *      a thread per call when its core workers are busy; the first response
 *      or acknowledgement moves the task to running;
 *   4. results are collected until all selected nodes answered, the single
 *      deadline passes, or the task is cancelled; late results are dropped;
 *   5. results are screened, aggregated and the task completes or fails.
 *
 * Failures surface as ReasoningError carrying the kind and per-node detail.
 */
class SYNOD_API Coordinator {
public:
    Coordinator(DistributedConfig config, std::shared_ptr<NodeConnector> connector,
                NowFn now = system_now());
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /**
     * @throws ReasoningError on any task-level failure
     */
    DistributedReasoningResult submit_task(const ReasoningQuery& query,
                                           const TaskConstraints& constraints = {},
                                           TaskPriority priority = TaskPriority::Medium);

    std::optional<DistributedReasoningTask> get_task_status(const std::string& task_id) const;

    /**
     * @brief Force a non-terminal task to cancelled; its submitter stops waiting.
     */
    bool cancel_task(const std::string& task_id);

    std::string register_node(const NodeRegistration& registration);

    /**
     * @brief Remove a node and top up the tasks it was serving.
     */
    bool deregister_node(const std::string& node_id);

    bool send_heartbeat(const NodeHeartbeat& heartbeat);

    std::vector<ReasoningNode> get_active_nodes() const;
    std::vector<ReasoningNode> get_nodes_by_capability(Capability capability) const;

    DistributedReasoningStats get_system_stats() const;

    /**
     * @brief Apply a partial JSON config; see DistributedConfig::apply.
     */
    void update_config(const nlohmann::json& patch);
    DistributedConfig get_config() const;

    HealthReport health_check() const;

    /**
     * @brief Start/stop background maintenance on heartbeat_interval.
     */
    void start();
    void stop();

    /**
     * @brief One maintenance pass: failure detection, redistribution,
     *        recovery and eviction of old finished tasks.
     */
    void run_maintenance();

    /**
     * @brief Replace `failed_node` in a running task with a fresh node.
     * @return true if a replacement was dispatched
     */
    bool top_up(const std::string& task_id, const std::string& failed_node);

    CoordinatorEvents& events() { return events_; }
    NodeRegistry& registry() { return registry_; }
    TaskQueue& queue() { return queue_; }
    FaultToleranceManager& fault_tolerance() { return fault_; }

private:
    struct Execution {
        std::mutex mutex;
        std::condition_variable cv;

        std::string task_id;
        ReasoningQuery query;
        TaskConstraints constraints;
        std::set<Capability> required;
        LoadBalancingStrategy strategy = LoadBalancingStrategy::LeastLoaded;

        std::vector<std::string> slots;                // Every node ever dispatched to
        std::set<std::string> outstanding;             // Still awaited
        std::set<std::string> started;                 // Calls that reached a dispatch thread
        std::vector<NodeReasoningResult> results;      // Arrival order
        std::map<std::string, std::string> lost;       // Timed out or failed mid-task
        std::vector<std::string> redistributed_from;
        bool acked = false;
        bool cancelled = false;
        bool finished = false;
    };

    void validate(const ReasoningQuery& query, const TaskConstraints& constraints) const;
    void admit(const std::string& task_id);
    void release_slot();
    void exclude_suspicious(TaskConstraints& constraints) const;
    void dispatch(const std::shared_ptr<Execution>& exec, const ReasoningNode& node);
    void collect(Execution& exec, TimePoint deadline);
    std::shared_ptr<Execution> find_execution(const std::string& task_id) const;

    void record_failure(const std::string& task_id, TaskStatus status, const std::string& message);
    [[noreturn]] void fail(const std::string& task_id, TaskStatus status, ErrorKind kind,
                           const std::string& message, std::map<std::string, std::string> failures = {});

    std::string next_task_id();

    mutable std::mutex config_mutex_;
    DistributedConfig config_;

    NowFn now_;
    NodeRegistry registry_;
    TaskQueue queue_;
    LoadBalancer balancer_;
    ResultAggregator aggregator_;
    FaultToleranceManager fault_;
    CoordinatorEvents events_;
    std::shared_ptr<NodeConnector> connector_;

    std::mutex admission_mutex_;
    std::condition_variable admission_cv_;
    size_t running_ = 0;

    mutable std::mutex exec_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Execution>> executions_;

    std::atomic<uint64_t> next_task_seq_{1};
    std::atomic<size_t> tasks_submitted_{0};
    std::atomic<size_t> tasks_completed_{0};
    std::atomic<size_t> tasks_failed_{0};

    mutable std::mutex completions_mutex_;
    std::deque<TimePoint> completions_;        // For throughput over the last minute

    DispatchPool pool_;
    PeriodicTask maintenance_;
};

} // namespace Synod
