#include <distributed/coordinator.hpp>
#include <utils/ids.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <stdexcept>

namespace Synod {

namespace {

constexpr int64_t THROUGHPUT_WINDOW_MS = 60000;
constexpr double OVERLOAD_WORKLOAD = 0.9;
constexpr double OVERLOADED_SHARE = 0.3;
constexpr double MIN_AVAILABLE_SHARE = 0.5;
constexpr double MIN_NODE_RELIABILITY = 0.8;
constexpr int64_t SHUTDOWN_GRACE_MS = 100;

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

std::string describe_capabilities(const std::set<Capability>& caps) {
    std::vector<std::string> names;
    for (auto c : caps) names.push_back(to_string(c));
    return join(names);
}

} // anonymous namespace

Coordinator::Coordinator(DistributedConfig config, std::shared_ptr<NodeConnector> connector, NowFn now)
    : config_(std::move(config)),
      now_(std::move(now)),
      registry_(config_.node_timeout_threshold_ms, now_),
      queue_(now_),
      balancer_(registry_),
      fault_(registry_, queue_, config_),
      connector_(std::move(connector)),
      pool_(config_.dispatch_threads),
      maintenance_("maintenance", Millis(config_.heartbeat_interval_ms), [this] { run_maintenance(); }) {
    if (!connector_) throw std::invalid_argument("Coordinator requires a node connector");

    registry_.on_status_change([this](const std::string& id, NodeStatus status) {
        events_.node_status_changed.emit(id, status);
    });
    fault_.set_top_up_handler([this](const std::string& task_id, const std::string& node_id) {
        return top_up(task_id, node_id);
    });
}

Coordinator::~Coordinator() {
    stop();
    // Calls that never returned stay on their own threads
    pool_.shutdown(Millis(SHUTDOWN_GRACE_MS));
}

// =============================================================================
// Task submission
// =============================================================================

void Coordinator::validate(const ReasoningQuery& query, const TaskConstraints& constraints) const {
    if (query.type.empty())
        throw ReasoningError(ErrorKind::InvalidQuery, "", "Query type must not be empty");
    for (const auto& atom : query.atoms)
        if (atom.type.empty())
            throw ReasoningError(ErrorKind::InvalidQuery, "", "Query atom without a type");
    if (constraints.min_confidence && (*constraints.min_confidence < 0.0 || *constraints.min_confidence > 1.0))
        throw ReasoningError(ErrorKind::InvalidQuery, "", "minConfidence must be in [0,1]");
    if (constraints.max_execution_time_ms && *constraints.max_execution_time_ms <= 0)
        throw ReasoningError(ErrorKind::InvalidQuery, "", "maxExecutionTime must be positive");
}

std::string Coordinator::next_task_id() {
    return make_id("task", next_task_seq_.fetch_add(1));
}

void Coordinator::record_failure(const std::string& task_id, TaskStatus status, const std::string& message) {
    TaskUpdate update;
    update.status = status;
    update.error = message;
    queue_.update_task(task_id, update);

    if (status != TaskStatus::Cancelled) ++tasks_failed_;
    Logger::error("Task " + task_id + " " + to_string(status) + ": " + message);
    events_.task_failed.emit(task_id, message);
}

void Coordinator::fail(const std::string& task_id, TaskStatus status, ErrorKind kind,
                       const std::string& message, std::map<std::string, std::string> failures) {
    record_failure(task_id, status, message);
    throw ReasoningError(kind, task_id, message, std::move(failures));
}

void Coordinator::admit(const std::string& task_id) {
    bool overload_reported = false;
    std::unique_lock<std::mutex> lock(admission_mutex_);

    while (true) {
        auto task = queue_.get_task(task_id);
        if (!task || task->status == TaskStatus::Cancelled) {
            lock.unlock();
            fail(task_id, TaskStatus::Cancelled, ErrorKind::TaskCancelled, "Task cancelled before dispatch");
        }

        const size_t limit = get_config().max_concurrent_tasks;
        if (running_ < limit && queue_.front_id() == task_id && queue_.dequeue_if(task_id)) {
            ++running_;
            break;
        }

        if (running_ >= limit && !overload_reported) {
            overload_reported = true;
            const size_t running = running_;
            lock.unlock();
            Logger::warn("System overloaded: " + std::to_string(running) + "/" + std::to_string(limit) +
                         " tasks executing, " + task_id + " waits");
            events_.system_overloaded.emit(running, limit);
            lock.lock();
            continue;
        }

        admission_cv_.wait(lock);
    }

    lock.unlock();
    admission_cv_.notify_all();
}

void Coordinator::release_slot() {
    {
        std::lock_guard<std::mutex> lock(admission_mutex_);
        --running_;
    }
    admission_cv_.notify_all();
}

void Coordinator::exclude_suspicious(TaskConstraints& constraints) const {
    for (const auto& node : registry_.all_nodes()) {
        if (!fault_.is_excluded(node.id)) continue;
        if (std::find(constraints.excluded_nodes.begin(), constraints.excluded_nodes.end(), node.id) ==
            constraints.excluded_nodes.end())
            constraints.excluded_nodes.push_back(node.id);
    }
}

void Coordinator::dispatch(const std::shared_ptr<Execution>& exec, const ReasoningNode& node) {
    auto connector = connector_;
    pool_.submit([exec, node, connector] {
        {
            std::lock_guard<std::mutex> lock(exec->mutex);
            if (exec->finished) return;
            exec->started.insert(node.id);
        }

        NodeReasoningResult out;
        out.node_id = node.id;
        out.reliability = node.performance.reliability;

        Timer timer;
        try {
            auto client = connector->connect(node);
            {
                std::lock_guard<std::mutex> lock(exec->mutex);
                exec->acked = true;
            }
            exec->cv.notify_all();
            out.result = client->execute_task(exec->query, exec->constraints);
        } catch (const std::exception& e) {
            out.error = e.what();
            out.result = ReasoningResult::failure(e.what(), exec->query.type);
        }
        out.execution_time_ms = timer.elapsed_ms();

        {
            std::lock_guard<std::mutex> lock(exec->mutex);
            if (exec->finished || !exec->outstanding.count(node.id)) {
                Logger::debug("Discarded late result from " + node.id + " for " + exec->task_id);
                return;
            }
            exec->acked = true;
            exec->outstanding.erase(node.id);
            exec->results.push_back(std::move(out));
        }
        exec->cv.notify_all();
    });
}

void Coordinator::collect(Execution& exec, TimePoint deadline) {
    bool running = false;
    std::unique_lock<std::mutex> lock(exec.mutex);

    while (true) {
        if (exec.acked && !running) {
            running = true;
            lock.unlock();
            TaskUpdate update;
            update.status = TaskStatus::Running;
            queue_.update_task(exec.task_id, update);
            lock.lock();
            continue;
        }
        if (exec.cancelled || exec.outstanding.empty()) return;

        const bool woke = exec.cv.wait_until(lock, deadline, [&] {
            return exec.cancelled || exec.outstanding.empty() || (exec.acked && !running);
        });
        if (!woke) return;
    }
}

std::shared_ptr<Coordinator::Execution> Coordinator::find_execution(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(exec_mutex_);
    auto it = executions_.find(task_id);
    return it == executions_.end() ? nullptr : it->second;
}

DistributedReasoningResult Coordinator::submit_task(const ReasoningQuery& query,
                                                    const TaskConstraints& constraints,
                                                    TaskPriority priority) {
    validate(query, constraints);
    const DistributedConfig config = get_config();
    Timer timer;

    DistributedReasoningTask task;
    task.id = next_task_id();
    task.query = query;
    task.priority = priority;
    task.constraints = constraints;
    task.required_capabilities = constraints.required_capabilities.empty()
        ? std::set<Capability>{capability_for_query_type(query.type)}
        : constraints.required_capabilities;
    task.created_at = now_();

    const std::string task_id = task.id;
    const auto required = task.required_capabilities;
    queue_.enqueue(std::move(task));
    ++tasks_submitted_;
    if (auto created = queue_.get_task(task_id)) events_.task_created.emit(*created);
    Logger::step("Task " + task_id + " submitted (" + query.type + ", " + to_string(priority) + ")");

    // 1. Admission in priority order
    admit(task_id);
    struct SlotGuard {
        Coordinator* self;
        ~SlotGuard() { self->release_slot(); }
    } slot_guard{this};

    // 2. Node selection
    const auto strategy = constraints.load_balancing.value_or(config.load_balancing_strategy);
    const size_t requested = LoadBalancer::requested_count(constraints, config);
    TaskConstraints selection = constraints;
    exclude_suspicious(selection);
    const auto nodes = balancer_.select_nodes(required, selection, strategy, requested);
    if (nodes.empty()) {
        std::string why = requested == 0
            ? "maxNodes is 0"
            : "No active node offers [" + describe_capabilities(required) + "]";
        if (constraints.require_all_nodes && requested > 0)
            why += " on " + std::to_string(requested) + " nodes";
        fail(task_id, TaskStatus::Failed, ErrorKind::NodeUnavailable, why);
    }

    std::vector<std::string> ids;
    for (const auto& n : nodes) ids.push_back(n.id);

    auto exec = std::make_shared<Execution>();
    exec->task_id = task_id;
    exec->query = query;
    exec->constraints = constraints;
    exec->required = required;
    exec->strategy = strategy;
    exec->slots = ids;
    exec->outstanding.insert(ids.begin(), ids.end());

    {
        std::lock_guard<std::mutex> lock(exec_mutex_);
        executions_[task_id] = exec;
    }
    struct ExecutionGuard {
        Coordinator* self;
        const std::string& id;
        ~ExecutionGuard() {
            std::lock_guard<std::mutex> lock(self->exec_mutex_);
            self->executions_.erase(id);
        }
    } exec_guard{this, task_id};

    TaskUpdate assign;
    assign.status = TaskStatus::Assigned;
    assign.assigned_nodes = ids;
    if (!queue_.update_task(task_id, assign))
        fail(task_id, TaskStatus::Cancelled, ErrorKind::TaskCancelled, "Task cancelled before dispatch");

    events_.task_assigned.emit(task_id, ids);
    Logger::info("Task " + task_id + " assigned to " + join(ids));

    // 3-4. Concurrent dispatch, single deadline
    for (const auto& n : nodes) {
        registry_.adjust_in_flight(n.id, 1);
        dispatch(exec, n);
    }

    const int64_t timeout_ms = constraints.max_execution_time_ms.value_or(config.default_timeout_ms);
    collect(*exec, Clock::now() + Millis(timeout_ms));

    std::vector<NodeReasoningResult> results;
    std::map<std::string, std::string> lost;
    std::vector<std::string> slots, redistributed;
    std::set<std::string> never_started;
    bool cancelled, timed_out;
    {
        std::lock_guard<std::mutex> lock(exec->mutex);
        exec->finished = true;
        cancelled = exec->cancelled;
        timed_out = !cancelled && !exec->outstanding.empty();
        for (const auto& id : exec->outstanding) {
            if (exec->started.count(id)) {
                exec->lost[id] = "no response within " + std::to_string(timeout_ms) + " ms";
            } else {
                exec->lost[id] = "call never started";
                never_started.insert(id);
            }
        }
        exec->outstanding.clear();
        results = exec->results;
        lost = exec->lost;
        slots = exec->slots;
        redistributed = exec->redistributed_from;
    }

    for (const auto& id : slots) registry_.adjust_in_flight(id, -1);
    if (config.enable_performance_monitoring) {
        for (const auto& r : results) registry_.record_execution(r.node_id, r.execution_time_ms, r.ok());
        for (const auto& [id, why] : lost)
            if (!never_started.count(id)) registry_.record_execution(id, static_cast<double>(timeout_ms), false);
    }

    auto failures = lost;
    size_t ok = 0;
    for (const auto& r : results) {
        if (r.ok()) ++ok;
        else failures[r.node_id] = *r.error;
    }

    if (cancelled)
        fail(task_id, TaskStatus::Cancelled, ErrorKind::TaskCancelled, "Task cancelled", failures);

    if (ok == 0) {
        if (timed_out)
            fail(task_id, TaskStatus::Timeout, ErrorKind::TaskTimeout,
                 "No usable result before the " + std::to_string(timeout_ms) + " ms deadline", failures);
        fail(task_id, TaskStatus::Failed, ErrorKind::AggregationFailure, "Every node failed", failures);
    }

    if (constraints.require_all_nodes && ok < ids.size()) {
        const std::string why = std::to_string(ok) + " of " + std::to_string(ids.size()) +
                                " required nodes produced a result";
        if (timed_out) fail(task_id, TaskStatus::Timeout, ErrorKind::TaskTimeout, why, failures);
        fail(task_id, TaskStatus::Failed, ErrorKind::NodeExecutionError, why, failures);
    }

    // 5. Screening and aggregation
    std::map<std::string, double> weights;
    std::vector<std::string> excluded;
    if (config.fault_tolerance_level != FaultToleranceLevel::None) {
        fault_.validate_results(results);
        for (const auto& r : results) {
            const double w = fault_.weight_for(r.node_id);
            weights[r.node_id] = w;
            if (w <= 0.0) excluded.push_back(r.node_id);
        }
    }

    auto settings = AggregationSettings::from_config(config);
    if (constraints.aggregation) settings.strategy = *constraints.aggregation;

    Aggregation agg;
    try {
        agg = aggregator_.aggregate(task_id, results, settings, weights);
    } catch (const ReasoningError& e) {
        record_failure(task_id, TaskStatus::Failed, e.what());
        throw;
    }

    if (constraints.min_confidence && agg.result.confidence < *constraints.min_confidence) {
        fail(task_id, TaskStatus::Failed, ErrorKind::ConsensusNotReached,
             "minConfidence not met: aggregated confidence " + std::to_string(agg.result.confidence) +
             " below " + std::to_string(*constraints.min_confidence), failures);
    }

    DistributedReasoningResult out;
    out.task_id = task_id;
    out.node_results = std::move(results);
    out.aggregated_result = std::move(agg.result);
    out.consensus_level = agg.consensus_level;
    out.execution_time_ms = timer.elapsed_ms();
    out.nodes_used = out.node_results.size();
    out.metadata.aggregation_strategy = settings.strategy;
    out.metadata.consensus_algorithm = settings.consensus;
    out.metadata.node_participation = std::move(agg.participation);
    out.metadata.quality = agg.quality;
    out.metadata.distribution_efficiency = agg.distribution_efficiency;
    out.metadata.weighted_consensus = agg.weighted_consensus;
    out.metadata.failed_nodes = std::move(lost);
    out.metadata.excluded_nodes = std::move(excluded);
    out.metadata.redistributed_from = std::move(redistributed);

    TaskUpdate done;
    done.status = TaskStatus::Completed;
    done.result = out;
    if (!queue_.update_task(task_id, done))
        fail(task_id, TaskStatus::Cancelled, ErrorKind::TaskCancelled, "Task cancelled", failures);

    ++tasks_completed_;
    {
        std::lock_guard<std::mutex> lock(completions_mutex_);
        completions_.push_back(now_());
    }

    Logger::success("Task " + task_id + " completed: " + std::to_string(out.nodes_used) +
                    " nodes, consensus " + std::to_string(out.consensus_level));
    if (out.consensus_level >= config.min_consensus_level)
        events_.consensus_reached.emit(task_id, out.consensus_level);
    events_.task_completed.emit(out);
    return out;
}

std::optional<DistributedReasoningTask> Coordinator::get_task_status(const std::string& task_id) const {
    return queue_.get_task(task_id);
}

bool Coordinator::cancel_task(const std::string& task_id) {
    TaskUpdate update;
    update.status = TaskStatus::Cancelled;
    update.error = std::string("cancelled");
    if (!queue_.update_task(task_id, update)) return false;

    if (auto exec = find_execution(task_id)) {
        {
            std::lock_guard<std::mutex> lock(exec->mutex);
            exec->cancelled = true;
        }
        exec->cv.notify_all();
    }
    {
        std::lock_guard<std::mutex> lock(admission_mutex_);
    }
    admission_cv_.notify_all();

    Logger::warn("Task " + task_id + " cancelled");
    return true;
}

bool Coordinator::top_up(const std::string& task_id, const std::string& failed_node) {
    auto exec = find_execution(task_id);
    if (!exec) return false;

    std::set<Capability> required;
    TaskConstraints constraints;
    LoadBalancingStrategy strategy;
    {
        std::lock_guard<std::mutex> lock(exec->mutex);
        if (exec->finished || exec->cancelled || !exec->outstanding.count(failed_node)) return false;

        exec->outstanding.erase(failed_node);
        exec->lost[failed_node] = "node failed during execution";
        exec->redistributed_from.push_back(failed_node);

        required = exec->required;
        constraints = exec->constraints;
        strategy = exec->strategy;
        constraints.excluded_nodes.insert(constraints.excluded_nodes.end(), exec->slots.begin(), exec->slots.end());
    }
    constraints.preferred_nodes.clear();
    constraints.require_all_nodes = false;
    exclude_suspicious(constraints);

    const auto picked = balancer_.select_nodes(required, constraints, strategy, 1);
    if (picked.empty()) {
        exec->cv.notify_all();
        Logger::warn("No replacement node for " + failed_node + " on task " + task_id);
        return false;
    }
    const auto& replacement = picked.front();

    {
        std::lock_guard<std::mutex> lock(exec->mutex);
        if (exec->finished || exec->cancelled) return false;
        exec->slots.push_back(replacement.id);
        exec->outstanding.insert(replacement.id);
    }

    if (auto task = queue_.get_task(task_id)) {
        auto nodes = task->assigned_nodes;
        std::replace(nodes.begin(), nodes.end(), failed_node, replacement.id);
        if (std::find(nodes.begin(), nodes.end(), replacement.id) == nodes.end()) nodes.push_back(replacement.id);
        TaskUpdate update;
        update.assigned_nodes = std::move(nodes);
        queue_.update_task(task_id, update);
    }

    registry_.adjust_in_flight(replacement.id, 1);
    dispatch(exec, replacement);
    Logger::step("Task " + task_id + ": " + failed_node + " replaced by " + replacement.id);
    return true;
}

// =============================================================================
// Nodes
// =============================================================================

std::string Coordinator::register_node(const NodeRegistration& registration) {
    const auto id = registry_.register_node(registration);
    if (auto node = registry_.get_node(id)) events_.node_registered.emit(*node);
    return id;
}

bool Coordinator::deregister_node(const std::string& node_id) {
    if (!registry_.deregister(node_id)) return false;
    fault_.redistribute_tasks(node_id);
    fault_.forget(node_id);
    events_.node_deregistered.emit(node_id);
    return true;
}

bool Coordinator::send_heartbeat(const NodeHeartbeat& heartbeat) {
    return registry_.process_heartbeat(heartbeat);
}

std::vector<ReasoningNode> Coordinator::get_active_nodes() const {
    return registry_.get_active_nodes();
}

std::vector<ReasoningNode> Coordinator::get_nodes_by_capability(Capability capability) const {
    return registry_.find_nodes_by_capability(capability);
}

// =============================================================================
// Observability and configuration
// =============================================================================

DistributedReasoningStats Coordinator::get_system_stats() const {
    DistributedReasoningStats stats;
    const auto all = registry_.all_nodes();
    const auto active = registry_.get_active_nodes();

    stats.total_nodes = all.size();
    stats.active_nodes = active.size();
    stats.total_tasks = tasks_submitted_.load();
    stats.completed_tasks = tasks_completed_.load();
    stats.failed_tasks = tasks_failed_.load();

    double response_sum = 0.0;
    size_t measured = 0;
    for (const auto& n : all) {
        if (n.performance.tasks_completed + n.performance.tasks_errored == 0) continue;
        response_sum += n.performance.avg_response_time_ms;
        ++measured;
    }
    stats.average_response_time_ms = measured ? response_sum / static_cast<double>(measured) : 0.0;

    {
        const auto now = now_();
        std::lock_guard<std::mutex> lock(completions_mutex_);
        const auto recent = std::count_if(completions_.begin(), completions_.end(), [&](TimePoint t) {
            return ms_between(t, now) <= THROUGHPUT_WINDOW_MS;
        });
        stats.system_throughput = static_cast<double>(recent) / (THROUGHPUT_WINDOW_MS / 1000.0);
    }

    double reliability = 0.0;
    for (const auto& n : active) {
        stats.node_utilization[n.id] = n.workload;
        for (auto c : n.capabilities) ++stats.capability_distribution[to_string(c)];
        reliability += n.performance.reliability;
    }
    stats.system_reliability = active.empty() ? 1.0 : reliability / static_cast<double>(active.size());
    return stats;
}

void Coordinator::update_config(const nlohmann::json& patch) {
    DistributedConfig next;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        next = config_;
        next.apply(patch);
        config_ = next;
    }
    registry_.set_timeout_threshold(next.node_timeout_threshold_ms);
    fault_.update_config(next);
    maintenance_.set_interval(Millis(next.heartbeat_interval_ms));
    {
        std::lock_guard<std::mutex> lock(admission_mutex_);
    }
    admission_cv_.notify_all();
    Logger::info("Configuration updated: " + patch.dump());
}

DistributedConfig Coordinator::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

HealthReport Coordinator::health_check() const {
    HealthReport report;
    const auto config = get_config();
    const auto active = registry_.get_active_nodes();

    if (active.empty()) {
        report.issues.push_back("No active nodes available");
    } else if (static_cast<double>(active.size()) < MIN_AVAILABLE_SHARE * static_cast<double>(config.max_nodes)) {
        report.issues.push_back("Low node availability: " + std::to_string(active.size()) + "/" +
                                std::to_string(config.max_nodes) + " nodes active");
    }

    if (!active.empty()) {
        const auto overloaded = std::count_if(active.begin(), active.end(), [](const ReasoningNode& n) {
            return n.workload > OVERLOAD_WORKLOAD;
        });
        if (static_cast<double>(overloaded) > OVERLOADED_SHARE * static_cast<double>(active.size()))
            report.issues.push_back("High system load: " + std::to_string(overloaded) + " nodes overloaded");
    }

    std::vector<std::string> unreliable;
    for (const auto& n : active)
        if (n.performance.reliability < MIN_NODE_RELIABILITY) unreliable.push_back(n.id);
    if (!unreliable.empty())
        report.issues.push_back("Low reliability nodes: " + join(unreliable));

    report.healthy = report.issues.empty();
    return report;
}

// =============================================================================
// Background maintenance
// =============================================================================

void Coordinator::run_maintenance() {
    fault_.run_once();

    const auto config = get_config();
    queue_.cleanup(config.task_retention_ms);

    const auto now = now_();
    std::lock_guard<std::mutex> lock(completions_mutex_);
    while (!completions_.empty() && ms_between(completions_.front(), now) > THROUGHPUT_WINDOW_MS)
        completions_.pop_front();
}

void Coordinator::start() {
    maintenance_.start();
    Logger::info("Coordinator maintenance started");
}

void Coordinator::stop() {
    if (!maintenance_.running()) return;
    maintenance_.stop();
    Logger::info("Coordinator maintenance stopped");
}

} // namespace Synod
