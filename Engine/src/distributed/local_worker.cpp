#include <distributed/local_worker.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <stdexcept>

namespace Synod {

LocalReasoningWorker::LocalReasoningWorker(const AtomSpace* store, std::set<Capability> capabilities,
                                           size_t max_concurrent)
    : router_(store),
      capabilities_(std::move(capabilities)),
      max_concurrent_(max_concurrent == 0 ? 1 : max_concurrent),
      started_at_(Clock::now()) {}

ReasoningResult LocalReasoningWorker::execute_task(const ReasoningQuery& query, const TaskConstraints&) {
    const Capability needed = capability_for_query_type(query.type);
    if (!capabilities_.count(needed))
        throw std::runtime_error("Capability '" + to_string(needed) + "' not offered by this worker");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) throw std::runtime_error("Worker is offline");
        if (maintenance_) throw std::runtime_error("Worker is in maintenance");
        if (active_ >= max_concurrent_) throw std::runtime_error("Worker at capacity");
        ++active_;
    }

    Timer timer;
    ReasoningResult result = router_.reason(query);
    const double ms = timer.elapsed_ms();
    const bool failed = result.metadata.value("error", false);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        const bool first = performance_.tasks_completed + performance_.tasks_errored == 0;
        performance_.avg_response_time_ms = first ? ms : 0.9 * performance_.avg_response_time_ms + 0.1 * ms;
        if (failed) ++performance_.tasks_errored;
        else ++performance_.tasks_completed;
        const auto total = performance_.tasks_completed + performance_.tasks_errored;
        performance_.reliability = static_cast<double>(performance_.tasks_completed) / static_cast<double>(total);
    }
    idle_cv_.notify_all();

    result.metadata["capabilities"] = nlohmann::json::array();
    for (auto c : capabilities_) result.metadata["capabilities"].push_back(to_string(c));
    result.metadata["processingTime"] = ms;
    return result;
}

NodeStatusReport LocalReasoningWorker::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeStatusReport report;
    if (shut_down_) report.status = NodeStatus::Offline;
    else if (maintenance_) report.status = NodeStatus::Maintenance;
    else if (active_ >= max_concurrent_) report.status = NodeStatus::Busy;
    else report.status = NodeStatus::Online;

    report.workload = static_cast<double>(active_) / static_cast<double>(max_concurrent_);
    report.performance = performance_;
    report.performance.uptime_ms = ms_between(started_at_, Clock::now());
    return report;
}

NodeHeartbeat LocalReasoningWorker::heartbeat(const std::string& node_id) const {
    const auto report = get_status();
    NodeHeartbeat hb;
    hb.node_id = node_id;
    hb.status = report.status;
    hb.workload = report.workload;
    hb.performance = report.performance;
    return hb;
}

void LocalReasoningWorker::set_maintenance(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    maintenance_ = on;
}

void LocalReasoningWorker::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (shut_down_) return;
    maintenance_ = true;
    idle_cv_.wait(lock, [this] { return active_ == 0; });
    shut_down_ = true;
    Logger::info("Local reasoning worker shut down");
}

} // namespace Synod
