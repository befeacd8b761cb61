#include <distributed/fault_tolerance.hpp>
#include <utils/logger.hpp>
#include <algorithm>

namespace Synod {

namespace {

constexpr double SUSPICIOUS_WEIGHT_HIGH = 0.5;

} // anonymous namespace

FaultToleranceManager::FaultToleranceManager(NodeRegistry& registry, TaskQueue& queue,
                                             const DistributedConfig& config)
    : registry_(registry),
      queue_(queue),
      level_(config.fault_tolerance_level),
      thresholds_{config.similarity_threshold, config.confidence_tolerance},
      suspicion_strikes_(config.suspicion_strikes),
      ticker_("fault-tolerance", Millis(config.heartbeat_interval_ms), [this] { run_once(); }) {}

FaultToleranceManager::~FaultToleranceManager() {
    stop();
}

void FaultToleranceManager::update_config(const DistributedConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = config.fault_tolerance_level;
        thresholds_ = {config.similarity_threshold, config.confidence_tolerance};
        suspicion_strikes_ = config.suspicion_strikes;
    }
    ticker_.set_interval(Millis(config.heartbeat_interval_ms));
}

void FaultToleranceManager::set_top_up_handler(TopUpHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    top_up_ = std::move(handler);
}

std::vector<std::string> FaultToleranceManager::detect_failures() {
    auto offline = registry_.cleanup_inactive_nodes();
    if (!offline.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_.insert(offline.begin(), offline.end());
    }
    return offline;
}

size_t FaultToleranceManager::handle_failure(const std::string& node_id) {
    if (auto node = registry_.get_node(node_id); node && node->status != NodeStatus::Offline)
        registry_.update_status(node_id, NodeStatus::Error);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_.insert(node_id);
    }
    return redistribute_tasks(node_id);
}

size_t FaultToleranceManager::redistribute_tasks(const std::string& node_id) {
    TopUpHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = top_up_;
    }

    size_t topped_up = 0;
    for (const auto& task_id : queue_.tasks_assigned_to(node_id)) {
        if (handler && handler(task_id, node_id)) {
            ++topped_up;
            continue;
        }

        auto task = queue_.get_task(task_id);
        if (!task) continue;
        auto nodes = task->assigned_nodes;
        nodes.erase(std::remove(nodes.begin(), nodes.end(), node_id), nodes.end());
        TaskUpdate update;
        update.assigned_nodes = std::move(nodes);
        queue_.update_task(task_id, update);
        Logger::warn("No replacement for " + node_id + " on task " + task_id);
    }

    if (topped_up > 0)
        Logger::step("Redistributed " + std::to_string(topped_up) + " task(s) from " + node_id);
    return topped_up;
}

ValidationReport FaultToleranceManager::validate_results(const std::vector<NodeReasoningResult>& results) {
    ValidationReport report;

    std::vector<const NodeReasoningResult*> ok;
    for (const auto& r : results)
        if (r.ok()) ok.push_back(&r);
    if (ok.empty()) {
        report.valid = false;
        return report;
    }

    std::vector<const ReasoningResult*> plain;
    for (const auto* r : ok) plain.push_back(&r->result);
    const auto group = majority_group(plain);

    // Reference: the majority conclusion at the group's mean confidence
    ReasoningResult reference = ok[group.front()]->result;
    double conf = 0.0;
    for (size_t idx : group) conf += ok[idx]->result.confidence;
    reference.confidence = conf / static_cast<double>(group.size());

    report.valid = group.size() * 2 > ok.size();

    std::lock_guard<std::mutex> lock(mutex_);
    const bool track = level_ == FaultToleranceLevel::High || level_ == FaultToleranceLevel::Byzantine;

    for (const auto* r : ok) {
        const bool agree = report.valid && agrees(r->result, reference, thresholds_);
        if (!agree && report.valid) report.disagreeing_nodes.push_back(r->node_id);
        if (!track || !report.valid) continue;

        auto& s = strikes_[r->node_id];
        if (agree) {
            if (s > 0) --s;
            if (s == 0 && suspicious_.erase(r->node_id))
                Logger::info("Node " + r->node_id + " no longer suspicious");
        } else {
            ++s;
            if (s >= suspicion_strikes_ && suspicious_.insert(r->node_id).second)
                Logger::warn("Node " + r->node_id + " flagged suspicious after " + std::to_string(s) + " disagreements");
        }
    }

    report.suspicious_nodes.assign(suspicious_.begin(), suspicious_.end());
    return report;
}

double FaultToleranceManager::weight_for(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!suspicious_.count(node_id)) return 1.0;
    switch (level_) {
        case FaultToleranceLevel::High:      return SUSPICIOUS_WEIGHT_HIGH;
        case FaultToleranceLevel::Byzantine: return 0.0;
        default:                             return 1.0;
    }
}

bool FaultToleranceManager::is_suspicious(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return suspicious_.count(node_id) > 0;
}

size_t FaultToleranceManager::strikes(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strikes_.find(node_id);
    return it == strikes_.end() ? 0 : it->second;
}

std::vector<std::string> FaultToleranceManager::recover() {
    std::vector<std::string> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        candidates.assign(failed_.begin(), failed_.end());
    }

    std::vector<std::string> recovered;
    for (const auto& id : candidates)
        if (registry_.is_active(id)) recovered.push_back(id);

    if (!recovered.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : recovered) {
            failed_.erase(id);
            strikes_.erase(id);
            suspicious_.erase(id);
        }
    }
    for (const auto& id : recovered) Logger::success("Node " + id + " recovered");
    return recovered;
}

void FaultToleranceManager::forget(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    strikes_.erase(node_id);
    suspicious_.erase(node_id);
    failed_.erase(node_id);
}

void FaultToleranceManager::run_once() {
    FaultToleranceLevel level;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level = level_;
    }

    const auto offline = detect_failures();
    if (level != FaultToleranceLevel::None) {
        for (const auto& id : offline) redistribute_tasks(id);
    }
    recover();
}

void FaultToleranceManager::start() {
    ticker_.start();
    Logger::info("Fault tolerance monitor started");
}

void FaultToleranceManager::stop() {
    if (!ticker_.running()) return;
    ticker_.stop();
    Logger::info("Fault tolerance monitor stopped");
}

} // namespace Synod
