#include <distributed/node_registry.hpp>
#include <utils/ids.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <stdexcept>

namespace Synod {

namespace {

constexpr double EMA_KEEP = 0.9;
constexpr double EMA_NEW = 0.1;

bool is_serving(NodeStatus s) {
    return s == NodeStatus::Online || s == NodeStatus::Busy;
}

void refresh_reliability(NodePerformance& p) {
    const auto total = p.tasks_completed + p.tasks_errored;
    p.reliability = total == 0 ? 1.0 : static_cast<double>(p.tasks_completed) / static_cast<double>(total);
}

} // anonymous namespace

NodeRegistry::NodeRegistry(int64_t node_timeout_threshold_ms, NowFn now)
    : timeout_threshold_ms_(node_timeout_threshold_ms), now_(std::move(now)) {}

std::string NodeRegistry::register_node(const NodeRegistration& registration) {
    if (registration.endpoint.empty())
        throw std::invalid_argument("Node registration requires an endpoint");
    if (registration.capabilities.empty())
        throw std::invalid_argument("Node registration requires at least one capability");

    auto entry = std::make_shared<Entry>();
    auto& node = entry->node;
    node.id = make_id("node", next_seq_.fetch_add(1));
    node.endpoint = registration.endpoint;
    node.capabilities = registration.capabilities;
    node.status = NodeStatus::Online;
    node.workload = 0.0;
    node.registered_at = now_();
    node.last_heartbeat = node.registered_at;
    node.metadata = registration.metadata.is_null() ? nlohmann::json::object() : registration.metadata;

    const std::string id = node.id;
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        nodes_.emplace(id, std::move(entry));
    }

    Logger::info("Registered node " + id + " at " + registration.endpoint);
    return id;
}

bool NodeRegistry::deregister(const std::string& node_id) {
    size_t erased;
    {
        std::unique_lock<std::shared_mutex> lock(map_mutex_);
        erased = nodes_.erase(node_id);
    }
    if (erased) Logger::info("Deregistered node " + node_id);
    return erased > 0;
}

std::shared_ptr<NodeRegistry::Entry> NodeRegistry::find(const std::string& node_id) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = nodes_.find(node_id);
    return it == nodes_.end() ? nullptr : it->second;
}

bool NodeRegistry::live_locked(const ReasoningNode& node, TimePoint now) const {
    return ms_between(node.last_heartbeat, now) < timeout_threshold_ms_.load();
}

void NodeRegistry::notify(const std::string& node_id, NodeStatus status) const {
    StatusCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_status_;
    }
    if (cb) cb(node_id, status);
}

bool NodeRegistry::process_heartbeat(const NodeHeartbeat& heartbeat) {
    auto entry = find(heartbeat.node_id);
    if (!entry) {
        Logger::debug("Heartbeat from unknown node " + heartbeat.node_id + " ignored");
        return false;
    }

    bool changed;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& node = entry->node;
        changed = node.status != heartbeat.status;
        node.last_heartbeat = now_();
        node.status = heartbeat.status;
        node.workload = std::clamp(heartbeat.workload, 0.0, 1.0);

        // A worker report never rolls back counts the coordinator recorded
        auto& perf = node.performance;
        const auto& reported = heartbeat.performance;
        perf.uptime_ms = reported.uptime_ms;
        if (reported.tasks_completed + reported.tasks_errored > perf.tasks_completed + perf.tasks_errored) {
            perf.tasks_completed = reported.tasks_completed;
            perf.tasks_errored = reported.tasks_errored;
            perf.avg_response_time_ms = reported.avg_response_time_ms;
            refresh_reliability(perf);
        }
    }

    if (changed) notify(heartbeat.node_id, heartbeat.status);
    return true;
}

std::optional<ReasoningNode> NodeRegistry::get_node(const std::string& node_id) const {
    auto entry = find(node_id);
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->node;
}

std::vector<ReasoningNode> NodeRegistry::all_nodes() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        entries.reserve(nodes_.size());
        for (const auto& [id, e] : nodes_) entries.push_back(e);
    }

    std::vector<ReasoningNode> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        std::lock_guard<std::mutex> lock(e->mutex);
        out.push_back(e->node);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    return out;
}

std::vector<ReasoningNode> NodeRegistry::get_active_nodes() const {
    const auto now = now_();
    auto nodes = all_nodes();
    nodes.erase(std::remove_if(nodes.begin(), nodes.end(), [&](const ReasoningNode& n) {
        return !(live_locked(n, now) && is_serving(n.status));
    }), nodes.end());
    return nodes;
}

std::vector<ReasoningNode> NodeRegistry::find_nodes_by_capability(Capability capability) const {
    auto nodes = get_active_nodes();
    nodes.erase(std::remove_if(nodes.begin(), nodes.end(), [&](const ReasoningNode& n) {
        return !n.has_capability(capability);
    }), nodes.end());
    return nodes;
}

std::vector<std::string> NodeRegistry::cleanup_inactive_nodes() {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        for (const auto& [id, e] : nodes_) entries.push_back(e);
    }

    const auto now = now_();
    std::vector<std::string> demoted;
    for (const auto& e : entries) {
        std::lock_guard<std::mutex> lock(e->mutex);
        if (e->node.status != NodeStatus::Offline && !live_locked(e->node, now)) {
            e->node.status = NodeStatus::Offline;
            demoted.push_back(e->node.id);
        }
    }

    std::sort(demoted.begin(), demoted.end());
    for (const auto& id : demoted) {
        Logger::warn("Node " + id + " missed heartbeats, marked offline");
        notify(id, NodeStatus::Offline);
    }
    return demoted;
}

bool NodeRegistry::is_live(const std::string& node_id) const {
    auto entry = find(node_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return live_locked(entry->node, now_());
}

bool NodeRegistry::is_active(const std::string& node_id) const {
    auto entry = find(node_id);
    if (!entry) return false;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return live_locked(entry->node, now_()) && is_serving(entry->node.status);
}

bool NodeRegistry::update_status(const std::string& node_id, NodeStatus status) {
    auto entry = find(node_id);
    if (!entry) return false;

    bool changed;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        changed = entry->node.status != status;
        entry->node.status = status;
    }
    if (changed) notify(node_id, status);
    return true;
}

bool NodeRegistry::record_execution(const std::string& node_id, double execution_time_ms, bool success) {
    auto entry = find(node_id);
    if (!entry) return false;

    std::lock_guard<std::mutex> lock(entry->mutex);
    auto& perf = entry->node.performance;
    const bool first = perf.tasks_completed + perf.tasks_errored == 0;
    perf.avg_response_time_ms = first
        ? execution_time_ms
        : EMA_KEEP * perf.avg_response_time_ms + EMA_NEW * execution_time_ms;
    if (success) ++perf.tasks_completed;
    else ++perf.tasks_errored;
    refresh_reliability(perf);
    return true;
}

bool NodeRegistry::adjust_in_flight(const std::string& node_id, int delta) {
    auto entry = find(node_id);
    if (!entry) return false;

    std::lock_guard<std::mutex> lock(entry->mutex);
    auto& n = entry->node.in_flight;
    if (delta < 0 && static_cast<size_t>(-delta) > n) n = 0;
    else n = static_cast<size_t>(static_cast<long long>(n) + delta);
    return true;
}

size_t NodeRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return nodes_.size();
}

void NodeRegistry::on_status_change(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_status_ = std::move(callback);
}

} // namespace Synod
