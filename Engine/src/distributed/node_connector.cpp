#include <distributed/node_connector.hpp>
#include <stdexcept>

namespace Synod {

void InProcessConnector::bind(const std::string& endpoint, std::shared_ptr<ReasoningNodeClient> client) {
    if (!client) throw std::invalid_argument("Cannot bind a null client to " + endpoint);
    std::lock_guard<std::mutex> lock(mutex_);
    clients_[endpoint] = std::move(client);
}

bool InProcessConnector::unbind(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.erase(endpoint) > 0;
}

size_t InProcessConnector::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

std::shared_ptr<ReasoningNodeClient> InProcessConnector::connect(const ReasoningNode& node) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(node.endpoint);
    if (it == clients_.end())
        throw std::runtime_error("No worker bound at " + node.endpoint + " (node " + node.id + ")");
    return it->second;
}

} // namespace Synod
