/**
 * @file node_connector.hpp
 * @brief Resolves a registered node to a callable client
 */

#pragma once

#include <distributed/node_client.hpp>
#include <export.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Synod {

class NodeConnector {
public:
    virtual ~NodeConnector() = default;

    /**
     * @throws std::runtime_error if the node cannot be reached
     */
    virtual std::shared_ptr<ReasoningNodeClient> connect(const ReasoningNode& node) = 0;
};

/**
 * @brief Endpoint -> client table for workers living in this process.
 */
class SYNOD_API InProcessConnector : public NodeConnector {
public:
    void bind(const std::string& endpoint, std::shared_ptr<ReasoningNodeClient> client);
    bool unbind(const std::string& endpoint);
    size_t size() const;

    std::shared_ptr<ReasoningNodeClient> connect(const ReasoningNode& node) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ReasoningNodeClient>> clients_;
};

} // namespace Synod
