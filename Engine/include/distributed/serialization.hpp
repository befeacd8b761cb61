/**
 * @file serialization.hpp
 * @brief JSON codecs for the coordination value types
 *
 * Used by the demo tool and by anything that reports task/node state
 * outward. Time points are rendered as milliseconds relative to a caller
 * supplied reference (steady clock values have no absolute meaning).
 */

#pragma once

#include <distributed/types.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>

namespace Synod {

SYNOD_API void to_json(nlohmann::json& j, const NodePerformance& p);
SYNOD_API void from_json(const nlohmann::json& j, NodePerformance& p);

SYNOD_API void to_json(nlohmann::json& j, const NodeRegistration& r);
SYNOD_API void from_json(const nlohmann::json& j, NodeRegistration& r);

SYNOD_API void to_json(nlohmann::json& j, const NodeHeartbeat& h);
SYNOD_API void from_json(const nlohmann::json& j, NodeHeartbeat& h);

SYNOD_API void to_json(nlohmann::json& j, const TaskConstraints& c);
SYNOD_API void from_json(const nlohmann::json& j, TaskConstraints& c);

SYNOD_API void to_json(nlohmann::json& j, const NodeReasoningResult& r);
SYNOD_API void to_json(nlohmann::json& j, const QualityMetrics& q);
SYNOD_API void to_json(nlohmann::json& j, const ResultMetadata& m);
SYNOD_API void to_json(nlohmann::json& j, const DistributedReasoningResult& r);
SYNOD_API void to_json(nlohmann::json& j, const DistributedReasoningStats& s);
SYNOD_API void to_json(nlohmann::json& j, const HealthReport& h);

SYNOD_API nlohmann::json node_to_json(const ReasoningNode& node, TimePoint now);
SYNOD_API nlohmann::json task_to_json(const DistributedReasoningTask& task, TimePoint now);

} // namespace Synod
