#include <reasoning/reasoning_engine.hpp>
#include <utils/logger.hpp>
#include <consensus/weighting.hpp>

namespace Synod {

ReasoningResult ReasoningEngine::reason(const ReasoningQuery& query) const {
    try {
        ReasoningResult result = infer(query);
        result.confidence = clamp_unit(result.confidence);
        if (!result.metadata.is_object()) result.metadata = nlohmann::json::object();
        result.metadata["engine"] = name();
        return result;
    } catch (const std::exception& e) {
        Logger::warn("[" + name() + "] reasoning failed: " + e.what());
        auto failed = ReasoningResult::failure(std::string("Reasoning failed: ") + e.what(), query.type);
        failed.metadata["engine"] = name();
        return failed;
    }
}

} // namespace Synod
