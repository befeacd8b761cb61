#pragma once

#include <knowledge/atom.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Synod {

struct ReasoningQuery {
    std::string type;                    // e.g. "deductive", "pattern-matching"
    std::vector<Atom> atoms;
    nlohmann::json context = nlohmann::json::object();
    nlohmann::json parameters = nlohmann::json::object();
};

struct ReasoningResult {
    std::vector<Atom> conclusion;
    double confidence = 0.0;             // [0,1]
    std::string explanation;
    nlohmann::json metadata = nlohmann::json::object();

    static ReasoningResult failure(const std::string& why, const std::string& reasoning_type) {
        ReasoningResult r;
        r.explanation = why;
        r.metadata = {{"error", true}, {"reasoningType", reasoning_type}};
        return r;
    }
};

SYNOD_API void to_json(nlohmann::json& j, const ReasoningQuery& q);
SYNOD_API void from_json(const nlohmann::json& j, ReasoningQuery& q);
SYNOD_API void to_json(nlohmann::json& j, const ReasoningResult& r);
SYNOD_API void from_json(const nlohmann::json& j, ReasoningResult& r);

} // namespace Synod
