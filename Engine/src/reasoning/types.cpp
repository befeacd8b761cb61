#include <reasoning/types.hpp>
#include <consensus/weighting.hpp>

namespace Synod {

void to_json(nlohmann::json& j, const ReasoningQuery& q) {
    j = nlohmann::json{
        {"type", q.type},
        {"atoms", q.atoms},
        {"context", q.context},
        {"parameters", q.parameters}
    };
}

void from_json(const nlohmann::json& j, ReasoningQuery& q) {
    q = ReasoningQuery{};
    q.type = j.value("type", std::string());
    if (j.contains("atoms")) q.atoms = j["atoms"].get<std::vector<Atom>>();
    if (j.contains("context")) q.context = j["context"];
    if (j.contains("parameters")) q.parameters = j["parameters"];
}

void to_json(nlohmann::json& j, const ReasoningResult& r) {
    j = nlohmann::json{
        {"conclusion", r.conclusion},
        {"confidence", r.confidence},
        {"explanation", r.explanation},
        {"metadata", r.metadata}
    };
}

void from_json(const nlohmann::json& j, ReasoningResult& r) {
    r = ReasoningResult{};
    if (j.contains("conclusion")) r.conclusion = j["conclusion"].get<std::vector<Atom>>();
    r.confidence = clamp_unit(j.value("confidence", 0.0));
    r.explanation = j.value("explanation", std::string());
    if (j.contains("metadata")) r.metadata = j["metadata"];
}

} // namespace Synod
