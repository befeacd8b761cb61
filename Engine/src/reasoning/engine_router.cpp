#include <reasoning/engine_router.hpp>

namespace Synod {

EngineRouter::EngineRouter(const AtomSpace* store)
    : deductive_(store),
      pattern_(store),
      hybrid_({&deductive_, &inductive_, &abductive_, &pattern_, &domain_}) {}

const ReasoningEngine& EngineRouter::engine_for(const std::string& query_type) const {
    if (query_type == "deductive") return deductive_;
    if (query_type == "inductive") return inductive_;
    if (query_type == "abductive") return abductive_;
    if (query_type == "pattern-matching") return pattern_;
    if (query_type == "domain-analysis" || query_type == "code-analysis") return domain_;
    return hybrid_;
}

ReasoningResult EngineRouter::reason(const ReasoningQuery& query) const {
    return engine_for(query.type).reason(query);
}

std::vector<std::string> EngineRouter::variant_names() const {
    return {deductive_.name(), inductive_.name(), abductive_.name(), pattern_.name(), domain_.name()};
}

} // namespace Synod
