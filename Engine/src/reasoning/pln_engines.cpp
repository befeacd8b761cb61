/**
 * @file pln_engines.cpp
 * @brief Deductive, inductive and abductive inference
 */

#include <reasoning/reasoning_engine.hpp>
#include <knowledge/atom_space.hpp>
#include <algorithm>
#include <map>
#include <numeric>
#include <unordered_set>

namespace Synod {

namespace {

bool is_true(const Atom& atom) {
    return atom.truth_value &&
           atom.truth_value->strength() > DeductiveEngine::TRUTH_THRESHOLD &&
           atom.truth_value->confidence() > DeductiveEngine::CONFIDENCE_THRESHOLD;
}

double mean_confidence(const std::vector<Atom>& atoms) {
    if (atoms.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& a : atoms) sum += a.truth_value ? a.truth_value->confidence() : 0.0;
    return sum / static_cast<double>(atoms.size());
}

std::string predicate_of(const Atom& observation) {
    const Atom& head = observation.outgoing.front();
    return head.name ? *head.name : head.type;
}

bool related(const Atom& a, const Atom& b) {
    if (a.name && a.name == b.name) return true;
    if (a.type == b.type) return true;
    for (const auto& x : a.outgoing)
        for (const auto& y : b.outgoing)
            if (x.name && x.name == y.name) return true;
    return false;
}

} // namespace

// =============================================================================
// Deductive
// =============================================================================

ReasoningResult DeductiveEngine::infer(const ReasoningQuery& query) const {
    std::vector<Atom> implications;
    std::vector<Atom> facts;

    for (const auto& atom : query.atoms) {
        if (atom.type == "ImplicationLink" && atom.outgoing.size() == 2)
            implications.push_back(atom);
        else
            facts.push_back(atom);
    }

    if (store_) {
        AtomPattern pattern;
        pattern.type = "ImplicationLink";
        for (const auto& stored : store_->query_atoms(pattern)) {
            if (stored.outgoing.size() != 2) continue;
            const std::string antecedent = structural_key(stored.outgoing[0]);
            for (const auto& fact : facts) {
                if (structural_key(fact) != antecedent) continue;
                // Bind the query's fact (with its truth value) as the antecedent
                Atom bound = stored;
                bound.outgoing[0] = fact;
                implications.push_back(std::move(bound));
            }
        }
    }

    std::vector<Atom> conclusions;
    std::unordered_set<std::string> seen;
    size_t rules_applied = 0;

    for (const auto& impl : implications) {
        const Atom& antecedent = impl.outgoing[0];
        const Atom& consequent = impl.outgoing[1];
        if (!is_true(antecedent) || !impl.truth_value) continue;

        Atom inferred = consequent;
        inferred.id.clear();
        inferred.truth_value = TruthValue(
            antecedent.truth_value->strength() * impl.truth_value->strength(),
            std::min(antecedent.truth_value->confidence(), impl.truth_value->confidence()) * CONFIDENCE_DISCOUNT);
        inferred.metadata = {{"rule", "modus-ponens"}};
        ++rules_applied;

        if (seen.insert(structural_key(inferred)).second)
            conclusions.push_back(std::move(inferred));
    }

    ReasoningResult result;
    result.confidence = mean_confidence(conclusions);
    result.explanation = "Deductive reasoning applied modus ponens " + std::to_string(rules_applied) +
                         " times over " + std::to_string(implications.size()) + " implications";
    result.metadata = {
        {"reasoningType", "pln-deductive"},
        {"rulesApplied", rules_applied},
        {"inferenceSteps", conclusions.size()}
    };
    result.conclusion = std::move(conclusions);
    return result;
}

// =============================================================================
// Inductive
// =============================================================================

ReasoningResult InductiveEngine::infer(const ReasoningQuery& query) const {
    std::map<std::string, std::vector<const Atom*>> groups;
    size_t observations = 0;

    for (const auto& atom : query.atoms) {
        if (atom.type != "EvaluationLink" || atom.outgoing.empty()) continue;
        groups[predicate_of(atom)].push_back(&atom);
        ++observations;
    }

    std::vector<Atom> patterns;
    for (const auto& [predicate, obs] : groups) {
        if (obs.size() < MIN_OBSERVATIONS) continue;

        size_t positive = std::count_if(obs.begin(), obs.end(), [](const Atom* a) {
            return a->truth_value && a->truth_value->strength() > 0.5;
        });
        const double n = static_cast<double>(obs.size());

        Atom variable{"", "VariableNode", std::string("$X"), std::nullopt, {}, nlohmann::json::object()};
        Atom evaluation{"", "EvaluationLink", predicate, std::nullopt, {variable}, nlohmann::json::object()};

        Atom pattern;
        pattern.type = "ImplicationLink";
        pattern.name = "pattern_" + predicate;
        pattern.truth_value = TruthValue(static_cast<double>(positive) / n, std::min(0.9, n / 10.0));
        pattern.outgoing = {variable, evaluation};
        pattern.metadata = {{"observations", obs.size()}};
        patterns.push_back(std::move(pattern));
    }

    ReasoningResult result;
    result.confidence = mean_confidence(patterns);
    result.explanation = "Inductive reasoning found " + std::to_string(patterns.size()) +
                         " generalizations from " + std::to_string(observations) + " observations";
    result.metadata = {
        {"reasoningType", "pln-inductive"},
        {"observationCount", observations},
        {"patternCount", patterns.size()}
    };
    result.conclusion = std::move(patterns);
    return result;
}

// =============================================================================
// Abductive
// =============================================================================

ReasoningResult AbductiveEngine::infer(const ReasoningQuery& query) const {
    std::vector<const Atom*> observations;
    for (const auto& atom : query.atoms)
        if (atom.type == "EvaluationLink" && !atom.outgoing.empty()) observations.push_back(&atom);

    struct Scored {
        Atom hypothesis;
        double score;
        size_t order;
    };
    std::vector<Scored> scored;

    for (const Atom* obs : observations) {
        Atom cause{"", "VariableNode", std::string("$Cause"), std::nullopt, {}, nlohmann::json::object()};

        Atom hypothesis;
        hypothesis.type = "ImplicationLink";
        hypothesis.name = "hypothesis_" + predicate_of(*obs);
        hypothesis.truth_value = TruthValue(0.5, 0.3);
        hypothesis.outgoing = {cause, *obs};
        hypothesis.outgoing[1].id.clear();

        double score = hypothesis.truth_value->strength() * hypothesis.truth_value->confidence();
        for (const Atom* other : observations)
            if (other != obs && related(*obs, *other)) score += 0.1;

        scored.push_back({std::move(hypothesis), score, scored.size()});
    }

    std::sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.order < b.order;
    });
    const size_t generated = scored.size();
    if (scored.size() > MAX_HYPOTHESES) scored.resize(MAX_HYPOTHESES);

    ReasoningResult result;
    double total = 0.0;
    for (auto& s : scored) {
        total += std::min(1.0, s.score);
        s.hypothesis.metadata = {{"plausibility", s.score}};
        result.conclusion.push_back(std::move(s.hypothesis));
    }
    result.confidence = scored.empty() ? 0.0 : total / static_cast<double>(scored.size());
    result.explanation = "Abductive reasoning generated " + std::to_string(result.conclusion.size()) +
                         " plausible explanations";
    result.metadata = {
        {"reasoningType", "pln-abductive"},
        {"hypothesesGenerated", generated},
        {"topHypotheses", result.conclusion.size()}
    };
    return result;
}

} // namespace Synod
