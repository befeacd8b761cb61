/**
 * @file test_reasoning_engines.cpp
 * @brief Unit tests for the local reasoning variants and the router
 */

#include <gtest/gtest.h>
#include <reasoning/engine_router.hpp>
#include <knowledge/atom_space.hpp>
#include <stdexcept>

using namespace Synod;

static Atom concept_atom(const std::string& name, double s, double c) {
    Atom a;
    a.type = "ConceptNode";
    a.name = name;
    a.truth_value = TruthValue(s, c);
    return a;
}

static Atom implication(const Atom& from, const Atom& to, double s, double c) {
    Atom link;
    link.type = "ImplicationLink";
    link.outgoing = {from, to};
    link.truth_value = TruthValue(s, c);
    return link;
}

static Atom observation(const std::string& predicate, const std::string& subject, double strength) {
    Atom pred;
    pred.type = "PredicateNode";
    pred.name = predicate;
    Atom subj;
    subj.type = "ConceptNode";
    subj.name = subject;
    Atom link;
    link.type = "EvaluationLink";
    link.outgoing = {pred, subj};
    link.truth_value = TruthValue(strength, 0.9);
    return link;
}

namespace {

class ThrowingEngine : public ReasoningEngine {
public:
    std::string name() const override { return "throwing"; }

protected:
    ReasoningResult infer(const ReasoningQuery&) const override {
        throw std::runtime_error("boom");
    }
};

} // anonymous namespace

// ============================================================================
// Deductive
// ============================================================================

TEST(DeductiveEngineTest, ModusPonensFromQuery) {
    DeductiveEngine engine;
    ReasoningQuery q;
    q.type = "deductive";
    q.atoms.push_back(implication(concept_atom("rain", 0.9, 0.8), concept_atom("wet", 0.0, 0.0), 0.8, 0.9));

    auto r = engine.reason(q);
    ASSERT_EQ(r.conclusion.size(), 1u);
    EXPECT_EQ(r.conclusion[0].name, "wet");
    EXPECT_NEAR(r.conclusion[0].truth_value->strength(), 0.72, 1e-9);
    EXPECT_NEAR(r.conclusion[0].truth_value->confidence(), 0.72, 1e-9);   // min(0.8, 0.9) * 0.9
    EXPECT_NEAR(r.confidence, 0.72, 1e-9);
    EXPECT_EQ(r.metadata["engine"], "deductive");
}

TEST(DeductiveEngineTest, WeakAntecedentDoesNotFire) {
    DeductiveEngine engine;
    ReasoningQuery q;
    q.type = "deductive";
    q.atoms.push_back(implication(concept_atom("rain", 0.6, 0.9), concept_atom("wet", 0, 0), 0.9, 0.9));

    auto r = engine.reason(q);
    EXPECT_TRUE(r.conclusion.empty());
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
}

TEST(DeductiveEngineTest, UsesStoredImplications) {
    AtomSpace space;
    space.add_atom(implication(concept_atom("human", 0, 0), concept_atom("mortal", 0, 0), 1.0, 1.0));
    DeductiveEngine engine(&space);

    ReasoningQuery q;
    q.type = "deductive";
    q.atoms.push_back(concept_atom("human", 0.9, 0.9));

    auto r = engine.reason(q);
    ASSERT_EQ(r.conclusion.size(), 1u);
    EXPECT_EQ(r.conclusion[0].name, "mortal");
    EXPECT_NEAR(r.conclusion[0].truth_value->confidence(), 0.81, 1e-9);
}

// ============================================================================
// Inductive / abductive
// ============================================================================

TEST(InductiveEngineTest, GeneralizesOverThreeObservations) {
    InductiveEngine engine;
    ReasoningQuery q;
    q.type = "inductive";
    q.atoms = {observation("flies", "sparrow", 0.9), observation("flies", "robin", 0.9),
               observation("flies", "penguin", 0.1), observation("swims", "duck", 0.9)};

    auto r = engine.reason(q);
    ASSERT_EQ(r.conclusion.size(), 1u);
    EXPECT_EQ(r.conclusion[0].name, "pattern_flies");
    EXPECT_NEAR(r.conclusion[0].truth_value->strength(), 2.0 / 3.0, 1e-9);
    EXPECT_NEAR(r.conclusion[0].truth_value->confidence(), 0.3, 1e-9);
}

TEST(AbductiveEngineTest, KeepsTopFiveHypotheses) {
    AbductiveEngine engine;
    ReasoningQuery q;
    q.type = "abductive";
    for (int i = 0; i < 7; ++i) q.atoms.push_back(observation("wet", "thing" + std::to_string(i), 0.9));

    auto r = engine.reason(q);
    EXPECT_EQ(r.conclusion.size(), AbductiveEngine::MAX_HYPOTHESES);
    EXPECT_EQ(r.metadata["hypothesesGenerated"], 7);
    for (const auto& h : r.conclusion) {
        EXPECT_EQ(h.type, "ImplicationLink");
        ASSERT_EQ(h.outgoing.size(), 2u);
        EXPECT_EQ(h.outgoing[0].name, "$Cause");
    }
    EXPECT_GT(r.confidence, 0.0);
    EXPECT_LE(r.confidence, 1.0);
}

// ============================================================================
// Pattern matching / domain analysis
// ============================================================================

TEST(PatternMatchingEngineTest, MatchesAgainstStore) {
    AtomSpace space;
    space.add_atom(concept_atom("cat", 0.9, 0.6));
    space.add_atom(concept_atom("dog", 0.9, 0.8));
    PatternMatchingEngine engine(&space);

    ReasoningQuery q;
    q.type = "pattern-matching";
    Atom probe;
    probe.type = "ConceptNode";
    q.atoms.push_back(probe);

    auto r = engine.reason(q);
    EXPECT_EQ(r.conclusion.size(), 2u);
    EXPECT_NEAR(r.confidence, 0.7, 1e-9);
}

TEST(PatternMatchingEngineTest, RecurringStructuresWithoutStore) {
    PatternMatchingEngine engine;
    ReasoningQuery q;
    q.type = "pattern-matching";
    q.atoms = {concept_atom("a", 1, 1), concept_atom("a", 0.5, 0.5), concept_atom("b", 1, 1)};

    auto r = engine.reason(q);
    ASSERT_EQ(r.conclusion.size(), 1u);
    EXPECT_EQ(r.conclusion[0].name, "a");
}

TEST(DomainAnalysisEngineTest, SummarisesTypes) {
    DomainAnalysisEngine engine;
    ReasoningQuery q;
    q.type = "domain-analysis";
    q.atoms = {concept_atom("a", 1, 1), observation("p", "x", 1.0)};

    auto r = engine.reason(q);
    // domain:ConceptNode, domain:EvaluationLink, link-density
    EXPECT_EQ(r.conclusion.size(), 3u);
    EXPECT_GT(r.confidence, 0.4);
    EXPECT_LE(r.confidence, 0.9);
}

TEST(DomainAnalysisEngineTest, EmptyQueryYieldsZeroConfidence) {
    DomainAnalysisEngine engine;
    auto r = engine.reason(ReasoningQuery{"domain-analysis", {}, {}, {}});
    EXPECT_TRUE(r.conclusion.empty());
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
}

// ============================================================================
// Totality and routing
// ============================================================================

TEST(ReasoningEngineTest, FailureBecomesZeroConfidenceResult) {
    ThrowingEngine engine;
    auto r = engine.reason(ReasoningQuery{"x", {}, {}, {}});
    EXPECT_DOUBLE_EQ(r.confidence, 0.0);
    EXPECT_TRUE(r.conclusion.empty());
    EXPECT_NE(r.explanation.find("boom"), std::string::npos);
    EXPECT_EQ(r.metadata["error"], true);
}

TEST(EngineRouterTest, RoutesByQueryType) {
    EngineRouter router;
    EXPECT_EQ(router.engine_for("deductive").name(), "deductive");
    EXPECT_EQ(router.engine_for("pattern-matching").name(), "pattern-matching");
    EXPECT_EQ(router.engine_for("code-analysis").name(), "domain-analysis");
    EXPECT_EQ(router.engine_for("something-else").name(), "hybrid");
    EXPECT_EQ(router.variant_names().size(), 5u);
}

TEST(EngineRouterTest, HybridCombinesVariants) {
    EngineRouter router;
    ReasoningQuery q;
    q.type = "mixed";
    q.atoms.push_back(implication(concept_atom("rain", 0.9, 0.8), concept_atom("wet", 0, 0), 0.8, 0.9));

    auto r = router.reason(q);
    EXPECT_EQ(r.metadata["reasoningType"], "hybrid");
    EXPECT_EQ(r.metadata["contributions"].size(), 5u);

    bool has_wet = false;
    for (const auto& a : r.conclusion) has_wet |= a.name == std::optional<std::string>("wet");
    EXPECT_TRUE(has_wet);
    EXPECT_GT(r.confidence, 0.0);
}
