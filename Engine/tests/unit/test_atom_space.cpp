/**
 * @file test_atom_space.cpp
 * @brief Unit tests for the in-memory knowledge store
 */

#include <gtest/gtest.h>
#include <knowledge/atom_space.hpp>
#include <thread>
#include <vector>

using namespace Synod;

static Atom node(const std::string& type, const std::string& name) {
    Atom a;
    a.type = type;
    a.name = name;
    return a;
}

TEST(TruthValueTest, ClampsIntoUnitRange) {
    TruthValue tv(1.7, -0.3);
    EXPECT_DOUBLE_EQ(tv.strength(), 1.0);
    EXPECT_DOUBLE_EQ(tv.confidence(), 0.0);

    tv.set_strength(-2.0);
    tv.set_confidence(4.0);
    EXPECT_DOUBLE_EQ(tv.strength(), 0.0);
    EXPECT_DOUBLE_EQ(tv.confidence(), 1.0);
}

TEST(TruthValueTest, JsonDecodeClamps) {
    auto tv = nlohmann::json::parse(R"({"strength": 3, "confidence": 0.4})").get<TruthValue>();
    EXPECT_DOUBLE_EQ(tv.strength(), 1.0);
    EXPECT_DOUBLE_EQ(tv.confidence(), 0.4);
}

TEST(AtomSpaceTest, AssignsIdsWhenAbsent) {
    AtomSpace space;
    auto a = space.add_atom(node("ConceptNode", "cat"));
    auto b = space.add_atom(node("ConceptNode", "dog"));

    EXPECT_FALSE(a.empty());
    EXPECT_NE(a, b);
    EXPECT_EQ(space.size(), 2u);
    ASSERT_TRUE(space.get_atom(a));
    EXPECT_EQ(space.get_atom(a)->name, "cat");
}

TEST(AtomSpaceTest, UpsertReplacesById) {
    AtomSpace space;
    Atom a = node("ConceptNode", "cat");
    a.id = "fixed";
    space.add_atom(a);

    a.name = "lion";
    EXPECT_EQ(space.add_atom(a), "fixed");
    EXPECT_EQ(space.size(), 1u);
    EXPECT_EQ(space.get_atom("fixed")->name, "lion");
}

TEST(AtomSpaceTest, GeneratedIdsSkipTakenIds) {
    AtomSpace space;
    Atom taken = node("ConceptNode", "x");
    taken.id = "atom_1";
    space.add_atom(taken);

    auto id = space.add_atom(node("ConceptNode", "y"));
    EXPECT_NE(id, "atom_1");
    EXPECT_EQ(space.size(), 2u);
}

TEST(AtomSpaceTest, QueryMatchesTypeNameAndShape) {
    AtomSpace space;
    space.add_atom(node("ConceptNode", "cat"));
    space.add_atom(node("ConceptNode", "dog"));
    space.add_atom(node("PredicateNode", "cat"));

    Atom link;
    link.type = "InheritanceLink";
    link.outgoing = {node("ConceptNode", "cat"), node("ConceptNode", "animal")};
    space.add_atom(link);

    AtomPattern by_type;
    by_type.type = "ConceptNode";
    EXPECT_EQ(space.query_atoms(by_type).size(), 2u);

    AtomPattern by_name;
    by_name.name = "cat";
    EXPECT_EQ(space.query_atoms(by_name).size(), 2u);

    AtomPattern shape;
    shape.type = "InheritanceLink";
    shape.outgoing_types = std::vector<std::string>{"ConceptNode", "ConceptNode"};
    EXPECT_EQ(space.query_atoms(shape).size(), 1u);

    // No partial match on arity
    shape.outgoing_types = std::vector<std::string>{"ConceptNode"};
    EXPECT_TRUE(space.query_atoms(shape).empty());
}

TEST(AtomSpaceTest, QueryByMinimumTruth) {
    AtomSpace space;
    Atom strong = node("ConceptNode", "a");
    strong.truth_value = TruthValue(0.9, 0.9);
    Atom weak = node("ConceptNode", "b");
    weak.truth_value = TruthValue(0.2, 0.9);
    space.add_atom(strong);
    space.add_atom(weak);
    space.add_atom(node("ConceptNode", "c"));

    AtomPattern p;
    p.min_truth = TruthValue(0.5, 0.5);
    auto found = space.query_atoms(p);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "a");
}

TEST(AtomSpaceTest, UpdateMergesAndPreservesId) {
    AtomSpace space;
    Atom a = node("ConceptNode", "cat");
    a.metadata = {{"source", "test"}, {"rank", 1}};
    auto id = space.add_atom(a);

    AtomUpdate update;
    update.truth_value = TruthValue(0.8, 0.7);
    update.metadata = nlohmann::json{{"rank", 2}};
    EXPECT_TRUE(space.update_atom(id, update));

    auto stored = space.get_atom(id);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->id, id);
    EXPECT_EQ(stored->name, "cat");
    ASSERT_TRUE(stored->truth_value);
    EXPECT_DOUBLE_EQ(stored->truth_value->strength(), 0.8);
    EXPECT_EQ(stored->metadata["source"], "test");
    EXPECT_EQ(stored->metadata["rank"], 2);
}

TEST(AtomSpaceTest, UnknownIdsReportFalse) {
    AtomSpace space;
    EXPECT_FALSE(space.remove_atom("missing"));
    EXPECT_FALSE(space.update_atom("missing", AtomUpdate{}));
    EXPECT_FALSE(space.get_atom("missing"));
}

TEST(AtomSpaceTest, RemoveAndClear) {
    AtomSpace space;
    auto id = space.add_atom(node("ConceptNode", "cat"));
    space.add_atom(node("ConceptNode", "dog"));

    EXPECT_TRUE(space.remove_atom(id));
    EXPECT_EQ(space.size(), 1u);
    space.clear();
    EXPECT_EQ(space.size(), 0u);
}

TEST(AtomSpaceTest, ConcurrentWritersGetDistinctIds) {
    AtomSpace space;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&space, t] {
            for (int i = 0; i < 100; ++i)
                space.add_atom(node("ConceptNode", "n" + std::to_string(t) + "_" + std::to_string(i)));
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(space.size(), 400u);
}

TEST(AtomTest, StructuralKeyIgnoresIdAndTruth) {
    Atom a = node("ConceptNode", "cat");
    Atom b = a;
    a.id = "atom_1";
    b.truth_value = TruthValue(0.1, 0.1);
    EXPECT_EQ(structural_key(a), structural_key(b));

    Atom link;
    link.type = "ListLink";
    link.outgoing = {a, node("ConceptNode", "dog")};
    EXPECT_EQ(structural_key(link), "ListLink:(ConceptNode:cat,ConceptNode:dog)");
}

TEST(AtomTest, JsonCodec) {
    auto j = nlohmann::json::parse(R"({
        "type": "InheritanceLink",
        "truthValue": {"strength": 0.9, "confidence": 0.8},
        "outgoing": [{"type": "ConceptNode", "name": "cat"}, {"type": "ConceptNode", "name": "animal"}]
    })");
    auto atom = j.get<Atom>();
    EXPECT_EQ(atom.type, "InheritanceLink");
    EXPECT_FALSE(atom.name);
    ASSERT_EQ(atom.outgoing.size(), 2u);
    EXPECT_EQ(atom.outgoing[1].name, "animal");
    EXPECT_EQ(nlohmann::json(atom)["truthValue"]["confidence"], 0.8);
}
