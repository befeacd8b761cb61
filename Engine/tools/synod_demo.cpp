/**
 * @file synod_demo.cpp
 * @brief Run one distributed query over in-process reasoning workers
 *
 * Usage: synod_demo [query-type] [--nodes N] [--config file.json] [--query file.json]
 */

#include <distributed/coordinator.hpp>
#include <distributed/local_worker.hpp>
#include <distributed/serialization.hpp>
#include <knowledge/atom_space.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace Synod;

namespace {

Atom concept_node(const std::string& name, double strength, double confidence) {
    Atom a;
    a.type = "ConceptNode";
    a.name = name;
    a.truth_value = TruthValue(strength, confidence);
    return a;
}

Atom implication(const Atom& from, const Atom& to, double strength, double confidence) {
    Atom link;
    link.type = "ImplicationLink";
    link.outgoing = {from, to};
    link.truth_value = TruthValue(strength, confidence);
    return link;
}

Atom evaluation(const std::string& predicate, const std::string& subject, double strength) {
    Atom pred;
    pred.type = "PredicateNode";
    pred.name = predicate;
    Atom subj = concept_node(subject, 1.0, 0.9);
    Atom link;
    link.type = "EvaluationLink";
    link.outgoing = {pred, subj};
    link.truth_value = TruthValue(strength, 0.9);
    return link;
}

void seed_knowledge(AtomSpace& space) {
    const auto socrates = concept_node("socrates-is-human", 0.95, 0.9);
    const auto mortal = concept_node("socrates-is-mortal", 0.0, 0.0);
    space.add_atom(socrates);
    space.add_atom(implication(socrates, mortal, 0.98, 0.95));
    for (const auto* who : {"plato", "aristotle", "zeno", "diogenes"})
        space.add_atom(evaluation("philosopher", who, 0.9));
}

ReasoningQuery default_query(const std::string& type) {
    ReasoningQuery q;
    q.type = type;
    q.atoms.push_back(concept_node("socrates-is-human", 0.95, 0.9));
    for (const auto* who : {"plato", "aristotle", "zeno"})
        q.atoms.push_back(evaluation("philosopher", who, 0.9));
    return q;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string query_type = "deductive";
    std::string config_path, query_path;
    size_t node_count = 3;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--nodes" && i + 1 < argc) node_count = std::stoul(argv[++i]);
        else if (arg == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (arg == "--query" && i + 1 < argc) query_path = argv[++i];
        else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0]
                      << " [query-type] [--nodes N] [--config file.json] [--query file.json]" << std::endl;
            return 0;
        }
        else query_type = arg;
    }

    try {
        DistributedConfig config = config_path.empty()
            ? DistributedConfig::load_from_env()
            : DistributedConfig::from_file(config_path);

        auto space = std::make_shared<AtomSpace>();
        seed_knowledge(*space);
        Logger::info("Knowledge store seeded with " + std::to_string(space->size()) + " atoms");

        auto connector = std::make_shared<InProcessConnector>();
        Coordinator coordinator(config, connector);

        const std::set<Capability> all_caps = {
            Capability::Deductive, Capability::Inductive, Capability::Abductive,
            Capability::PatternMatching, Capability::DomainAnalysis, Capability::CodeAnalysis
        };

        std::vector<std::pair<std::string, std::shared_ptr<LocalReasoningWorker>>> workers;
        for (size_t i = 0; i < node_count; ++i) {
            const std::string endpoint = "local://worker-" + std::to_string(i + 1);
            auto worker = std::make_shared<LocalReasoningWorker>(space.get(), all_caps);
            connector->bind(endpoint, worker);

            NodeRegistration reg;
            reg.endpoint = endpoint;
            reg.capabilities = worker->get_capabilities();
            reg.metadata = {{"specialization", "general"}};
            const auto id = coordinator.register_node(reg);
            coordinator.send_heartbeat(worker->heartbeat(id));
            workers.emplace_back(id, worker);
        }

        ReasoningQuery query = default_query(query_type);
        if (!query_path.empty()) {
            std::ifstream file(query_path);
            if (!file) throw std::runtime_error("Cannot open query file: " + query_path);
            query = nlohmann::json::parse(file).get<ReasoningQuery>();
        }

        auto sub = coordinator.events().consensus_reached.subscribe([](const std::string& id, const double& level) {
            Logger::success("Consensus on " + id + ": " + std::to_string(level));
        });

        const auto result = coordinator.submit_task(query);

        nlohmann::json report;
        report["result"] = result;
        report["stats"] = coordinator.get_system_stats();
        report["health"] = coordinator.health_check();
        std::cout << report.dump(2) << std::endl;

        for (auto& [id, worker] : workers) {
            worker->shutdown();
            coordinator.deregister_node(id);
        }
        return 0;
    } catch (const ReasoningError& e) {
        Logger::error(std::string("Reasoning failed: ") + e.what());
        return 2;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
