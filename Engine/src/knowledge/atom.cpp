#include <knowledge/atom.hpp>
#include <consensus/weighting.hpp>

namespace Synod {

TruthValue::TruthValue(double strength, double confidence)
    : strength_(clamp_unit(strength)), confidence_(clamp_unit(confidence)) {}

void TruthValue::set_strength(double s) { strength_ = clamp_unit(s); }
void TruthValue::set_confidence(double c) { confidence_ = clamp_unit(c); }

bool AtomPattern::matches(const Atom& atom) const {
    if (type && atom.type != *type) return false;
    if (name && atom.name != *name) return false;

    if (outgoing_types) {
        if (outgoing_types->size() != atom.outgoing.size()) return false;
        for (size_t i = 0; i < atom.outgoing.size(); ++i) {
            if (atom.outgoing[i].type != (*outgoing_types)[i]) return false;
        }
    }

    if (min_truth) {
        if (!atom.truth_value) return false;
        if (atom.truth_value->strength() < min_truth->strength()) return false;
        if (atom.truth_value->confidence() < min_truth->confidence()) return false;
    }
    return true;
}

void AtomUpdate::apply_to(Atom& atom) const {
    if (type) atom.type = *type;
    if (name) atom.name = *name;
    if (truth_value) atom.truth_value = *truth_value;
    if (outgoing) atom.outgoing = *outgoing;
    if (metadata && metadata->is_object()) {
        if (!atom.metadata.is_object()) atom.metadata = nlohmann::json::object();
        for (auto& [key, value] : metadata->items())
            atom.metadata[key] = value;
    }
}

std::string structural_key(const Atom& atom) {
    std::string key = atom.type;
    key += ':';
    if (atom.name) key += *atom.name;
    if (!atom.outgoing.empty()) {
        key += '(';
        for (size_t i = 0; i < atom.outgoing.size(); ++i) {
            if (i) key += ',';
            key += structural_key(atom.outgoing[i]);
        }
        key += ')';
    }
    return key;
}

void to_json(nlohmann::json& j, const TruthValue& tv) {
    j = nlohmann::json{{"strength", tv.strength()}, {"confidence", tv.confidence()}};
}

void from_json(const nlohmann::json& j, TruthValue& tv) {
    tv = TruthValue(j.value("strength", 0.0), j.value("confidence", 0.0));
}

void to_json(nlohmann::json& j, const Atom& atom) {
    j = nlohmann::json::object();
    if (!atom.id.empty()) j["id"] = atom.id;
    j["type"] = atom.type;
    if (atom.name) j["name"] = *atom.name;
    if (atom.truth_value) j["truthValue"] = *atom.truth_value;
    if (!atom.outgoing.empty()) j["outgoing"] = atom.outgoing;
    if (atom.metadata.is_object() && !atom.metadata.empty()) j["metadata"] = atom.metadata;
}

void from_json(const nlohmann::json& j, Atom& atom) {
    atom = Atom{};
    atom.id = j.value("id", std::string());
    atom.type = j.at("type").get<std::string>();
    if (j.contains("name") && j["name"].is_string()) atom.name = j["name"].get<std::string>();
    if (j.contains("truthValue")) atom.truth_value = j["truthValue"].get<TruthValue>();
    if (j.contains("outgoing")) atom.outgoing = j["outgoing"].get<std::vector<Atom>>();
    if (j.contains("metadata") && j["metadata"].is_object()) atom.metadata = j["metadata"];
}

} // namespace Synod
