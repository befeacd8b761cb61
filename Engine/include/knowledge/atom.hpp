/**
 * @file atom.hpp
 * @brief Typed knowledge records ("atoms") with optional truth values
 */

#pragma once

#include <export.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Synod {

/**
 * @brief Probabilistic belief: both fields always lie in [0,1].
 */
class SYNOD_API TruthValue {
public:
    TruthValue() = default;
    TruthValue(double strength, double confidence);

    double strength() const { return strength_; }
    double confidence() const { return confidence_; }

    void set_strength(double s);
    void set_confidence(double c);

    bool operator==(const TruthValue& o) const {
        return strength_ == o.strength_ && confidence_ == o.confidence_;
    }

private:
    double strength_ = 0.0;
    double confidence_ = 0.0;
};

struct Atom {
    std::string id;                         // Empty until stored
    std::string type;
    std::optional<std::string> name;
    std::optional<TruthValue> truth_value;
    std::vector<Atom> outgoing;             // Ordered child links
    nlohmann::json metadata = nlohmann::json::object();

    bool is_link() const { return !outgoing.empty(); }
};

/**
 * @brief Exact-match query over the store. Unset fields match anything.
 */
struct AtomPattern {
    std::optional<std::string> type;
    std::optional<std::string> name;
    std::optional<std::vector<std::string>> outgoing_types; // Arity and order must match
    std::optional<TruthValue> min_truth;

    bool matches(const Atom& atom) const;
};

/**
 * @brief Partial update; metadata is merged key by key.
 */
struct AtomUpdate {
    std::optional<std::string> type;
    std::optional<std::string> name;
    std::optional<TruthValue> truth_value;
    std::optional<std::vector<Atom>> outgoing;
    std::optional<nlohmann::json> metadata;

    void apply_to(Atom& atom) const;
};

/**
 * @brief Structure-only identity of an atom: type, name and outgoing shape.
 *
 * Ids, truth values and metadata are ignored, so the same fact inferred on
 * two nodes yields the same key.
 */
SYNOD_API std::string structural_key(const Atom& atom);

SYNOD_API void to_json(nlohmann::json& j, const TruthValue& tv);
SYNOD_API void from_json(const nlohmann::json& j, TruthValue& tv);
SYNOD_API void to_json(nlohmann::json& j, const Atom& atom);
SYNOD_API void from_json(const nlohmann::json& j, Atom& atom);

} // namespace Synod
