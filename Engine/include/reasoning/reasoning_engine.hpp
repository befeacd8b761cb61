/**
 * @file reasoning_engine.hpp
 * @brief Polymorphic reasoning contract: reason(query) -> result
 *
 * Every variant is total. reason() wraps the variant's infer() and turns any
 * exception into a zero-confidence result whose explanation carries the
 * failure, so callers never need a try block around a local engine.
 */

#pragma once

#include <reasoning/types.hpp>
#include <export.hpp>
#include <string>

namespace Synod {

class AtomSpace;

class SYNOD_API ReasoningEngine {
public:
    virtual ~ReasoningEngine() = default;

    ReasoningResult reason(const ReasoningQuery& query) const;

    virtual std::string name() const = 0;

protected:
    virtual ReasoningResult infer(const ReasoningQuery& query) const = 0;
};

// =============================================================================
// PLN-style variants
// =============================================================================

/**
 * @brief Modus ponens over ImplicationLink(A, B) atoms.
 *
 * Implications come from the query itself and, when a store is attached,
 * from stored implications whose antecedent matches a query atom.
 */
class SYNOD_API DeductiveEngine : public ReasoningEngine {
public:
    explicit DeductiveEngine(const AtomSpace* store = nullptr) : store_(store) {}
    std::string name() const override { return "deductive"; }

    static constexpr double TRUTH_THRESHOLD = 0.7;
    static constexpr double CONFIDENCE_THRESHOLD = 0.5;
    static constexpr double CONFIDENCE_DISCOUNT = 0.9;

protected:
    ReasoningResult infer(const ReasoningQuery& query) const override;

private:
    const AtomSpace* store_;
};

/**
 * @brief Generalises EvaluationLink observations grouped by predicate.
 */
class SYNOD_API InductiveEngine : public ReasoningEngine {
public:
    std::string name() const override { return "inductive"; }

    static constexpr size_t MIN_OBSERVATIONS = 3;

protected:
    ReasoningResult infer(const ReasoningQuery& query) const override;
};

/**
 * @brief Ranks candidate causes for EvaluationLink observations.
 */
class SYNOD_API AbductiveEngine : public ReasoningEngine {
public:
    std::string name() const override { return "abductive"; }

    static constexpr size_t MAX_HYPOTHESES = 5;

protected:
    ReasoningResult infer(const ReasoningQuery& query) const override;
};

} // namespace Synod
