#pragma once

#include <reasoning/reasoning_engine.hpp>

namespace Synod {

/**
 * @brief Treats query atoms as patterns against the store and reports matches.
 *
 * Without a store, recurring structures inside the query itself are
 * reported instead.
 */
class SYNOD_API PatternMatchingEngine : public ReasoningEngine {
public:
    explicit PatternMatchingEngine(const AtomSpace* store = nullptr) : store_(store) {}
    std::string name() const override { return "pattern-matching"; }

protected:
    ReasoningResult infer(const ReasoningQuery& query) const override;

private:
    ReasoningResult recurring_structures(const ReasoningQuery& query) const;

    const AtomSpace* store_;
};

} // namespace Synod
