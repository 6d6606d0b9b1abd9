#ifndef LOOKAHEAD_ANALYZER_HPP
#define LOOKAHEAD_ANALYZER_HPP
#include <optional>
#include "atn_state.hpp"
#include "prediction_context.hpp"

struct LookaheadOptions {
    // When false a predicate edge adds Symbol::INVALID and ends that path
    bool see_through_predicates = true;
    // When true, reaching a rule stop state with the empty context adds EOF
    // instead of EPSILON
    bool add_eof = false;
};

// Computes the set of symbols that can follow an ATN state by walking its
// epsilon closure.
//
// Rule stop states are where the call context matters: with the empty context
// the walk records EPSILON (or EOF, see LookaheadOptions) and stops at the
// rule boundary; otherwise it resumes at each return state recorded in the
// context. A null context is the empty context.
class LookaheadAnalyzer {
public:
    explicit LookaheadAnalyzer(const Atn& atn, LookaheadOptions options = {});

    IntervalSet look(const State* s, const ContextRef& ctx) const;

    // Like look(s, ctx), but the walk also ends at `stop_state`, which then
    // contributes EPSILON when reached with the empty context.
    IntervalSet look(const State* s, const State* stop_state, const ContextRef& ctx) const;

    // Lookahead of each alternative of decision state `s`, rule-local and
    // without evaluating predicates. An alternative whose set is empty or
    // reaches a predicate has no entry.
    std::vector<std::optional<IntervalSet>> decision_lookahead(const State* s) const;

private:
    const Atn& atn;
    LookaheadOptions options;

    IntervalSet traverse(const State* s, const State* stop_state, ContextRef ctx,
                         bool see_through_predicates, bool add_eof) const;
};

#endif // LOOKAHEAD_ANALYZER_HPP
