#ifndef RULE_CONTEXT_HPP
#define RULE_CONTEXT_HPP

// Live parse context as seen by the automaton: one level per active rule
// invocation. The outermost level has no parent.
struct RuleContext {
    const RuleContext* parent = nullptr;

    // Number of the state holding the rule transition that entered this
    // level's rule; -1 at the outermost level.
    int invoking_state = -1;

    bool is_root() const { return parent == nullptr; }
};

#endif // RULE_CONTEXT_HPP
