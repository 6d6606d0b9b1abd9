#ifndef ATN_STATE_HPP
#define ATN_STATE_HPP
#include "interval_set.hpp"

enum class StateType{
    INVALID,
    BASIC,
    RULE_START,
    BLOCK_START,
    PLUS_BLOCK_START,
    STAR_BLOCK_START,
    TOKEN_START,      // lexer mode entry
    RULE_STOP,
    BLOCK_END,
    STAR_LOOP_BACK,
    STAR_LOOP_ENTRY,
    PLUS_LOOP_BACK,
    LOOP_END
};

enum class TransitionType{
    EPSILON,
    RANGE,
    RULE,
    PREDICATE,
    ATOM,
    ACTION,
    SET,
    NOT_SET,
    WILDCARD,
    PRECEDENCE
};

struct State;

struct Transition {
    TransitionType type;
    State* target;

    // ATOM, RANGE, SET, NOT_SET
    IntervalSet label{};

    // RULE: the state to resume at once the callee's stop state is reached
    State* follow_state = nullptr;

    int rule_index = -1;    // RULE, PREDICATE, ACTION
    int precedence = 0;     // RULE, PRECEDENCE
    int pred_index = -1;    // PREDICATE
    int action_index = -1;  // ACTION
    bool is_ctx_dependent = false;

    static Transition epsilon(State* target);
    static Transition atom(State* target, int symbol);
    static Transition range(State* target, int lo, int hi);
    static Transition set(State* target, IntervalSet symbols);
    static Transition not_set(State* target, IntervalSet symbols);
    static Transition wildcard(State* target);
    // Throws std::logic_error unless rule_start is a RULE_START state
    static Transition rule(State* rule_start, State* follow_state, int precedence = 0);
    static Transition predicate(State* target, int rule_index, int pred_index, bool ctx_dependent);
    static Transition precedence_predicate(State* target, int precedence);
    static Transition action(State* target, int rule_index, int action_index, bool ctx_dependent);

    // Traversed without consuming input
    bool is_epsilon() const;
    bool matches(int symbol, int min_vocab, int max_vocab) const;
};

struct State {
    StateType type;
    int state_number = -1;  // index in the owning Atn's state list
    int rule_index = -1;

    // Valid only for decision states (see is_decision_state); -1 until registered.
    int decision = -1;

    // RULE_START: the matching RULE_STOP
    State* stop_state = nullptr;

    std::vector<Transition> transitions;

    explicit State(StateType t, int rule = -1) : type(t), rule_index(rule) {}
    ~State();

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    void add_transition(Transition t);
    bool only_has_epsilon_transitions() const { return epsilon_only; }
    bool is_decision_state() const;
    // First RULE transition out of this state, or null
    const Transition* rule_transition() const;

    // Rule-local follow set, published at most once.
    // Null until Atn::next_tokens(state) has run for this state.
    const IntervalSet* cached_next_tokens() const { return next_within_rule.load(std::memory_order_acquire); }

    // Publishes `computed` unless another thread got there first; returns
    // whichever set ended up published.
    const IntervalSet& publish_next_tokens(std::unique_ptr<IntervalSet> computed) const;

private:
    bool epsilon_only = false;
    mutable std::atomic<const IntervalSet*> next_within_rule{nullptr};
};

std::string to_string(StateType type);

#endif // ATN_STATE_HPP
