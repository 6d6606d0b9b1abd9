#ifndef ATN_HPP
#define ATN_HPP
#include "atn_state.hpp"
#include "dfa.hpp"
#include "prediction_context.hpp"
#include "rule_context.hpp"
#include "slot_arena.hpp"

enum class GrammarType{
    LEXER,
    PARSER
};

enum class LexerActionType{
    CHANNEL,
    CUSTOM,
    MODE,
    MORE,
    POP_MODE,
    PUSH_MODE,
    SKIP,
    TYPE
};

struct LexerAction {
    LexerActionType type;
    int value = 0;          // channel, mode or token type
    int rule_index = -1;    // CUSTOM
    int action_index = -1;  // CUSTOM
};

// Augmented transition network shared by every recognizer run over one
// grammar.
//
// The graph is assembled once (see AtnBuilder) and is read-only afterwards.
// What changes later is append-only: the per-state rule-local follow sets,
// the DFA caches of decisions and modes, and the prediction-context cache.
// All of them can be used from several threads at once.
class Atn {
public:
    Atn(GrammarType grammar_type, int max_token_type);
    Atn(const Atn&) = delete;
    Atn& operator=(const Atn&) = delete;

    GrammarType get_grammar_type() const { return grammar_type; }
    // Largest symbol any transition can match
    int get_max_token_type() const { return max_token_type; }

    // Construction ------------------------------------------------------

    // Takes ownership and stamps the state number. A null state reserves an
    // absent slot.
    State* add_state(std::unique_ptr<State> state);
    State* create_state(StateType type, int rule_index = -1);
    // Drops the state and leaves its slot absent; other numbers are kept.
    // Throws std::logic_error if the state is a registered decision or rule
    // boundary, or another state's transition leads to it.
    void remove_state(State* state);

    // Registers a rule's boundary pair under the next rule index and returns
    // it. Both states must already belong to this ATN.
    int define_rule(State* start, State* stop);

    // Assigns the next decision number and adds its DFA cache entry.
    // Throws std::logic_error for a state that cannot be a decision or is
    // one already.
    int define_decision_state(State* state);

    // Registers a lexer mode; its start state also becomes a decision.
    int define_mode(const std::string& name, State* start);

    void define_rule_token_type(int rule, int token_type);
    int add_lexer_action(LexerAction action);

    // Lookup --------------------------------------------------------------

    // Null when out of range or removed
    State* get_state(int state_number) const;
    // Number of slots, absent ones included
    size_t state_count() const { return states.size(); }

    size_t rule_count() const { return rule_to_start_state.size(); }
    State* get_rule_start_state(int rule) const { return rule_to_start_state.at(static_cast<size_t>(rule)); }
    State* get_rule_stop_state(int rule) const { return rule_to_stop_state.at(static_cast<size_t>(rule)); }
    int get_rule_token_type(int rule) const;

    // Null when no decision has been defined
    State* get_decision_state(int decision) const;
    size_t number_of_decisions() const { return decision_to_state.size(); }

    State* get_mode_start_state(int mode) const { return mode_to_start_state.at(static_cast<size_t>(mode)); }
    // Null for an unknown mode name
    State* get_mode_start_state(const std::string& name) const;
    size_t number_of_modes() const { return mode_to_start_state.size(); }

    const LexerAction& get_lexer_action(int index) const { return lexer_actions.at(static_cast<size_t>(index)); }

    // DFA caches, indexed by decision / mode number. References stay valid
    // for the lifetime of the ATN.
    Dfa& get_decision_dfa(int decision) const { return decision_to_dfa.at(static_cast<size_t>(decision)); }
    Dfa& get_mode_dfa(int mode) const { return mode_to_dfa.at(static_cast<size_t>(mode)); }
    size_t decision_dfa_count() const { return decision_to_dfa.size(); }
    size_t mode_dfa_count() const { return mode_to_dfa.size(); }

    // Follow sets ----------------------------------------------------------

    // Symbols that can follow `s` without leaving its rule; EPSILON when the
    // end of the rule is reachable. Computed on first use, then the same set
    // is returned every time.
    const IntervalSet& next_tokens(const State* s) const;

    // Symbols that can follow `s` in call context `ctx`. Null or empty `ctx`
    // gives the rule-local set (see LookaheadAnalyzer).
    IntervalSet next_tokens(const State* s, const ContextRef& ctx) const;

    // Symbols that may follow state `state_number` given the full parse
    // context, predicates assumed true. EOF is included when the outermost
    // rule can end without further input. A null context is the outermost
    // level. Throws std::invalid_argument if there is no such state.
    IntervalSet get_expected_tokens(int state_number, const RuleContext* ctx) const;

    // Prediction contexts ------------------------------------------------

    ContextRef get_cached_context(const ContextRef& ctx) const;
    // Canonical union of `contexts`; see merge()
    ContextRef merge_contexts(const std::vector<ContextRef>& contexts) const;
    const PredictionContextCache& get_context_cache() const { return context_cache; }

private:
    const GrammarType grammar_type;
    const int max_token_type;

    // Owns every state; slots of removed states are null
    std::vector<std::unique_ptr<State>> states;

    std::vector<State*> decision_to_state;
    std::vector<State*> rule_to_start_state;
    std::vector<State*> rule_to_stop_state;
    std::vector<int> rule_to_token_type;
    std::map<std::string, State*> mode_name_to_start_state;
    std::vector<State*> mode_to_start_state;
    std::vector<LexerAction> lexer_actions;

    SlotArena<Dfa> decision_to_dfa;
    SlotArena<Dfa> mode_to_dfa;

    mutable PredictionContextCache context_cache;
};

#endif // ATN_HPP
