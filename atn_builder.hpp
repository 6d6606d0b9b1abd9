#ifndef ATN_BUILDER_HPP
#define ATN_BUILDER_HPP
#include "atn.hpp"

// Frag is a piece of a rule body between an entry state and an exit state.
// Fragments are wired together with epsilon transitions.
struct Frag {
    State* start;
    State* end;
};

// Assembles an ATN rule by rule from fragments, registering rules and
// decisions as it goes. Every method that creates states takes the index of
// the rule the states belong to.
//
//   AtnBuilder b(atn);
//   int a = b.rule();                       // A : 'x' B ;
//   int r = b.rule();                       // B : 'y' ;
//   b.set_rule_body(a, b.sequence({b.atom(a, X), b.rule_ref(a, r)}));
//   b.set_rule_body(r, b.atom(r, Y));
class AtnBuilder {
public:
    explicit AtnBuilder(Atn& target) : atn(target) {}

    // Creates the RULE_START / RULE_STOP pair of the next rule and returns
    // its index
    int rule();
    // Lexer rule producing `token_type`
    int lexer_rule(int token_type);
    // Wires start -> body -> stop
    void set_rule_body(int rule, Frag body);

    Frag epsilon(int rule);
    Frag atom(int rule, int symbol);
    Frag range(int rule, int lo, int hi);
    Frag set(int rule, IntervalSet symbols);
    Frag not_set(int rule, IntervalSet symbols);
    Frag wildcard(int rule);
    Frag action(int rule, int action_index, bool ctx_dependent = false);
    Frag predicate(int rule, int pred_index, bool ctx_dependent = false);
    Frag precedence_predicate(int rule, int precedence);

    // Call of `callee`. Also adds the callee's return edge to the follow
    // state, so the callee must already exist.
    Frag rule_ref(int rule, int callee, int precedence = 0);

    Frag sequence(const std::vector<Frag>& elements);
    // (a | b | ...): a BLOCK_START decision. A single alternative is
    // returned unchanged.
    Frag alternatives(int rule, const std::vector<Frag>& alts);
    // (body)?
    Frag optional(int rule, Frag body);
    // (body)*
    Frag star(int rule, Frag body);
    // (body)+
    Frag plus(int rule, Frag body);

    // Lexer mode whose start state branches to the given rules
    State* mode(const std::string& name, const std::vector<int>& rules);

private:
    Atn& atn;

    State* create_state(StateType type, int rule);
    // left --make(right)--> right
    Frag element(int rule, const std::function<Transition(State*)>& make);
    static void connect(State* from, State* to);
};

#endif // ATN_BUILDER_HPP
