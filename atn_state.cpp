#include "atn_state.hpp"

Transition Transition::epsilon(State* target){
    return Transition{TransitionType::EPSILON, target};
}

Transition Transition::atom(State* target, int symbol){
    Transition t{TransitionType::ATOM, target};
    t.label = IntervalSet::of(symbol);
    return t;
}

Transition Transition::range(State* target, int lo, int hi){
    Transition t{TransitionType::RANGE, target};
    t.label = IntervalSet::of(lo, hi);
    return t;
}

Transition Transition::set(State* target, IntervalSet symbols){
    Transition t{TransitionType::SET, target};
    t.label = std::move(symbols);
    return t;
}

Transition Transition::not_set(State* target, IntervalSet symbols){
    Transition t{TransitionType::NOT_SET, target};
    t.label = std::move(symbols);
    return t;
}

Transition Transition::wildcard(State* target){
    return Transition{TransitionType::WILDCARD, target};
}

Transition Transition::rule(State* rule_start, State* follow_state, int precedence){
    if (!rule_start || rule_start->type != StateType::RULE_START){
        throw std::logic_error("rule transition must target a rule start state");
    }
    if (!follow_state) throw std::logic_error("rule transition requires a follow state");
    Transition t{TransitionType::RULE, rule_start};
    t.follow_state = follow_state;
    t.rule_index = rule_start->rule_index;
    t.precedence = precedence;
    return t;
}

Transition Transition::predicate(State* target, int rule_index, int pred_index, bool ctx_dependent){
    Transition t{TransitionType::PREDICATE, target};
    t.rule_index = rule_index;
    t.pred_index = pred_index;
    t.is_ctx_dependent = ctx_dependent;
    return t;
}

Transition Transition::precedence_predicate(State* target, int precedence){
    Transition t{TransitionType::PRECEDENCE, target};
    t.precedence = precedence;
    return t;
}

Transition Transition::action(State* target, int rule_index, int action_index, bool ctx_dependent){
    Transition t{TransitionType::ACTION, target};
    t.rule_index = rule_index;
    t.action_index = action_index;
    t.is_ctx_dependent = ctx_dependent;
    return t;
}

bool Transition::is_epsilon() const{
    switch (type){
        case TransitionType::EPSILON:
        case TransitionType::RULE:
        case TransitionType::PREDICATE:
        case TransitionType::ACTION:
        case TransitionType::PRECEDENCE:
            return true;
        default:
            return false;
    }
}

bool Transition::matches(int symbol, int min_vocab, int max_vocab) const{
    switch (type){
        case TransitionType::ATOM:
        case TransitionType::RANGE:
        case TransitionType::SET:
            return label.contains(symbol);
        case TransitionType::NOT_SET:
            return symbol >= min_vocab && symbol <= max_vocab && !label.contains(symbol);
        case TransitionType::WILDCARD:
            return symbol >= min_vocab && symbol <= max_vocab;
        default:
            return false;
    }
}

State::~State(){
    delete next_within_rule.load(std::memory_order_acquire);
}

void State::add_transition(Transition t){
    if (transitions.empty()){
        epsilon_only = t.is_epsilon();
    }else if (epsilon_only != t.is_epsilon()){
        epsilon_only = false;
    }
    transitions.push_back(std::move(t));
}

bool State::is_decision_state() const{
    switch (type){
        case StateType::BLOCK_START:
        case StateType::PLUS_BLOCK_START:
        case StateType::STAR_BLOCK_START:
        case StateType::TOKEN_START:
        case StateType::STAR_LOOP_ENTRY:
        case StateType::PLUS_LOOP_BACK:
            return true;
        default:
            return false;
    }
}

const Transition* State::rule_transition() const{
    for (const auto& t : transitions){
        if (t.type == TransitionType::RULE) return &t;
    }
    return nullptr;
}

const IntervalSet& State::publish_next_tokens(std::unique_ptr<IntervalSet> computed) const{
    const IntervalSet* expected = nullptr;
    const IntervalSet* mine = computed.get();
    if (next_within_rule.compare_exchange_strong(expected, mine,
            std::memory_order_acq_rel, std::memory_order_acquire)){
        computed.release();  // owned by the state from now on
        return *mine;
    }
    // Lost the race: `computed` is dropped, `expected` holds the winner
    return *expected;
}

std::string to_string(StateType type){
    switch (type){
        case StateType::INVALID: return "INVALID";
        case StateType::BASIC: return "BASIC";
        case StateType::RULE_START: return "RULE_START";
        case StateType::BLOCK_START: return "BLOCK_START";
        case StateType::PLUS_BLOCK_START: return "PLUS_BLOCK_START";
        case StateType::STAR_BLOCK_START: return "STAR_BLOCK_START";
        case StateType::TOKEN_START: return "TOKEN_START";
        case StateType::RULE_STOP: return "RULE_STOP";
        case StateType::BLOCK_END: return "BLOCK_END";
        case StateType::STAR_LOOP_BACK: return "STAR_LOOP_BACK";
        case StateType::STAR_LOOP_ENTRY: return "STAR_LOOP_ENTRY";
        case StateType::PLUS_LOOP_BACK: return "PLUS_LOOP_BACK";
        case StateType::LOOP_END: return "LOOP_END";
        default: return "UNKNOWN";
    }
}
