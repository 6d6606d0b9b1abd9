#include "atn_builder.hpp"

State* AtnBuilder::create_state(StateType type, int rule){
    return atn.create_state(type, rule);
}

void AtnBuilder::connect(State* from, State* to){
    from->add_transition(Transition::epsilon(to));
}

Frag AtnBuilder::element(int rule, const std::function<Transition(State*)>& make){
    State* left = create_state(StateType::BASIC, rule);
    State* right = create_state(StateType::BASIC, rule);
    left->add_transition(make(right));
    return Frag{left, right};
}

int AtnBuilder::rule(){
    int index = static_cast<int>(atn.rule_count());
    State* start = create_state(StateType::RULE_START, index);
    State* stop = create_state(StateType::RULE_STOP, index);
    return atn.define_rule(start, stop);
}

int AtnBuilder::lexer_rule(int token_type){
    int index = rule();
    atn.define_rule_token_type(index, token_type);
    return index;
}

void AtnBuilder::set_rule_body(int rule, Frag body){
    connect(atn.get_rule_start_state(rule), body.start);
    connect(body.end, atn.get_rule_stop_state(rule));
}

Frag AtnBuilder::epsilon(int rule){
    return element(rule, [](State* target) { return Transition::epsilon(target); });
}

Frag AtnBuilder::atom(int rule, int symbol){
    return element(rule, [symbol](State* target) { return Transition::atom(target, symbol); });
}

Frag AtnBuilder::range(int rule, int lo, int hi){
    return element(rule, [lo, hi](State* target) { return Transition::range(target, lo, hi); });
}

Frag AtnBuilder::set(int rule, IntervalSet symbols){
    return element(rule, [&symbols](State* target) { return Transition::set(target, symbols); });
}

Frag AtnBuilder::not_set(int rule, IntervalSet symbols){
    return element(rule, [&symbols](State* target) { return Transition::not_set(target, symbols); });
}

Frag AtnBuilder::wildcard(int rule){
    return element(rule, [](State* target) { return Transition::wildcard(target); });
}

Frag AtnBuilder::action(int rule, int action_index, bool ctx_dependent){
    return element(rule, [=](State* target) {
        return Transition::action(target, rule, action_index, ctx_dependent);
    });
}

Frag AtnBuilder::predicate(int rule, int pred_index, bool ctx_dependent){
    return element(rule, [=](State* target) {
        return Transition::predicate(target, rule, pred_index, ctx_dependent);
    });
}

Frag AtnBuilder::precedence_predicate(int rule, int precedence){
    return element(rule, [precedence](State* target) {
        return Transition::precedence_predicate(target, precedence);
    });
}

Frag AtnBuilder::rule_ref(int rule, int callee, int precedence){
    State* callee_start = atn.get_rule_start_state(callee);
    Frag call = element(rule, [&](State* follow) {
        return Transition::rule(callee_start, follow, precedence);
    });
    // Return edge: leaving the callee resumes at the follow state
    atn.get_rule_stop_state(callee)->add_transition(Transition::epsilon(call.end));
    return call;
}

Frag AtnBuilder::sequence(const std::vector<Frag>& elements){
    if (elements.empty()) throw std::logic_error("empty sequence");
    for (size_t i = 0; i + 1 < elements.size(); i++){
        connect(elements[i].end, elements[i + 1].start);
    }
    return Frag{elements.front().start, elements.back().end};
}

Frag AtnBuilder::alternatives(int rule, const std::vector<Frag>& alts){
    if (alts.empty()) throw std::logic_error("block without alternatives");
    if (alts.size() == 1) return alts.front();

    State* block_start = create_state(StateType::BLOCK_START, rule);
    State* block_end = create_state(StateType::BLOCK_END, rule);
    for (const auto& alt : alts){
        connect(block_start, alt.start);
        connect(alt.end, block_end);
    }
    atn.define_decision_state(block_start);
    return Frag{block_start, block_end};
}

// The bypass is the last alternative
Frag AtnBuilder::optional(int rule, Frag body){
    State* block_start = create_state(StateType::BLOCK_START, rule);
    State* block_end = create_state(StateType::BLOCK_END, rule);
    connect(block_start, body.start);
    connect(block_start, block_end);
    connect(body.end, block_end);
    atn.define_decision_state(block_start);
    return Frag{block_start, block_end};
}

//  entry -> block_start -> body -> block_end -> loop_back -> entry
//  entry -> loop_end
Frag AtnBuilder::star(int rule, Frag body){
    State* entry = create_state(StateType::STAR_LOOP_ENTRY, rule);
    State* block_start = create_state(StateType::STAR_BLOCK_START, rule);
    State* block_end = create_state(StateType::BLOCK_END, rule);
    State* loop_back = create_state(StateType::STAR_LOOP_BACK, rule);
    State* loop_end = create_state(StateType::LOOP_END, rule);

    connect(entry, block_start);
    connect(entry, loop_end);
    connect(block_start, body.start);
    connect(body.end, block_end);
    connect(block_end, loop_back);
    connect(loop_back, entry);

    atn.define_decision_state(entry);
    atn.define_decision_state(block_start);
    return Frag{entry, loop_end};
}

//  block_start -> body -> block_end -> loop_back -> block_start
//                                      loop_back -> loop_end
Frag AtnBuilder::plus(int rule, Frag body){
    State* block_start = create_state(StateType::PLUS_BLOCK_START, rule);
    State* block_end = create_state(StateType::BLOCK_END, rule);
    State* loop_back = create_state(StateType::PLUS_LOOP_BACK, rule);
    State* loop_end = create_state(StateType::LOOP_END, rule);

    connect(block_start, body.start);
    connect(body.end, block_end);
    connect(block_end, loop_back);
    connect(loop_back, block_start);
    connect(loop_back, loop_end);

    atn.define_decision_state(block_start);
    atn.define_decision_state(loop_back);
    return Frag{block_start, loop_end};
}

State* AtnBuilder::mode(const std::string& name, const std::vector<int>& rules){
    State* start = create_state(StateType::TOKEN_START, -1);
    for (int r : rules){
        connect(start, atn.get_rule_start_state(r));
    }
    atn.define_mode(name, start);
    return start;
}
