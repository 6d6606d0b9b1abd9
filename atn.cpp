#include "atn.hpp"
#include "lookahead_analyzer.hpp"

Atn::Atn(GrammarType type, int max_type) : grammar_type(type), max_token_type(max_type) {}

State* Atn::add_state(std::unique_ptr<State> state){
    if (state) state->state_number = static_cast<int>(states.size());
    states.push_back(std::move(state));
    return states.back().get();
}

State* Atn::create_state(StateType type, int rule_index){
    return add_state(std::make_unique<State>(type, rule_index));
}

// Frees the state; later states are not renumbered. Only states nothing
// else points at can go.
void Atn::remove_state(State* state){
    if (!state || get_state(state->state_number) != state) return;

    const std::string name = "state " + std::to_string(state->state_number);
    if (state->decision >= 0){
        throw std::logic_error(name + " is decision " + std::to_string(state->decision));
    }
    if (std::find(rule_to_start_state.begin(), rule_to_start_state.end(), state) != rule_to_start_state.end() ||
        std::find(rule_to_stop_state.begin(), rule_to_stop_state.end(), state) != rule_to_stop_state.end()){
        throw std::logic_error(name + " is a rule boundary");
    }
    for (const auto& other : states){
        if (!other || other.get() == state) continue;
        for (const Transition& t : other->transitions){
            if (t.target == state || t.follow_state == state){
                throw std::logic_error(name + " is reached from state " + std::to_string(other->state_number));
            }
        }
    }
    states[static_cast<size_t>(state->state_number)].reset();
}

int Atn::define_rule(State* start, State* stop){
    if (!start || start->type != StateType::RULE_START || !stop || stop->type != StateType::RULE_STOP){
        throw std::logic_error("rule needs a RULE_START and a RULE_STOP state");
    }
    int rule = static_cast<int>(rule_to_start_state.size());
    if (start->rule_index != rule || stop->rule_index != rule){
        throw std::logic_error("rule boundary states must carry rule index " + std::to_string(rule));
    }
    start->stop_state = stop;
    rule_to_start_state.push_back(start);
    rule_to_stop_state.push_back(stop);
    return rule;
}

int Atn::define_decision_state(State* state){
    if (!state || !state->is_decision_state()){
        throw std::logic_error("state cannot be a decision");
    }
    if (state->decision >= 0){
        throw std::logic_error("state is already decision " + std::to_string(state->decision));
    }
    decision_to_state.push_back(state);
    state->decision = static_cast<int>(decision_to_state.size()) - 1;
    decision_to_dfa.append(std::make_unique<Dfa>(state, state->decision));
    return state->decision;
}

int Atn::define_mode(const std::string& name, State* start){
    if (!start || start->type != StateType::TOKEN_START){
        throw std::logic_error("mode " + name + " needs a TOKEN_START state");
    }
    if (mode_name_to_start_state.count(name) || start->decision >= 0){
        throw std::logic_error("mode " + name + " already defined");
    }
    int mode = static_cast<int>(mode_to_start_state.size());
    mode_name_to_start_state[name] = start;
    mode_to_start_state.push_back(start);
    mode_to_dfa.append(std::make_unique<Dfa>(start, mode));
    define_decision_state(start);
    return mode;
}

void Atn::define_rule_token_type(int rule, int token_type){
    size_t index = static_cast<size_t>(rule);
    if (rule < 0) throw std::logic_error("negative rule index");
    if (rule_to_token_type.size() <= index) rule_to_token_type.resize(index + 1, Symbol::INVALID);
    rule_to_token_type[index] = token_type;
}

int Atn::add_lexer_action(LexerAction action){
    lexer_actions.push_back(action);
    return static_cast<int>(lexer_actions.size()) - 1;
}

State* Atn::get_state(int state_number) const{
    if (state_number < 0 || static_cast<size_t>(state_number) >= states.size()) return nullptr;
    return states[static_cast<size_t>(state_number)].get();
}

int Atn::get_rule_token_type(int rule) const{
    if (rule < 0 || static_cast<size_t>(rule) >= rule_to_token_type.size()) return Symbol::INVALID;
    return rule_to_token_type[static_cast<size_t>(rule)];
}

State* Atn::get_decision_state(int decision) const{
    if (decision_to_state.empty()) return nullptr;
    return decision_to_state.at(static_cast<size_t>(decision));
}

State* Atn::get_mode_start_state(const std::string& name) const{
    auto it = mode_name_to_start_state.find(name);
    return it == mode_name_to_start_state.end() ? nullptr : it->second;
}

const IntervalSet& Atn::next_tokens(const State* s) const{
    if (const IntervalSet* cached = s->cached_next_tokens()) return *cached;
    // Racing threads compute equal sets; only the first one is published
    auto computed = std::make_unique<IntervalSet>(next_tokens(s, PredictionContext::empty()));
    return s->publish_next_tokens(std::move(computed));
}

IntervalSet Atn::next_tokens(const State* s, const ContextRef& ctx) const{
    LookaheadAnalyzer analyzer(*this);
    return analyzer.look(s, ctx);
}

IntervalSet Atn::get_expected_tokens(int state_number, const RuleContext* ctx) const{
    if (state_number < 0 || static_cast<size_t>(state_number) >= states.size()){
        throw std::invalid_argument("Invalid state number " + std::to_string(state_number));
    }
    const State* s = get_state(state_number);
    if (!s) throw std::invalid_argument("State " + std::to_string(state_number) + " was removed");

    const IntervalSet* following = &next_tokens(s);
    if (!following->contains(Symbol::EPSILON)) return *following;

    IntervalSet expected = *following;
    expected.remove(Symbol::EPSILON);
    while (ctx && ctx->invoking_state >= 0 && following->contains(Symbol::EPSILON)){
        const State* invoking = get_state(ctx->invoking_state);
        const Transition* call = invoking ? invoking->rule_transition() : nullptr;
        if (!call){
            throw std::logic_error("invoking state " + std::to_string(ctx->invoking_state) +
                                   " does not call a rule");
        }
        following = &next_tokens(call->follow_state);
        expected.add_all(*following);
        expected.remove(Symbol::EPSILON);
        ctx = ctx->parent;
    }

    if (following->contains(Symbol::EPSILON)) expected.add(Symbol::END_OF_INPUT);
    return expected;
}

ContextRef Atn::get_cached_context(const ContextRef& ctx) const{
    return context_cache.canonicalize(ctx);
}

ContextRef Atn::merge_contexts(const std::vector<ContextRef>& contexts) const{
    if (contexts.empty()) return PredictionContext::empty();

    MergeCache merge_cache;
    ContextRef merged = contexts.front();
    for (size_t i = 1; i < contexts.size(); i++){
        merged = merge(merged, contexts[i], &merge_cache);
    }
    return get_cached_context(merged);
}
