#include "lookahead_analyzer.hpp"
#include "atn.hpp"

namespace {

// Pending work of the closure walk. VISIT enters a state; TRANSITION follows
// one outgoing edge; RESTORE resets a rule's "on the call path" flag once
// everything reached through that call has been processed.
struct Step {
    enum class Kind { VISIT, TRANSITION, RESTORE };

    Kind kind;
    const State* state = nullptr;
    ContextRef ctx{};
    size_t index = 0;
    int rule = -1;
    bool value = false;
};

} // namespace

LookaheadAnalyzer::LookaheadAnalyzer(const Atn& a, LookaheadOptions opts) : atn(a), options(opts) {}

IntervalSet LookaheadAnalyzer::look(const State* s, const ContextRef& ctx) const{
    return traverse(s, nullptr, ctx, options.see_through_predicates, options.add_eof);
}

IntervalSet LookaheadAnalyzer::look(const State* s, const State* stop_state, const ContextRef& ctx) const{
    return traverse(s, stop_state, ctx, options.see_through_predicates, options.add_eof);
}

std::vector<std::optional<IntervalSet>> LookaheadAnalyzer::decision_lookahead(const State* s) const{
    std::vector<std::optional<IntervalSet>> alts;
    if (!s) return alts;

    for (const auto& t : s->transitions){
        IntervalSet set = traverse(t.target, nullptr, PredictionContext::empty(), false, false);
        if (set.empty() || set.contains(Symbol::INVALID)) alts.push_back(std::nullopt);
        else alts.push_back(std::move(set));
    }
    return alts;
}

// Iterative depth-first walk. Items are pushed in reverse so they pop in
// transition order, which keeps the visit order (and with it the effect of
// the busy set and the call-path flags) identical to a recursive walk.
IntervalSet LookaheadAnalyzer::traverse(const State* start, const State* stop_state, ContextRef ctx,
                                        bool see_through_predicates, bool add_eof) const{
    IntervalSet look;
    if (!start) return look;
    if (!ctx) ctx = PredictionContext::empty();

    const int boundary = add_eof ? Symbol::END_OF_INPUT : Symbol::EPSILON;

    // (state, context) pairs already entered during this walk
    std::set<std::pair<int, ContextRef>> busy;
    // Rules currently entered through a rule transition
    std::vector<bool> called_rule_stack(atn.rule_count(), false);

    std::vector<Step> work;
    work.push_back({Step::Kind::VISIT, start, ctx});

    while (!work.empty()){
        Step step = std::move(work.back());
        work.pop_back();

        switch (step.kind){
        case Step::Kind::RESTORE:
            called_rule_stack[static_cast<size_t>(step.rule)] = step.value;
            break;

        case Step::Kind::VISIT:
        {
            const State* s = step.state;
            if (!busy.insert({s->state_number, step.ctx}).second) break;

            if (s == stop_state && step.ctx->is_empty()){
                look.add(boundary);
                break;
            }

            if (s->type == StateType::RULE_STOP){
                if (step.ctx->is_empty()){
                    look.add(boundary);
                    break;
                }

                // Returning to the callers: this rule is no longer on the path
                size_t rule = static_cast<size_t>(s->rule_index);
                work.push_back({Step::Kind::RESTORE, nullptr, nullptr, 0, s->rule_index, called_rule_stack[rule]});
                called_rule_stack[rule] = false;

                for (size_t i = step.ctx->size(); i-- > 0;){
                    int return_state = step.ctx->get_return_state(i);
                    if (return_state == PredictionContext::EMPTY_RETURN_STATE){
                        look.add(boundary);  // one of the merged histories ends here
                        continue;
                    }
                    const State* resume = atn.get_state(return_state);
                    if (!resume){
                        throw std::logic_error("context returns to missing state " + std::to_string(return_state));
                    }
                    work.push_back({Step::Kind::VISIT, resume, step.ctx->get_parent(i)});
                }
                break;
            }

            for (size_t i = s->transitions.size(); i-- > 0;){
                work.push_back({Step::Kind::TRANSITION, s, step.ctx, i});
            }
            break;
        }

        case Step::Kind::TRANSITION:
        {
            const Transition& t = step.state->transitions[step.index];
            switch (t.type){
            case TransitionType::RULE:
            {
                size_t callee = static_cast<size_t>(t.target->rule_index);
                if (called_rule_stack[callee]) break;  // left recursion

                ContextRef callee_ctx = PredictionContext::singleton(step.ctx, t.follow_state->state_number);
                called_rule_stack[callee] = true;
                work.push_back({Step::Kind::RESTORE, nullptr, nullptr, 0, t.target->rule_index, false});
                work.push_back({Step::Kind::VISIT, t.target, std::move(callee_ctx)});
                break;
            }
            case TransitionType::PREDICATE:
            case TransitionType::PRECEDENCE:
                if (see_through_predicates) work.push_back({Step::Kind::VISIT, t.target, step.ctx});
                else look.add(Symbol::INVALID);
                break;
            case TransitionType::WILDCARD:
                look.add(Symbol::MIN_USER, atn.get_max_token_type());
                break;
            case TransitionType::NOT_SET:
                look.add_all(t.label.complement(Symbol::MIN_USER, atn.get_max_token_type()));
                break;
            case TransitionType::ATOM:
            case TransitionType::RANGE:
            case TransitionType::SET:
                look.add_all(t.label);
                break;
            case TransitionType::EPSILON:
            case TransitionType::ACTION:
                work.push_back({Step::Kind::VISIT, t.target, step.ctx});
                break;
            }
            break;
        }
        }
    }
    return look;
}
