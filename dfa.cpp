#include "dfa.hpp"

DfaState* DfaState::get_edge(int symbol) const{
    std::lock_guard<std::mutex> guard(edge_lock);
    auto it = edges.find(symbol);
    return it == edges.end() ? nullptr : it->second;
}

void DfaState::set_edge(int symbol, DfaState* target){
    std::lock_guard<std::mutex> guard(edge_lock);
    edges[symbol] = target;
}

size_t DfaState::edge_count() const{
    std::lock_guard<std::mutex> guard(edge_lock);
    return edges.size();
}

size_t Dfa::SignatureHash::operator()(const std::vector<int>& key) const{
    size_t h = key.size();
    for (int v : key) h = h * 31 + std::hash<int>{}(v);
    return h;
}

DfaState* Dfa::set_s0_if_absent(DfaState* state){
    DfaState* expected = nullptr;
    if (s0.compare_exchange_strong(expected, state, std::memory_order_acq_rel)) return state;
    return expected;
}

DfaState* Dfa::add_state(std::unique_ptr<DfaState> state){
    std::lock_guard<std::mutex> guard(states_lock);
    auto it = states.find(state->signature);
    if (it != states.end()) return it->second.get();

    state->state_number = static_cast<int>(states.size());
    DfaState* stored = state.get();
    states.emplace(state->signature, std::move(state));
    return stored;
}

DfaState* Dfa::find_state(const std::vector<int>& signature) const{
    std::lock_guard<std::mutex> guard(states_lock);
    auto it = states.find(signature);
    return it == states.end() ? nullptr : it->second.get();
}

size_t Dfa::state_count() const{
    std::lock_guard<std::mutex> guard(states_lock);
    return states.size();
}
