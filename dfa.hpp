#ifndef DFA_HPP
#define DFA_HPP
#include "atn_state.hpp"

// One state of a lookahead DFA. The configuration signature is whatever key
// the prediction simulator derives from its configuration set; two states
// with the same signature are the same DFA state.
class DfaState {
public:
    explicit DfaState(std::vector<int> key) : signature(std::move(key)) {}

    const std::vector<int>& get_signature() const { return signature; }
    int get_state_number() const { return state_number; }

    bool is_accept_state = false;
    int prediction = 0;     // predicted alternative once accepting

    // Target on `symbol`, or null if not computed yet
    DfaState* get_edge(int symbol) const;
    void set_edge(int symbol, DfaState* target);
    size_t edge_count() const;

private:
    friend class Dfa;

    const std::vector<int> signature;
    int state_number = -1;

    mutable std::mutex edge_lock;
    std::unordered_map<int, DfaState*> edges;
};

// Lookahead cache for one decision (or lexer mode), filled in over time by an
// external prediction simulator.
class Dfa {
public:
    Dfa(const State* start, int decision_number)
        : atn_start_state(start), decision(decision_number) {}

    const State* get_atn_start_state() const { return atn_start_state; }
    int get_decision() const { return decision; }

    DfaState* get_s0() const { return s0.load(std::memory_order_acquire); }
    // Sets the start state if none is set yet; returns the one in effect.
    DfaState* set_s0_if_absent(DfaState* state);

    // Insert-if-absent by signature. Returns the stored state, which is
    // `state` itself only if no equal state existed; `state` is dropped
    // otherwise.
    DfaState* add_state(std::unique_ptr<DfaState> state);
    DfaState* find_state(const std::vector<int>& signature) const;
    size_t state_count() const;

private:
    struct SignatureHash {
        size_t operator()(const std::vector<int>& key) const;
    };

    const State* atn_start_state;
    const int decision;
    std::atomic<DfaState*> s0{nullptr};

    mutable std::mutex states_lock;
    std::unordered_map<std::vector<int>, std::unique_ptr<DfaState>, SignatureHash> states;
};

#endif // DFA_HPP
