#ifndef PREDICTION_CONTEXT_HPP
#define PREDICTION_CONTEXT_HPP
#include "std.hpp"

class Atn;
struct RuleContext;
class PredictionContext;

using ContextRef = std::shared_ptr<const PredictionContext>;

// Immutable suffix of an invocation stack. Each entry i pairs a return state
// number with the context of the caller below it. Entries are sorted by
// return state; the empty marker ("stack ended here") is the entry with
// return state EMPTY_RETURN_STATE and no parent, and always sorts last.
//
// A node with one entry is a plain link in a call chain; more entries mean
// several merged histories share the suffix below this point.
class PredictionContext {
public:
    static constexpr int EMPTY_RETURN_STATE = INT_MAX;

    // The canonical empty context
    static const ContextRef& empty();

    static ContextRef singleton(ContextRef parent, int return_state);
    // `parents` and `return_states` must be the same length and
    // return_states strictly increasing; throws std::logic_error otherwise.
    static ContextRef array(std::vector<ContextRef> parents, std::vector<int> return_states);

    // Converts a live parse context chain into the equivalent prediction
    // context. Null (or a root-level context) gives empty().
    static ContextRef from_rule_context(const Atn& atn, const RuleContext* ctx);

    // Releases parent chains iteratively, so dropping a deep context does
    // not nest one destructor call per level.
    ~PredictionContext();

    size_t size() const { return return_states.size(); }
    const ContextRef& get_parent(size_t index) const { return parents[index]; }
    int get_return_state(size_t index) const { return return_states[index]; }

    bool is_empty() const { return this == empty().get(); }
    // True when one of the merged histories ended here
    bool has_empty_path() const { return return_states.back() == EMPTY_RETURN_STATE; }

    size_t hash() const { return cached_hash; }

    // Structural equality over the whole graph
    bool equals(const PredictionContext& other) const;

    std::string to_string() const;

private:
    PredictionContext(std::vector<ContextRef> parents, std::vector<int> return_states);

    // Only emptied while the node is being destroyed
    std::vector<ContextRef> parents;
    const std::vector<int> return_states;
    const size_t cached_hash;
};

bool operator==(const PredictionContext& a, const PredictionContext& b);

// Canonicalization table. One per automaton, grows for its lifetime.
// Nodes stored here only ever reference canonical parents, so two stored
// nodes are equal iff their return states match and their parents are the
// same instances.
class PredictionContextCache {
public:
    // Maps nodes already processed during one canonicalize call to their
    // canonical representative.
    using IdentityMap = std::unordered_map<const PredictionContext*, ContextRef>;

    // Insert-if-absent. Every parent of `ctx` must already be canonical.
    ContextRef add(const ContextRef& ctx);
    // The stored node equal to `ctx`, or null
    ContextRef get(const ContextRef& ctx) const;

    ContextRef canonicalize(const ContextRef& ctx);
    ContextRef canonicalize(const ContextRef& ctx, IdentityMap& visited);

    size_t size() const;

private:
    struct ShallowHash {
        size_t operator()(const ContextRef& ctx) const { return ctx->hash(); }
    };
    struct ShallowEqual {
        bool operator()(const ContextRef& a, const ContextRef& b) const;
    };

    mutable std::mutex lock;
    std::unordered_set<ContextRef, ShallowHash, ShallowEqual> nodes;
};

// Results of sub-merges performed during one merge, keyed by input identity.
using MergeCache = std::map<std::pair<const PredictionContext*, const PredictionContext*>, ContextRef>;

// Union of two call-stack histories. At each shared suffix the result holds
// the distinct entries of both inputs; an ended history is kept as its own
// entry. The result is not canonical; see Atn::merge_contexts.
// Runs on an explicit work stack; sub-merges are memoized in `merge_cache`
// (a call-local table when none is given).
ContextRef merge(const ContextRef& a, const ContextRef& b, MergeCache* merge_cache = nullptr);

#endif // PREDICTION_CONTEXT_HPP
