#include "prediction_context.hpp"
#include "atn.hpp"
#include "rule_context.hpp"

namespace {

size_t mix(size_t h, size_t v){
    return h ^ (v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

size_t compute_hash(const std::vector<ContextRef>& parents, const std::vector<int>& return_states){
    size_t h = 1;
    for (const auto& p : parents) h = mix(h, p ? p->hash() : 0);
    for (int r : return_states) h = mix(h, std::hash<int>{}(r));
    return h;
}

// True when `ctx` holds exactly these entries, parents compared by identity
bool same_entries(const PredictionContext& ctx,
                  const std::vector<ContextRef>& parents, const std::vector<int>& return_states){
    if (ctx.size() != return_states.size()) return false;
    for (size_t i = 0; i < return_states.size(); i++){
        if (ctx.get_return_state(i) != return_states[i] || ctx.get_parent(i) != parents[i]) return false;
    }
    return true;
}

} // namespace

PredictionContext::PredictionContext(std::vector<ContextRef> p, std::vector<int> r)
    : parents(std::move(p)), return_states(std::move(r)),
      cached_hash(compute_hash(parents, return_states)) {}

PredictionContext::~PredictionContext(){
    std::vector<ContextRef> pending;
    pending.swap(parents);
    while (!pending.empty()){
        ContextRef node = std::move(pending.back());
        pending.pop_back();
        // Sole owner: take its parents before it goes, leaving it nothing to release
        if (node && node.use_count() == 1){
            auto& node_parents = const_cast<PredictionContext&>(*node).parents;
            for (auto& p : node_parents) pending.push_back(std::move(p));
            node_parents.clear();
        }
    }
}

const ContextRef& PredictionContext::empty(){
    static const ContextRef instance(new PredictionContext({nullptr}, {EMPTY_RETURN_STATE}));
    return instance;
}

ContextRef PredictionContext::singleton(ContextRef parent, int return_state){
    if (return_state == EMPTY_RETURN_STATE) return empty();
    if (!parent) parent = empty();
    return ContextRef(new PredictionContext({std::move(parent)}, {return_state}));
}

ContextRef PredictionContext::array(std::vector<ContextRef> parents, std::vector<int> return_states){
    if (parents.size() != return_states.size() || parents.empty()){
        throw std::logic_error("prediction context needs one parent per return state");
    }
    for (size_t i = 0; i < return_states.size(); i++){
        if (i > 0 && return_states[i - 1] >= return_states[i]){
            throw std::logic_error("prediction context return states must be strictly increasing");
        }
        if (return_states[i] == EMPTY_RETURN_STATE) parents[i] = nullptr;
        else if (!parents[i]) parents[i] = empty();
    }
    if (return_states.size() == 1) return singleton(parents[0], return_states[0]);
    return ContextRef(new PredictionContext(std::move(parents), std::move(return_states)));
}

ContextRef PredictionContext::from_rule_context(const Atn& atn, const RuleContext* ctx){
    // Collect the levels below the root, innermost first
    std::vector<const RuleContext*> levels;
    for (const RuleContext* c = ctx; c && !c->is_root(); c = c->parent){
        levels.push_back(c);
    }

    ContextRef result = empty();
    for (auto it = levels.rbegin(); it != levels.rend(); ++it){
        const State* invoking = atn.get_state((*it)->invoking_state);
        const Transition* call = invoking ? invoking->rule_transition() : nullptr;
        if (!call){
            throw std::logic_error("invoking state " + std::to_string((*it)->invoking_state) +
                                   " does not call a rule");
        }
        result = singleton(result, call->follow_state->state_number);
    }
    return result;
}

bool PredictionContext::equals(const PredictionContext& other) const{
    using Pair = std::pair<const PredictionContext*, const PredictionContext*>;
    std::vector<Pair> work{{this, &other}};
    std::set<Pair> seen;

    while (!work.empty()){
        auto [a, b] = work.back();
        work.pop_back();
        if (a == b || !seen.insert({a, b}).second) continue;
        if (a->cached_hash != b->cached_hash || a->return_states != b->return_states) return false;

        for (size_t i = 0; i < a->parents.size(); i++){
            const PredictionContext* pa = a->parents[i].get();
            const PredictionContext* pb = b->parents[i].get();
            if (!pa || !pb){
                if (pa != pb) return false;
                continue;
            }
            work.push_back({pa, pb});
        }
    }
    return true;
}

std::string PredictionContext::to_string() const{
    std::string str = "[";
    for (size_t i = 0; i < return_states.size(); i++){
        if (i > 0) str += ", ";
        if (return_states[i] == EMPTY_RETURN_STATE) str += "$";
        else str += std::to_string(return_states[i]);
    }
    str += "]";
    return str;
}

bool operator==(const PredictionContext& a, const PredictionContext& b){
    return a.equals(b);
}

// ---------------------------------------------------------------------------

bool PredictionContextCache::ShallowEqual::operator()(const ContextRef& a, const ContextRef& b) const{
    if (a == b) return true;
    if (a->hash() != b->hash() || a->size() != b->size()) return false;
    for (size_t i = 0; i < a->size(); i++){
        if (a->get_return_state(i) != b->get_return_state(i) || a->get_parent(i) != b->get_parent(i)) return false;
    }
    return true;
}

ContextRef PredictionContextCache::add(const ContextRef& ctx){
    if (!ctx || ctx->is_empty()) return PredictionContext::empty();
    std::lock_guard<std::mutex> guard(lock);
    return *nodes.insert(ctx).first;
}

ContextRef PredictionContextCache::get(const ContextRef& ctx) const{
    if (!ctx || ctx->is_empty()) return PredictionContext::empty();
    std::lock_guard<std::mutex> guard(lock);
    auto it = nodes.find(ctx);
    return it == nodes.end() ? nullptr : *it;
}

size_t PredictionContextCache::size() const{
    std::lock_guard<std::mutex> guard(lock);
    return nodes.size();
}

ContextRef PredictionContextCache::canonicalize(const ContextRef& ctx){
    IdentityMap visited;
    return canonicalize(ctx, visited);
}

// Post-order walk over the context DAG: a node is replaced once all of its
// parents have canonical representatives. Shared substructure is processed
// once per call no matter how many paths lead to it.
ContextRef PredictionContextCache::canonicalize(const ContextRef& ctx, IdentityMap& visited){
    if (!ctx || ctx->is_empty()) return PredictionContext::empty();

    std::vector<ContextRef> work{ctx};
    while (!work.empty()){
        ContextRef node = work.back();
        if (visited.count(node.get())){
            work.pop_back();
            continue;
        }
        if (node->is_empty()){
            visited.emplace(node.get(), node);
            work.pop_back();
            continue;
        }

        bool ready = true;
        for (size_t i = 0; i < node->size(); i++){
            const ContextRef& parent = node->get_parent(i);
            if (parent && !visited.count(parent.get())){
                work.push_back(parent);
                ready = false;
            }
        }
        if (!ready) continue;
        work.pop_back();

        std::vector<ContextRef> parents;
        std::vector<int> return_states;
        bool changed = false;
        for (size_t i = 0; i < node->size(); i++){
            const ContextRef& parent = node->get_parent(i);
            ContextRef canonical_parent = parent ? visited.at(parent.get()) : nullptr;
            changed = changed || canonical_parent != parent;
            parents.push_back(std::move(canonical_parent));
            return_states.push_back(node->get_return_state(i));
        }

        ContextRef candidate = changed
            ? PredictionContext::array(std::move(parents), std::move(return_states))
            : node;
        ContextRef canonical = add(candidate);
        visited.emplace(node.get(), canonical);
        visited.emplace(canonical.get(), canonical);
    }
    return visited.at(ctx.get());
}

// ---------------------------------------------------------------------------

namespace {

using MergePair = std::pair<const PredictionContext*, const PredictionContext*>;

// Either argument order, null if not merged yet
ContextRef find_merged(const MergeCache& merge_cache, const PredictionContext* a, const PredictionContext* b){
    auto it = merge_cache.find({a, b});
    if (it != merge_cache.end()) return it->second;
    it = merge_cache.find({b, a});
    return it == merge_cache.end() ? nullptr : it->second;
}

// Hashes first: most unequal pairs never reach the full structural walk
bool same_context(const ContextRef& a, const ContextRef& b){
    return a == b || (a->hash() == b->hash() && a->equals(*b));
}

// Merge of two nodes whose shared-return-state parent pairs have already
// been merged into `merge_cache`.
ContextRef merge_entries(const ContextRef& a, const ContextRef& b, const MergeCache& merge_cache){
    std::vector<ContextRef> parents;
    std::vector<int> return_states;
    size_t i = 0, j = 0;

    while (i < a->size() && j < b->size()){
        int ra = a->get_return_state(i);
        int rb = b->get_return_state(j);
        if (ra == rb){
            const ContextRef& pa = a->get_parent(i);
            const ContextRef& pb = b->get_parent(j);
            // both ended here, or both continue into a merged caller
            if (!pa || !pb) parents.push_back(nullptr);
            else if (pa == pb) parents.push_back(pa);
            else parents.push_back(find_merged(merge_cache, pa.get(), pb.get()));
            return_states.push_back(ra);
            i++;
            j++;
        }else if (ra < rb){
            parents.push_back(a->get_parent(i));
            return_states.push_back(ra);
            i++;
        }else{
            parents.push_back(b->get_parent(j));
            return_states.push_back(rb);
            j++;
        }
    }
    for (; i < a->size(); i++){
        parents.push_back(a->get_parent(i));
        return_states.push_back(a->get_return_state(i));
    }
    for (; j < b->size(); j++){
        parents.push_back(b->get_parent(j));
        return_states.push_back(b->get_return_state(j));
    }

    // Share one instance between equal parents
    for (size_t k = 1; k < parents.size(); k++){
        if (!parents[k]) continue;
        for (size_t m = 0; m < k; m++){
            if (parents[m] && parents[m] != parents[k] && same_context(parents[m], parents[k])){
                parents[k] = parents[m];
                break;
            }
        }
    }

    if (same_entries(*a, parents, return_states)) return a;
    if (same_entries(*b, parents, return_states)) return b;
    return PredictionContext::array(std::move(parents), std::move(return_states));
}

} // namespace

// Post-order walk over pairs of nodes: a pair is merged once every pair of
// parents sharing a return state has a result.
ContextRef merge(const ContextRef& a_in, const ContextRef& b_in, MergeCache* merge_cache){
    const ContextRef& a = a_in ? a_in : PredictionContext::empty();
    const ContextRef& b = b_in ? b_in : PredictionContext::empty();
    if (same_context(a, b)) return a;

    MergeCache local_cache;
    MergeCache& results = merge_cache ? *merge_cache : local_cache;
    if (ContextRef done = find_merged(results, a.get(), b.get())) return done;

    std::vector<std::pair<ContextRef, ContextRef>> work{{a, b}};
    while (!work.empty()){
        ContextRef x = work.back().first;
        ContextRef y = work.back().second;
        if (find_merged(results, x.get(), y.get())){
            work.pop_back();
            continue;
        }
        if (same_context(x, y)){
            results.emplace(MergePair{x.get(), y.get()}, x);
            work.pop_back();
            continue;
        }

        bool ready = true;
        size_t i = 0, j = 0;
        while (i < x->size() && j < y->size()){
            int rx = x->get_return_state(i);
            int ry = y->get_return_state(j);
            if (rx < ry){
                i++;
            }else if (ry < rx){
                j++;
            }else{
                const ContextRef& px = x->get_parent(i);
                const ContextRef& py = y->get_parent(j);
                if (px && py && px != py && !find_merged(results, px.get(), py.get())){
                    work.emplace_back(px, py);
                    ready = false;
                }
                i++;
                j++;
            }
        }
        if (!ready) continue;

        work.pop_back();
        results.emplace(MergePair{x.get(), y.get()}, merge_entries(x, y, results));
    }
    return find_merged(results, a.get(), b.get());
}
