#include "interval_set.hpp"

IntervalSet::IntervalSet(std::initializer_list<int> symbols){
    for (int s : symbols) add(s);
}

IntervalSet IntervalSet::of(int symbol){
    IntervalSet set;
    set.add(symbol);
    return set;
}

IntervalSet IntervalSet::of(int lo, int hi){
    IntervalSet set;
    set.add(lo, hi);
    return set;
}

void IntervalSet::add(int symbol){
    add(symbol, symbol);
}

void IntervalSet::add(int lo, int hi){
    if (hi < lo) return;
    intervals.push_back({lo, hi});
    normalize();
}

void IntervalSet::add_all(const IntervalSet& other){
    if (other.intervals.empty()) return;
    intervals.insert(intervals.end(), other.intervals.begin(), other.intervals.end());
    normalize();
}

void IntervalSet::remove(int symbol){
    for (size_t idx = 0; idx < intervals.size(); idx++){
        Interval& r = intervals[idx];
        if (symbol < r.lo) return;  // sorted, nothing further can match
        if (symbol > r.hi) continue;

        if (r.lo == r.hi){
            intervals.erase(intervals.begin() + static_cast<std::ptrdiff_t>(idx));
        }else if (symbol == r.lo){
            r.lo++;
        }else if (symbol == r.hi){
            r.hi--;
        }else{
            // split [lo, hi] into [lo, symbol-1] and [symbol+1, hi]
            Interval upper{symbol + 1, r.hi};
            r.hi = symbol - 1;
            intervals.insert(intervals.begin() + static_cast<std::ptrdiff_t>(idx) + 1, upper);
        }
        return;
    }
}

bool IntervalSet::contains(int symbol) const{
    // Binary search over the sorted intervals
    auto it = std::upper_bound(intervals.begin(), intervals.end(), symbol,
        [](int s, const Interval& r) { return s < r.lo; });
    if (it == intervals.begin()) return false;
    --it;
    return symbol <= it->hi;
}

size_t IntervalSet::size() const{
    size_t n = 0;
    for (const auto& r : intervals){
        n += static_cast<size_t>(static_cast<long long>(r.hi) - r.lo + 1);
    }
    return n;
}

int IntervalSet::min_element() const{
    if (intervals.empty()) return Symbol::INVALID;
    return intervals.front().lo;
}

IntervalSet IntervalSet::complement(int min, int max) const{
    IntervalSet result;
    long long next = min;
    for (const auto& r : intervals){
        if (r.hi < min) continue;
        if (r.lo > max) break;
        if (r.lo > next) result.intervals.push_back({static_cast<int>(next), r.lo - 1});
        next = static_cast<long long>(r.hi) + 1;
    }
    if (next <= max) result.intervals.push_back({static_cast<int>(next), max});
    return result;
}

std::vector<int> IntervalSet::to_list() const{
    std::vector<int> symbols;
    for (const auto& r : intervals){
        for (long long s = r.lo; s <= r.hi; s++) symbols.push_back(static_cast<int>(s));
    }
    return symbols;
}

std::string IntervalSet::to_string(const std::vector<std::string>& vocabulary) const{
    auto name_of = [&](int s) -> std::string {
        if (s == Symbol::END_OF_INPUT) return "<EOF>";
        if (s == Symbol::EPSILON) return "<EPSILON>";
        if (s >= 0 && static_cast<size_t>(s) < vocabulary.size() && !vocabulary[static_cast<size_t>(s)].empty()){
            return vocabulary[static_cast<size_t>(s)];
        }
        return std::to_string(s);
    };

    std::string str = "{";
    bool first = true;
    for (const auto& r : intervals){
        if (!first) str += ", ";
        first = false;
        if (r.lo == r.hi || r.lo < 0 || !vocabulary.empty()){
            // named vocabularies and sentinels are listed symbol by symbol
            for (long long s = r.lo; s <= r.hi; s++){
                if (s != r.lo) str += ", ";
                str += name_of(static_cast<int>(s));
            }
        }else{
            str += name_of(r.lo) + ".." + name_of(r.hi);
        }
    }
    str += "}";
    return str;
}

// Sorts the intervals and merges overlapping or adjacent ones in place,
// producing a minimal, ordered set of disjoint ranges.
void IntervalSet::normalize(){
    if (intervals.empty()) return;

    std::sort(intervals.begin(), intervals.end(),
        [](const Interval& a, const Interval& b) {
            if (a.lo != b.lo) return a.lo < b.lo;
            return a.hi < b.hi;
        });

    size_t write = 0;

    for (size_t read = 1; read < intervals.size(); ++read) {
        Interval& last = intervals[write];
        const Interval& cur = intervals[read];

        if (static_cast<long long>(cur.lo) <= static_cast<long long>(last.hi) + 1) {
            // merge into last
            last.hi = std::max(last.hi, cur.hi);
        } else {
            ++write;
            intervals[write] = cur;
        }
    }

    intervals.resize(write + 1);
}
