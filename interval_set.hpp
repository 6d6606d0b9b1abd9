#ifndef INTERVAL_SET_HPP
#define INTERVAL_SET_HPP
#include "std.hpp"
#include "symbol.hpp"

// Closed range [lo, hi] of symbol values
struct Interval {
    int lo;
    int hi;

    bool operator==(const Interval&) const = default;
};

// Ordered set of symbols stored as sorted, disjoint, non-adjacent intervals.
class IntervalSet {
public:
    IntervalSet() = default;
    IntervalSet(std::initializer_list<int> symbols);

    static IntervalSet of(int symbol);
    static IntervalSet of(int lo, int hi);

    void add(int symbol);
    void add(int lo, int hi);
    void add_all(const IntervalSet& other);
    void remove(int symbol);

    bool contains(int symbol) const;
    bool empty() const { return intervals.empty(); }
    // Number of symbols in the set (not the number of intervals)
    size_t size() const;
    int min_element() const;

    // Symbols in [min, max] that are not in this set
    IntervalSet complement(int min, int max) const;

    const std::vector<Interval>& get_intervals() const { return intervals; }
    std::vector<int> to_list() const;

    // Renders e.g. {'x', 'y', <EOF>}; symbols without a name print as numbers.
    std::string to_string(const std::vector<std::string>& vocabulary = {}) const;

    bool operator==(const IntervalSet& other) const { return intervals == other.intervals; }

private:
    std::vector<Interval> intervals;

    void normalize();
};

#endif // INTERVAL_SET_HPP
