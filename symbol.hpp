#ifndef SYMBOL_HPP
#define SYMBOL_HPP

// Reserved symbol values. Real token types (and lexer code points) are >= 0;
// the sentinels never collide with them.
struct Symbol {
    static constexpr int INVALID = 0;       // also the "hit a predicate" marker
    static constexpr int MIN_USER = 1;
    static constexpr int END_OF_INPUT = -1; // EOF
    static constexpr int EPSILON = -2;      // no input consumed
};

#endif // SYMBOL_HPP
