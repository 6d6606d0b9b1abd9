#include <thread>

#include "atn_builder.hpp"
#include "lookahead_analyzer.hpp"
#include "gtest/gtest.h"

namespace {

enum : int { X = 1, Y, Z, W, Q };

const IntervalSet kEpsilon = IntervalSet::of(Symbol::EPSILON);

class NextTokensTest : public ::testing::Test {
 protected:
  Atn atn{GrammarType::PARSER, Q};
  AtnBuilder b{atn};
};

}  // namespace

// A : 'x' B ;  B : 'y' ;
TEST_F(NextTokensTest, StartOfCalledRule) {
  int a = b.rule();
  int r = b.rule();
  Frag call = b.rule_ref(a, r);
  b.set_rule_body(a, b.sequence({b.atom(a, X), call}));
  b.set_rule_body(r, b.atom(r, Y));

  const State* b_start = atn.get_rule_start_state(r);
  EXPECT_EQ(atn.next_tokens(b_start), IntervalSet{Y});
  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(a)), IntervalSet{X});
  EXPECT_EQ(atn.next_tokens(call.start), IntervalSet{Y});
  EXPECT_EQ(atn.next_tokens(call.end), kEpsilon);
}

// A : B? 'z' ;  B : 'w' ;
TEST_F(NextTokensTest, OptionalCallDecision) {
  int a = b.rule();
  int r = b.rule();
  Frag opt = b.optional(a, b.rule_ref(a, r));
  b.set_rule_body(a, b.sequence({opt, b.atom(a, Z)}));
  b.set_rule_body(r, b.atom(r, W));

  ASSERT_EQ(opt.start->decision, 0);
  const IntervalSet& next = atn.next_tokens(opt.start);
  EXPECT_EQ(next, (IntervalSet{W, Z}));
  EXPECT_FALSE(next.contains(Symbol::EPSILON));
}

// S : 'a' ;
TEST_F(NextTokensTest, StopStateOfTopLevelRule) {
  int s = b.rule();
  b.set_rule_body(s, b.atom(s, X));

  const State* stop = atn.get_rule_stop_state(s);
  EXPECT_EQ(atn.next_tokens(stop), kEpsilon);
  EXPECT_EQ(atn.next_tokens(stop, PredictionContext::empty()), kEpsilon);
}

TEST_F(NextTokensTest, StopStatesEndAtRuleBoundaryWithEmptyContext) {
  // A : 'x' B 'q' ;  B : 'y' ;  C : A ;
  int a = b.rule();
  int r = b.rule();
  int c = b.rule();
  b.set_rule_body(a, b.sequence({b.atom(a, X), b.rule_ref(a, r), b.atom(a, Q)}));
  b.set_rule_body(r, b.atom(r, Y));
  b.set_rule_body(c, b.rule_ref(c, a));

  for (int rule = 0; rule < static_cast<int>(atn.rule_count()); rule++) {
    const State* stop = atn.get_rule_stop_state(rule);
    EXPECT_EQ(atn.next_tokens(stop, PredictionContext::empty()), kEpsilon) << "rule " << rule;
    EXPECT_EQ(atn.next_tokens(stop, nullptr), kEpsilon) << "rule " << rule;
  }
  // return edges exist but are not followed without a caller context
  EXPECT_FALSE(atn.get_rule_stop_state(r)->transitions.empty());
}

TEST_F(NextTokensTest, CachedSetIsPublishedOnce) {
  int a = b.rule();
  b.set_rule_body(a, b.star(a, b.atom(a, X)));
  const State* start = atn.get_rule_start_state(a);

  EXPECT_EQ(start->cached_next_tokens(), nullptr);
  const IntervalSet& first = atn.next_tokens(start);
  const IntervalSet& second = atn.next_tokens(start);
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(start->cached_next_tokens(), &first);
  EXPECT_EQ(first, (IntervalSet{Symbol::EPSILON, X}));
}

TEST_F(NextTokensTest, ConcurrentCallsShareOneInstance) {
  // A : ('x' | 'y' B)* 'z' ;  B : 'w'? ;
  int a = b.rule();
  int r = b.rule();
  Frag body = b.alternatives(a, {b.atom(a, X), b.sequence({b.atom(a, Y), b.rule_ref(a, r)})});
  b.set_rule_body(a, b.sequence({b.star(a, body), b.atom(a, Z)}));
  b.set_rule_body(r, b.optional(r, b.atom(r, W)));

  const size_t n = atn.state_count();
  std::vector<std::vector<const IntervalSet*>> seen(8, std::vector<const IntervalSet*>(n));
  std::vector<std::thread> threads;
  for (size_t t = 0; t < seen.size(); t++) {
    threads.emplace_back([&, t] {
      for (size_t i = 0; i < n; i++) {
        seen[t][i] = &atn.next_tokens(atn.get_state(static_cast<int>(i)));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  for (size_t i = 0; i < n; i++) {
    for (size_t t = 1; t < seen.size(); t++) {
      EXPECT_EQ(seen[t][i], seen[0][i]) << "state " << i;
    }
    EXPECT_EQ(atn.get_state(static_cast<int>(i))->cached_next_tokens(), seen[0][i]);
  }
  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(a)), (IntervalSet{X, Y, Z}));
}

TEST_F(NextTokensTest, ContextContinuesPastRuleEnd) {
  // A : B 'q' ;  B : 'y'? ;
  int a = b.rule();
  int r = b.rule();
  Frag call = b.rule_ref(a, r);
  b.set_rule_body(a, b.sequence({call, b.atom(a, Q)}));
  b.set_rule_body(r, b.optional(r, b.atom(r, Y)));

  const State* b_start = atn.get_rule_start_state(r);
  EXPECT_EQ(atn.next_tokens(b_start), (IntervalSet{Symbol::EPSILON, Y}));

  ContextRef ctx = PredictionContext::singleton(PredictionContext::empty(), call.end->state_number);
  EXPECT_EQ(atn.next_tokens(b_start, ctx), (IntervalSet{Y, Q}));

  RuleContext root;
  RuleContext in_b{&root, call.start->state_number};
  EXPECT_EQ(atn.next_tokens(b_start, PredictionContext::from_rule_context(atn, &in_b)), (IntervalSet{Y, Q}));

  // a merged context where one history has ended
  ContextRef merged = atn.merge_contexts({ctx, PredictionContext::empty()});
  EXPECT_EQ(atn.next_tokens(b_start, merged), (IntervalSet{Symbol::EPSILON, Y, Q}));
}

TEST_F(NextTokensTest, LoopsTerminate) {
  // A : ('x')+ 'y' ;  B : (C)* 'z' ;  C : 'w'? ;
  int a = b.rule();
  int r = b.rule();
  int c = b.rule();
  Frag loop = b.plus(a, b.atom(a, X));
  b.set_rule_body(a, b.sequence({loop, b.atom(a, Y)}));
  Frag star = b.star(r, b.rule_ref(r, c));
  b.set_rule_body(r, b.sequence({star, b.atom(r, Z)}));
  b.set_rule_body(c, b.optional(c, b.atom(c, W)));

  EXPECT_EQ(atn.next_tokens(loop.start), IntervalSet{X});
  const State* loop_back = atn.get_decision_state(loop.start->decision + 1);
  ASSERT_EQ(loop_back->type, StateType::PLUS_LOOP_BACK);
  EXPECT_EQ(atn.next_tokens(loop_back), (IntervalSet{X, Y}));

  EXPECT_EQ(atn.next_tokens(star.start), (IntervalSet{W, Z}));
  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(r)), (IntervalSet{W, Z}));
}

TEST_F(NextTokensTest, LeftRecursionTerminates) {
  // E : E '+' 'x' | 'x' ;
  int e = b.rule();
  Frag recursive = b.sequence({b.rule_ref(e, e), b.atom(e, Y), b.atom(e, X)});
  b.set_rule_body(e, b.alternatives(e, {recursive, b.atom(e, X)}));

  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(e)), IntervalSet{X});
  // after the recursive call: '+' here, or whatever follows E
  ContextRef ctx = PredictionContext::singleton(nullptr, recursive.start->transitions[0].follow_state->state_number);
  EXPECT_EQ(atn.next_tokens(atn.get_rule_stop_state(e), ctx), IntervalSet{Y});
}

TEST_F(NextTokensTest, MutualRecursionTerminates) {
  // A : B 'x' | 'y' ;  B : A? 'z' ;
  int a = b.rule();
  int r = b.rule();
  b.set_rule_body(r, b.sequence({b.optional(r, b.rule_ref(r, a)), b.atom(r, Z)}));
  b.set_rule_body(a, b.alternatives(a, {b.sequence({b.rule_ref(a, r), b.atom(a, X)}), b.atom(a, Y)}));

  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(a)), (IntervalSet{Y, Z}));
  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(r)), (IntervalSet{Y, Z}));
}

TEST_F(NextTokensTest, SetsWildcardsAndActions) {
  // A : ~'x' ;  B : . ;  C : {action} ('x'..'z' | [q w]) ;
  int a = b.rule();
  int r = b.rule();
  int c = b.rule();
  b.set_rule_body(a, b.not_set(a, IntervalSet{X}));
  b.set_rule_body(r, b.wildcard(r));
  b.set_rule_body(c, b.sequence({b.action(c, 0), b.alternatives(c, {b.range(c, X, Z), b.set(c, IntervalSet{Q, W})})}));

  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(a)), IntervalSet::of(Y, Q));
  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(r)), IntervalSet::of(X, Q));
  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(c)), IntervalSet::of(X, Q));
}

TEST_F(NextTokensTest, Predicates) {
  // A : {p}? 'x' | 'y' ;
  int a = b.rule();
  Frag block = b.alternatives(a, {b.sequence({b.predicate(a, 0), b.atom(a, X)}), b.atom(a, Y)});
  b.set_rule_body(a, block);

  EXPECT_EQ(atn.next_tokens(block.start), (IntervalSet{X, Y}));

  LookaheadOptions options;
  options.see_through_predicates = false;
  LookaheadAnalyzer blind(atn, options);
  EXPECT_EQ(blind.look(block.start, nullptr), (IntervalSet{Symbol::INVALID, Y}));

  LookaheadAnalyzer analyzer(atn);
  auto alts = analyzer.decision_lookahead(block.start);
  ASSERT_EQ(alts.size(), 2u);
  EXPECT_FALSE(alts[0].has_value());
  ASSERT_TRUE(alts[1].has_value());
  EXPECT_EQ(*alts[1], IntervalSet{Y});
}

TEST_F(NextTokensTest, DecisionLookaheadPerAlternative) {
  // A : ('x' | 'y')* ;
  int a = b.rule();
  Frag star = b.star(a, b.alternatives(a, {b.atom(a, X), b.atom(a, Y)}));
  b.set_rule_body(a, star);

  LookaheadAnalyzer analyzer(atn);
  auto alts = analyzer.decision_lookahead(star.start);
  ASSERT_EQ(alts.size(), 2u);
  ASSERT_TRUE(alts[0] && alts[1]);
  EXPECT_EQ(*alts[0], (IntervalSet{X, Y}));
  EXPECT_EQ(*alts[1], kEpsilon);
  EXPECT_TRUE(analyzer.decision_lookahead(nullptr).empty());
}

TEST_F(NextTokensTest, ExplicitStopState) {
  // A : B? 'y' ;  B : 'w' ;
  int a = b.rule();
  int r = b.rule();
  Frag opt = b.optional(a, b.rule_ref(a, r));
  b.set_rule_body(a, b.sequence({opt, b.atom(a, Y)}));
  b.set_rule_body(r, b.atom(r, W));

  LookaheadAnalyzer analyzer(atn);
  EXPECT_EQ(analyzer.look(atn.get_rule_start_state(a), opt.end, nullptr), (IntervalSet{Symbol::EPSILON, W}));
  EXPECT_EQ(analyzer.look(atn.get_rule_start_state(a), nullptr), (IntervalSet{W, Y}));
}

TEST_F(NextTokensTest, AddEofOption) {
  int s = b.rule();
  b.set_rule_body(s, b.optional(s, b.atom(s, X)));

  LookaheadOptions options;
  options.add_eof = true;
  LookaheadAnalyzer analyzer(atn, options);
  EXPECT_EQ(analyzer.look(atn.get_rule_start_state(s), nullptr), (IntervalSet{Symbol::END_OF_INPUT, X}));
  EXPECT_EQ(atn.next_tokens(atn.get_rule_start_state(s)), (IntervalSet{Symbol::EPSILON, X}));
}
