#include "interval_set.hpp"
#include "gtest/gtest.h"

TEST(IntervalSetTest, AdjacentAndOverlappingRangesMerge) {
  IntervalSet set;
  set.add(1);
  set.add(2);
  set.add(3, 5);
  set.add(4, 7);
  ASSERT_EQ(set.get_intervals().size(), 1u);
  EXPECT_EQ(set.get_intervals()[0], (Interval{1, 7}));
  EXPECT_EQ(set.size(), 7u);
}

TEST(IntervalSetTest, RemoveSplitsAndTrims) {
  IntervalSet set = IntervalSet::of(1, 5);
  set.remove(3);
  EXPECT_FALSE(set.contains(3));
  EXPECT_TRUE(set.contains(2));
  EXPECT_TRUE(set.contains(4));
  ASSERT_EQ(set.get_intervals().size(), 2u);

  set.remove(1);
  set.remove(5);
  EXPECT_EQ(set.to_list(), (std::vector<int>{2, 4}));

  set.remove(42);
  EXPECT_EQ(set.size(), 2u);
}

TEST(IntervalSetTest, Complement) {
  IntervalSet set{2, 4};
  EXPECT_EQ(set.complement(1, 5), (IntervalSet{1, 3, 5}));
  EXPECT_TRUE(IntervalSet::of(1, 5).complement(1, 5).empty());
  EXPECT_EQ(IntervalSet().complement(1, 3), IntervalSet::of(1, 3));
}

TEST(IntervalSetTest, SentinelsAreOrdinaryMembers) {
  IntervalSet set{Symbol::EPSILON, Symbol::END_OF_INPUT, 3};
  EXPECT_TRUE(set.contains(Symbol::EPSILON));
  EXPECT_TRUE(set.contains(Symbol::END_OF_INPUT));
  EXPECT_FALSE(set.contains(Symbol::INVALID));

  set.remove(Symbol::EPSILON);
  EXPECT_FALSE(set.contains(Symbol::EPSILON));
  EXPECT_EQ(set, (IntervalSet{Symbol::END_OF_INPUT, 3}));
  EXPECT_EQ(set.min_element(), Symbol::END_OF_INPUT);
}

TEST(IntervalSetTest, ToString) {
  const std::vector<std::string> vocabulary = {"", "'x'", "'y'"};
  EXPECT_EQ((IntervalSet{1, 2}).to_string(vocabulary), "{'x', 'y'}");
  EXPECT_EQ((IntervalSet{Symbol::END_OF_INPUT, 1}).to_string(vocabulary), "{<EOF>, 'x'}");
  EXPECT_EQ(IntervalSet::of(Symbol::EPSILON).to_string(), "{<EPSILON>}");
  EXPECT_EQ(IntervalSet::of(1, 3).to_string(), "{1..3}");
  EXPECT_EQ((IntervalSet{7, 9}).to_string(), "{7, 9}");
  EXPECT_EQ(IntervalSet().to_string(), "{}");
}
