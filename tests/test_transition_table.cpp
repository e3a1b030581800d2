#include <gtest/gtest.h>

#include "../include/dfakit/transition_table.hpp"

namespace dfakit::model {
namespace {

TEST(TransitionTableTest, KeepsOutEdgesInInsertionOrder) {
  TransitionTable table;
  ASSERT_TRUE(table.insert({"q0", 'b', "q1"}));
  ASSERT_TRUE(table.insert({"q0", 'a', "q2"}));
  ASSERT_TRUE(table.insert({"q1", 'c', "q0"}));

  const auto& out = table.out_edges("q0");
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], (OutEdge{'b', "q1"}));
  EXPECT_EQ(out[1], (OutEdge{'a', "q2"}));

  EXPECT_EQ(table.states(), (std::vector<State>{"q0", "q1", "q2"}));
  EXPECT_EQ(table.alphabet(), (std::vector<Symbol>{'b', 'a', 'c'}));
  EXPECT_EQ(table.size(), 3u);
}

TEST(TransitionTableTest, RejectsSecondDestinationForSameSymbol) {
  TransitionTable table;
  ASSERT_TRUE(table.insert({"q0", 'a', "q1"}));

  EXPECT_FALSE(table.insert({"q0", 'a', "q2"}));
  EXPECT_EQ(table.target("q0", 'a'), "q1");
  EXPECT_EQ(table.size(), 1u);
  EXPECT_FALSE(table.contains("q2"));
}

TEST(TransitionTableTest, RepeatedIdenticalEdgeIsIgnored) {
  TransitionTable table;
  ASSERT_TRUE(table.insert({"q0", 'a', "q1"}));
  EXPECT_TRUE(table.insert({"q0", 'a', "q1"}));
  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.out_edges("q0").size(), 1u);
}

TEST(TransitionTableTest, UnknownStateHasNoEdges) {
  TransitionTable table;
  ASSERT_TRUE(table.insert({"q0", 'a', "q1"}));

  EXPECT_TRUE(table.out_edges("q1").empty());
  EXPECT_TRUE(table.out_edges("nowhere").empty());
  EXPECT_EQ(table.target("q0", 'b'), std::nullopt);
}

TEST(TransitionTableTest, FormatListsOneStatePerLine) {
  TransitionTable table;
  ASSERT_TRUE(table.insert({"s1", 'a', "s2"}));
  ASSERT_TRUE(table.insert({"s2", 'b', "s3"}));
  ASSERT_TRUE(table.insert({"s2", 'c', "s1"}));

  EXPECT_EQ(table.format(),
            "s1: a -> s2\n"
            "s2: b -> s3, c -> s1\n"
            "s3: \n");
}

}  // namespace
}  // namespace dfakit::model
