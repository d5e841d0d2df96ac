#include <gtest/gtest.h>
#include "amlnet/core/path_finder.hpp"
#include "test_utils.hpp"

using namespace amlnet::core;
using namespace amlnet::core::test;

TEST(PathFinder, ChainPathBothDirections) {
  auto store = make_chain_store(5);
  auto fwd = find_path(*store, "E0", "E4");
  ASSERT_TRUE(fwd.found);
  EXPECT_FALSE(fwd.error.has_value());
  EXPECT_EQ(fwd.length(), 4);
  EXPECT_EQ(fwd.entities, (std::vector<EntityId>{"E0", "E1", "E2", "E3", "E4"}));

  auto back = find_path(*store, "E4", "E0");
  ASSERT_TRUE(back.found);
  EXPECT_EQ(back.length(), 4);
  EXPECT_EQ(back.entities.front(), "E4");
  EXPECT_EQ(back.edges.front().relationship_id, "r3");
}

TEST(PathFinder, SameEntityIsTrivialPath) {
  auto store = make_chain_store(2);
  auto res = find_path(*store, "E1", "E1");
  EXPECT_TRUE(res.found);
  EXPECT_EQ(res.length(), 0);
  EXPECT_EQ(res.entities, (std::vector<EntityId>{"E1"}));
}

TEST(PathFinder, DisconnectedEntitiesNotFound) {
  auto store = store_from_edges(make_two_triangles());
  auto res = find_path(*store, "A1", "B1");
  EXPECT_FALSE(res.found);
  EXPECT_FALSE(res.error.has_value());
  EXPECT_TRUE(res.edges.empty());
}

TEST(PathFinder, DepthLimit) {
  auto store = make_chain_store(5);
  PathOptions opts;
  opts.max_depth = 3;
  EXPECT_FALSE(find_path(*store, "E0", "E4", opts).found);
  opts.max_depth = 4;
  EXPECT_TRUE(find_path(*store, "E0", "E4", opts).found);
}

TEST(PathFinder, TieBreakFollowsAscendingIds) {
  auto store = store_from_edges({
    make_edge("ac", "A", "C"), make_edge("ab", "A", "B"),
    make_edge("cd", "C", "D"), make_edge("bd", "B", "D"),
  });
  auto res = find_path(*store, "A", "D");
  ASSERT_TRUE(res.found);
  EXPECT_EQ(res.length(), 2);
  // Frontier {C, B} is expanded in ascending order, so B is tried first.
  EXPECT_EQ(res.entities, (std::vector<EntityId>{"A", "B", "D"}));
}

TEST(PathFinder, ConfidenceFilter) {
  auto store = store_from_edges({
    make_edge("ab", "A", "B", RelationshipType::BusinessAssociate, 0.2),
    make_edge("ac", "A", "C"), make_edge("cb", "C", "B"),
  });
  PathOptions opts;
  opts.min_confidence = 0.5;
  auto res = find_path(*store, "A", "B", opts);
  ASSERT_TRUE(res.found);
  EXPECT_EQ(res.length(), 2);
}

TEST(PathFinder, StoreFailureIsReported) {
  auto failing = std::make_shared<FailingStore>(make_chain_store(5));
  failing->traversal_successes = 1;
  auto res = find_path(*failing, "E0", "E4");
  EXPECT_FALSE(res.found);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_EQ(res.error->code, ErrorCode::StoreUnavailable);
}

TEST(PathFinder, InvalidArgumentsThrow) {
  auto store = make_chain_store(2);
  EXPECT_THROW((void)find_path(*store, "", "E1"), InvalidRequest);
  PathOptions opts;
  opts.max_depth = 0;
  EXPECT_THROW((void)find_path(*store, "E0", "E1", opts), InvalidRequest);
}

TEST(PathAnalysis, StrengthRiskAndConfidence) {
  auto store = store_from_edges({
    make_edge("r1", "A", "B", RelationshipType::DirectorOf, 0.9, true, true,
              RelationshipStrength::Confirmed),
    make_edge("r2", "B", "C", RelationshipType::UboOf, 0.6, false, true,
              RelationshipStrength::Possible),
  });
  auto a = analyze_path(find_path(*store, "A", "C"));
  ASSERT_TRUE(a.path.found);
  ASSERT_EQ(a.steps.size(), 2u);
  EXPECT_EQ(a.steps[0].step, 1);
  EXPECT_EQ(a.steps[0].from, "A");
  EXPECT_EQ(a.steps[1].to, "C");
  EXPECT_DOUBLE_EQ(a.steps[1].risk_weight, 0.7);
  EXPECT_DOUBLE_EQ(a.connection_strength, 0.7);
  EXPECT_DOUBLE_EQ(a.risk_score, 0.7);
  EXPECT_DOUBLE_EQ(a.path_confidence, 0.6);
}

TEST(PathAnalysis, NotFoundHasZeroScores) {
  auto store = store_from_edges(make_two_triangles());
  auto a = analyze_path(find_path(*store, "A1", "B2"));
  EXPECT_FALSE(a.path.found);
  EXPECT_TRUE(a.steps.empty());
  EXPECT_DOUBLE_EQ(a.connection_strength, 0.0);
}

TEST(PathFinder, DegreesOfSeparation) {
  auto store = make_chain_store(4);
  EXPECT_EQ(degrees_of_separation(*store, "E0", "E3"), 3);
  EXPECT_EQ(degrees_of_separation(*store, "E2", "E2"), 0);
  store->add_entity(make_entity("lonely"));
  EXPECT_FALSE(degrees_of_separation(*store, "E0", "lonely").has_value());
}
