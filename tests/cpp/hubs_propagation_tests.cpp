#include <gtest/gtest.h>
#include "amlnet/core/hubs.hpp"
#include "amlnet/core/risk_propagation.hpp"
#include "test_utils.hpp"

using namespace amlnet::core;
using namespace amlnet::core::test;

namespace {
// X has six active edges; A..D have at most two.
std::vector<RelationshipEdge> hub_edges() {
  return {
    make_edge("1", "X", "A"), make_edge("2", "X", "B"), make_edge("3", "A", "X"),
    make_edge("4", "X", "C"), make_edge("5", "D", "X"), make_edge("6", "X", "D"),
  };
}

// A -> B -> C as director_of at confidence 0.9, A carrying risk 0.8.
std::shared_ptr<InMemoryGraphStore> propagation_chain() {
  auto store = std::make_shared<InMemoryGraphStore>();
  store->add_entity(make_entity("A", 0.8));
  store->add_entity(make_entity("B", 0.1));
  store->add_entity(make_entity("C", 0.1));
  store->add_relationship(make_edge("ab", "A", "B", RelationshipType::DirectorOf, 0.9));
  store->add_relationship(make_edge("bc", "B", "C", RelationshipType::DirectorOf, 0.9));
  return store;
}
} // namespace

TEST(Hubs, OnlyHighDegreeEntity) {
  const auto edges = hub_edges();
  const auto hubs = detect_hubs(edges, std::vector<EntityId>{});
  ASSERT_EQ(hubs.size(), 1u);
  const auto& x = hubs[0];
  EXPECT_EQ(x.entity_id, "X");
  EXPECT_EQ(x.total_connections, 6);
  EXPECT_EQ(x.outgoing_connections, 4);
  EXPECT_EQ(x.incoming_connections, 2);
  EXPECT_EQ(x.distinct_relationship_types, 1);
  EXPECT_NEAR(x.average_confidence, 0.9, 1e-12);
}

TEST(Hubs, InfluenceScoreUsesRecords) {
  const auto edges = hub_edges();
  const std::vector<EntityRecord> records {make_entity("X", 0.5, EntityType::Organization, "X Holdings")};
  const auto hubs = detect_hubs(edges, std::vector<EntityId>{}, HubOptions{}, records);
  ASSERT_EQ(hubs.size(), 1u);
  EXPECT_EQ(hubs[0].name, "X Holdings");
  EXPECT_EQ(hubs[0].type, EntityType::Organization);
  EXPECT_EQ(hubs[0].risk_level, RiskLevel::Medium);
  // 0.4*6 + 0.3*(0.9*30) + 0.2*(1*5) + 0.1*(0.5*10)
  EXPECT_NEAR(hubs[0].hub_influence_score, 12.0, 1e-9);

  HubOptions plain;
  plain.include_risk_analysis = false;
  const auto no_risk = detect_hubs(edges, std::vector<EntityId>{}, plain, records);
  EXPECT_DOUBLE_EQ(no_risk[0].hub_influence_score, 0.0);
}

TEST(Hubs, CandidatesLimitEligibility) {
  const auto edges = hub_edges();
  HubOptions opts;
  opts.min_connections = 2;
  const std::vector<EntityId> only_a {"A"};
  const auto hubs = detect_hubs(edges, only_a, opts);
  ASSERT_EQ(hubs.size(), 1u);
  EXPECT_EQ(hubs[0].entity_id, "A");
  EXPECT_EQ(hubs[0].total_connections, 2);
}

TEST(Hubs, TypeFilterAndInactiveEdges) {
  auto edges = hub_edges();
  edges[0].relationship_type = RelationshipType::UboOf;
  edges[1].active = false;
  HubOptions opts;
  opts.min_connections = 1;
  opts.connection_types = {RelationshipType::UboOf};
  const auto hubs = detect_hubs(edges, std::vector<EntityId>{}, opts);
  ASSERT_EQ(hubs.size(), 2u);
  EXPECT_EQ(hubs[0].entity_id, "A");
  EXPECT_EQ(hubs[1].entity_id, "X");
  EXPECT_EQ(hubs[1].total_connections, 1);

  opts.connection_types.clear();
  opts.min_connections = 5;
  const auto all = detect_hubs(edges, std::vector<EntityId>{}, opts);
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].total_connections, 5);
}

TEST(Hubs, SortedAndTruncated) {
  std::vector<RelationshipEdge> edges;
  for (int i = 0; i < 3; ++i) edges.push_back(make_edge("p" + std::to_string(i), "P", "n" + std::to_string(i)));
  for (int i = 0; i < 4; ++i) edges.push_back(make_edge("q" + std::to_string(i), "Q", "m" + std::to_string(i)));
  HubOptions opts;
  opts.min_connections = 3;
  opts.max_results = 1;
  const auto hubs = detect_hubs(edges, std::vector<EntityId>{}, opts);
  ASSERT_EQ(hubs.size(), 1u);
  EXPECT_EQ(hubs[0].entity_id, "Q");
}

TEST(Hubs, StoreScanWithEnrichment) {
  auto store = make_star_store(6);
  const auto res = detect_hubs(*store, std::vector<EntityId>{});
  EXPECT_FALSE(res.error.has_value());
  ASSERT_EQ(res.hubs.size(), 1u);
  EXPECT_EQ(res.hubs[0].entity_id, "C");
  EXPECT_EQ(res.hubs[0].name, "Center Corp");
  EXPECT_DOUBLE_EQ(res.hubs[0].risk_score, 0.5);
  EXPECT_GT(res.hubs[0].hub_influence_score, 0.0);
}

TEST(Hubs, StoreCandidatesUseIncidentEdges) {
  auto store = make_star_store(6);
  const std::vector<EntityId> candidates {"C", "L0"};
  const auto res = detect_hubs(*store, candidates);
  ASSERT_EQ(res.hubs.size(), 1u);
  EXPECT_EQ(res.hubs[0].total_connections, 6);
}

TEST(Hubs, LookupFailureKeepsHubs) {
  auto failing = std::make_shared<FailingStore>(make_star_store(6));
  failing->lookup_successes = 0;
  const auto res = detect_hubs(*failing, std::vector<EntityId>{});
  ASSERT_TRUE(res.error.has_value());
  ASSERT_EQ(res.hubs.size(), 1u);
  EXPECT_EQ(res.hubs[0].name, "Unknown");
}

TEST(Hubs, ScanFailureReturnsNoHubs) {
  auto store = make_star_store(6);
  store->set_available(false);
  const auto res = detect_hubs(*store, std::vector<EntityId>{});
  ASSERT_TRUE(res.error.has_value());
  EXPECT_TRUE(res.hubs.empty());
}

TEST(RiskPropagation, ChainDecays) {
  auto store = propagation_chain();
  PropagationOptions opts;
  opts.min_propagated_score = 0.05;
  const auto res = propagate_risk(*store, "A", opts);
  EXPECT_FALSE(res.error.has_value());
  EXPECT_DOUBLE_EQ(res.source_risk, 0.8);
  ASSERT_EQ(res.reached.size(), 3u);
  EXPECT_EQ(res.reached[0].entity_id, "A");
  EXPECT_EQ(res.reached[0].depth, 0);

  const auto* b = res.find("B");
  ASSERT_NE(b, nullptr);
  EXPECT_NEAR(b->risk, 0.252, 1e-9);
  EXPECT_EQ(b->depth, 1);

  const auto* c = res.find("C");
  ASSERT_NE(c, nullptr);
  EXPECT_NEAR(c->risk, 0.07938, 1e-9);
  EXPECT_EQ(c->depth, 2);
  EXPECT_EQ(c->path, (std::vector<RelationshipId>{"ab", "bc"}));
  EXPECT_EQ(res.depth_reached, 2);

  const auto scores = res.scores();
  EXPECT_DOUBLE_EQ(scores.at("A"), 0.8);
  EXPECT_LT(scores.at("C"), scores.at("B"));
}

TEST(RiskPropagation, MinimumScoreCutsOff) {
  auto store = propagation_chain();
  const auto res = propagate_risk(*store, "A");
  ASSERT_EQ(res.reached.size(), 2u);
  EXPECT_EQ(res.find("C"), nullptr);
  EXPECT_EQ(res.depth_reached, 1);
  for (const auto& r : res.reached) EXPECT_GE(r.risk, 0.1);
}

TEST(RiskPropagation, LowOrUnknownSeedIsEmpty) {
  auto store = propagation_chain();
  store->add_entity(make_entity("low", 0.05));
  store->add_relationship(make_edge("la", "low", "A", RelationshipType::DirectorOf, 0.9));
  EXPECT_TRUE(propagate_risk(*store, "low").reached.empty());
  const auto unknown = propagate_risk(*store, "nobody");
  EXPECT_TRUE(unknown.reached.empty());
  EXPECT_FALSE(unknown.error.has_value());
}

TEST(RiskPropagation, FirstArrivalWins) {
  auto store = std::make_shared<InMemoryGraphStore>();
  for (const auto* id : {"S", "P1", "P2", "T"}) store->add_entity(make_entity(id, 0.0));
  store->add_entity(make_entity("S", 1.0));
  store->add_relationship(make_edge("s1", "S", "P1", RelationshipType::DirectorOf, 0.5));
  store->add_relationship(make_edge("s2", "S", "P2", RelationshipType::DirectorOf, 1.0));
  store->add_relationship(make_edge("t1", "P1", "T", RelationshipType::DirectorOf, 1.0));
  store->add_relationship(make_edge("t2", "P2", "T", RelationshipType::DirectorOf, 1.0));
  PropagationOptions opts;
  opts.min_propagated_score = 0.05;
  const auto res = propagate_risk(*store, "S", opts);
  EXPECT_NEAR(res.find("P1")->risk, 0.175, 1e-9);
  EXPECT_NEAR(res.find("P2")->risk, 0.35, 1e-9);
  const auto* t = res.find("T");
  ASSERT_NE(t, nullptr);
  // Reached through P1 first, although P2 would give 0.1225.
  EXPECT_NEAR(t->risk, 0.06125, 1e-9);
  EXPECT_EQ(t->path, (std::vector<RelationshipId>{"s1", "t1"}));
}

TEST(RiskPropagation, StoreErrorsAndInvalidInput) {
  auto failing = std::make_shared<FailingStore>(propagation_chain());
  failing->traversal_successes = 1;
  PropagationOptions opts;
  opts.min_propagated_score = 0.05;
  const auto res = propagate_risk(*failing, "A", opts);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_NE(res.find("B"), nullptr);

  auto store = propagation_chain();
  EXPECT_THROW((void)propagate_risk(*store, ""), InvalidRequest);
  opts.propagation_factor = 1.2;
  EXPECT_THROW((void)propagate_risk(*store, "A", opts), InvalidRequest);
}
