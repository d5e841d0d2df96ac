#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "amlnet/core/graph_store.hpp"
#include "test_utils.hpp"

using namespace amlnet::core;
using namespace amlnet::core::test;

TEST(InMemoryStore, TraversalTagsHopDepth) {
  auto store = make_chain_store(4);
  auto res = store->bounded_traversal("E0", 2, RelationshipFilter{}, StoreContext{});
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.value.size(), 2u);
  EXPECT_EQ(res.value[0].edge.relationship_id, "r0");
  EXPECT_EQ(res.value[0].depth, 1);
  EXPECT_EQ(res.value[1].edge.relationship_id, "r1");
  EXPECT_EQ(res.value[1].depth, 2);
}

TEST(InMemoryStore, TraversalIsBidirectional) {
  auto store = make_chain_store(4);
  auto res = store->bounded_traversal("E2", 1, RelationshipFilter{}, StoreContext{});
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.value.size(), 2u);
  // Incident edges in insertion order: r1 (E1->E2) then r2 (E2->E3)
  EXPECT_EQ(res.value[0].edge.relationship_id, "r1");
  EXPECT_EQ(res.value[1].edge.relationship_id, "r2");
}

TEST(InMemoryStore, TraversalAppliesFilter) {
  auto store = std::make_shared<InMemoryGraphStore>();
  store->add_relationship(make_edge("hi", "A", "B", RelationshipType::UboOf, 0.9));
  store->add_relationship(make_edge("lo", "A", "C", RelationshipType::UboOf, 0.2));
  store->add_relationship(make_edge("off", "A", "D", RelationshipType::UboOf, 0.9, false, false));
  RelationshipFilter f;
  f.min_confidence = 0.5;
  auto res = store->bounded_traversal("A", 3, f, StoreContext{});
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.value.size(), 1u);
  EXPECT_EQ(res.value[0].edge.relationship_id, "hi");
}

TEST(InMemoryStore, DuplicateAndRemovedRelationships) {
  InMemoryGraphStore store;
  EXPECT_TRUE(store.add_relationship(make_edge("r", "A", "B")));
  EXPECT_FALSE(store.add_relationship(make_edge("r", "A", "C")));
  EXPECT_EQ(store.num_relationships(), 1u);

  EXPECT_TRUE(store.remove_relationship("r"));
  EXPECT_FALSE(store.remove_relationship("r"));
  EXPECT_EQ(store.num_relationships(), 0u);
  auto res = store.bounded_traversal("A", 2, RelationshipFilter{}, StoreContext{});
  ASSERT_TRUE(res.ok());
  EXPECT_TRUE(res.value.empty());
}

TEST(InMemoryStore, LookupOmitsUnknownAndDeduplicates) {
  auto store = make_chain_store(3);
  auto res = store->batch_lookup_entities({"E1", "missing", "E1", "E0"}, StoreContext{});
  ASSERT_TRUE(res.ok());
  ASSERT_EQ(res.value.size(), 2u);
  EXPECT_EQ(res.value[0].id, "E1");
  EXPECT_EQ(res.value[1].id, "E0");
}

TEST(InMemoryStore, ScanReturnsMatchingRelationships) {
  auto store = make_chain_store(5);
  store->add_relationship(make_edge("x", "E0", "E4", RelationshipType::UboOf, 0.9, false, false));
  auto res = store->scan_relationships(RelationshipFilter{}, StoreContext{});
  ASSERT_TRUE(res.ok());
  EXPECT_EQ(res.value.size(), 4u);
}

TEST(InMemoryStore, UnavailableStoreReportsError) {
  auto store = make_chain_store(3);
  store->set_available(false);
  auto res = store->bounded_traversal("E0", 1, RelationshipFilter{}, StoreContext{});
  ASSERT_FALSE(res.ok());
  EXPECT_EQ(res.error->code, ErrorCode::StoreUnavailable);
  EXPECT_TRUE(res.value.empty());
  EXPECT_FALSE(store->batch_lookup_entities({"E0"}, StoreContext{}).ok());
  EXPECT_FALSE(store->scan_relationships(RelationshipFilter{}, StoreContext{}).ok());
}

TEST(StoreContext, CancelledAndExpired) {
  auto store = make_chain_store(3);

  StoreContext cancelled;
  cancelled.cancelled = std::make_shared<std::atomic<bool>>(true);
  auto c = store->bounded_traversal("E0", 1, RelationshipFilter{}, cancelled);
  ASSERT_FALSE(c.ok());
  EXPECT_EQ(c.error->code, ErrorCode::Cancelled);

  StoreContext expired;
  expired.deadline = StoreContext::Clock::now() - std::chrono::seconds(1);
  auto t = store->batch_lookup_entities({"E0"}, expired);
  ASSERT_FALSE(t.ok());
  EXPECT_EQ(t.error->code, ErrorCode::StoreTimeout);

  auto fresh = StoreContext::with_timeout(std::chrono::seconds(30));
  EXPECT_FALSE(fresh.expired());
  EXPECT_FALSE(fresh.check("op").has_value());
  fresh.cancelled->store(true);
  EXPECT_TRUE(fresh.is_cancelled());
}

TEST(CollectIncidentEdges, DeduplicatesSharedEdges) {
  auto store = make_chain_store(4);
  std::vector<EntityId> ids {"E1", "E2"};
  auto res = collect_incident_edges(*store, ids, RelationshipFilter{}, StoreContext{});
  ASSERT_TRUE(res.ok());
  // r0, r1 from E1; r1 again and r2 from E2
  ASSERT_EQ(res.value.size(), 3u);
  EXPECT_EQ(res.value[0].relationship_id, "r0");
  EXPECT_EQ(res.value[1].relationship_id, "r1");
  EXPECT_EQ(res.value[2].relationship_id, "r2");
}

TEST(InMemoryStore, AvailabilityToggleDuringReads) {
  auto store = make_chain_store(4);
  std::atomic<bool> stop {false};
  std::thread reader([&] {
    while (!stop.load()) {
      auto res = store->bounded_traversal("E0", 2, RelationshipFilter{}, StoreContext{});
      if (!res.ok()) {
        EXPECT_EQ(res.error->code, ErrorCode::StoreUnavailable);
      }
    }
  });
  for (int i = 0; i < 1000; ++i) store->set_available(i % 2 == 0);
  store->set_available(true);
  stop.store(true);
  reader.join();
  EXPECT_TRUE(store->bounded_traversal("E0", 2, RelationshipFilter{}, StoreContext{}).ok());
}
