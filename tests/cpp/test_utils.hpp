#pragma once

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "amlnet/core/graph_store.hpp"
#include "amlnet/core/types.hpp"

namespace amlnet::core::test {

inline RelationshipEdge make_edge(const std::string& id, const std::string& src, const std::string& dst,
                                  RelationshipType type = RelationshipType::BusinessAssociate,
                                  double confidence = 0.9, bool verified = false, bool active = true,
                                  RelationshipStrength strength = RelationshipStrength::Likely) {
  RelationshipEdge e;
  e.relationship_id = id;
  e.source_id = src;
  e.target_id = dst;
  e.relationship_type = type;
  e.strength = strength;
  e.confidence = confidence;
  e.verified = verified;
  e.active = active;
  return e;
}

inline EntityRecord make_entity(const std::string& id, double risk = 0.0,
                                EntityType type = EntityType::Individual,
                                const std::string& name = "") {
  EntityRecord r;
  r.id = id;
  r.name = name.empty() ? "Entity " + id : name;
  r.type = type;
  r.risk_score = risk;
  r.risk_level = categorize_risk(risk);
  return r;
}

// Chain E0 - E1 - ... - E{n-1}; edge ids "r0".."r{n-2}".
inline std::shared_ptr<InMemoryGraphStore> make_chain_store(
    int n, double confidence = 0.9, RelationshipType type = RelationshipType::DirectorOf) {
  auto store = std::make_shared<InMemoryGraphStore>();
  for (int i = 0; i < n; ++i) store->add_entity(make_entity("E" + std::to_string(i), 0.1));
  for (int i = 0; i + 1 < n; ++i) {
    store->add_relationship(make_edge("r" + std::to_string(i), "E" + std::to_string(i),
                                      "E" + std::to_string(i + 1), type, confidence));
  }
  return store;
}

// Center "C" linked to leaves "L0".."L{n-1}", alternating edge direction.
inline std::shared_ptr<InMemoryGraphStore> make_star_store(int leaves, double confidence = 0.9) {
  auto store = std::make_shared<InMemoryGraphStore>();
  store->add_entity(make_entity("C", 0.5, EntityType::Organization, "Center Corp"));
  for (int i = 0; i < leaves; ++i) {
    const auto leaf = "L" + std::to_string(i);
    store->add_entity(make_entity(leaf, 0.1));
    if (i % 2 == 0) {
      store->add_relationship(make_edge("s" + std::to_string(i), "C", leaf,
                                        RelationshipType::BusinessAssociate, confidence));
    } else {
      store->add_relationship(make_edge("s" + std::to_string(i), leaf, "C",
                                        RelationshipType::BusinessAssociate, confidence));
    }
  }
  return store;
}

// Two disjoint triangles A1-A2-A3 and B1-B2-B3, all edges at confidence 0.9.
inline std::vector<RelationshipEdge> make_two_triangles() {
  return {
    make_edge("a12", "A1", "A2"), make_edge("a23", "A2", "A3"), make_edge("a31", "A3", "A1"),
    make_edge("b12", "B1", "B2"), make_edge("b23", "B2", "B3"), make_edge("b31", "B3", "B1"),
  };
}

inline std::shared_ptr<InMemoryGraphStore> store_from_edges(
    const std::vector<RelationshipEdge>& edges, double risk = 0.1) {
  auto store = std::make_shared<InMemoryGraphStore>();
  for (const auto& e : edges) {
    store->add_entity(make_entity(e.source_id, risk));
    store->add_entity(make_entity(e.target_id, risk));
    store->add_relationship(e);
  }
  return store;
}

// Delegating store that starts failing a chosen call after a number of successes.
class FailingStore final : public GraphStore {
public:
  explicit FailingStore(std::shared_ptr<GraphStore> inner) : inner_(std::move(inner)) {}

  int traversal_successes {-1};  // -1 = never fail
  int lookup_successes {-1};
  ErrorCode code {ErrorCode::StoreUnavailable};
  int traversal_calls {0};
  int lookup_calls {0};

  StoreResult<std::vector<TraversalEdge>> bounded_traversal(
      const EntityId& center, std::int32_t max_depth,
      const RelationshipFilter& filter, const StoreContext& ctx) override {
    if (traversal_successes >= 0 && traversal_calls++ >= traversal_successes) {
      return StoreResult<std::vector<TraversalEdge>>::failure(code, "injected traversal failure");
    }
    return inner_->bounded_traversal(center, max_depth, filter, ctx);
  }

  StoreResult<std::vector<EntityRecord>> batch_lookup_entities(
      const std::vector<EntityId>& ids, const StoreContext& ctx) override {
    if (lookup_successes >= 0 && lookup_calls++ >= lookup_successes) {
      return StoreResult<std::vector<EntityRecord>>::failure(code, "injected lookup failure");
    }
    return inner_->batch_lookup_entities(ids, ctx);
  }

  StoreResult<std::vector<RelationshipEdge>> scan_relationships(
      const RelationshipFilter& filter, const StoreContext& ctx) override {
    if (traversal_successes == 0) {
      return StoreResult<std::vector<RelationshipEdge>>::failure(code, "injected scan failure");
    }
    return inner_->scan_relationships(filter, ctx);
  }

private:
  std::shared_ptr<GraphStore> inner_;
};

} // namespace amlnet::core::test
