/*
  GraphStore interface: the narrow contract through which the engine reads the
  entity/relationship store.

  Any storage engine (document store, relational adjacency table, native graph
  database, in-memory structure) implements these calls. All calls are
  read-only and report failures as Error values inside StoreResult; they never
  throw for store-side problems.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual ... = 0: pure virtual (like @abstractmethod)
*/
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "amlnet/core/error.hpp"
#include "amlnet/core/options.hpp"
#include "amlnet/core/types.hpp"

namespace amlnet::core {

// Deadline and cancellation threaded from the request down to every store call.
struct StoreContext {
  using Clock = std::chrono::steady_clock;

  std::optional<Clock::time_point> deadline {};
  std::shared_ptr<std::atomic<bool>> cancelled {};

  [[nodiscard]] static StoreContext with_timeout(std::chrono::milliseconds timeout);

  [[nodiscard]] bool expired() const noexcept {
    return deadline.has_value() && Clock::now() >= *deadline;
  }
  [[nodiscard]] bool is_cancelled() const noexcept {
    return cancelled && cancelled->load(std::memory_order_relaxed);
  }
  // Error to report when the call must not proceed, if any.
  [[nodiscard]] std::optional<Error> check(const char* operation) const;
};

// Relationship edge tagged with the hop (1-based) at which traversal reached it.
struct TraversalEdge {
  RelationshipEdge edge;
  std::int32_t depth {1};
};

class GraphStore {
public:
  virtual ~GraphStore() noexcept = default;

  // Edges reachable within max_depth hops of center in either direction,
  // restricted to `filter`, in breadth-first order.
  [[nodiscard]] virtual StoreResult<std::vector<TraversalEdge>> bounded_traversal(
      const EntityId& center, std::int32_t max_depth,
      const RelationshipFilter& filter, const StoreContext& ctx) = 0;

  // Entity summaries for the ids that exist; unknown ids are omitted.
  [[nodiscard]] virtual StoreResult<std::vector<EntityRecord>> batch_lookup_entities(
      const std::vector<EntityId>& ids, const StoreContext& ctx) = 0;

  // Every relationship matching `filter` (used by hub detection without candidates).
  [[nodiscard]] virtual StoreResult<std::vector<RelationshipEdge>> scan_relationships(
      const RelationshipFilter& filter, const StoreContext& ctx) = 0;
};

using GraphStorePtr = std::shared_ptr<GraphStore>;

// One-hop edges of every entity in `ids`, deduplicated by relationship id and
// kept in first-seen order. Stops at the first store error.
[[nodiscard]] StoreResult<std::vector<RelationshipEdge>> collect_incident_edges(
    GraphStore& store, std::span<const EntityId> ids,
    const RelationshipFilter& filter, const StoreContext& ctx);

// Reference adapter holding the whole store in memory. Deterministic: each hop
// expands its frontier in ascending entity id and visits incident edges in
// insertion order.
class InMemoryGraphStore final : public GraphStore {
public:
  InMemoryGraphStore() = default;

  // Replaces an existing entity with the same id.
  void add_entity(EntityRecord entity);
  // Returns false (and ignores the edge) when the relationship id already exists.
  bool add_relationship(RelationshipEdge edge);
  // Removes a relationship; returns false when it does not exist.
  bool remove_relationship(const RelationshipId& id);

  // Simulates an outage: every call fails with StoreUnavailable while false.
  void set_available(bool available) noexcept { available_.store(available); }

  [[nodiscard]] std::size_t num_entities() const noexcept { return entities_.size(); }
  [[nodiscard]] std::size_t num_relationships() const noexcept { return live_relationships_; }

  StoreResult<std::vector<TraversalEdge>> bounded_traversal(
      const EntityId& center, std::int32_t max_depth,
      const RelationshipFilter& filter, const StoreContext& ctx) override;

  StoreResult<std::vector<EntityRecord>> batch_lookup_entities(
      const std::vector<EntityId>& ids, const StoreContext& ctx) override;

  StoreResult<std::vector<RelationshipEdge>> scan_relationships(
      const RelationshipFilter& filter, const StoreContext& ctx) override;

private:
  [[nodiscard]] std::optional<Error> precheck(const char* operation, const StoreContext& ctx) const;

  std::atomic<bool> available_ {true};
  std::map<EntityId, EntityRecord> entities_ {};
  // Insertion-ordered relationship storage; removed slots are tombstoned.
  std::vector<std::optional<RelationshipEdge>> relationships_ {};
  std::unordered_map<RelationshipId, std::size_t> by_id_ {};
  std::unordered_map<EntityId, std::vector<std::size_t>> incident_ {};
  std::size_t live_relationships_ {0};
};

} // namespace amlnet::core
