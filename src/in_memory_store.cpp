/*
  InMemoryGraphStore: reference GraphStore adapter.

  Keeps entities in an ordered map and relationships in insertion order with a
  per-entity incidence list, so traversal output is reproducible across runs.
  The context is checked before each call and between traversal hops.
*/
#include "amlnet/core/graph_store.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace amlnet::core {

void InMemoryGraphStore::add_entity(EntityRecord entity) {
  auto id = entity.id;
  entities_[id] = std::move(entity);
}

bool InMemoryGraphStore::add_relationship(RelationshipEdge edge) {
  if (by_id_.count(edge.relationship_id) != 0) {
    return false;
  }
  const std::size_t idx = relationships_.size();
  by_id_.emplace(edge.relationship_id, idx);
  incident_[edge.source_id].push_back(idx);
  if (edge.target_id != edge.source_id) {
    incident_[edge.target_id].push_back(idx);
  }
  relationships_.emplace_back(std::move(edge));
  ++live_relationships_;
  return true;
}

bool InMemoryGraphStore::remove_relationship(const RelationshipId& id) {
  auto it = by_id_.find(id);
  if (it == by_id_.end()) return false;
  const std::size_t idx = it->second;
  const auto& edge = *relationships_[idx];
  for (const auto* endpoint : {&edge.source_id, &edge.target_id}) {
    auto inc = incident_.find(*endpoint);
    if (inc == incident_.end()) continue;
    auto& v = inc->second;
    v.erase(std::remove(v.begin(), v.end(), idx), v.end());
  }
  relationships_[idx].reset();
  by_id_.erase(it);
  --live_relationships_;
  return true;
}

std::optional<Error> InMemoryGraphStore::precheck(const char* operation,
                                                  const StoreContext& ctx) const {
  if (!available_.load()) {
    return Error{ErrorCode::StoreUnavailable, std::string(operation) + ": store unavailable"};
  }
  return ctx.check(operation);
}

StoreResult<std::vector<TraversalEdge>> InMemoryGraphStore::bounded_traversal(
    const EntityId& center, std::int32_t max_depth,
    const RelationshipFilter& filter, const StoreContext& ctx) {
  using Result = StoreResult<std::vector<TraversalEdge>>;
  if (auto err = precheck("bounded_traversal", ctx)) {
    return Result::failure(err->code, err->message);
  }

  std::vector<TraversalEdge> out;
  std::unordered_set<std::size_t> seen_edges;
  std::unordered_set<EntityId> visited {center};
  std::vector<EntityId> frontier {center};

  for (std::int32_t depth = 1; depth <= max_depth && !frontier.empty(); ++depth) {
    if (auto err = ctx.check("bounded_traversal")) {
      return Result::failure(err->code, err->message);
    }
    std::sort(frontier.begin(), frontier.end());
    std::vector<EntityId> next;
    for (const auto& u : frontier) {
      auto inc = incident_.find(u);
      if (inc == incident_.end()) continue;
      for (std::size_t idx : inc->second) {
        const auto& slot = relationships_[idx];
        if (!slot || seen_edges.count(idx) != 0 || !filter.matches(*slot)) continue;
        seen_edges.insert(idx);
        out.push_back(TraversalEdge{*slot, depth});
        const auto& v = slot->other(u);
        if (visited.insert(v).second) {
          next.push_back(v);
        }
      }
    }
    frontier = std::move(next);
  }
  spdlog::debug("bounded_traversal center={} depth={} edges={}", center, max_depth, out.size());
  return Result::success(std::move(out));
}

StoreResult<std::vector<EntityRecord>> InMemoryGraphStore::batch_lookup_entities(
    const std::vector<EntityId>& ids, const StoreContext& ctx) {
  using Result = StoreResult<std::vector<EntityRecord>>;
  if (auto err = precheck("batch_lookup_entities", ctx)) {
    return Result::failure(err->code, err->message);
  }
  std::vector<EntityRecord> out;
  out.reserve(ids.size());
  std::unordered_set<EntityId> emitted;
  for (const auto& id : ids) {
    auto it = entities_.find(id);
    if (it != entities_.end() && emitted.insert(id).second) {
      out.push_back(it->second);
    }
  }
  return Result::success(std::move(out));
}

StoreResult<std::vector<RelationshipEdge>> InMemoryGraphStore::scan_relationships(
    const RelationshipFilter& filter, const StoreContext& ctx) {
  using Result = StoreResult<std::vector<RelationshipEdge>>;
  if (auto err = precheck("scan_relationships", ctx)) {
    return Result::failure(err->code, err->message);
  }
  std::vector<RelationshipEdge> out;
  for (const auto& slot : relationships_) {
    if (slot && filter.matches(*slot)) out.push_back(*slot);
  }
  return Result::success(std::move(out));
}

} // namespace amlnet::core
