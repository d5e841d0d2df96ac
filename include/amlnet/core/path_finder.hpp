/* Minimum-hop path search between two entities over the GraphStore. */
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "amlnet/core/error.hpp"
#include "amlnet/core/graph_store.hpp"
#include "amlnet/core/options.hpp"

namespace amlnet::core {

struct PathResult {
  EntityId source_entity_id {};
  EntityId target_entity_id {};
  bool found {false};
  // Relationships in traversal order; entities[i] -> entities[i+1] via edges[i],
  // regardless of the relationship's declared direction.
  std::vector<RelationshipEdge> edges {};
  std::vector<EntityId> entities {};
  std::optional<Error> error {};

  [[nodiscard]] std::int32_t length() const noexcept { return static_cast<std::int32_t>(edges.size()); }
};

struct PathStep {
  std::int32_t step {0};  // 1-based
  EntityId from {};
  EntityId to {};
  RelationshipEdge relationship {};
  Score risk_weight {0.0};
};

struct PathAnalysis {
  PathResult path {};
  std::vector<PathStep> steps {};
  Score connection_strength {0.0};  // mean strength value along the path
  Score risk_score {0.0};           // mean relationship-type risk weight
  Score path_confidence {0.0};      // weakest confidence along the path
};

// Breadth-first search treating relationships as undirected. Each level asks
// the store for one hop of edges per frontier entity; the frontier is expanded
// in ascending entity id and neighbours in store order, so among several
// minimum-hop paths the first one discovered in that order is returned. The
// result is minimal in hop count only, not in any weight.
// Throws InvalidRequest for empty ids or out-of-range options.
[[nodiscard]] PathResult find_path(GraphStore& store, const EntityId& source,
                                   const EntityId& target, const PathOptions& opts = {},
                                   const StoreContext& ctx = {});

[[nodiscard]] PathAnalysis analyze_path(PathResult path);

// Hop count between two entities, or nullopt when unconnected within max_depth.
[[nodiscard]] std::optional<std::int32_t> degrees_of_separation(
    GraphStore& store, const EntityId& a, const EntityId& b,
    const PathOptions& opts = {}, const StoreContext& ctx = {});

} // namespace amlnet::core
