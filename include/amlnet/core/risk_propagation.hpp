/* Decaying multi-hop risk diffusion from a seed entity. */
#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "amlnet/core/error.hpp"
#include "amlnet/core/graph_store.hpp"
#include "amlnet/core/options.hpp"
#include "amlnet/core/types.hpp"

namespace amlnet::core {

struct PropagatedRisk {
  EntityId entity_id {};
  Score risk {0.0};
  std::int32_t depth {0};                     // 0 for the seed
  std::vector<RelationshipId> path {};        // relationships from the seed, in hop order
};

struct PropagationResult {
  EntityId source_entity_id {};
  Score source_risk {0.0};
  // Reach order: the seed first, then level by level.
  std::vector<PropagatedRisk> reached {};
  std::int32_t depth_reached {0};
  std::optional<Error> error {};

  [[nodiscard]] const PropagatedRisk* find(const EntityId& id) const noexcept;
  // entity id -> propagated value (the seed maps to its base risk).
  [[nodiscard]] std::unordered_map<EntityId, Score> scores() const;
};

// Breadth-first by depth level d = 1..max_depth. For every entity reached at
// d-1 (in reach order) its direct connections are fetched from the store; an
// unreached neighbour receives
//   parent_risk * propagation_factor * confidence * relationship_type_risk_weight
// (so seed_risk * propagation_factor^d times the product along the hop path)
// and is recorded when that value is >= min_propagated_score.
// First-arrival policy: a reached entity keeps its first value even when a later
// path would yield a higher one. Expansion stops when a level adds nothing.
// A seed below min_propagated_score (or unknown to the store) yields an empty
// result. Throws InvalidRequest for an empty id or invalid options.
[[nodiscard]] PropagationResult propagate_risk(GraphStore& store, const EntityId& source,
                                               const PropagationOptions& opts = {},
                                               const StoreContext& ctx = {});

} // namespace amlnet::core
