/* Circular relationship detection around an entity. */
#pragma once

#include <span>
#include <vector>

#include "amlnet/core/options.hpp"
#include "amlnet/core/types.hpp"

namespace amlnet::core {

struct RelationshipCycle {
  // Starts at the origin entity; the closing edge returns to entities.front().
  std::vector<EntityId> entities {};
  std::vector<RelationshipId> relationships {};  // relationships[i] joins entities[i] and entities[i+1 mod n]

  [[nodiscard]] std::size_t length() const noexcept { return entities.size(); }
};

// Simple cycles through `origin` with 3 <= length <= opts.max_cycle_length,
// treating active relationships as undirected. Each cycle is reported once:
// rotated to start at origin and oriented so that the second entity is the
// smaller of the two neighbours of origin. Parallel relationships between the
// same pair are collapsed to the first one. At most opts.max_cycles cycles, in
// DFS order over ascending neighbour ids.
[[nodiscard]] std::vector<RelationshipCycle> find_cycles(
    const EntityId& origin,
    std::span<const EntityId> ids,
    std::span<const RelationshipEdge> edges,
    const CycleOptions& opts = {});

} // namespace amlnet::core
