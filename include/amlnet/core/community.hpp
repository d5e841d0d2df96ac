/* Connected-component communities over high-confidence relationships. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "amlnet/core/options.hpp"
#include "amlnet/core/types.hpp"

namespace amlnet::core {

struct Community {
  std::vector<EntityId> entity_ids {};   // BFS order from the first member
  std::int32_t edge_count {0};           // qualifying edges inside the community
  Score density {0.0};                   // edge_count / (n(n-1)/2)
  Score average_confidence {0.0};

  [[nodiscard]] std::size_t size() const noexcept { return entity_ids.size(); }
};

// Connected components of the undirected graph formed by active edges with
// confidence >= opts.confidence_floor() whose endpoints are both candidates.
// Components are seeded in candidate order; those smaller than
// min_community_size are discarded, so isolated entities never appear.
// Returned communities are disjoint subsets of the candidates.
// Throws InvalidRequest for invalid options.
[[nodiscard]] std::vector<Community> detect_communities(
    std::span<const EntityId> candidates,
    std::span<const RelationshipEdge> edges,
    const CommunityOptions& opts = {});

} // namespace amlnet::core
