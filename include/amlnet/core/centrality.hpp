/* Degree-based centrality over a candidate entity set. */
#pragma once

#include <span>
#include <vector>

#include "amlnet/core/options.hpp"
#include "amlnet/core/types.hpp"

namespace amlnet::core {

// For each unique candidate (in first-occurrence order), aggregates active
// edges whose endpoints are both candidates:
//   degree               = outgoing + incoming
//   normalized_degree    = degree / max(|candidates| - 1, 1)
//   weighted             = sum(confidence)
//   risk_weighted        = sum(confidence * relationship_type_risk_weight)
//   high_confidence      = count(confidence >= 0.8)
//   centrality_score     = 0.4*normalized + 0.3*(weighted / max(degree, 1)) + 0.3*risk_weighted
// With include_advanced, degree-derived proxies are filled in:
//   closeness  ~ min(normalized * 1.2, 1.0)
//   betweenness ~ normalized * 0.8
// These are approximations kept for numeric compatibility, not shortest-path
// centralities. Candidates without edges get an all-zero record.
[[nodiscard]] std::vector<CentralityRecord> compute_centrality(
    std::span<const EntityId> candidates,
    std::span<const RelationshipEdge> edges,
    const CentralityOptions& opts = {});

// Highest-degree entities (ties by id), used as an approximation of bridges.
[[nodiscard]] std::vector<EntityId> find_bridges(
    std::span<const CentralityRecord> records, std::size_t limit = 5);

} // namespace amlnet::core
