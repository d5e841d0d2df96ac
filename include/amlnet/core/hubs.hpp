/* Degree-threshold hub detection with optional risk enrichment. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "amlnet/core/error.hpp"
#include "amlnet/core/graph_store.hpp"
#include "amlnet/core/options.hpp"
#include "amlnet/core/types.hpp"

namespace amlnet::core {

struct HubEntity {
  EntityId entity_id {};
  std::string name {"Unknown"};
  EntityType type {EntityType::Unknown};
  std::int32_t total_connections {0};
  std::int32_t outgoing_connections {0};
  std::int32_t incoming_connections {0};
  Score average_confidence {0.0};
  std::int32_t distinct_relationship_types {0};
  Score risk_score {0.0};
  RiskLevel risk_level {RiskLevel::Low};
  // 0 unless risk analysis was requested.
  Score hub_influence_score {0.0};
};

struct HubResult {
  std::vector<HubEntity> hubs {};
  std::optional<Error> error {};
};

// Pure variant: counts active edges (filtered by opts.connection_types) per
// endpoint, outgoing plus incoming. With a non-empty candidate list only
// candidates may become hubs; otherwise every endpoint seen in `edges` is
// considered. Entities with degree >= min_connections
// are sorted by degree descending (ties by id) and truncated to max_results.
// `records` supplies name/type/risk; when include_risk_analysis is set the
// influence score is computed from them (missing records use defaults).
[[nodiscard]] std::vector<HubEntity> detect_hubs(
    std::span<const RelationshipEdge> edges,
    std::span<const EntityId> candidates,
    const HubOptions& opts = {},
    std::span<const EntityRecord> records = {});

// Store-backed variant: collects one-hop edges for each candidate, or scans
// every active relationship when there are none, then enriches the surviving
// hubs through batch_lookup_entities. A lookup failure keeps the hubs with
// default entity data and reports the error.
[[nodiscard]] HubResult detect_hubs(GraphStore& store,
                                    std::span<const EntityId> candidates,
                                    const HubOptions& opts = {},
                                    const StoreContext& ctx = {});

// 0.4*degree + 0.3*(avg_confidence*30) + 0.2*(distinct_types*5) + 0.1*(risk*10)
[[nodiscard]] Score hub_influence_score(const HubEntity& hub) noexcept;

} // namespace amlnet::core
