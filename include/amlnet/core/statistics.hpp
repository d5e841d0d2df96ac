/* Aggregate network statistics, relationship patterns and network risk scores. */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "amlnet/core/network_graph.hpp"
#include "amlnet/core/types.hpp"

namespace amlnet::core {

// Relationship counts grouped into the investigative patterns they suggest.
struct PatternCounts {
  std::int32_t corporate_hierarchies {0};        // director_of, shareholder_of, parent_of_subsidiary
  std::int32_t beneficial_ownership_chains {0};  // ubo_of, potential_beneficial_owner_of
  std::int32_t household_clusters {0};           // household_member
  std::int32_t duplicate_entity_groups {0};      // confirmed_same_entity, potential_duplicate
  std::int32_t high_risk_networks {0};           // transactional_counterparty_high_risk, business_associate_suspected
};

struct NetworkStatistics {
  std::int32_t total_entities {0};
  std::int32_t total_relationships {0};
  Score density {0.0};
  Score average_confidence {0.0};
  Score verification_rate {0.0};
  // Relationships whose type weight is above 0.6.
  std::int32_t high_risk_relationship_count {0};
  std::map<RiskLevel, std::int32_t> risk_distribution {};
  std::map<EntityType, std::int32_t> entity_type_distribution {};
  std::map<RelationshipType, std::int32_t> relationship_type_distribution {};
  PatternCounts patterns {};
};

struct NodeRiskScore {
  EntityId entity_id {};
  Score base_risk {0.0};
  Score connection_risk_factor {0.0};
  Score network_risk_score {0.0};
  RiskLevel risk_level {RiskLevel::Low};
  std::int32_t high_risk_connections {0};
  std::int32_t total_connections {0};
};

// density = edges / (n(n-1)/2), 0 when n < 2.
[[nodiscard]] Score network_density(std::int32_t num_entities, std::int32_t num_relationships) noexcept;

[[nodiscard]] PatternCounts count_patterns(std::span<const RelationshipEdge> edges) noexcept;

[[nodiscard]] NetworkStatistics compute_statistics(const NetworkGraph& graph);

// For every node: contributions confidence*0.8 (high) or confidence*1.0
// (critical) from each incident edge to a high/critical neighbour,
//   connection_risk_factor = min(sum / direct_connections, 0.5)
//   network_risk_score     = min(base_risk + connection_risk_factor, 1.0)
// categorized with categorize_risk. Nodes without connections keep their base risk.
[[nodiscard]] std::vector<NodeRiskScore> compute_network_risk(const NetworkGraph& graph);

// Investigator-facing follow-ups derived from the statistics and, when known,
// the center's network risk score.
[[nodiscard]] std::vector<std::string> recommendations(
    const NetworkStatistics& stats, std::optional<Score> center_network_risk = std::nullopt);

} // namespace amlnet::core
