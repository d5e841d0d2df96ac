/*
  Network statistics, pattern counts, per-node network risk and review
  recommendations over a built NetworkGraph.
*/
#include "amlnet/core/statistics.hpp"

#include <algorithm>
#include <unordered_map>

namespace amlnet::core {

namespace {
constexpr Score kHighRiskTypeWeight = 0.6;
constexpr Score kMaxConnectionRiskFactor = 0.5;
} // namespace

Score network_density(std::int32_t num_entities, std::int32_t num_relationships) noexcept {
  if (num_entities < 2) return 0.0;
  const auto n = static_cast<Score>(num_entities);
  return static_cast<Score>(num_relationships) / (n * (n - 1.0) / 2.0);
}

PatternCounts count_patterns(std::span<const RelationshipEdge> edges) noexcept {
  PatternCounts p;
  for (const auto& e : edges) {
    switch (e.relationship_type) {
      case RelationshipType::DirectorOf:
      case RelationshipType::ShareholderOf:
      case RelationshipType::ParentOfSubsidiary:
        ++p.corporate_hierarchies;
        break;
      case RelationshipType::UboOf:
      case RelationshipType::PotentialBeneficialOwnerOf:
        ++p.beneficial_ownership_chains;
        break;
      case RelationshipType::HouseholdMember:
        ++p.household_clusters;
        break;
      case RelationshipType::ConfirmedSameEntity:
      case RelationshipType::PotentialDuplicate:
        ++p.duplicate_entity_groups;
        break;
      case RelationshipType::TransactionalCounterpartyHighRisk:
      case RelationshipType::BusinessAssociateSuspected:
        ++p.high_risk_networks;
        break;
      default:
        break;
    }
  }
  return p;
}

NetworkStatistics compute_statistics(const NetworkGraph& graph) {
  NetworkStatistics s;
  s.total_entities = static_cast<std::int32_t>(graph.nodes.size());
  s.total_relationships = static_cast<std::int32_t>(graph.edges.size());
  s.density = network_density(s.total_entities, s.total_relationships);

  for (const auto& n : graph.nodes) {
    ++s.risk_distribution[n.risk_level];
    ++s.entity_type_distribution[n.type];
  }
  Score conf_sum = 0.0;
  std::int32_t verified = 0;
  for (const auto& e : graph.edges) {
    conf_sum += e.confidence;
    if (e.verified) ++verified;
    if (relationship_type_risk_weight(e.relationship_type) > kHighRiskTypeWeight) {
      ++s.high_risk_relationship_count;
    }
    ++s.relationship_type_distribution[e.relationship_type];
  }
  if (s.total_relationships > 0) {
    const auto m = static_cast<Score>(s.total_relationships);
    s.average_confidence = conf_sum / m;
    s.verification_rate = static_cast<Score>(verified) / m;
  }
  s.patterns = count_patterns(graph.edges);
  return s;
}

std::vector<NodeRiskScore> compute_network_risk(const NetworkGraph& graph) {
  std::unordered_map<EntityId, std::size_t> pos;
  std::vector<NodeRiskScore> out;
  out.reserve(graph.nodes.size());
  for (const auto& n : graph.nodes) {
    pos.emplace(n.id, out.size());
    NodeRiskScore r;
    r.entity_id = n.id;
    r.base_risk = n.risk_score;
    out.push_back(std::move(r));
  }
  std::vector<Score> contribution(out.size(), 0.0);

  auto contribute = [&](const EntityId& self, const EntityId& other, Score confidence) {
    auto it = pos.find(self);
    if (it == pos.end()) return;
    auto& r = out[it->second];
    ++r.total_connections;
    const auto* nb = graph.find_node(other);
    if (nb == nullptr) return;
    if (nb->risk_level == RiskLevel::High || nb->risk_level == RiskLevel::Critical) {
      ++r.high_risk_connections;
      contribution[it->second] += confidence * (nb->risk_level == RiskLevel::High ? 0.8 : 1.0);
    }
  };
  for (const auto& e : graph.edges) {
    if (!e.active || e.is_self_loop()) continue;
    contribute(e.source_id, e.target_id, e.confidence);
    contribute(e.target_id, e.source_id, e.confidence);
  }

  for (std::size_t i = 0; i < out.size(); ++i) {
    auto& r = out[i];
    if (r.total_connections > 0) {
      r.connection_risk_factor = std::min(
          contribution[i] / static_cast<Score>(r.total_connections), kMaxConnectionRiskFactor);
    }
    r.network_risk_score = std::min(r.base_risk + r.connection_risk_factor, 1.0);
    r.risk_level = categorize_risk(r.network_risk_score);
  }
  return out;
}

std::vector<std::string> recommendations(const NetworkStatistics& stats,
                                         std::optional<Score> center_network_risk) {
  std::vector<std::string> out;
  if (center_network_risk && *center_network_risk > 0.7) {
    out.emplace_back("Immediate compliance review required");
  }
  if (stats.total_relationships > 0 && stats.verification_rate < 0.5) {
    out.emplace_back("Verify more relationships to improve network reliability");
  }
  if (stats.high_risk_relationship_count > 0) {
    out.emplace_back("Review high-risk relationships for compliance");
  }
  if (stats.patterns.beneficial_ownership_chains > 2) {
    out.emplace_back("Investigate complex beneficial ownership structures");
  }
  if (stats.density > 0.8) {
    out.emplace_back("High network density may indicate shell company structures");
  }
  return out;
}

} // namespace amlnet::core
