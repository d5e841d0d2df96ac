/* Core entity/relationship types and the static relationship risk table.
 *
 * For Python developers:
 * - EntityId/RelationshipId: std::string (opaque store identifiers)
 * - enum class: closed set of values (like a str Enum without free-form strings)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace amlnet::core {

using EntityId = std::string;
using RelationshipId = std::string;
using Score = double;   // Risk scores, confidences and weights in [0, 1]

enum class EntityType {
  Individual = 1,
  Organization = 2,
  Unknown = 3
};

enum class RiskLevel {
  Low = 1,
  Medium = 2,
  High = 3,
  Critical = 4
};

// Qualitative strength attached to a relationship by the resolution pipeline.
enum class RelationshipStrength {
  Confirmed = 1,
  Likely = 2,
  Possible = 3,
  Suspected = 4
};

enum class RelationshipType {
  // Entity resolution links
  ConfirmedSameEntity,
  PotentialDuplicate,
  // Corporate structure
  DirectorOf,
  UboOf,
  ParentOfSubsidiary,
  ShareholderOf,
  CorporateStructure,
  // Household / personal
  HouseholdMember,
  FamilyMember,
  // High-risk associations
  BusinessAssociateSuspected,
  PotentialBeneficialOwnerOf,
  TransactionalCounterpartyHighRisk,
  // Public information
  ProfessionalColleaguePublic,
  SocialMediaConnectionPublic,
  // Legacy / generic
  BusinessAssociate,
  SharedAddress,
  SharedIdentifier,
  TransactionCounterparty,
  Unknown
};

// Store-side entity summary returned by GraphStore::batch_lookup_entities.
struct EntityRecord {
  EntityId id;
  std::string name {"Unknown"};
  EntityType type {EntityType::Unknown};
  Score risk_score {0.0};
  RiskLevel risk_level {RiskLevel::Low};
};

struct RelationshipEdge {
  RelationshipId relationship_id;
  EntityId source_id;
  EntityId target_id;
  RelationshipType relationship_type {RelationshipType::Unknown};
  RelationshipStrength strength {RelationshipStrength::Possible};
  Score confidence {0.5};
  bool verified {false};
  bool active {true};

  // Endpoint on the other side of `id`; callers guarantee `id` is an endpoint.
  [[nodiscard]] const EntityId& other(const EntityId& id) const noexcept {
    return id == source_id ? target_id : source_id;
  }
  [[nodiscard]] bool touches(const EntityId& id) const noexcept {
    return source_id == id || target_id == id;
  }
  [[nodiscard]] bool is_self_loop() const noexcept { return source_id == target_id; }
};

// Per-node centrality metrics (see centrality.hpp for the formulas).
struct CentralityRecord {
  EntityId entity_id;
  std::int32_t degree_centrality {0};
  Score normalized_degree {0.0};
  Score weighted_centrality {0.0};
  Score risk_weighted_centrality {0.0};
  std::int32_t high_confidence_connections {0};
  // Degree-derived proxies; populated only when advanced metrics are requested.
  Score closeness_centrality {0.0};
  Score betweenness_centrality {0.0};
  Score centrality_score {0.0};
};

struct EntityNode {
  EntityId id;
  std::string name {"Unknown"};
  EntityType type {EntityType::Unknown};
  Score risk_score {0.0};
  RiskLevel risk_level {RiskLevel::Low};
  std::optional<CentralityRecord> centrality {};
  std::int32_t connection_count {0};
  bool is_center {false};
};

// Static relationship-type risk weight (0.9 / 0.7 / 0.3, default 0.5).
[[nodiscard]] Score relationship_type_risk_weight(RelationshipType t) noexcept;

// Numeric value of a qualitative strength, used for path strength averages.
[[nodiscard]] Score strength_value(RelationshipStrength s) noexcept;

// Fixed cutoffs: >= 0.8 critical, >= 0.6 high, >= 0.4 medium, else low.
[[nodiscard]] RiskLevel categorize_risk(Score score) noexcept;

// String conversions. Parsers return nullopt for values outside the closed set;
// callers decide on the DataQuality default.
[[nodiscard]] std::string_view to_string(EntityType t) noexcept;
[[nodiscard]] std::string_view to_string(RiskLevel l) noexcept;
[[nodiscard]] std::string_view to_string(RelationshipStrength s) noexcept;
[[nodiscard]] std::string_view to_string(RelationshipType t) noexcept;
[[nodiscard]] std::optional<EntityType> parse_entity_type(std::string_view s) noexcept;
[[nodiscard]] std::optional<RiskLevel> parse_risk_level(std::string_view s) noexcept;
[[nodiscard]] std::optional<RelationshipStrength> parse_strength(std::string_view s) noexcept;
[[nodiscard]] std::optional<RelationshipType> parse_relationship_type(std::string_view s) noexcept;

// Hash combine formula shared by parameter-keyed caches.
inline void hash_combine(std::size_t& h, std::size_t v) noexcept {
  h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
}

} // namespace amlnet::core
