/*
  Relationship risk table and enum/string conversions.

  The risk table is an exhaustive switch so adding a RelationshipType forces a
  decision about its weight at compile time (-Wswitch).
*/
#include "amlnet/core/types.hpp"

#include <array>
#include <utility>

namespace amlnet::core {

Score relationship_type_risk_weight(RelationshipType t) noexcept {
  switch (t) {
    case RelationshipType::ConfirmedSameEntity:
    case RelationshipType::BusinessAssociateSuspected:
    case RelationshipType::TransactionalCounterpartyHighRisk:
      return 0.9;
    case RelationshipType::DirectorOf:
    case RelationshipType::UboOf:
    case RelationshipType::ParentOfSubsidiary:
    case RelationshipType::PotentialBeneficialOwnerOf:
      return 0.7;
    case RelationshipType::HouseholdMember:
    case RelationshipType::ProfessionalColleaguePublic:
    case RelationshipType::SocialMediaConnectionPublic:
      return 0.3;
    case RelationshipType::PotentialDuplicate:
    case RelationshipType::ShareholderOf:
    case RelationshipType::CorporateStructure:
    case RelationshipType::FamilyMember:
    case RelationshipType::BusinessAssociate:
    case RelationshipType::SharedAddress:
    case RelationshipType::SharedIdentifier:
    case RelationshipType::TransactionCounterparty:
    case RelationshipType::Unknown:
      return 0.5;
  }
  return 0.5;
}

Score strength_value(RelationshipStrength s) noexcept {
  switch (s) {
    case RelationshipStrength::Confirmed: return 0.9;
    case RelationshipStrength::Likely: return 0.7;
    case RelationshipStrength::Possible: return 0.5;
    case RelationshipStrength::Suspected: return 0.3;
  }
  return 0.5;
}

RiskLevel categorize_risk(Score score) noexcept {
  if (score >= 0.8) return RiskLevel::Critical;
  if (score >= 0.6) return RiskLevel::High;
  if (score >= 0.4) return RiskLevel::Medium;
  return RiskLevel::Low;
}

namespace {
constexpr std::array<std::pair<RelationshipType, std::string_view>, 19> kRelationshipNames {{
  {RelationshipType::ConfirmedSameEntity, "confirmed_same_entity"},
  {RelationshipType::PotentialDuplicate, "potential_duplicate"},
  {RelationshipType::DirectorOf, "director_of"},
  {RelationshipType::UboOf, "ubo_of"},
  {RelationshipType::ParentOfSubsidiary, "parent_of_subsidiary"},
  {RelationshipType::ShareholderOf, "shareholder_of"},
  {RelationshipType::CorporateStructure, "corporate_structure"},
  {RelationshipType::HouseholdMember, "household_member"},
  {RelationshipType::FamilyMember, "family_member"},
  {RelationshipType::BusinessAssociateSuspected, "business_associate_suspected"},
  {RelationshipType::PotentialBeneficialOwnerOf, "potential_beneficial_owner_of"},
  {RelationshipType::TransactionalCounterpartyHighRisk, "transactional_counterparty_high_risk"},
  {RelationshipType::ProfessionalColleaguePublic, "professional_colleague_public"},
  {RelationshipType::SocialMediaConnectionPublic, "social_media_connection_public"},
  {RelationshipType::BusinessAssociate, "business_associate"},
  {RelationshipType::SharedAddress, "shared_address"},
  {RelationshipType::SharedIdentifier, "shared_identifier"},
  {RelationshipType::TransactionCounterparty, "transaction_counterparty"},
  {RelationshipType::Unknown, "unknown"},
}};
} // namespace

std::string_view to_string(EntityType t) noexcept {
  switch (t) {
    case EntityType::Individual: return "individual";
    case EntityType::Organization: return "organization";
    case EntityType::Unknown: return "unknown";
  }
  return "unknown";
}

std::string_view to_string(RiskLevel l) noexcept {
  switch (l) {
    case RiskLevel::Low: return "low";
    case RiskLevel::Medium: return "medium";
    case RiskLevel::High: return "high";
    case RiskLevel::Critical: return "critical";
  }
  return "low";
}

std::string_view to_string(RelationshipStrength s) noexcept {
  switch (s) {
    case RelationshipStrength::Confirmed: return "confirmed";
    case RelationshipStrength::Likely: return "likely";
    case RelationshipStrength::Possible: return "possible";
    case RelationshipStrength::Suspected: return "suspected";
  }
  return "possible";
}

std::string_view to_string(RelationshipType t) noexcept {
  for (const auto& [type, name] : kRelationshipNames) {
    if (type == t) return name;
  }
  return "unknown";
}

std::optional<EntityType> parse_entity_type(std::string_view s) noexcept {
  if (s == "individual") return EntityType::Individual;
  if (s == "organization") return EntityType::Organization;
  if (s == "unknown") return EntityType::Unknown;
  return std::nullopt;
}

std::optional<RiskLevel> parse_risk_level(std::string_view s) noexcept {
  if (s == "low") return RiskLevel::Low;
  if (s == "medium") return RiskLevel::Medium;
  if (s == "high") return RiskLevel::High;
  if (s == "critical") return RiskLevel::Critical;
  return std::nullopt;
}

std::optional<RelationshipStrength> parse_strength(std::string_view s) noexcept {
  if (s == "confirmed") return RelationshipStrength::Confirmed;
  if (s == "likely") return RelationshipStrength::Likely;
  if (s == "possible") return RelationshipStrength::Possible;
  if (s == "suspected") return RelationshipStrength::Suspected;
  return std::nullopt;
}

std::optional<RelationshipType> parse_relationship_type(std::string_view s) noexcept {
  for (const auto& [type, name] : kRelationshipNames) {
    if (name == s) return type;
  }
  return std::nullopt;
}

} // namespace amlnet::core
