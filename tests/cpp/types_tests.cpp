#include <gtest/gtest.h>
#include "amlnet/core/error.hpp"
#include "amlnet/core/options.hpp"
#include "amlnet/core/types.hpp"
#include "test_utils.hpp"

using namespace amlnet::core;
using namespace amlnet::core::test;

TEST(RiskWeights, HighRiskTypes) {
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::ConfirmedSameEntity), 0.9);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::BusinessAssociateSuspected), 0.9);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::TransactionalCounterpartyHighRisk), 0.9);
}

TEST(RiskWeights, OwnershipTypes) {
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::DirectorOf), 0.7);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::UboOf), 0.7);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::ParentOfSubsidiary), 0.7);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::PotentialBeneficialOwnerOf), 0.7);
}

TEST(RiskWeights, LowRiskAndDefault) {
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::HouseholdMember), 0.3);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::ProfessionalColleaguePublic), 0.3);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::SocialMediaConnectionPublic), 0.3);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::SharedAddress), 0.5);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::ShareholderOf), 0.5);
  EXPECT_DOUBLE_EQ(relationship_type_risk_weight(RelationshipType::Unknown), 0.5);
}

TEST(RiskLevels, FixedCutoffs) {
  EXPECT_EQ(categorize_risk(1.0), RiskLevel::Critical);
  EXPECT_EQ(categorize_risk(0.8), RiskLevel::Critical);
  EXPECT_EQ(categorize_risk(0.79), RiskLevel::High);
  EXPECT_EQ(categorize_risk(0.6), RiskLevel::High);
  EXPECT_EQ(categorize_risk(0.4), RiskLevel::Medium);
  EXPECT_EQ(categorize_risk(0.39), RiskLevel::Low);
  EXPECT_EQ(categorize_risk(0.0), RiskLevel::Low);
}

TEST(Strength, NumericValues) {
  EXPECT_DOUBLE_EQ(strength_value(RelationshipStrength::Confirmed), 0.9);
  EXPECT_DOUBLE_EQ(strength_value(RelationshipStrength::Likely), 0.7);
  EXPECT_DOUBLE_EQ(strength_value(RelationshipStrength::Possible), 0.5);
  EXPECT_DOUBLE_EQ(strength_value(RelationshipStrength::Suspected), 0.3);
}

TEST(Names, RelationshipTypes) {
  EXPECT_EQ(to_string(RelationshipType::TransactionalCounterpartyHighRisk),
            "transactional_counterparty_high_risk");
  EXPECT_EQ(parse_relationship_type("ubo_of"), RelationshipType::UboOf);
  EXPECT_EQ(parse_relationship_type("unknown"), RelationshipType::Unknown);
  EXPECT_FALSE(parse_relationship_type("UBO_OF").has_value());
  EXPECT_FALSE(parse_relationship_type("").has_value());
}

TEST(Names, EntityAndRisk) {
  EXPECT_EQ(parse_entity_type("organization"), EntityType::Organization);
  EXPECT_FALSE(parse_entity_type("company").has_value());
  EXPECT_EQ(parse_risk_level("critical"), RiskLevel::Critical);
  EXPECT_EQ(parse_strength("suspected"), RelationshipStrength::Suspected);
  EXPECT_EQ(to_string(RiskLevel::Medium), "medium");
}

TEST(RelationshipEdge, EndpointHelpers) {
  auto e = make_edge("r", "A", "B");
  EXPECT_EQ(e.other("A"), "B");
  EXPECT_EQ(e.other("B"), "A");
  EXPECT_TRUE(e.touches("A"));
  EXPECT_FALSE(e.touches("C"));
  EXPECT_FALSE(e.is_self_loop());
  EXPECT_TRUE(make_edge("s", "A", "A").is_self_loop());
}

TEST(RelationshipFilter, Matches) {
  RelationshipFilter f;
  EXPECT_TRUE(f.matches(make_edge("r", "A", "B")));
  EXPECT_FALSE(f.matches(make_edge("r", "A", "B", RelationshipType::BusinessAssociate, 0.9, false, false)));

  f.only_verified = true;
  EXPECT_FALSE(f.matches(make_edge("r", "A", "B")));
  EXPECT_TRUE(f.matches(make_edge("r", "A", "B", RelationshipType::BusinessAssociate, 0.9, true)));

  f = {};
  f.min_confidence = 0.5;
  EXPECT_FALSE(f.matches(make_edge("r", "A", "B", RelationshipType::BusinessAssociate, 0.4)));
  EXPECT_TRUE(f.matches(make_edge("r", "A", "B", RelationshipType::BusinessAssociate, 0.5)));

  f = {};
  f.relationship_types = {RelationshipType::UboOf};
  EXPECT_FALSE(f.matches(make_edge("r", "A", "B")));
  EXPECT_TRUE(f.matches(make_edge("r", "A", "B", RelationshipType::UboOf)));
}

TEST(NetworkQuery, DefaultsAreValid) {
  NetworkQuery q;
  q.center_entity_id = "C";
  EXPECT_NO_THROW(q.validate());
  EXPECT_EQ(q.max_depth, 2);
  EXPECT_DOUBLE_EQ(q.min_confidence, 0.3);
  EXPECT_EQ(q.max_entities, 100);
  EXPECT_EQ(q.max_relationships, 200);
}

TEST(NetworkQuery, RejectsOutOfRange) {
  NetworkQuery base;
  base.center_entity_id = "C";

  auto q = base;
  q.center_entity_id.clear();
  EXPECT_THROW(q.validate(), InvalidRequest);

  q = base; q.max_depth = 0;
  EXPECT_THROW(q.validate(), InvalidRequest);
  q = base; q.max_depth = 6;
  EXPECT_THROW(q.validate(), InvalidRequest);
  q = base; q.min_confidence = 1.5;
  EXPECT_THROW(q.validate(), InvalidRequest);
  q = base; q.max_entities = 9;
  EXPECT_THROW(q.validate(), InvalidRequest);
  q = base; q.max_entities = 501;
  EXPECT_THROW(q.validate(), InvalidRequest);
  q = base; q.max_relationships = 19;
  EXPECT_THROW(q.validate(), InvalidRequest);
  q = base; q.max_relationships = 2001;
  EXPECT_THROW(q.validate(), InvalidRequest);
}

TEST(NetworkQuery, HashIgnoresLayoutAndTypeOrder) {
  NetworkQuery a;
  a.center_entity_id = "C";
  a.relationship_types = {RelationshipType::UboOf, RelationshipType::DirectorOf};
  auto b = a;
  b.relationship_types = {RelationshipType::DirectorOf, RelationshipType::UboOf};
  b.layout_algorithm = LayoutAlgorithm::Circular;
  EXPECT_EQ(a.hash(), b.hash());

  auto c = a;
  c.max_depth = 3;
  EXPECT_NE(a.hash(), c.hash());
}

TEST(Options, Validation) {
  PathOptions p;
  EXPECT_NO_THROW(p.validate());
  p.max_depth = 11;
  EXPECT_THROW(p.validate(), InvalidRequest);

  PropagationOptions r;
  EXPECT_NO_THROW(r.validate());
  r.propagation_factor = 1.5;
  EXPECT_THROW(r.validate(), InvalidRequest);

  HubOptions h;
  EXPECT_EQ(h.min_connections, 5);
  EXPECT_EQ(h.max_results, 20);
  h.min_connections = 0;
  EXPECT_THROW(h.validate(), InvalidRequest);

  CommunityOptions c;
  c.min_community_size = 0;
  EXPECT_THROW(c.validate(), InvalidRequest);
}

TEST(Options, CommunityConfidenceFloor) {
  CommunityOptions c;
  EXPECT_DOUBLE_EQ(c.confidence_floor(), 0.7);
  c.resolution = 0.5;
  EXPECT_DOUBLE_EQ(c.confidence_floor(), 0.35);
  c.resolution = 2.0;
  EXPECT_DOUBLE_EQ(c.confidence_floor(), 1.0);
}
