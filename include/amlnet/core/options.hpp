/* Request option bundles for the network analysis algorithms. */
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "amlnet/core/types.hpp"

namespace amlnet::core {

// Edge predicate applied by GraphStore adapters. An empty type list admits all types.
struct RelationshipFilter {
  std::vector<RelationshipType> relationship_types {};
  Score min_confidence {0.0};
  bool only_verified {false};
  bool only_active {true};

  [[nodiscard]] bool matches(const RelationshipEdge& e) const noexcept;
  [[nodiscard]] std::size_t hash() const noexcept;
};

enum class LayoutAlgorithm {
  Force = 1,
  Hierarchical = 2,
  Circular = 3
};

struct NetworkQuery {
  EntityId center_entity_id {};
  std::int32_t max_depth {2};                // 1..5
  std::vector<RelationshipType> relationship_types {};
  Score min_confidence {0.3};
  bool only_verified {false};
  bool only_active {true};
  std::vector<EntityType> include_entity_types {};
  std::vector<EntityType> exclude_entity_types {};
  std::int32_t max_entities {100};           // 10..500
  std::int32_t max_relationships {200};      // 20..2000
  LayoutAlgorithm layout_algorithm {LayoutAlgorithm::Force};  // cosmetic only

  [[nodiscard]] RelationshipFilter filter() const;
  // Throws InvalidRequest.
  void validate() const;
  // Parameter hash for result caching; layout is excluded.
  [[nodiscard]] std::size_t hash() const noexcept;
};

struct PathOptions {
  std::int32_t max_depth {6};                // 1..10
  std::vector<RelationshipType> relationship_types {};
  Score min_confidence {0.0};

  void validate() const;
};

struct CentralityOptions {
  bool include_advanced {true};
};

struct CommunityOptions {
  std::int32_t min_community_size {3};
  // Scales the 0.7 confidence floor; no other effect.
  double resolution {1.0};

  void validate() const;
  [[nodiscard]] Score confidence_floor() const noexcept;
};

struct HubOptions {
  std::int32_t min_connections {5};
  std::vector<RelationshipType> connection_types {};
  bool include_risk_analysis {true};
  std::int32_t max_results {20};

  void validate() const;
};

struct PropagationOptions {
  std::int32_t max_depth {3};
  double propagation_factor {0.5};
  Score min_propagated_score {0.1};
  std::vector<RelationshipType> relationship_types {};

  void validate() const;
};

struct CycleOptions {
  std::int32_t max_cycle_length {6};
  std::int32_t max_cycles {10};
};

} // namespace amlnet::core
