/*
  Option validation and hashing.

  Validation throws InvalidRequest so a request is rejected before any store
  call is issued.
*/
#include "amlnet/core/options.hpp"

#include <algorithm>
#include <functional>
#include <string>

#include "amlnet/core/error.hpp"

namespace amlnet::core {

namespace {
void require(bool cond, const std::string& what) {
  if (!cond) throw InvalidRequest(what);
}

bool in_unit_range(double v) noexcept { return v >= 0.0 && v <= 1.0; }

std::size_t hash_types(const std::vector<RelationshipType>& types) noexcept {
  // Order-insensitive: the filter treats the list as a set.
  std::vector<int> sorted;
  sorted.reserve(types.size());
  for (auto t : types) sorted.push_back(static_cast<int>(t));
  std::sort(sorted.begin(), sorted.end());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
  std::size_t h = 0;
  for (int v : sorted) hash_combine(h, std::hash<int>{}(v));
  return h;
}
} // namespace

bool RelationshipFilter::matches(const RelationshipEdge& e) const noexcept {
  if (only_active && !e.active) return false;
  if (only_verified && !e.verified) return false;
  if (e.confidence < min_confidence) return false;
  if (!relationship_types.empty() &&
      std::find(relationship_types.begin(), relationship_types.end(), e.relationship_type) ==
          relationship_types.end()) {
    return false;
  }
  return true;
}

std::size_t RelationshipFilter::hash() const noexcept {
  std::size_t h = hash_types(relationship_types);
  hash_combine(h, std::hash<double>{}(min_confidence));
  hash_combine(h, std::hash<bool>{}(only_verified));
  hash_combine(h, std::hash<bool>{}(only_active));
  return h;
}

RelationshipFilter NetworkQuery::filter() const {
  RelationshipFilter f;
  f.relationship_types = relationship_types;
  f.min_confidence = min_confidence;
  f.only_verified = only_verified;
  f.only_active = only_active;
  return f;
}

void NetworkQuery::validate() const {
  require(!center_entity_id.empty(), "center_entity_id is required");
  require(max_depth >= 1 && max_depth <= 5, "max_depth must be in [1, 5]");
  require(in_unit_range(min_confidence), "min_confidence must be in [0, 1]");
  require(max_entities >= 10 && max_entities <= 500, "max_entities must be in [10, 500]");
  require(max_relationships >= 20 && max_relationships <= 2000,
          "max_relationships must be in [20, 2000]");
}

std::size_t NetworkQuery::hash() const noexcept {
  std::size_t h = std::hash<std::string>{}(center_entity_id);
  hash_combine(h, std::hash<std::int32_t>{}(max_depth));
  hash_combine(h, filter().hash());
  for (auto t : include_entity_types) hash_combine(h, std::hash<int>{}(static_cast<int>(t)));
  hash_combine(h, 0x5bd1e995U);  // separates include from exclude lists
  for (auto t : exclude_entity_types) hash_combine(h, std::hash<int>{}(static_cast<int>(t)));
  hash_combine(h, std::hash<std::int32_t>{}(max_entities));
  hash_combine(h, std::hash<std::int32_t>{}(max_relationships));
  return h;
}

void PathOptions::validate() const {
  require(max_depth >= 1 && max_depth <= 10, "path max_depth must be in [1, 10]");
  require(in_unit_range(min_confidence), "min_confidence must be in [0, 1]");
}

void CommunityOptions::validate() const {
  require(min_community_size >= 1, "min_community_size must be >= 1");
  require(resolution > 0.0, "resolution must be > 0");
}

Score CommunityOptions::confidence_floor() const noexcept {
  return std::clamp(0.7 * resolution, 0.0, 1.0);
}

void HubOptions::validate() const {
  require(min_connections >= 1, "min_connections must be >= 1");
  require(max_results >= 1, "max_results must be >= 1");
}

void PropagationOptions::validate() const {
  require(max_depth >= 1 && max_depth <= 5, "propagation max_depth must be in [1, 5]");
  require(in_unit_range(propagation_factor), "propagation_factor must be in [0, 1]");
  require(in_unit_range(min_propagated_score), "min_propagated_score must be in [0, 1]");
}

} // namespace amlnet::core
