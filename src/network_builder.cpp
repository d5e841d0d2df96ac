/*
  build_network: one bidirectional bounded traversal, then assembly.

  Assembly steps, in order:
    1. drop self-loops and duplicate relationship ids (first occurrence wins);
    2. truncate to max_relationships preserving BFS order (closest kept);
    3. collect node ids in discovery order, center first, and cap them to
       max_entities (latest-discovered dropped);
    4. enrich via batch lookup, then apply entity-type include/exclude filters
       (the center is never filtered out);
    5. prune nodes no longer within max_depth of the center over the surviving
       edges, so the node set always equals the edge endpoints plus the center.
*/
#include "amlnet/core/network_builder.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace amlnet::core {

namespace {
bool type_allowed(EntityType t, const NetworkQuery& q) {
  if (!q.include_entity_types.empty() &&
      std::find(q.include_entity_types.begin(), q.include_entity_types.end(), t) ==
          q.include_entity_types.end()) {
    return false;
  }
  return std::find(q.exclude_entity_types.begin(), q.exclude_entity_types.end(), t) ==
         q.exclude_entity_types.end();
}

void retain_edges_within(std::vector<TraversalEdge>& edges,
                         const std::unordered_set<EntityId>& keep) {
  edges.erase(std::remove_if(edges.begin(), edges.end(), [&](const TraversalEdge& te) {
                return keep.count(te.edge.source_id) == 0 || keep.count(te.edge.target_id) == 0;
              }),
              edges.end());
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}
} // namespace

EntityNode make_node(const EntityId& id, const EntityRecord* record, bool is_center) {
  EntityNode node;
  node.id = id;
  node.is_center = is_center;
  if (record != nullptr) {
    node.name = record->name.empty() ? std::string("Unknown") : record->name;
    node.type = record->type;
    node.risk_score = std::clamp(record->risk_score, 0.0, 1.0);
    node.risk_level = record->risk_level;
  }
  return node;
}

BuildResult build_network(GraphStore& store, const NetworkQuery& query, const StoreContext& ctx) {
  query.validate();
  const auto start = std::chrono::steady_clock::now();

  BuildResult result;
  result.graph.center_entity_id = query.center_entity_id;
  result.graph.max_depth = query.max_depth;

  auto traversal = store.bounded_traversal(query.center_entity_id, query.max_depth,
                                           query.filter(), ctx);
  if (!traversal.ok()) {
    spdlog::warn("network build failed for {}: {}", query.center_entity_id, traversal.error->message);
    result.error = Error{ErrorCode::NetworkBuildFailed,
                         std::string(to_string(traversal.error->code)) + ": " + traversal.error->message};
    result.graph.reindex();
    result.query_time_ms = elapsed_ms(start);
    return result;
  }

  // 1. self-loops and duplicates
  std::vector<TraversalEdge> edges;
  edges.reserve(traversal.value.size());
  std::unordered_set<RelationshipId> seen;
  for (auto& te : traversal.value) {
    if (te.edge.is_self_loop() || te.depth > query.max_depth) continue;
    if (!seen.insert(te.edge.relationship_id).second) continue;
    edges.push_back(std::move(te));
  }

  // 2. relationship cap
  if (edges.size() > static_cast<std::size_t>(query.max_relationships)) {
    spdlog::debug("truncating {} relationships to {}", edges.size(), query.max_relationships);
    edges.resize(static_cast<std::size_t>(query.max_relationships));
  }

  // 3. node discovery order and entity cap
  std::vector<EntityId> order {query.center_entity_id};
  std::unordered_set<EntityId> keep {query.center_entity_id};
  for (const auto& te : edges) {
    for (const auto* id : {&te.edge.source_id, &te.edge.target_id}) {
      if (keep.size() >= static_cast<std::size_t>(query.max_entities)) break;
      if (keep.insert(*id).second) order.push_back(*id);
    }
  }
  retain_edges_within(edges, keep);

  // 4. enrichment and entity-type filters
  std::unordered_map<EntityId, EntityRecord> records;
  auto lookup = store.batch_lookup_entities(order, ctx);
  if (lookup.ok()) {
    for (auto& r : lookup.value) {
      auto id = r.id;
      records.emplace(std::move(id), std::move(r));
    }
  } else {
    spdlog::warn("entity enrichment failed for {}: {}", query.center_entity_id, lookup.error->message);
    result.error = lookup.error;
  }
  if (!query.include_entity_types.empty() || !query.exclude_entity_types.empty()) {
    for (auto it = order.begin() + 1; it != order.end(); ++it) {
      auto rec = records.find(*it);
      const EntityType t = rec == records.end() ? EntityType::Unknown : rec->second.type;
      if (!type_allowed(t, query)) keep.erase(*it);
    }
    retain_edges_within(edges, keep);
  }

  // 5. depth pruning over surviving edges
  std::vector<EntityId> candidates;
  for (const auto& id : order) {
    if (keep.count(id) != 0) candidates.push_back(id);
  }
  std::vector<RelationshipEdge> plain;
  plain.reserve(edges.size());
  for (const auto& te : edges) plain.push_back(te.edge);
  const auto idx = AdjacencyIndex::from_edges(candidates, plain, /*active_only=*/false);
  const auto dist = hop_distances(idx, 0, query.max_depth);

  std::unordered_set<EntityId> reachable;
  for (NodeId n = 0; n < idx.num_nodes(); ++n) {
    const auto d = dist[static_cast<std::size_t>(n)];
    if (d < 0) continue;
    reachable.insert(idx.id(n));
    result.graph.max_depth_reached = std::max(result.graph.max_depth_reached, d);
  }

  auto& graph = result.graph;
  for (auto& e : plain) {
    if (reachable.count(e.source_id) != 0 && reachable.count(e.target_id) != 0) {
      graph.edges.push_back(std::move(e));
    }
  }

  std::unordered_map<EntityId, std::int32_t> degree;
  for (const auto& e : graph.edges) {
    ++degree[e.source_id];
    ++degree[e.target_id];
  }
  for (const auto& id : candidates) {
    if (reachable.count(id) == 0) continue;
    auto rec = records.find(id);
    if (rec == records.end() && lookup.ok()) {
      spdlog::debug("entity {} missing from store; using defaults", id);
    }
    auto node = make_node(id, rec == records.end() ? nullptr : &rec->second,
                          id == query.center_entity_id);
    node.connection_count = degree[id];
    graph.nodes.push_back(std::move(node));
  }
  graph.reindex();
  result.query_time_ms = elapsed_ms(start);

  spdlog::info("built network for {}: {} entities, {} relationships, depth {} ({:.2f} ms)",
               query.center_entity_id, graph.total_entities, graph.total_relationships,
               graph.max_depth_reached, result.query_time_ms);
  return result;
}

} // namespace amlnet::core
