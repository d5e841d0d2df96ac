/*
  detect_hubs: degree counting over the adjacency index plus store enrichment.
*/
#include "amlnet/core/hubs.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "amlnet/core/network_graph.hpp"

namespace amlnet::core {

namespace {
// Candidates first, then every other endpoint seen in `edges`.
std::vector<EntityId> node_universe(std::span<const EntityId> candidates,
                                    std::span<const RelationshipEdge> edges) {
  std::vector<EntityId> ids;
  std::unordered_set<EntityId> seen;
  for (const auto& c : candidates) {
    if (seen.insert(c).second) ids.push_back(c);
  }
  for (const auto& e : edges) {
    if (seen.insert(e.source_id).second) ids.push_back(e.source_id);
    if (seen.insert(e.target_id).second) ids.push_back(e.target_id);
  }
  return ids;
}

void apply_record(HubEntity& h, const EntityRecord& r) {
  h.name = r.name;
  h.type = r.type;
  h.risk_score = r.risk_score;
  h.risk_level = r.risk_level;
}
} // namespace

Score hub_influence_score(const HubEntity& hub) noexcept {
  return 0.4 * static_cast<Score>(hub.total_connections) +
         0.3 * (hub.average_confidence * 30.0) +
         0.2 * (static_cast<Score>(hub.distinct_relationship_types) * 5.0) +
         0.1 * (hub.risk_score * 10.0);
}

std::vector<HubEntity> detect_hubs(
    std::span<const RelationshipEdge> edges,
    std::span<const EntityId> candidates,
    const HubOptions& opts,
    std::span<const EntityRecord> records) {
  opts.validate();
  const auto universe = node_universe(candidates, edges);
  const auto g = AdjacencyIndex::from_edges(universe, edges, /*active_only=*/true);
  // Only candidates may become hubs; unique candidates occupy the first NodeIds.
  const NodeId eligible = candidates.empty()
      ? g.num_nodes()
      : static_cast<NodeId>(std::unordered_set<EntityId>(candidates.begin(), candidates.end()).size());
  const auto M = static_cast<std::size_t>(g.num_edges());
  const auto type = g.type_view();
  const auto conf = g.confidence_view();
  const auto src = g.edge_src_view();

  auto mask = std::make_unique<bool[]>(M);
  for (std::size_t e = 0; e < M; ++e) {
    mask[e] = opts.connection_types.empty() ||
              std::find(opts.connection_types.begin(), opts.connection_types.end(), type[e]) !=
                  opts.connection_types.end();
  }
  const std::span<const bool> edge_mask(mask.get(), M);

  std::vector<HubEntity> hubs;
  for (NodeId u = 0; u < eligible; ++u) {
    const auto adj = g.neighbours(u, edge_mask);
    if (adj.size() < static_cast<std::size_t>(opts.min_connections)) continue;
    HubEntity h;
    h.entity_id = g.id(u);
    std::set<RelationshipType> types;
    Score conf_sum = 0.0;
    for (const auto& [v, e] : adj) {
      (void)v;
      const auto ei = static_cast<std::size_t>(e);
      if (src[ei] == u) {
        ++h.outgoing_connections;
      } else {
        ++h.incoming_connections;
      }
      conf_sum += conf[ei];
      types.insert(type[ei]);
    }
    h.total_connections = static_cast<std::int32_t>(adj.size());
    h.average_confidence = conf_sum / static_cast<Score>(adj.size());
    h.distinct_relationship_types = static_cast<std::int32_t>(types.size());
    hubs.push_back(std::move(h));
  }

  std::sort(hubs.begin(), hubs.end(), [](const HubEntity& a, const HubEntity& b) {
    if (a.total_connections != b.total_connections) return a.total_connections > b.total_connections;
    return a.entity_id < b.entity_id;
  });
  if (hubs.size() > static_cast<std::size_t>(opts.max_results)) {
    hubs.resize(static_cast<std::size_t>(opts.max_results));
  }

  if (!records.empty()) {
    std::unordered_map<EntityId, const EntityRecord*> by_id;
    for (const auto& r : records) by_id.emplace(r.id, &r);
    for (auto& h : hubs) {
      auto it = by_id.find(h.entity_id);
      if (it != by_id.end()) apply_record(h, *it->second);
    }
  }
  if (opts.include_risk_analysis) {
    for (auto& h : hubs) h.hub_influence_score = hub_influence_score(h);
  }
  return hubs;
}

HubResult detect_hubs(GraphStore& store, std::span<const EntityId> candidates,
                      const HubOptions& opts, const StoreContext& ctx) {
  opts.validate();
  RelationshipFilter filter;
  filter.relationship_types = opts.connection_types;

  HubResult out;
  StoreResult<std::vector<RelationshipEdge>> edges =
      candidates.empty() ? store.scan_relationships(filter, ctx)
                         : collect_incident_edges(store, candidates, filter, ctx);
  if (!edges.ok()) {
    spdlog::warn("hub detection aborted: {}", edges.error->message);
    out.error = edges.error;
    return out;
  }

  out.hubs = detect_hubs(edges.value, candidates, opts);
  if (out.hubs.empty()) return out;

  std::vector<EntityId> ids;
  ids.reserve(out.hubs.size());
  for (const auto& h : out.hubs) ids.push_back(h.entity_id);
  auto lookup = store.batch_lookup_entities(ids, ctx);
  if (!lookup.ok()) {
    spdlog::warn("hub enrichment failed, using defaults: {}", lookup.error->message);
    out.error = lookup.error;
  } else {
    std::unordered_map<EntityId, const EntityRecord*> by_id;
    for (const auto& r : lookup.value) by_id.emplace(r.id, &r);
    for (auto& h : out.hubs) {
      auto it = by_id.find(h.entity_id);
      if (it != by_id.end()) apply_record(h, *it->second);
    }
  }
  if (opts.include_risk_analysis) {
    for (auto& h : out.hubs) h.hub_influence_score = hub_influence_score(h);
  }
  spdlog::debug("hub detection found {} hubs", out.hubs.size());
  return out;
}

} // namespace amlnet::core
