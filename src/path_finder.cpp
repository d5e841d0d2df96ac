/*
  find_path: level-synchronous BFS over store lookups.

  Each entity's parent edge is fixed on first discovery, so the search can stop
  as soon as the target is discovered: the recorded path is the same one a
  queue-based BFS would return when the target is first dequeued.
*/
#include "amlnet/core/path_finder.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace amlnet::core {

namespace {
struct Parent {
  EntityId entity;
  RelationshipEdge edge;
};

PathResult reconstruct(PathResult res, const std::unordered_map<EntityId, Parent>& parent) {
  std::vector<EntityId> rev_entities {res.target_entity_id};
  std::vector<RelationshipEdge> rev_edges;
  EntityId cur = res.target_entity_id;
  while (cur != res.source_entity_id) {
    const auto& p = parent.at(cur);
    rev_edges.push_back(p.edge);
    rev_entities.push_back(p.entity);
    cur = p.entity;
  }
  res.entities.assign(rev_entities.rbegin(), rev_entities.rend());
  res.edges.assign(rev_edges.rbegin(), rev_edges.rend());
  res.found = true;
  return res;
}
} // namespace

PathResult find_path(GraphStore& store, const EntityId& source, const EntityId& target,
                     const PathOptions& opts, const StoreContext& ctx) {
  if (source.empty() || target.empty()) {
    throw InvalidRequest("find_path: source and target ids are required");
  }
  opts.validate();

  PathResult res;
  res.source_entity_id = source;
  res.target_entity_id = target;
  if (source == target) {
    res.found = true;
    res.entities = {source};
    return res;
  }

  RelationshipFilter filter;
  filter.relationship_types = opts.relationship_types;
  filter.min_confidence = opts.min_confidence;

  std::unordered_map<EntityId, Parent> parent;
  std::unordered_set<EntityId> visited {source};
  std::vector<EntityId> frontier {source};

  for (std::int32_t depth = 1; depth <= opts.max_depth && !frontier.empty(); ++depth) {
    std::sort(frontier.begin(), frontier.end());
    std::vector<EntityId> next;
    for (const auto& u : frontier) {
      auto hop = store.bounded_traversal(u, 1, filter, ctx);
      if (!hop.ok()) {
        spdlog::warn("path search {} -> {} aborted at depth {}: {}", source, target, depth,
                     hop.error->message);
        res.error = hop.error;
        return res;
      }
      for (auto& te : hop.value) {
        if (te.edge.is_self_loop() || !te.edge.touches(u)) continue;
        const EntityId v = te.edge.other(u);
        if (!visited.insert(v).second) continue;
        parent.emplace(v, Parent{u, std::move(te.edge)});
        if (v == target) {
          spdlog::debug("path {} -> {} found with {} hops", source, target, depth);
          return reconstruct(std::move(res), parent);
        }
        next.push_back(v);
      }
    }
    frontier = std::move(next);
  }
  spdlog::debug("no path {} -> {} within {} hops", source, target, opts.max_depth);
  return res;
}

PathAnalysis analyze_path(PathResult path) {
  PathAnalysis a;
  const auto n = path.edges.size();
  if (path.found && n > 0) {
    Score strength = 0.0;
    Score risk = 0.0;
    Score weakest = std::numeric_limits<Score>::max();
    for (std::size_t i = 0; i < n; ++i) {
      const auto& e = path.edges[i];
      PathStep s;
      s.step = static_cast<std::int32_t>(i + 1);
      s.from = path.entities[i];
      s.to = path.entities[i + 1];
      s.relationship = e;
      s.risk_weight = relationship_type_risk_weight(e.relationship_type);
      strength += strength_value(e.strength);
      risk += s.risk_weight;
      weakest = std::min(weakest, e.confidence);
      a.steps.push_back(std::move(s));
    }
    a.connection_strength = strength / static_cast<Score>(n);
    a.risk_score = risk / static_cast<Score>(n);
    a.path_confidence = weakest;
  }
  a.path = std::move(path);
  return a;
}

std::optional<std::int32_t> degrees_of_separation(GraphStore& store, const EntityId& a,
                                                  const EntityId& b, const PathOptions& opts,
                                                  const StoreContext& ctx) {
  auto res = find_path(store, a, b, opts, ctx);
  if (!res.found) return std::nullopt;
  return res.length();
}

} // namespace amlnet::core
