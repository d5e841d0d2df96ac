/*
  propagate_risk: level-synchronous diffusion with first-arrival values.

  The per-hop update parent * factor * confidence * weight accumulates to
  seed * factor^d * prod(confidence * weight) at depth d.
*/
#include "amlnet/core/risk_propagation.hpp"

#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace amlnet::core {

const PropagatedRisk* PropagationResult::find(const EntityId& id) const noexcept {
  for (const auto& r : reached) {
    if (r.entity_id == id) return &r;
  }
  return nullptr;
}

std::unordered_map<EntityId, Score> PropagationResult::scores() const {
  std::unordered_map<EntityId, Score> out;
  out.reserve(reached.size());
  for (const auto& r : reached) out.emplace(r.entity_id, r.risk);
  return out;
}

PropagationResult propagate_risk(GraphStore& store, const EntityId& source,
                                 const PropagationOptions& opts, const StoreContext& ctx) {
  if (source.empty()) throw InvalidRequest("propagate_risk: source id is required");
  opts.validate();

  PropagationResult res;
  res.source_entity_id = source;

  auto seed = store.batch_lookup_entities({source}, ctx);
  if (!seed.ok()) {
    spdlog::warn("risk propagation from {} aborted: {}", source, seed.error->message);
    res.error = seed.error;
    return res;
  }
  if (seed.value.empty()) {
    spdlog::debug("risk propagation: seed {} not found", source);
    return res;
  }
  res.source_risk = seed.value.front().risk_score;
  if (res.source_risk < opts.min_propagated_score) {
    spdlog::debug("risk propagation: seed {} risk {:.3f} below minimum", source, res.source_risk);
    return res;
  }

  RelationshipFilter filter;
  filter.relationship_types = opts.relationship_types;

  res.reached.push_back(PropagatedRisk{source, res.source_risk, 0, {}});
  std::unordered_set<EntityId> visited {source};
  std::size_t level_begin = 0;

  for (std::int32_t depth = 1; depth <= opts.max_depth; ++depth) {
    const std::size_t level_end = res.reached.size();
    for (std::size_t i = level_begin; i < level_end; ++i) {
      // Copy: push_back below may reallocate `reached`.
      const PropagatedRisk parent = res.reached[i];
      auto hop = store.bounded_traversal(parent.entity_id, 1, filter, ctx);
      if (!hop.ok()) {
        spdlog::warn("risk propagation from {} stopped at depth {}: {}", source, depth,
                     hop.error->message);
        res.error = hop.error;
        return res;
      }
      for (const auto& te : hop.value) {
        const auto& e = te.edge;
        if (e.is_self_loop() || !e.touches(parent.entity_id)) continue;
        const EntityId& v = e.other(parent.entity_id);
        if (visited.count(v) != 0) continue;
        const Score value = parent.risk * opts.propagation_factor * e.confidence *
                            relationship_type_risk_weight(e.relationship_type);
        if (value < opts.min_propagated_score) continue;
        visited.insert(v);
        PropagatedRisk r;
        r.entity_id = v;
        r.risk = value;
        r.depth = depth;
        r.path = parent.path;
        r.path.push_back(e.relationship_id);
        res.reached.push_back(std::move(r));
      }
    }
    if (res.reached.size() == level_end) break;
    res.depth_reached = depth;
    level_begin = level_end;
  }
  spdlog::debug("risk propagation from {} reached {} entities", source, res.reached.size() - 1);
  return res;
}

} // namespace amlnet::core
