/*
  detect_communities: BFS components over a confidence edge mask.
*/
#include "amlnet/core/community.hpp"

#include <deque>
#include <memory>

#include "amlnet/core/network_graph.hpp"

namespace amlnet::core {

std::vector<Community> detect_communities(
    std::span<const EntityId> candidates,
    std::span<const RelationshipEdge> edges,
    const CommunityOptions& opts) {
  opts.validate();
  const auto g = AdjacencyIndex::from_edges(candidates, edges, /*active_only=*/true);
  const auto N = static_cast<std::size_t>(g.num_nodes());
  const auto M = static_cast<std::size_t>(g.num_edges());
  const auto conf = g.confidence_view();
  const Score floor = opts.confidence_floor();

  // bool array rather than std::vector<bool> so it can back a span
  auto mask = std::make_unique<bool[]>(M);
  for (std::size_t e = 0; e < M; ++e) mask[e] = conf[e] >= floor;
  const std::span<const bool> edge_mask(mask.get(), M);

  std::vector<std::int32_t> component(N, -1);
  std::vector<Community> out;
  std::int32_t next_label = 0;
  for (NodeId seed = 0; seed < g.num_nodes(); ++seed) {
    if (component[static_cast<std::size_t>(seed)] >= 0) continue;
    const auto label = next_label++;
    std::vector<NodeId> members {seed};
    component[static_cast<std::size_t>(seed)] = label;
    std::deque<NodeId> queue {seed};
    while (!queue.empty()) {
      const NodeId u = queue.front();
      queue.pop_front();
      for (const auto& [v, e] : g.neighbours(u, edge_mask)) {
        (void)e;
        auto& cv = component[static_cast<std::size_t>(v)];
        if (cv < 0) {
          cv = label;
          members.push_back(v);
          queue.push_back(v);
        }
      }
    }
    // Singletons are isolated entities, never communities.
    if (members.size() < 2 || members.size() < static_cast<std::size_t>(opts.min_community_size)) continue;

    Community c;
    for (auto m : members) c.entity_ids.push_back(g.id(m));
    const auto src = g.edge_src_view();
    Score conf_sum = 0.0;
    for (std::size_t e = 0; e < M; ++e) {
      if (mask[e] && component[static_cast<std::size_t>(src[e])] == label) {
        ++c.edge_count;
        conf_sum += conf[e];
      }
    }
    const auto n = static_cast<Score>(c.entity_ids.size());
    const Score possible = n * (n - 1.0) / 2.0;
    c.density = possible > 0.0 ? static_cast<Score>(c.edge_count) / possible : 0.0;
    c.average_confidence = c.edge_count > 0 ? conf_sum / static_cast<Score>(c.edge_count) : 0.0;
    out.push_back(std::move(c));
  }
  return out;
}

} // namespace amlnet::core
