/*
  compute_centrality: single pass over the CSR and reverse CSR of the
  candidate-restricted adjacency.
*/
#include "amlnet/core/centrality.hpp"

#include <algorithm>

#include "amlnet/core/network_graph.hpp"

namespace amlnet::core {

namespace {
constexpr Score kHighConfidence = 0.8;
} // namespace

std::vector<CentralityRecord> compute_centrality(
    std::span<const EntityId> candidates,
    std::span<const RelationshipEdge> edges,
    const CentralityOptions& opts) {
  const auto g = AdjacencyIndex::from_edges(candidates, edges, /*active_only=*/true);
  const auto N = g.num_nodes();
  const auto conf = g.confidence_view();
  const auto type = g.type_view();
  const auto row = g.row_offsets_view();
  const auto aei = g.adj_edge_index_view();
  const auto in_row = g.in_row_offsets_view();
  const auto in_aei = g.in_adj_edge_index_view();
  const Score denom = static_cast<Score>(std::max(N - 1, 1));

  std::vector<CentralityRecord> out;
  out.reserve(static_cast<std::size_t>(N));
  for (NodeId u = 0; u < N; ++u) {
    CentralityRecord r;
    r.entity_id = g.id(u);
    const auto ui = static_cast<std::size_t>(u);
    auto accumulate = [&](EdgeId e) {
      const auto c = conf[static_cast<std::size_t>(e)];
      r.weighted_centrality += c;
      r.risk_weighted_centrality += c * relationship_type_risk_weight(type[static_cast<std::size_t>(e)]);
      if (c >= kHighConfidence) ++r.high_confidence_connections;
    };
    for (auto j = static_cast<std::size_t>(row[ui]); j < static_cast<std::size_t>(row[ui + 1]); ++j) accumulate(aei[j]);
    for (auto j = static_cast<std::size_t>(in_row[ui]); j < static_cast<std::size_t>(in_row[ui + 1]); ++j) accumulate(in_aei[j]);

    r.degree_centrality = g.out_degree(u) + g.in_degree(u);
    r.normalized_degree = static_cast<Score>(r.degree_centrality) / denom;
    const Score avg_conf = r.weighted_centrality / static_cast<Score>(std::max(r.degree_centrality, 1));
    r.centrality_score = 0.4 * r.normalized_degree + 0.3 * avg_conf + 0.3 * r.risk_weighted_centrality;
    if (opts.include_advanced) {
      r.closeness_centrality = std::min(r.normalized_degree * 1.2, 1.0);
      r.betweenness_centrality = r.normalized_degree * 0.8;
    }
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<EntityId> find_bridges(std::span<const CentralityRecord> records, std::size_t limit) {
  std::vector<const CentralityRecord*> sorted;
  sorted.reserve(records.size());
  for (const auto& r : records) {
    if (r.degree_centrality > 0) sorted.push_back(&r);
  }
  std::stable_sort(sorted.begin(), sorted.end(), [](const CentralityRecord* a, const CentralityRecord* b) {
    if (a->degree_centrality != b->degree_centrality) return a->degree_centrality > b->degree_centrality;
    return a->entity_id < b->entity_id;
  });
  std::vector<EntityId> out;
  for (std::size_t i = 0; i < sorted.size() && i < limit; ++i) out.push_back(sorted[i]->entity_id);
  return out;
}

} // namespace amlnet::core
