/*
  AdjacencyIndex: immutable adjacency with deterministic layout.

  Construction maps entity ids to dense NodeIds, drops edges that leave the
  node universe (and self-loops), and compacts the rest into CSR adjacency
  (and reverse CSR) using a stable (src, dst) ordering so traversal order does
  not depend on hash iteration.
*/
#include "amlnet/core/network_graph.hpp"

#include <algorithm>
#include <deque>
#include <numeric>

namespace amlnet::core {

const EntityNode* NetworkGraph::find_node(const EntityId& id) const noexcept {
  auto it = index_.find(id);
  if (it != index_.end() && it->second < nodes.size() && nodes[it->second].id == id) {
    return &nodes[it->second];
  }
  // Index is stale or was never built.
  for (const auto& n : nodes) {
    if (n.id == id) return &n;
  }
  return nullptr;
}

std::vector<EntityId> NetworkGraph::node_ids() const {
  std::vector<EntityId> out;
  out.reserve(nodes.size());
  for (const auto& n : nodes) out.push_back(n.id);
  return out;
}

void NetworkGraph::reindex() {
  index_.clear();
  index_.reserve(nodes.size());
  for (std::size_t i = 0; i < nodes.size(); ++i) index_.emplace(nodes[i].id, i);
  total_entities = static_cast<std::int32_t>(nodes.size());
  total_relationships = static_cast<std::int32_t>(edges.size());
}

AdjacencyIndex AdjacencyIndex::from_edges(
    std::span<const EntityId> ids,
    std::span<const RelationshipEdge> edges,
    bool active_only) {
  AdjacencyIndex g;
  g.ids_.reserve(ids.size());
  for (const auto& id : ids) {
    // Duplicate ids keep their first position.
    if (g.lookup_.emplace(id, static_cast<NodeId>(g.ids_.size())).second) {
      g.ids_.push_back(id);
    }
  }
  const auto n = g.ids_.size();

  // Gather admissible edges
  std::vector<NodeId> src_v, dst_v;
  std::vector<std::size_t> orig_v;
  for (std::size_t i = 0; i < edges.size(); ++i) {
    const auto& e = edges[i];
    if (active_only && !e.active) continue;
    if (e.is_self_loop()) continue;
    auto s = g.lookup_.find(e.source_id);
    auto d = g.lookup_.find(e.target_id);
    if (s == g.lookup_.end() || d == g.lookup_.end()) continue;
    src_v.push_back(s->second);
    dst_v.push_back(d->second);
    orig_v.push_back(i);
  }
  const std::size_t m = src_v.size();

  // Compact/sort edges deterministically by (src, dst), stable w.r.t. input order.
  std::vector<std::size_t> idx(m);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (src_v[a] != src_v[b]) return src_v[a] < src_v[b];
    return dst_v[a] < dst_v[b];
  });
  g.src_.resize(m);
  g.dst_.resize(m);
  g.confidence_.resize(m);
  g.type_.resize(m);
  g.source_index_.resize(m);
  for (std::size_t i = 0; i < m; ++i) {
    const auto k = idx[i];
    g.src_[i] = src_v[k];
    g.dst_[i] = dst_v[k];
    g.source_index_[i] = orig_v[k];
    g.confidence_[i] = edges[orig_v[k]].confidence;
    g.type_[i] = edges[orig_v[k]].relationship_type;
  }

  // Build CSR adjacency
  g.row_offsets_.assign(n + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g.row_offsets_[static_cast<std::size_t>(g.src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g.row_offsets_.size(); ++i) {
    g.row_offsets_[i] += g.row_offsets_[i - 1];
  }
  g.col_indices_.resize(m);
  g.adj_edge_index_.resize(m);
  std::vector<std::int32_t> cursor = g.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = g.src_[e];
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    g.col_indices_[pos] = g.dst_[e];
    g.adj_edge_index_[pos] = static_cast<EdgeId>(e);
  }
  // Build reverse CSR (incoming adjacency)
  g.in_row_offsets_.assign(n + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g.in_row_offsets_[static_cast<std::size_t>(g.dst_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g.in_row_offsets_.size(); ++i) {
    g.in_row_offsets_[i] += g.in_row_offsets_[i - 1];
  }
  g.in_col_indices_.resize(m);
  g.in_adj_edge_index_.resize(m);
  std::vector<std::int32_t> rcursor = g.in_row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto v = g.dst_[e];
    auto pos = static_cast<std::size_t>(rcursor[static_cast<std::size_t>(v)]++);
    g.in_col_indices_[pos] = g.src_[e];
    g.in_adj_edge_index_[pos] = static_cast<EdgeId>(e);
  }
  return g;
}

std::optional<NodeId> AdjacencyIndex::find(const EntityId& id) const noexcept {
  auto it = lookup_.find(id);
  if (it == lookup_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::pair<NodeId, EdgeId>> AdjacencyIndex::neighbours(
    NodeId n, std::span<const bool> edge_mask) const {
  const bool use_mask = edge_mask.size() == src_.size();
  std::vector<std::pair<NodeId, EdgeId>> out;
  const auto u = static_cast<std::size_t>(n);
  for (auto j = static_cast<std::size_t>(row_offsets_[u]); j < static_cast<std::size_t>(row_offsets_[u + 1]); ++j) {
    const auto e = adj_edge_index_[j];
    if (use_mask && !edge_mask[static_cast<std::size_t>(e)]) continue;
    out.emplace_back(col_indices_[j], e);
  }
  for (auto j = static_cast<std::size_t>(in_row_offsets_[u]); j < static_cast<std::size_t>(in_row_offsets_[u + 1]); ++j) {
    const auto e = in_adj_edge_index_[j];
    if (use_mask && !edge_mask[static_cast<std::size_t>(e)]) continue;
    out.emplace_back(in_col_indices_[j], e);
  }
  return out;
}

std::vector<std::int32_t> hop_distances(
    const AdjacencyIndex& idx, NodeId src, std::int32_t max_hops,
    std::span<const bool> edge_mask) {
  std::vector<std::int32_t> dist(static_cast<std::size_t>(idx.num_nodes()), -1);
  if (src < 0 || src >= idx.num_nodes()) return dist;
  dist[static_cast<std::size_t>(src)] = 0;
  std::deque<NodeId> queue {src};
  while (!queue.empty()) {
    const NodeId u = queue.front();
    queue.pop_front();
    const auto du = dist[static_cast<std::size_t>(u)];
    if (du >= max_hops) continue;
    for (const auto& [v, e] : idx.neighbours(u, edge_mask)) {
      (void)e;
      auto& dv = dist[static_cast<std::size_t>(v)];
      if (dv < 0) {
        dv = du + 1;
        queue.push_back(v);
      }
    }
  }
  return dist;
}

} // namespace amlnet::core
