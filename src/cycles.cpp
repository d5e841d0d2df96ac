/*
  find_cycles: bounded DFS from the origin over a collapsed undirected
  adjacency built from the AdjacencyIndex.
*/
#include "amlnet/core/cycles.hpp"

#include <algorithm>
#include <map>

#include "amlnet/core/network_graph.hpp"

namespace amlnet::core {

namespace {
struct Neighbour {
  NodeId node;
  EdgeId edge;
};

class CycleSearch {
public:
  CycleSearch(const AdjacencyIndex& g, std::span<const RelationshipEdge> edges,
              const CycleOptions& opts)
      : g_(g), edges_(edges), opts_(opts), on_path_(static_cast<std::size_t>(g.num_nodes()), false) {
    adj_.resize(static_cast<std::size_t>(g.num_nodes()));
    for (NodeId u = 0; u < g.num_nodes(); ++u) {
      // Collapse parallel edges; keep the first in CSR order.
      std::map<EntityId, Neighbour> by_id;
      for (const auto& [v, e] : g.neighbours(u)) by_id.emplace(g.id(v), Neighbour{v, e});
      auto& row = adj_[static_cast<std::size_t>(u)];
      for (const auto& [id, nb] : by_id) row.push_back(nb);
    }
  }

  std::vector<RelationshipCycle> run(NodeId origin) {
    origin_ = origin;
    path_ = {origin};
    on_path_[static_cast<std::size_t>(origin)] = true;
    dfs(origin);
    return std::move(out_);
  }

private:
  bool full() const { return out_.size() >= static_cast<std::size_t>(opts_.max_cycles); }

  void dfs(NodeId u) {
    for (const auto& nb : adj_[static_cast<std::size_t>(u)]) {
      if (full()) return;
      if (nb.node == origin_) {
        // Closing edge: emit only in canonical orientation.
        if (path_.size() >= 3 && g_.id(path_[1]) < g_.id(path_.back())) emit(nb.edge);
        continue;
      }
      if (on_path_[static_cast<std::size_t>(nb.node)]) continue;
      if (path_.size() >= static_cast<std::size_t>(opts_.max_cycle_length)) continue;
      path_.push_back(nb.node);
      path_edges_.push_back(nb.edge);
      on_path_[static_cast<std::size_t>(nb.node)] = true;
      dfs(nb.node);
      on_path_[static_cast<std::size_t>(nb.node)] = false;
      path_edges_.pop_back();
      path_.pop_back();
    }
  }

  void emit(EdgeId closing) {
    const auto src_index = g_.source_index_view();
    RelationshipCycle c;
    for (auto n : path_) c.entities.push_back(g_.id(n));
    for (auto e : path_edges_) {
      c.relationships.push_back(edges_[src_index[static_cast<std::size_t>(e)]].relationship_id);
    }
    c.relationships.push_back(edges_[src_index[static_cast<std::size_t>(closing)]].relationship_id);
    out_.push_back(std::move(c));
  }

  const AdjacencyIndex& g_;
  std::span<const RelationshipEdge> edges_;
  const CycleOptions& opts_;
  std::vector<std::vector<Neighbour>> adj_ {};
  std::vector<bool> on_path_;
  std::vector<NodeId> path_ {};
  std::vector<EdgeId> path_edges_ {};
  NodeId origin_ {0};
  std::vector<RelationshipCycle> out_ {};
};
} // namespace

std::vector<RelationshipCycle> find_cycles(
    const EntityId& origin,
    std::span<const EntityId> ids,
    std::span<const RelationshipEdge> edges,
    const CycleOptions& opts) {
  if (opts.max_cycle_length < 3 || opts.max_cycles < 1) return {};
  const auto g = AdjacencyIndex::from_edges(ids, edges, /*active_only=*/true);
  const auto start = g.find(origin);
  if (!start) return {};
  CycleSearch search(g, edges, opts);
  return search.run(*start);
}

} // namespace amlnet::core
