/* Request-scoped network graph and its compact CSR adjacency index. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "amlnet/core/types.hpp"

namespace amlnet::core {

// Dense node/edge indices used inside AdjacencyIndex.
using NodeId = std::int32_t;
using EdgeId = std::int32_t;

// Subgraph around a center entity. Nodes are kept in discovery order with the
// center first; edges in breadth-first order, deduplicated by relationship id.
// Invariant: node ids == endpoints of edges plus the center.
struct NetworkGraph {
  EntityId center_entity_id {};
  std::int32_t max_depth {0};
  std::int32_t max_depth_reached {0};
  std::vector<EntityNode> nodes {};
  std::vector<RelationshipEdge> edges {};
  std::int32_t total_entities {0};
  std::int32_t total_relationships {0};

  [[nodiscard]] const EntityNode* find_node(const EntityId& id) const noexcept;
  [[nodiscard]] std::vector<EntityId> node_ids() const;
  [[nodiscard]] bool empty() const noexcept { return nodes.empty(); }

  // Rebuilds the id -> position lookup after `nodes` is modified.
  void reindex();

private:
  std::unordered_map<EntityId, std::size_t> index_ {};
};

// Immutable adjacency over a fixed node universe with CSR (outgoing) and
// reverse CSR (incoming) layouts.
//
// Notes on identifiers:
// - NodeId is the position of an entity in the `ids` span passed to from_edges.
// - EdgeId refers to the compacted, deterministically ordered edge list
//   (sorted by (src, dst), stable with respect to input order).
// - source_index_view() maps an EdgeId back to its position in the input edges.
// Edges with an endpoint outside the universe, and self-loops, are not indexed.
class AdjacencyIndex {
public:
  [[nodiscard]] static AdjacencyIndex from_edges(
      std::span<const EntityId> ids,
      std::span<const RelationshipEdge> edges,
      bool active_only);
  ~AdjacencyIndex() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(ids_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(src_.size()); }

  [[nodiscard]] std::optional<NodeId> find(const EntityId& id) const noexcept;
  [[nodiscard]] const EntityId& id(NodeId n) const noexcept { return ids_[static_cast<std::size_t>(n)]; }

  [[nodiscard]] std::span<const NodeId> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeId> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const Score> confidence_view() const noexcept { return confidence_; }
  [[nodiscard]] std::span<const RelationshipType> type_view() const noexcept { return type_; }
  [[nodiscard]] std::span<const std::size_t> source_index_view() const noexcept { return source_index_; }
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeId> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const EdgeId> adj_edge_index_view() const noexcept { return adj_edge_index_; }
  [[nodiscard]] std::span<const std::int32_t> in_row_offsets_view() const noexcept { return in_row_offsets_; }
  [[nodiscard]] std::span<const NodeId> in_col_indices_view() const noexcept { return in_col_indices_; }
  [[nodiscard]] std::span<const EdgeId> in_adj_edge_index_view() const noexcept { return in_adj_edge_index_; }

  // Undirected neighbours of n as (neighbour, edge) pairs: outgoing entries
  // first, then incoming, each in CSR order. Edges failing edge_mask are skipped.
  [[nodiscard]] std::vector<std::pair<NodeId, EdgeId>> neighbours(
      NodeId n, std::span<const bool> edge_mask = {}) const;

  [[nodiscard]] std::int32_t out_degree(NodeId n) const noexcept {
    return row_offsets_[static_cast<std::size_t>(n) + 1] - row_offsets_[static_cast<std::size_t>(n)];
  }
  [[nodiscard]] std::int32_t in_degree(NodeId n) const noexcept {
    return in_row_offsets_[static_cast<std::size_t>(n) + 1] - in_row_offsets_[static_cast<std::size_t>(n)];
  }

private:
  std::vector<EntityId> ids_ {};
  std::unordered_map<EntityId, NodeId> lookup_ {};

  std::vector<NodeId> src_ {};
  std::vector<NodeId> dst_ {};
  std::vector<Score> confidence_ {};
  std::vector<RelationshipType> type_ {};
  std::vector<std::size_t> source_index_ {};

  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeId> col_indices_ {};
  std::vector<EdgeId> adj_edge_index_ {};
  std::vector<std::int32_t> in_row_offsets_ {};
  std::vector<NodeId> in_col_indices_ {};
  std::vector<EdgeId> in_adj_edge_index_ {};
};

// Undirected hop distances from src, -1 for nodes farther than max_hops or
// unreachable. Honors an optional edge mask (length == num_edges()).
[[nodiscard]] std::vector<std::int32_t> hop_distances(
    const AdjacencyIndex& idx, NodeId src, std::int32_t max_hops,
    std::span<const bool> edge_mask = {});

} // namespace amlnet::core
