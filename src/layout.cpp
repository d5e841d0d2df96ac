/*
  Display layout: ring, circle and hop-row positions plus risk colours and sizes.
*/
#include "amlnet/core/layout.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numbers>

namespace amlnet::core {

namespace {
constexpr double kSpacing = 100.0;

void ring_positions(const NetworkGraph& graph, NetworkLayout& out, bool by_connections) {
  const auto n = static_cast<double>(graph.nodes.size());
  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    const auto& node = graph.nodes[i];
    auto& nl = out.nodes[i];
    if (node.is_center) continue;  // origin
    const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / n;
    const double radius = by_connections ? 100.0 + 10.0 * node.connection_count : 150.0;
    nl.x = radius * std::cos(angle);
    nl.y = radius * std::sin(angle);
  }
}

void hierarchical_positions(const NetworkGraph& graph, NetworkLayout& out) {
  const auto ids = graph.node_ids();
  const auto idx = AdjacencyIndex::from_edges(ids, graph.edges, /*active_only=*/false);
  std::vector<std::int32_t> dist(ids.size(), -1);
  if (auto c = idx.find(graph.center_entity_id)) {
    dist = hop_distances(idx, *c, static_cast<std::int32_t>(ids.size()));
  }
  const std::int32_t last_row = dist.empty() ? 0 : *std::max_element(dist.begin(), dist.end()) + 1;
  std::map<std::int32_t, std::vector<std::size_t>> rows;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    rows[dist[i] < 0 ? last_row : dist[i]].push_back(i);
  }
  for (const auto& [row, members] : rows) {
    const double width = static_cast<double>(members.size() - 1) * kSpacing;
    for (std::size_t k = 0; k < members.size(); ++k) {
      auto& nl = out.nodes[members[k]];
      nl.x = static_cast<double>(k) * kSpacing - width / 2.0;
      nl.y = static_cast<double>(row) * kSpacing;
    }
  }
}
} // namespace

std::string_view node_color(RiskLevel level) noexcept {
  switch (level) {
    case RiskLevel::Low: return "#4CAF50";
    case RiskLevel::Medium: return "#FF9800";
    case RiskLevel::High: return "#F44336";
    case RiskLevel::Critical: return "#9C27B0";
  }
  return "#757575";
}

std::string_view edge_color(Score confidence) noexcept {
  if (confidence >= 0.8) return "#4CAF50";
  if (confidence >= 0.6) return "#FF9800";
  if (confidence >= 0.4) return "#FFC107";
  return "#9E9E9E";
}

std::string_view to_string(LayoutAlgorithm a) noexcept {
  switch (a) {
    case LayoutAlgorithm::Force: return "force";
    case LayoutAlgorithm::Hierarchical: return "hierarchical";
    case LayoutAlgorithm::Circular: return "circular";
  }
  return "force";
}

std::optional<LayoutAlgorithm> parse_layout_algorithm(std::string_view s) noexcept {
  if (s == "force") return LayoutAlgorithm::Force;
  if (s == "hierarchical") return LayoutAlgorithm::Hierarchical;
  if (s == "circular") return LayoutAlgorithm::Circular;
  return std::nullopt;
}

NetworkLayout compute_layout(const NetworkGraph& graph, LayoutAlgorithm algorithm) {
  NetworkLayout out;
  out.algorithm = algorithm;
  out.nodes.reserve(graph.nodes.size());
  for (const auto& n : graph.nodes) {
    NodeLayout nl;
    nl.id = n.id;
    nl.size = std::clamp(5.0 * n.connection_count, 10.0, 50.0);
    nl.color = std::string(node_color(n.risk_level));
    out.nodes.push_back(std::move(nl));
  }
  for (const auto& e : graph.edges) {
    EdgeLayout el;
    el.id = e.relationship_id;
    el.thickness = std::max(1.0, 5.0 * e.confidence);
    el.color = std::string(edge_color(e.confidence));
    out.edges.push_back(std::move(el));
  }

  switch (algorithm) {
    case LayoutAlgorithm::Force:
      ring_positions(graph, out, /*by_connections=*/true);
      break;
    case LayoutAlgorithm::Circular:
      ring_positions(graph, out, /*by_connections=*/false);
      break;
    case LayoutAlgorithm::Hierarchical:
      hierarchical_positions(graph, out);
      break;
  }
  return out;
}

} // namespace amlnet::core
