/* Visualization hints for a built network. Cosmetic only. */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "amlnet/core/network_graph.hpp"
#include "amlnet/core/options.hpp"

namespace amlnet::core {

struct NodeLayout {
  EntityId id {};
  double x {0.0};
  double y {0.0};
  double size {10.0};
  std::string color {};
};

struct EdgeLayout {
  RelationshipId id {};
  double thickness {1.0};
  std::string color {};
};

struct NetworkLayout {
  LayoutAlgorithm algorithm {LayoutAlgorithm::Force};
  std::vector<NodeLayout> nodes {};  // same order as graph.nodes
  std::vector<EdgeLayout> edges {};  // same order as graph.edges
};

[[nodiscard]] std::string_view node_color(RiskLevel level) noexcept;
[[nodiscard]] std::string_view edge_color(Score confidence) noexcept;

[[nodiscard]] std::string_view to_string(LayoutAlgorithm a) noexcept;
[[nodiscard]] std::optional<LayoutAlgorithm> parse_layout_algorithm(std::string_view s) noexcept;

// Positions per algorithm (n = number of nodes, i = node position):
//   Force:        angle 2*pi*i/n, radius 100 + 10*connection_count, center at origin
//   Circular:     angle 2*pi*i/n, radius 150, center at origin
//   Hierarchical: row = hop distance from the center (unreachable nodes in a
//                 final row), 100 apart in both directions, rows centered on x = 0
// Node size is clamp(5*connection_count, 10, 50); edge thickness max(1, 5*confidence).
[[nodiscard]] NetworkLayout compute_layout(const NetworkGraph& graph, LayoutAlgorithm algorithm);

} // namespace amlnet::core
