/* Bounded subgraph construction around a center entity. */
#pragma once

#include <optional>

#include "amlnet/core/error.hpp"
#include "amlnet/core/graph_store.hpp"
#include "amlnet/core/network_graph.hpp"
#include "amlnet/core/options.hpp"

namespace amlnet::core {

struct BuildResult {
  NetworkGraph graph {};
  // NetworkBuildFailed when traversal failed (graph then has zero nodes);
  // StoreUnavailable/StoreTimeout when only entity enrichment failed.
  std::optional<Error> error {};
  double query_time_ms {0.0};

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// Pulls the filtered, depth-bounded subgraph around query.center_entity_id.
// Throws InvalidRequest for out-of-range parameters; store failures are
// returned in BuildResult::error and never thrown.
[[nodiscard]] BuildResult build_network(GraphStore& store, const NetworkQuery& query,
                                        const StoreContext& ctx = {});

// Maps store records onto nodes, applying DataQuality defaults for entities the
// store did not return.
[[nodiscard]] EntityNode make_node(const EntityId& id, const EntityRecord* record,
                                   bool is_center);

} // namespace amlnet::core
