/*
  NetworkAnalysisService: per-request orchestration over a GraphStore.

  A request builds the network once; centrality, communities, hubs, risk
  propagation and cycle detection then read the same immutable graph and may
  run concurrently (std::async). A path search requested alongside runs
  concurrently with the build. Built networks are cached by center id plus
  parameter hash with a TTL; invalidate_cache()/invalidate_entity() must be
  called when relationship data changes.

  GraphStore implementations must tolerate concurrent read calls.
*/
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "amlnet/core/centrality.hpp"
#include "amlnet/core/community.hpp"
#include "amlnet/core/config.hpp"
#include "amlnet/core/cycles.hpp"
#include "amlnet/core/graph_store.hpp"
#include "amlnet/core/hubs.hpp"
#include "amlnet/core/layout.hpp"
#include "amlnet/core/network_builder.hpp"
#include "amlnet/core/path_finder.hpp"
#include "amlnet/core/result_cache.hpp"
#include "amlnet/core/risk_propagation.hpp"
#include "amlnet/core/statistics.hpp"

namespace amlnet::core {

struct AnalysisRequest {
  NetworkQuery query {};
  bool include_centrality {true};
  bool include_communities {true};
  bool include_hubs {true};
  bool include_risk_propagation {true};
  bool include_cycles {true};
  bool include_layout {true};
  // When set, a path from the center to this entity is searched concurrently.
  std::optional<EntityId> path_target {};
};

struct AnalysisReport {
  // Nodes carry their centrality record when centrality was requested.
  NetworkGraph graph {};
  // Build error (NetworkBuildFailed or an enrichment error) or the first
  // analyzer store error; analyzers that failed leave their section empty.
  std::optional<Error> error {};
  double query_time_ms {0.0};
  bool from_cache {false};

  std::vector<CentralityRecord> centrality {};
  std::vector<EntityId> bridges {};
  std::vector<Community> communities {};
  std::vector<HubEntity> hubs {};
  std::optional<PropagationResult> propagation {};
  std::vector<RelationshipCycle> cycles {};
  NetworkStatistics statistics {};
  std::vector<NodeRiskScore> network_risk {};
  std::vector<std::string> recommendations {};
  std::optional<NetworkLayout> layout {};
  std::optional<PathAnalysis> path {};

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

class NetworkAnalysisService {
public:
  // Throws std::invalid_argument for a null store and ConfigError for an
  // out-of-range config.
  explicit NetworkAnalysisService(GraphStorePtr store, AnalysisConfig config = {});

  // Context carrying the configured store timeout. Callers that need to cancel
  // a request attach a `cancelled` flag and pass it to the overloads below.
  [[nodiscard]] StoreContext make_context() const;

  // Every entry point has an overload taking the caller's StoreContext; the
  // short forms use make_context(). One request runs entirely under one context.

  // Cached network build. Only successful builds are cached.
  [[nodiscard]] std::shared_ptr<const BuildResult> build_network(const NetworkQuery& query);
  [[nodiscard]] std::shared_ptr<const BuildResult> build_network(const NetworkQuery& query,
                                                                 const StoreContext& ctx);

  // The path search and risk propagation follow the query's relationship_types;
  // the path search also honours its min_confidence. Propagation keeps its own
  // min_propagated_score cut-off.
  [[nodiscard]] AnalysisReport analyze_network(const AnalysisRequest& request);
  [[nodiscard]] AnalysisReport analyze_network(const AnalysisRequest& request,
                                               const StoreContext& ctx);

  [[nodiscard]] PathResult find_path(const EntityId& source, const EntityId& target);
  [[nodiscard]] PathResult find_path(const EntityId& source, const EntityId& target,
                                     const PathOptions& opts);
  [[nodiscard]] PathResult find_path(const EntityId& source, const EntityId& target,
                                     const PathOptions& opts, const StoreContext& ctx);
  [[nodiscard]] PathAnalysis analyze_path(const EntityId& source, const EntityId& target);
  [[nodiscard]] std::optional<std::int32_t> degrees_of_separation(const EntityId& a,
                                                                  const EntityId& b);
  [[nodiscard]] std::optional<std::int32_t> degrees_of_separation(const EntityId& a,
                                                                  const EntityId& b,
                                                                  const StoreContext& ctx);

  [[nodiscard]] PropagationResult propagate_risk(const EntityId& source);
  [[nodiscard]] PropagationResult propagate_risk(const EntityId& source,
                                                 const PropagationOptions& opts);
  [[nodiscard]] PropagationResult propagate_risk(const EntityId& source,
                                                 const PropagationOptions& opts,
                                                 const StoreContext& ctx);

  // Hubs among candidates, or over the whole store when candidates is empty.
  [[nodiscard]] HubResult detect_hubs(std::span<const EntityId> candidates);
  [[nodiscard]] HubResult detect_hubs(std::span<const EntityId> candidates, const HubOptions& opts);
  [[nodiscard]] HubResult detect_hubs(std::span<const EntityId> candidates, const HubOptions& opts,
                                      const StoreContext& ctx);

  // Candidate-set analyses (e.g. ids supplied by search ranking): relationships
  // are gathered one hop around each candidate and restricted to the set.
  [[nodiscard]] StoreResult<std::vector<CentralityRecord>> centrality(
      std::span<const EntityId> candidates);
  [[nodiscard]] StoreResult<std::vector<CentralityRecord>> centrality(
      std::span<const EntityId> candidates, const StoreContext& ctx);
  [[nodiscard]] StoreResult<std::vector<Community>> communities(
      std::span<const EntityId> candidates);
  [[nodiscard]] StoreResult<std::vector<Community>> communities(
      std::span<const EntityId> candidates, const CommunityOptions& opts);
  [[nodiscard]] StoreResult<std::vector<Community>> communities(
      std::span<const EntityId> candidates, const CommunityOptions& opts, const StoreContext& ctx);

  // Cycles through `entity` within the configured cycle length.
  [[nodiscard]] StoreResult<std::vector<RelationshipCycle>> find_cycles(const EntityId& entity);
  [[nodiscard]] StoreResult<std::vector<RelationshipCycle>> find_cycles(const EntityId& entity,
                                                                        const StoreContext& ctx);

  // Network risk score of one entity over its direct connections.
  [[nodiscard]] StoreResult<NodeRiskScore> network_risk_score(const EntityId& entity);
  [[nodiscard]] StoreResult<NodeRiskScore> network_risk_score(const EntityId& entity,
                                                              const StoreContext& ctx);

  void invalidate_cache();
  std::size_t invalidate_entity(const EntityId& id);

  [[nodiscard]] const AnalysisConfig& config() const noexcept { return config_; }
  [[nodiscard]] std::size_t cache_size() const;

private:
  using BuildPtr = std::shared_ptr<const BuildResult>;

  // Build plus whether it was served from the cache.
  [[nodiscard]] std::pair<BuildPtr, bool> cached_build(const NetworkQuery& query,
                                                       const StoreContext& ctx);
  [[nodiscard]] StoreResult<std::vector<RelationshipEdge>> candidate_edges(
      std::span<const EntityId> candidates, const StoreContext& ctx);

  GraphStorePtr store_;
  AnalysisConfig config_;
  std::unique_ptr<ResultCache<std::string, BuildResult>> cache_ {};
};

} // namespace amlnet::core
