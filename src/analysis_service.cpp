/*
  NetworkAnalysisService: build once, analyze concurrently, merge at the end.
*/
#include "amlnet/core/analysis_service.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace amlnet::core {

namespace {
std::string cache_key(const NetworkQuery& q) {
  return q.center_entity_id + "#" + std::to_string(q.hash());
}

EntityRecord record_of(const EntityNode& n) {
  return EntityRecord{n.id, n.name, n.type, n.risk_score, n.risk_level};
}
} // namespace

NetworkAnalysisService::NetworkAnalysisService(GraphStorePtr store, AnalysisConfig config)
    : store_(std::move(store)), config_(std::move(config)) {
  if (!store_) throw std::invalid_argument("NetworkAnalysisService requires a GraphStore");
  validate_config(config_);
  if (config_.cache_enabled && config_.cache_max_entries > 0) {
    cache_ = std::make_unique<ResultCache<std::string, BuildResult>>(config_.cache_max_entries,
                                                                     config_.cache_ttl);
  }
}

StoreContext NetworkAnalysisService::make_context() const {
  if (config_.store_timeout.count() > 0) return StoreContext::with_timeout(config_.store_timeout);
  return {};
}

std::pair<NetworkAnalysisService::BuildPtr, bool> NetworkAnalysisService::cached_build(
    const NetworkQuery& query, const StoreContext& ctx) {
  query.validate();
  const auto key = cache_key(query);
  if (cache_) {
    if (auto hit = cache_->get(key)) {
      spdlog::debug("network cache hit for {}", query.center_entity_id);
      return {std::move(hit), true};
    }
  }
  auto built = std::make_shared<const BuildResult>(amlnet::core::build_network(*store_, query, ctx));
  if (cache_ && built->ok()) {
    cache_->put(key, built, built->graph.node_ids());
  }
  return {std::move(built), false};
}

std::shared_ptr<const BuildResult> NetworkAnalysisService::build_network(const NetworkQuery& query) {
  return build_network(query, make_context());
}

std::shared_ptr<const BuildResult> NetworkAnalysisService::build_network(const NetworkQuery& query,
                                                                         const StoreContext& ctx) {
  return cached_build(query, ctx).first;
}

AnalysisReport NetworkAnalysisService::analyze_network(const AnalysisRequest& request) {
  return analyze_network(request, make_context());
}

AnalysisReport NetworkAnalysisService::analyze_network(const AnalysisRequest& request,
                                                       const StoreContext& ctx) {
  const auto start = std::chrono::steady_clock::now();
  const auto& query = request.query;
  query.validate();
  if (request.path_target && request.path_target->empty()) {
    throw InvalidRequest("path_target must not be empty");
  }
  const auto policy = config_.parallel ? std::launch::async : std::launch::deferred;

  // Store-backed analyzers follow the query's relationship filter.
  PathOptions path_opts = config_.path;
  PropagationOptions propagation_opts = config_.propagation;
  if (!query.relationship_types.empty()) {
    path_opts.relationship_types = query.relationship_types;
    propagation_opts.relationship_types = query.relationship_types;
  }
  path_opts.min_confidence = std::max(path_opts.min_confidence, query.min_confidence);

  std::future<PathResult> path_future;
  if (request.path_target) {
    path_future = std::async(policy, [this, &query, &request, &path_opts, &ctx] {
      return amlnet::core::find_path(*store_, query.center_entity_id, *request.path_target,
                                     path_opts, ctx);
    });
  }

  AnalysisReport report;
  const auto build = cached_build(query, ctx);
  const auto& built = build.first;
  report.from_cache = build.second;
  report.graph = built->graph;
  report.error = built->error;

  const NetworkGraph& g = built->graph;
  if (!g.empty()) {
    const auto ids = g.node_ids();
    const std::span<const RelationshipEdge> edges(g.edges);

    std::future<std::vector<CentralityRecord>> centrality_f;
    std::future<std::vector<Community>> communities_f;
    std::future<std::vector<HubEntity>> hubs_f;
    std::future<PropagationResult> propagation_f;
    std::future<std::vector<RelationshipCycle>> cycles_f;

    if (request.include_centrality) {
      centrality_f = std::async(policy, [&] { return compute_centrality(ids, edges, config_.centrality); });
    }
    if (request.include_communities) {
      communities_f = std::async(policy, [&] { return detect_communities(ids, edges, config_.communities); });
    }
    if (request.include_hubs) {
      hubs_f = std::async(policy, [&] {
        std::vector<EntityRecord> records;
        records.reserve(g.nodes.size());
        for (const auto& n : g.nodes) records.push_back(record_of(n));
        return amlnet::core::detect_hubs(edges, ids, config_.hubs, records);
      });
    }
    if (request.include_risk_propagation) {
      propagation_f = std::async(policy, [&] {
        return amlnet::core::propagate_risk(*store_, g.center_entity_id, propagation_opts, ctx);
      });
    }
    if (request.include_cycles) {
      cycles_f = std::async(policy, [&] {
        return amlnet::core::find_cycles(g.center_entity_id, ids, edges, config_.cycles);
      });
    }

    if (centrality_f.valid()) {
      report.centrality = centrality_f.get();
      report.bridges = find_bridges(report.centrality);
      std::unordered_map<EntityId, const CentralityRecord*> by_id;
      for (const auto& r : report.centrality) by_id.emplace(r.entity_id, &r);
      for (auto& n : report.graph.nodes) {
        auto it = by_id.find(n.id);
        if (it != by_id.end()) n.centrality = *it->second;
      }
    }
    if (communities_f.valid()) report.communities = communities_f.get();
    if (hubs_f.valid()) report.hubs = hubs_f.get();
    if (propagation_f.valid()) {
      report.propagation = propagation_f.get();
      if (!report.error && report.propagation->error) report.error = report.propagation->error;
    }
    if (cycles_f.valid()) report.cycles = cycles_f.get();
  }
  report.graph.reindex();

  report.statistics = compute_statistics(report.graph);
  report.network_risk = compute_network_risk(report.graph);
  std::optional<Score> center_risk;
  for (const auto& r : report.network_risk) {
    if (r.entity_id == query.center_entity_id) center_risk = r.network_risk_score;
  }
  report.recommendations = recommendations(report.statistics, center_risk);
  if (request.include_layout) {
    report.layout = compute_layout(report.graph, query.layout_algorithm);
  }

  if (path_future.valid()) {
    report.path = amlnet::core::analyze_path(path_future.get());
    if (!report.error && report.path->path.error) report.error = report.path->path.error;
  }

  report.query_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  spdlog::info("network analysis for {}: {} nodes, {} edges, {} communities, {} hubs in {:.1f} ms{}",
               query.center_entity_id, report.graph.nodes.size(), report.graph.edges.size(),
               report.communities.size(), report.hubs.size(), report.query_time_ms,
               report.from_cache ? " (cached network)" : "");
  return report;
}

PathResult NetworkAnalysisService::find_path(const EntityId& source, const EntityId& target) {
  return find_path(source, target, config_.path);
}

PathResult NetworkAnalysisService::find_path(const EntityId& source, const EntityId& target,
                                             const PathOptions& opts) {
  return find_path(source, target, opts, make_context());
}

PathResult NetworkAnalysisService::find_path(const EntityId& source, const EntityId& target,
                                             const PathOptions& opts, const StoreContext& ctx) {
  return amlnet::core::find_path(*store_, source, target, opts, ctx);
}

PathAnalysis NetworkAnalysisService::analyze_path(const EntityId& source, const EntityId& target) {
  return amlnet::core::analyze_path(find_path(source, target));
}

std::optional<std::int32_t> NetworkAnalysisService::degrees_of_separation(const EntityId& a,
                                                                          const EntityId& b) {
  return degrees_of_separation(a, b, make_context());
}

std::optional<std::int32_t> NetworkAnalysisService::degrees_of_separation(const EntityId& a,
                                                                          const EntityId& b,
                                                                          const StoreContext& ctx) {
  return amlnet::core::degrees_of_separation(*store_, a, b, config_.path, ctx);
}

PropagationResult NetworkAnalysisService::propagate_risk(const EntityId& source) {
  return propagate_risk(source, config_.propagation);
}

PropagationResult NetworkAnalysisService::propagate_risk(const EntityId& source,
                                                         const PropagationOptions& opts) {
  return propagate_risk(source, opts, make_context());
}

PropagationResult NetworkAnalysisService::propagate_risk(const EntityId& source,
                                                         const PropagationOptions& opts,
                                                         const StoreContext& ctx) {
  return amlnet::core::propagate_risk(*store_, source, opts, ctx);
}

HubResult NetworkAnalysisService::detect_hubs(std::span<const EntityId> candidates) {
  return detect_hubs(candidates, config_.hubs);
}

HubResult NetworkAnalysisService::detect_hubs(std::span<const EntityId> candidates,
                                              const HubOptions& opts) {
  return detect_hubs(candidates, opts, make_context());
}

HubResult NetworkAnalysisService::detect_hubs(std::span<const EntityId> candidates,
                                              const HubOptions& opts, const StoreContext& ctx) {
  return amlnet::core::detect_hubs(*store_, candidates, opts, ctx);
}

StoreResult<std::vector<RelationshipEdge>> NetworkAnalysisService::candidate_edges(
    std::span<const EntityId> candidates, const StoreContext& ctx) {
  return collect_incident_edges(*store_, candidates, RelationshipFilter{}, ctx);
}

StoreResult<std::vector<CentralityRecord>> NetworkAnalysisService::centrality(
    std::span<const EntityId> candidates) {
  return centrality(candidates, make_context());
}

StoreResult<std::vector<CentralityRecord>> NetworkAnalysisService::centrality(
    std::span<const EntityId> candidates, const StoreContext& ctx) {
  using Result = StoreResult<std::vector<CentralityRecord>>;
  auto edges = candidate_edges(candidates, ctx);
  if (!edges.ok()) return Result{{}, edges.error};
  return Result::success(compute_centrality(candidates, edges.value, config_.centrality));
}

StoreResult<std::vector<Community>> NetworkAnalysisService::communities(
    std::span<const EntityId> candidates) {
  return communities(candidates, config_.communities);
}

StoreResult<std::vector<Community>> NetworkAnalysisService::communities(
    std::span<const EntityId> candidates, const CommunityOptions& opts) {
  return communities(candidates, opts, make_context());
}

StoreResult<std::vector<Community>> NetworkAnalysisService::communities(
    std::span<const EntityId> candidates, const CommunityOptions& opts, const StoreContext& ctx) {
  using Result = StoreResult<std::vector<Community>>;
  opts.validate();
  auto edges = candidate_edges(candidates, ctx);
  if (!edges.ok()) return Result{{}, edges.error};
  return Result::success(detect_communities(candidates, edges.value, opts));
}

StoreResult<std::vector<RelationshipCycle>> NetworkAnalysisService::find_cycles(
    const EntityId& entity) {
  return find_cycles(entity, make_context());
}

StoreResult<std::vector<RelationshipCycle>> NetworkAnalysisService::find_cycles(
    const EntityId& entity, const StoreContext& ctx) {
  using Result = StoreResult<std::vector<RelationshipCycle>>;
  auto query = config_.make_query(entity);
  // A cycle of length L through the entity never leaves L/2 hops.
  query.max_depth = std::clamp(config_.cycles.max_cycle_length / 2, 1, 5);
  const auto built = build_network(query, ctx);
  if (built->graph.empty()) return Result{{}, built->error};
  const auto ids = built->graph.node_ids();
  return Result::success(amlnet::core::find_cycles(entity, ids, built->graph.edges, config_.cycles));
}

StoreResult<NodeRiskScore> NetworkAnalysisService::network_risk_score(const EntityId& entity) {
  return network_risk_score(entity, make_context());
}

StoreResult<NodeRiskScore> NetworkAnalysisService::network_risk_score(const EntityId& entity,
                                                                      const StoreContext& ctx) {
  using Result = StoreResult<NodeRiskScore>;
  auto query = config_.make_query(entity);
  query.max_depth = 1;
  const auto built = build_network(query, ctx);
  if (built->graph.empty()) return Result{{}, built->error};
  for (auto& r : compute_network_risk(built->graph)) {
    if (r.entity_id == entity) return Result{std::move(r), built->error};
  }
  return Result{{}, built->error};
}

void NetworkAnalysisService::invalidate_cache() {
  if (cache_) cache_->invalidate_all();
  spdlog::info("network cache invalidated");
}

std::size_t NetworkAnalysisService::invalidate_entity(const EntityId& id) {
  const std::size_t removed = cache_ ? cache_->invalidate_entity(id) : 0;
  spdlog::debug("invalidated {} cached networks touching {}", removed, id);
  return removed;
}

std::size_t NetworkAnalysisService::cache_size() const {
  return cache_ ? cache_->size() : 0;
}

} // namespace amlnet::core
