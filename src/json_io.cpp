/*
  JSON snapshot loading and report rendering with jsoncpp.
*/
#include "amlnet/core/json_io.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "amlnet/core/error.hpp"

namespace amlnet::core {

namespace {
Json::Value parse_stream(std::istream& in, const std::string& source) {
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errs;
  if (!Json::parseFromStream(builder, in, &root, &errs)) {
    throw ConfigError("invalid JSON in " + source + ": " + errs);
  }
  return root;
}

std::string required_string(const Json::Value& obj, const char* key, const char* what) {
  if (!obj.isMember(key) || !obj[key].isString() || obj[key].asString().empty()) {
    throw ConfigError(std::string(what) + " requires a non-empty string '" + key + "'");
  }
  return obj[key].asString();
}

std::string string_or(const Json::Value& obj, const char* key, const std::string& fallback) {
  return obj.isMember(key) && obj[key].isString() ? obj[key].asString() : fallback;
}

double number_or(const Json::Value& obj, const char* key, double fallback) {
  return obj.isMember(key) && obj[key].isNumeric() ? obj[key].asDouble() : fallback;
}

bool bool_or(const Json::Value& obj, const char* key, bool fallback) {
  return obj.isMember(key) && obj[key].isBool() ? obj[key].asBool() : fallback;
}

// Parses an enum field; absent or unrecognized values use `fallback`.
template <typename T, typename Parser>
T enum_or(const Json::Value& obj, const char* key, T fallback, Parser parse, const std::string& owner) {
  if (!obj.isMember(key)) return fallback;
  const auto raw = obj[key].isString() ? obj[key].asString() : std::string();
  if (auto v = parse(raw)) return *v;
  spdlog::warn("{}: unrecognized {} '{}', using default", owner, key, raw);
  return fallback;
}

EntityRecord entity_from_json(const Json::Value& e) {
  if (!e.isObject()) throw ConfigError("entity entries must be objects");
  EntityRecord r;
  r.id = required_string(e, "id", "entity");
  r.name = string_or(e, "name", "Unknown");
  if (r.name.empty()) r.name = "Unknown";
  r.type = enum_or(e, "type", EntityType::Unknown, parse_entity_type, r.id);
  if (!e.isMember("risk_score")) spdlog::debug("entity {}: missing risk_score, using 0.0", r.id);
  r.risk_score = std::clamp(number_or(e, "risk_score", 0.0), 0.0, 1.0);
  r.risk_level = enum_or(e, "risk_level", categorize_risk(r.risk_score), parse_risk_level, r.id);
  return r;
}

RelationshipEdge relationship_from_json(const Json::Value& j) {
  if (!j.isObject()) throw ConfigError("relationship entries must be objects");
  RelationshipEdge e;
  e.relationship_id = required_string(j, "id", "relationship");
  e.source_id = required_string(j, "source", "relationship");
  e.target_id = required_string(j, "target", "relationship");
  e.relationship_type = enum_or(j, "type", RelationshipType::Unknown, parse_relationship_type,
                                e.relationship_id);
  e.strength = enum_or(j, "strength", RelationshipStrength::Possible, parse_strength,
                       e.relationship_id);
  e.confidence = std::clamp(number_or(j, "confidence", 0.5), 0.0, 1.0);
  e.verified = bool_or(j, "verified", false);
  e.active = bool_or(j, "active", true);
  return e;
}

Json::Value node_json(const EntityNode& n) {
  Json::Value v(Json::objectValue);
  v["id"] = n.id;
  v["name"] = n.name;
  v["type"] = std::string(to_string(n.type));
  v["risk_score"] = n.risk_score;
  v["risk_level"] = std::string(to_string(n.risk_level));
  v["connection_count"] = n.connection_count;
  v["is_center"] = n.is_center;
  if (n.centrality) {
    Json::Value c(Json::objectValue);
    c["degree_centrality"] = n.centrality->degree_centrality;
    c["normalized_degree"] = n.centrality->normalized_degree;
    c["weighted_centrality"] = n.centrality->weighted_centrality;
    c["risk_weighted_centrality"] = n.centrality->risk_weighted_centrality;
    c["high_confidence_connections"] = n.centrality->high_confidence_connections;
    c["closeness_centrality"] = n.centrality->closeness_centrality;
    c["betweenness_centrality"] = n.centrality->betweenness_centrality;
    c["centrality_score"] = n.centrality->centrality_score;
    v["centrality"] = c;
  }
  return v;
}

Json::Value edge_json(const RelationshipEdge& e) {
  Json::Value v(Json::objectValue);
  v["id"] = e.relationship_id;
  v["source"] = e.source_id;
  v["target"] = e.target_id;
  v["type"] = std::string(to_string(e.relationship_type));
  v["strength"] = std::string(to_string(e.strength));
  v["confidence"] = e.confidence;
  v["verified"] = e.verified;
  v["active"] = e.active;
  return v;
}

Json::Value error_json(const Error& err) {
  Json::Value v(Json::objectValue);
  v["code"] = to_string(err.code);
  v["message"] = err.message;
  return v;
}

template <typename K>
Json::Value distribution_json(const std::map<K, std::int32_t>& m) {
  Json::Value v(Json::objectValue);
  for (const auto& [k, count] : m) v[std::string(to_string(k))] = count;
  return v;
}

Json::Value string_array(const std::vector<std::string>& xs) {
  Json::Value v(Json::arrayValue);
  for (const auto& x : xs) v.append(x);
  return v;
}
} // namespace

Json::Value parse_json_string(const std::string& text) {
  std::istringstream in(text);
  return parse_stream(in, "<string>");
}

Json::Value parse_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open " + path);
  return parse_stream(in, path);
}

std::shared_ptr<InMemoryGraphStore> store_from_json(const Json::Value& root) {
  if (!root.isObject()) throw ConfigError("snapshot root must be an object");
  auto store = std::make_shared<InMemoryGraphStore>();
  const auto& entities = root["entities"];
  const auto& relationships = root["relationships"];
  if (!entities.isNull() && !entities.isArray()) throw ConfigError("'entities' must be an array");
  if (!relationships.isNull() && !relationships.isArray()) {
    throw ConfigError("'relationships' must be an array");
  }
  for (const auto& e : entities) store->add_entity(entity_from_json(e));
  for (const auto& r : relationships) {
    auto edge = relationship_from_json(r);
    const auto id = edge.relationship_id;
    if (!store->add_relationship(std::move(edge))) {
      spdlog::warn("snapshot: duplicate relationship id {} skipped", id);
    }
  }
  spdlog::info("snapshot loaded: {} entities, {} relationships", store->num_entities(),
               store->num_relationships());
  return store;
}

std::shared_ptr<InMemoryGraphStore> load_store_snapshot(const std::string& path) {
  return store_from_json(parse_json_file(path));
}

Json::Value to_json(const NetworkGraph& graph) {
  Json::Value v(Json::objectValue);
  v["center_entity_id"] = graph.center_entity_id;
  v["max_depth"] = graph.max_depth;
  v["max_depth_reached"] = graph.max_depth_reached;
  v["total_entities"] = graph.total_entities;
  v["total_relationships"] = graph.total_relationships;
  Json::Value nodes(Json::arrayValue);
  for (const auto& n : graph.nodes) nodes.append(node_json(n));
  v["nodes"] = nodes;
  Json::Value edges(Json::arrayValue);
  for (const auto& e : graph.edges) edges.append(edge_json(e));
  v["edges"] = edges;
  return v;
}

Json::Value to_json(const PathAnalysis& a) {
  Json::Value v(Json::objectValue);
  v["source_entity_id"] = a.path.source_entity_id;
  v["target_entity_id"] = a.path.target_entity_id;
  v["path_found"] = a.path.found;
  v["path_length"] = a.path.length();
  Json::Value entities(Json::arrayValue);
  for (const auto& id : a.path.entities) entities.append(id);
  v["entities"] = entities;
  Json::Value steps(Json::arrayValue);
  for (const auto& s : a.steps) {
    Json::Value st(Json::objectValue);
    st["step"] = s.step;
    st["from"] = s.from;
    st["to"] = s.to;
    st["relationship"] = edge_json(s.relationship);
    st["risk_weight"] = s.risk_weight;
    steps.append(st);
  }
  v["steps"] = steps;
  v["connection_strength"] = a.connection_strength;
  v["risk_score"] = a.risk_score;
  v["path_confidence"] = a.path_confidence;
  if (a.path.error) v["error"] = error_json(*a.path.error);
  return v;
}

Json::Value to_json(const AnalysisReport& report) {
  Json::Value v(Json::objectValue);
  v["network"] = to_json(report.graph);
  v["query_time_ms"] = report.query_time_ms;
  v["from_cache"] = report.from_cache;
  if (report.error) v["error"] = error_json(*report.error);

  Json::Value bridges(Json::arrayValue);
  for (const auto& id : report.bridges) bridges.append(id);
  v["bridges"] = bridges;

  Json::Value communities(Json::arrayValue);
  for (const auto& c : report.communities) {
    Json::Value cj(Json::objectValue);
    Json::Value members(Json::arrayValue);
    for (const auto& id : c.entity_ids) members.append(id);
    cj["entities"] = members;
    cj["edge_count"] = c.edge_count;
    cj["density"] = c.density;
    cj["average_confidence"] = c.average_confidence;
    communities.append(cj);
  }
  v["communities"] = communities;

  Json::Value hubs(Json::arrayValue);
  for (const auto& h : report.hubs) {
    Json::Value hj(Json::objectValue);
    hj["entity_id"] = h.entity_id;
    hj["name"] = h.name;
    hj["type"] = std::string(to_string(h.type));
    hj["total_connections"] = h.total_connections;
    hj["outgoing_connections"] = h.outgoing_connections;
    hj["incoming_connections"] = h.incoming_connections;
    hj["average_confidence"] = h.average_confidence;
    hj["distinct_relationship_types"] = h.distinct_relationship_types;
    hj["risk_score"] = h.risk_score;
    hj["risk_level"] = std::string(to_string(h.risk_level));
    hj["hub_influence_score"] = h.hub_influence_score;
    hubs.append(hj);
  }
  v["hubs"] = hubs;

  if (report.propagation) {
    Json::Value pj(Json::objectValue);
    for (const auto& r : report.propagation->reached) pj[r.entity_id] = r.risk;
    v["propagated_risk"] = pj;
  }

  Json::Value cycles(Json::arrayValue);
  for (const auto& c : report.cycles) {
    Json::Value cj(Json::arrayValue);
    for (const auto& id : c.entities) cj.append(id);
    cycles.append(cj);
  }
  v["cycles"] = cycles;

  const auto& s = report.statistics;
  Json::Value sj(Json::objectValue);
  sj["total_entities"] = s.total_entities;
  sj["total_relationships"] = s.total_relationships;
  sj["density"] = s.density;
  sj["average_confidence"] = s.average_confidence;
  sj["verification_rate"] = s.verification_rate;
  sj["high_risk_relationship_count"] = s.high_risk_relationship_count;
  sj["risk_distribution"] = distribution_json(s.risk_distribution);
  sj["entity_type_distribution"] = distribution_json(s.entity_type_distribution);
  sj["relationship_type_distribution"] = distribution_json(s.relationship_type_distribution);
  Json::Value patterns(Json::objectValue);
  patterns["corporate_hierarchies"] = s.patterns.corporate_hierarchies;
  patterns["beneficial_ownership_chains"] = s.patterns.beneficial_ownership_chains;
  patterns["household_clusters"] = s.patterns.household_clusters;
  patterns["duplicate_entity_groups"] = s.patterns.duplicate_entity_groups;
  patterns["high_risk_networks"] = s.patterns.high_risk_networks;
  sj["patterns"] = patterns;
  v["statistics"] = sj;

  Json::Value risk(Json::objectValue);
  for (const auto& r : report.network_risk) {
    Json::Value rj(Json::objectValue);
    rj["base_risk"] = r.base_risk;
    rj["connection_risk_factor"] = r.connection_risk_factor;
    rj["network_risk_score"] = r.network_risk_score;
    rj["risk_level"] = std::string(to_string(r.risk_level));
    rj["high_risk_connections"] = r.high_risk_connections;
    rj["total_connections"] = r.total_connections;
    risk[r.entity_id] = rj;
  }
  v["network_risk"] = risk;
  v["recommendations"] = string_array(report.recommendations);

  if (report.layout) {
    Json::Value lj(Json::objectValue);
    lj["algorithm"] = std::string(to_string(report.layout->algorithm));
    Json::Value nodes(Json::arrayValue);
    for (const auto& n : report.layout->nodes) {
      Json::Value nj(Json::objectValue);
      nj["id"] = n.id;
      nj["x"] = n.x;
      nj["y"] = n.y;
      nj["size"] = n.size;
      nj["color"] = n.color;
      nodes.append(nj);
    }
    lj["nodes"] = nodes;
    Json::Value edges(Json::arrayValue);
    for (const auto& e : report.layout->edges) {
      Json::Value ej(Json::objectValue);
      ej["id"] = e.id;
      ej["thickness"] = e.thickness;
      ej["color"] = e.color;
      edges.append(ej);
    }
    lj["edges"] = edges;
    v["layout"] = lj;
  }
  if (report.path) v["path"] = to_json(*report.path);
  return v;
}

std::string to_json_string(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

} // namespace amlnet::core
