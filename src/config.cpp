/*
  AnalysisConfig loading (jsoncpp) and logging setup (spdlog).
*/
#include "amlnet/core/config.hpp"

#include <spdlog/spdlog.h>

#include "amlnet/core/error.hpp"
#include "amlnet/core/json_io.hpp"

namespace amlnet::core {

namespace {
// Typed readers: absent keys keep the current value, wrong types throw.
void read(const Json::Value& obj, const char* section, const char* key, std::int32_t& out) {
  if (!obj.isMember(key)) return;
  const auto& v = obj[key];
  if (!v.isInt()) {
    throw ConfigError(std::string(section) + "." + key + " must be an integer");
  }
  out = v.asInt();
}

void read(const Json::Value& obj, const char* section, const char* key, double& out) {
  if (!obj.isMember(key)) return;
  const auto& v = obj[key];
  if (!v.isNumeric()) {
    throw ConfigError(std::string(section) + "." + key + " must be a number");
  }
  out = v.asDouble();
}

void read(const Json::Value& obj, const char* section, const char* key, bool& out) {
  if (!obj.isMember(key)) return;
  const auto& v = obj[key];
  if (!v.isBool()) {
    throw ConfigError(std::string(section) + "." + key + " must be a boolean");
  }
  out = v.asBool();
}

void read(const Json::Value& obj, const char* section, const char* key, std::string& out) {
  if (!obj.isMember(key)) return;
  const auto& v = obj[key];
  if (!v.isString()) {
    throw ConfigError(std::string(section) + "." + key + " must be a string");
  }
  out = v.asString();
}

const Json::Value& section(const Json::Value& root, const char* name) {
  static const Json::Value kEmpty(Json::objectValue);
  if (!root.isMember(name)) return kEmpty;
  const auto& v = root[name];
  if (!v.isObject()) throw ConfigError(std::string(name) + " must be an object");
  return v;
}

template <typename Options>
void check(const Options& opts, const char* name) {
  try {
    opts.validate();
  } catch (const InvalidRequest& e) {
    throw ConfigError(std::string(name) + ": " + e.what());
  }
}
} // namespace

NetworkQuery AnalysisConfig::make_query(const EntityId& center) const {
  NetworkQuery q;
  q.center_entity_id = center;
  q.max_depth = network_max_depth;
  q.min_confidence = network_min_confidence;
  q.max_entities = max_entities;
  q.max_relationships = max_relationships;
  return q;
}

void validate_config(const AnalysisConfig& cfg) {
  check(cfg.make_query("config"), "network");
  check(cfg.path, "path");
  check(cfg.communities, "communities");
  check(cfg.hubs, "hubs");
  check(cfg.propagation, "propagation");
  if (cfg.cache_ttl.count() < 0) throw ConfigError("cache.ttl_seconds must be >= 0");
  if (cfg.store_timeout.count() < 0) throw ConfigError("store.timeout_ms must be >= 0");
  if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off && cfg.log_level != "off") {
    throw ConfigError("logging.level: unknown level '" + cfg.log_level + "'");
  }
}

AnalysisConfig config_from_json(const Json::Value& root) {
  if (!root.isObject()) throw ConfigError("configuration root must be an object");
  AnalysisConfig cfg;

  const auto& net = section(root, "network");
  read(net, "network", "max_depth", cfg.network_max_depth);
  read(net, "network", "min_confidence", cfg.network_min_confidence);
  read(net, "network", "max_entities", cfg.max_entities);
  read(net, "network", "max_relationships", cfg.max_relationships);

  read(section(root, "path"), "path", "max_depth", cfg.path.max_depth);
  read(section(root, "centrality"), "centrality", "include_advanced", cfg.centrality.include_advanced);

  const auto& com = section(root, "communities");
  read(com, "communities", "min_community_size", cfg.communities.min_community_size);
  read(com, "communities", "resolution", cfg.communities.resolution);

  const auto& hubs = section(root, "hubs");
  read(hubs, "hubs", "min_connections", cfg.hubs.min_connections);
  read(hubs, "hubs", "include_risk_analysis", cfg.hubs.include_risk_analysis);
  read(hubs, "hubs", "max_results", cfg.hubs.max_results);

  const auto& prop = section(root, "propagation");
  read(prop, "propagation", "max_depth", cfg.propagation.max_depth);
  read(prop, "propagation", "propagation_factor", cfg.propagation.propagation_factor);
  read(prop, "propagation", "min_propagated_score", cfg.propagation.min_propagated_score);

  const auto& cyc = section(root, "cycles");
  read(cyc, "cycles", "max_cycle_length", cfg.cycles.max_cycle_length);
  read(cyc, "cycles", "max_cycles", cfg.cycles.max_cycles);

  const auto& cache = section(root, "cache");
  read(cache, "cache", "enabled", cfg.cache_enabled);
  std::int32_t ttl = static_cast<std::int32_t>(cfg.cache_ttl.count());
  read(cache, "cache", "ttl_seconds", ttl);
  std::int32_t entries = static_cast<std::int32_t>(cfg.cache_max_entries);
  read(cache, "cache", "max_entries", entries);
  if (ttl < 0 || entries < 0) throw ConfigError("cache ttl_seconds and max_entries must be >= 0");
  cfg.cache_ttl = std::chrono::seconds(ttl);
  cfg.cache_max_entries = static_cast<std::size_t>(entries);

  std::int32_t timeout = static_cast<std::int32_t>(cfg.store_timeout.count());
  read(section(root, "store"), "store", "timeout_ms", timeout);
  if (timeout < 0) throw ConfigError("store.timeout_ms must be >= 0");
  cfg.store_timeout = std::chrono::milliseconds(timeout);

  read(section(root, "execution"), "execution", "parallel", cfg.parallel);
  read(section(root, "logging"), "logging", "level", cfg.log_level);

  validate_config(cfg);
  return cfg;
}

AnalysisConfig load_config(const std::string& path) {
  auto cfg = config_from_json(parse_json_file(path));
  spdlog::debug("loaded analysis config from {}", path);
  return cfg;
}

void configure_logging(const std::string& level) {
  const auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") {
    throw ConfigError("unknown log level '" + level + "'");
  }
  spdlog::set_level(lvl);
  spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // namespace amlnet::core
