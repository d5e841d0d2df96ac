/*
  AnalysisConfig: service-wide defaults loaded from JSON.

  Example document (every key optional; unknown keys are ignored):
    {
      "network":     {"max_depth": 2, "min_confidence": 0.3,
                      "max_entities": 100, "max_relationships": 200},
      "path":        {"max_depth": 6},
      "centrality":  {"include_advanced": true},
      "communities": {"min_community_size": 3, "resolution": 1.0},
      "hubs":        {"min_connections": 5, "include_risk_analysis": true, "max_results": 20},
      "propagation": {"max_depth": 3, "propagation_factor": 0.5, "min_propagated_score": 0.1},
      "cycles":      {"max_cycle_length": 6, "max_cycles": 10},
      "cache":       {"enabled": true, "ttl_seconds": 900, "max_entries": 256},
      "store":       {"timeout_ms": 0},
      "execution":   {"parallel": true},
      "logging":     {"level": "info"}
    }
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <json/json.h>

#include "amlnet/core/options.hpp"

namespace amlnet::core {

struct AnalysisConfig {
  // Defaults applied to NetworkQuery fields the caller leaves untouched.
  std::int32_t network_max_depth {2};
  Score network_min_confidence {0.3};
  std::int32_t max_entities {100};
  std::int32_t max_relationships {200};

  PathOptions path {};
  CentralityOptions centrality {};
  CommunityOptions communities {};
  HubOptions hubs {};
  PropagationOptions propagation {};
  CycleOptions cycles {};

  bool cache_enabled {true};
  std::chrono::seconds cache_ttl {900};
  std::size_t cache_max_entries {256};

  // 0 disables the per-request store deadline.
  std::chrono::milliseconds store_timeout {0};
  // Run the per-request analyzers concurrently via std::async.
  bool parallel {true};
  std::string log_level {"info"};

  // NetworkQuery for `center` populated from the defaults above.
  [[nodiscard]] NetworkQuery make_query(const EntityId& center) const;
};

// Throws ConfigError naming the first out-of-range setting.
void validate_config(const AnalysisConfig& cfg);

// Throws ConfigError on wrong value types or out-of-range values.
[[nodiscard]] AnalysisConfig config_from_json(const Json::Value& root);
// Throws ConfigError when the file cannot be read or parsed.
[[nodiscard]] AnalysisConfig load_config(const std::string& path);

// Sets the global spdlog level ("trace", "debug", "info", "warn", "error",
// "critical", "off") and the log pattern. Throws ConfigError for unknown levels.
void configure_logging(const std::string& level);

} // namespace amlnet::core
