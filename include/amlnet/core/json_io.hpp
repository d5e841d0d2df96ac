/* JSON (jsoncpp) snapshot loading and report rendering. */
#pragma once

#include <memory>
#include <string>

#include <json/json.h>

#include "amlnet/core/analysis_service.hpp"
#include "amlnet/core/graph_store.hpp"

namespace amlnet::core {

// Throw ConfigError with the parser's message on malformed input.
[[nodiscard]] Json::Value parse_json_string(const std::string& text);
[[nodiscard]] Json::Value parse_json_file(const std::string& path);

// Builds an in-memory store from
//   {"entities": [{"id", "name", "type", "risk_score", "risk_level"}, ...],
//    "relationships": [{"id", "source", "target", "type", "strength",
//                       "confidence", "verified", "active"}, ...]}
// Missing or unrecognized fields fall back to the data-quality defaults
// (name "Unknown", type unknown, risk 0.0, risk level from the score,
// relationship type unknown, strength possible, confidence 0.5, active true).
// Missing ids or endpoints throw ConfigError; duplicate relationship ids are
// skipped with a warning.
[[nodiscard]] std::shared_ptr<InMemoryGraphStore> store_from_json(const Json::Value& root);
[[nodiscard]] std::shared_ptr<InMemoryGraphStore> load_store_snapshot(const std::string& path);

[[nodiscard]] Json::Value to_json(const NetworkGraph& graph);
[[nodiscard]] Json::Value to_json(const PathAnalysis& analysis);
[[nodiscard]] Json::Value to_json(const AnalysisReport& report);

// Compact single-line rendering.
[[nodiscard]] std::string to_json_string(const Json::Value& value);

} // namespace amlnet::core
