/*
  Pybind11 module exposing AmlNet-Core C++ APIs to the Python API layer.

  Notes:
    - Result structs are exposed read-only; request/option structs read-write.
    - Service calls release the GIL while the store is traversed.
    - Entity lists accept any Python sequence of str.
    - AnalysisReport.to_json() renders the JSON string the HTTP layer returns.
*/
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>

#include "amlnet/core/analysis_service.hpp"
#include "amlnet/core/config.hpp"
#include "amlnet/core/error.hpp"
#include "amlnet/core/graph_store.hpp"
#include "amlnet/core/json_io.hpp"
#include "amlnet/core/types.hpp"

namespace py = pybind11;
using namespace amlnet::core;

namespace {
template <typename T>
py::object error_or_none(const std::optional<T>& err) {
  if (!err) return py::none();
  return py::make_tuple(std::string(to_string(err->code)), err->message);
}
} // namespace

PYBIND11_MODULE(_amlnet_core, m) {
  m.doc() = "AmlNet-Core C++ bindings";

  py::register_exception<InvalidRequest>(m, "InvalidRequest", PyExc_ValueError);
  py::register_exception<ConfigError>(m, "ConfigError", PyExc_RuntimeError);

  py::enum_<EntityType>(m, "EntityType")
      .value("INDIVIDUAL", EntityType::Individual)
      .value("ORGANIZATION", EntityType::Organization)
      .value("UNKNOWN", EntityType::Unknown);

  py::enum_<RiskLevel>(m, "RiskLevel")
      .value("LOW", RiskLevel::Low)
      .value("MEDIUM", RiskLevel::Medium)
      .value("HIGH", RiskLevel::High)
      .value("CRITICAL", RiskLevel::Critical);

  py::enum_<RelationshipStrength>(m, "RelationshipStrength")
      .value("CONFIRMED", RelationshipStrength::Confirmed)
      .value("LIKELY", RelationshipStrength::Likely)
      .value("POSSIBLE", RelationshipStrength::Possible)
      .value("SUSPECTED", RelationshipStrength::Suspected);

  py::enum_<LayoutAlgorithm>(m, "LayoutAlgorithm")
      .value("FORCE", LayoutAlgorithm::Force)
      .value("HIERARCHICAL", LayoutAlgorithm::Hierarchical)
      .value("CIRCULAR", LayoutAlgorithm::Circular);

  // Relationship types travel as their snake_case names.
  m.def("relationship_type_risk_weight", [](const std::string& name) {
    auto t = parse_relationship_type(name);
    return relationship_type_risk_weight(t.value_or(RelationshipType::Unknown));
  }, py::arg("relationship_type"));
  m.def("categorize_risk", &categorize_risk, py::arg("score"));

  py::class_<EntityRecord>(m, "EntityRecord")
      .def(py::init([](std::string id, std::string name, EntityType type, double risk_score,
                       std::optional<RiskLevel> risk_level) {
        return EntityRecord{std::move(id), std::move(name), type, risk_score,
                            risk_level.value_or(categorize_risk(risk_score))};
      }),
        py::arg("id"), py::kw_only(), py::arg("name") = "Unknown",
        py::arg("type") = EntityType::Unknown, py::arg("risk_score") = 0.0,
        py::arg("risk_level") = py::none())
      .def_readonly("id", &EntityRecord::id)
      .def_readonly("name", &EntityRecord::name)
      .def_readonly("type", &EntityRecord::type)
      .def_readonly("risk_score", &EntityRecord::risk_score)
      .def_readonly("risk_level", &EntityRecord::risk_level);

  py::class_<GraphStore, std::shared_ptr<GraphStore>>(m, "GraphStore");

  py::class_<InMemoryGraphStore, GraphStore, std::shared_ptr<InMemoryGraphStore>>(m, "InMemoryGraphStore")
      .def(py::init<>())
      .def("add_entity", &InMemoryGraphStore::add_entity, py::arg("entity"))
      .def("add_relationship", [](InMemoryGraphStore& s, std::string id, std::string source,
                                  std::string target, const std::string& type,
                                  RelationshipStrength strength, double confidence,
                                  bool verified, bool active) {
        RelationshipEdge e;
        e.relationship_id = std::move(id);
        e.source_id = std::move(source);
        e.target_id = std::move(target);
        e.relationship_type = parse_relationship_type(type).value_or(RelationshipType::Unknown);
        e.strength = strength;
        e.confidence = confidence;
        e.verified = verified;
        e.active = active;
        return s.add_relationship(std::move(e));
      },
        py::arg("id"), py::arg("source"), py::arg("target"), py::kw_only(),
        py::arg("type") = "unknown", py::arg("strength") = RelationshipStrength::Possible,
        py::arg("confidence") = 0.5, py::arg("verified") = false, py::arg("active") = true)
      .def("remove_relationship", &InMemoryGraphStore::remove_relationship, py::arg("id"))
      .def("set_available", &InMemoryGraphStore::set_available, py::arg("available"))
      .def("num_entities", &InMemoryGraphStore::num_entities)
      .def("num_relationships", &InMemoryGraphStore::num_relationships);

  m.def("load_store_snapshot", &load_store_snapshot, py::arg("path"));
  m.def("store_from_json", [](const std::string& text) {
    return store_from_json(parse_json_string(text));
  }, py::arg("text"));

  py::class_<NetworkQuery>(m, "NetworkQuery")
      .def(py::init([](std::string center) {
        NetworkQuery q; q.center_entity_id = std::move(center); return q;
      }), py::arg("center_entity_id"))
      .def_readwrite("center_entity_id", &NetworkQuery::center_entity_id)
      .def_readwrite("max_depth", &NetworkQuery::max_depth)
      .def_readwrite("min_confidence", &NetworkQuery::min_confidence)
      .def_readwrite("only_verified", &NetworkQuery::only_verified)
      .def_readwrite("only_active", &NetworkQuery::only_active)
      .def_readwrite("include_entity_types", &NetworkQuery::include_entity_types)
      .def_readwrite("exclude_entity_types", &NetworkQuery::exclude_entity_types)
      .def_readwrite("max_entities", &NetworkQuery::max_entities)
      .def_readwrite("max_relationships", &NetworkQuery::max_relationships)
      .def_readwrite("layout_algorithm", &NetworkQuery::layout_algorithm)
      .def_property("relationship_types",
          [](const NetworkQuery& q) {
            std::vector<std::string> out;
            for (auto t : q.relationship_types) out.emplace_back(to_string(t));
            return out;
          },
          [](NetworkQuery& q, const std::vector<std::string>& names) {
            q.relationship_types.clear();
            for (const auto& n : names) {
              auto t = parse_relationship_type(n);
              if (!t) throw InvalidRequest("unknown relationship type '" + n + "'");
              q.relationship_types.push_back(*t);
            }
          })
      .def("validate", &NetworkQuery::validate);

  py::class_<AnalysisRequest>(m, "AnalysisRequest")
      .def(py::init([](NetworkQuery q, std::optional<std::string> path_target) {
        AnalysisRequest r; r.query = std::move(q); r.path_target = std::move(path_target); return r;
      }), py::arg("query"), py::kw_only(), py::arg("path_target") = py::none())
      .def_readwrite("query", &AnalysisRequest::query)
      .def_readwrite("include_centrality", &AnalysisRequest::include_centrality)
      .def_readwrite("include_communities", &AnalysisRequest::include_communities)
      .def_readwrite("include_hubs", &AnalysisRequest::include_hubs)
      .def_readwrite("include_risk_propagation", &AnalysisRequest::include_risk_propagation)
      .def_readwrite("include_cycles", &AnalysisRequest::include_cycles)
      .def_readwrite("include_layout", &AnalysisRequest::include_layout)
      .def_readwrite("path_target", &AnalysisRequest::path_target);

  py::class_<AnalysisConfig>(m, "AnalysisConfig")
      .def(py::init<>())
      .def_static("from_json", [](const std::string& text) {
        return config_from_json(parse_json_string(text));
      }, py::arg("text"))
      .def_static("load", &load_config, py::arg("path"))
      .def_readwrite("parallel", &AnalysisConfig::parallel)
      .def_readwrite("cache_enabled", &AnalysisConfig::cache_enabled)
      .def_readwrite("log_level", &AnalysisConfig::log_level);

  m.def("configure_logging", &configure_logging, py::arg("level"));

  py::class_<AnalysisReport>(m, "AnalysisReport")
      .def_property_readonly("ok", &AnalysisReport::ok)
      .def_property_readonly("error", [](const AnalysisReport& r) { return error_or_none(r.error); })
      .def_readonly("query_time_ms", &AnalysisReport::query_time_ms)
      .def_readonly("from_cache", &AnalysisReport::from_cache)
      .def_readonly("bridges", &AnalysisReport::bridges)
      .def_readonly("recommendations", &AnalysisReport::recommendations)
      .def_property_readonly("node_ids", [](const AnalysisReport& r) { return r.graph.node_ids(); })
      .def_property_readonly("communities", [](const AnalysisReport& r) {
        std::vector<std::vector<EntityId>> out;
        for (const auto& c : r.communities) out.push_back(c.entity_ids);
        return out;
      })
      .def_property_readonly("propagated_risk", [](const AnalysisReport& r) {
        return r.propagation ? r.propagation->scores() : std::unordered_map<EntityId, Score>{};
      })
      .def("to_json", [](const AnalysisReport& r) { return to_json_string(to_json(r)); });

  py::class_<NetworkAnalysisService>(m, "NetworkAnalysisService")
      .def(py::init([](std::shared_ptr<GraphStore> store, std::optional<AnalysisConfig> config) {
        return std::make_unique<NetworkAnalysisService>(std::move(store), config.value_or(AnalysisConfig{}));
      }), py::arg("store"), py::arg("config") = py::none())
      .def("analyze_network", [](NetworkAnalysisService& s, const AnalysisRequest& req) {
        py::gil_scoped_release release;
        return s.analyze_network(req);
      }, py::arg("request"))
      .def("find_path", [](NetworkAnalysisService& s, const std::string& src, const std::string& dst) {
        PathAnalysis a;
        {
          py::gil_scoped_release release;
          a = s.analyze_path(src, dst);
        }
        return to_json_string(to_json(a));
      }, py::arg("source"), py::arg("target"))
      .def("degrees_of_separation", [](NetworkAnalysisService& s, const std::string& a, const std::string& b) {
        py::gil_scoped_release release;
        return s.degrees_of_separation(a, b);
      }, py::arg("a"), py::arg("b"))
      .def("propagate_risk", [](NetworkAnalysisService& s, const std::string& source) {
        PropagationResult r;
        {
          py::gil_scoped_release release;
          r = s.propagate_risk(source);
        }
        return py::make_tuple(r.scores(), error_or_none(r.error));
      }, py::arg("source"))
      .def("detect_hubs", [](NetworkAnalysisService& s, const std::vector<std::string>& candidates) {
        HubResult r;
        {
          py::gil_scoped_release release;
          r = s.detect_hubs(candidates);
        }
        py::list hubs;
        for (const auto& h : r.hubs) {
          py::dict d;
          d["entity_id"] = h.entity_id;
          d["name"] = h.name;
          d["total_connections"] = h.total_connections;
          d["average_confidence"] = h.average_confidence;
          d["risk_score"] = h.risk_score;
          d["hub_influence_score"] = h.hub_influence_score;
          hubs.append(d);
        }
        return py::make_tuple(hubs, error_or_none(r.error));
      }, py::arg("candidates") = std::vector<std::string>{})
      .def("invalidate_cache", &NetworkAnalysisService::invalidate_cache)
      .def("invalidate_entity", &NetworkAnalysisService::invalidate_entity, py::arg("entity_id"))
      .def("cache_size", &NetworkAnalysisService::cache_size);
}
