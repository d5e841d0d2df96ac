/*
  StoreContext and adapter-independent helpers over the GraphStore contract.
*/
#include "amlnet/core/graph_store.hpp"

#include <unordered_set>

namespace amlnet::core {

StoreContext StoreContext::with_timeout(std::chrono::milliseconds timeout) {
  StoreContext ctx;
  ctx.deadline = Clock::now() + timeout;
  ctx.cancelled = std::make_shared<std::atomic<bool>>(false);
  return ctx;
}

std::optional<Error> StoreContext::check(const char* operation) const {
  if (is_cancelled()) {
    return Error{ErrorCode::Cancelled, std::string(operation) + ": request cancelled"};
  }
  if (expired()) {
    return Error{ErrorCode::StoreTimeout, std::string(operation) + ": deadline exceeded"};
  }
  return std::nullopt;
}

StoreResult<std::vector<RelationshipEdge>> collect_incident_edges(
    GraphStore& store, std::span<const EntityId> ids,
    const RelationshipFilter& filter, const StoreContext& ctx) {
  using Result = StoreResult<std::vector<RelationshipEdge>>;
  std::vector<RelationshipEdge> out;
  std::unordered_set<RelationshipId> seen;
  for (const auto& id : ids) {
    auto hop = store.bounded_traversal(id, 1, filter, ctx);
    if (!hop.ok()) return Result{{}, hop.error};
    for (auto& te : hop.value) {
      if (seen.insert(te.edge.relationship_id).second) out.push_back(std::move(te.edge));
    }
  }
  return Result::success(std::move(out));
}

} // namespace amlnet::core
