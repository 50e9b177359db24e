#include "planner.h"

#include <map>
#include <set>
#include <unordered_map>

namespace cascade {

namespace {

void throw_if_invalid(dependency_graph const &graph) {
  if (auto fault{ graph.validate() }) {
    auto const message{ graph_fault_describe(*fault, graph) };
    throw structural_error{ std::move(*fault), message };
  }
}

// Kahn's algorithm over `subset`; the ready set is keyed by display position.
std::vector<std::string> topo_order(dependency_graph const &graph,
                                    std::set<std::string> const &subset) {
  std::unordered_map<std::string, std::size_t> in_degree;
  std::map<std::size_t, std::string> ready;

  for (auto const &id : subset) {
    std::size_t degree{ 0 };
    for (auto const &dep : graph.dependencies_of(id)) {
      if (subset.contains(dep)) { ++degree; }
    }
    in_degree[id] = degree;
    if (degree == 0) { ready.emplace(*graph.position_of(id), id); }
  }

  std::vector<std::string> plan;
  plan.reserve(subset.size());

  while (!ready.empty()) {
    auto node{ ready.extract(ready.begin()) };
    std::string id{ std::move(node.mapped()) };

    for (auto const &next : graph.dependents_of(id)) {
      if (!subset.contains(next)) { continue; }
      if (--in_degree[next] == 0) { ready.emplace(*graph.position_of(next), next); }
    }
    plan.push_back(std::move(id));
  }

  if (plan.size() != subset.size()) {
    throw std::logic_error("planner: cycle survived validation");
  }
  return plan;
}

}  // namespace

structural_error::structural_error(graph_fault fault, std::string const &message)
    : std::runtime_error{ message }, fault_{ std::move(fault) } {}

std::vector<std::string> planner_plan(dependency_graph const &graph,
                                      std::string const &changed_id) {
  if (!graph.contains(changed_id)) {
    throw std::invalid_argument("planner: unknown cell: " + changed_id);
  }
  throw_if_invalid(graph);

  auto subset{ graph.downstream_of(changed_id) };
  subset.insert(changed_id);
  return topo_order(graph, subset);
}

std::vector<std::string> planner_plan_all(dependency_graph const &graph) {
  throw_if_invalid(graph);
  std::set<std::string> const subset{ graph.order().begin(), graph.order().end() };
  return topo_order(graph, subset);
}

}  // namespace cascade
