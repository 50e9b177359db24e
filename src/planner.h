#pragma once

#include "dependency_graph.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace cascade {

// Raised when the graph fails validation; what() is the user-facing description.
class structural_error : public std::runtime_error {
 public:
  structural_error(graph_fault fault, std::string const &message);

  graph_fault const &fault() const { return fault_; }

 private:
  graph_fault fault_;
};

// The changed cell followed by everything downstream of it, in topological order with
// ties broken by display position. Validates the graph first.
std::vector<std::string> planner_plan(dependency_graph const &graph,
                                      std::string const &changed_id);

// Every cell in topological order (run-all).
std::vector<std::string> planner_plan_all(dependency_graph const &graph);

}  // namespace cascade
