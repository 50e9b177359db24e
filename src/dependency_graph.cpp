#include "dependency_graph.h"

#include "util.h"

#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <stdexcept>

namespace cascade {

void dependency_graph::insert(std::string const &id, std::optional<std::size_t> position) {
  if (nodes_.contains(id)) {
    throw std::invalid_argument("dependency_graph: cell already exists: " + id);
  }
  nodes_.emplace(id, node{});

  if (!position || *position >= order_.size()) {
    order_.push_back(id);
  } else {
    order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(*position), id);
  }
}

void dependency_graph::upsert(std::string const &id,
                              std::set<std::string> defines,
                              std::set<std::string> uses) {
  if (!nodes_.contains(id)) { insert(id); }
  auto &n{ nodes_.at(id) };
  n.defines = std::move(defines);
  n.uses = std::move(uses);
}

bool dependency_graph::remove(std::string const &id) {
  if (nodes_.erase(id) == 0) { return false; }
  order_.erase(std::find(order_.begin(), order_.end(), id));
  return true;
}

bool dependency_graph::contains(std::string const &id) const { return nodes_.contains(id); }

dependency_graph::node const &dependency_graph::node_at(std::string const &id) const {
  auto const it{ nodes_.find(id) };
  if (it == nodes_.end()) {
    throw std::out_of_range("dependency_graph: unknown cell: " + id);
  }
  return it->second;
}

bool dependency_graph::depends_on(node const &reader, node const &writer) const {
  // Both sets are ordered; walk them together.
  auto r{ reader.uses.begin() };
  auto w{ writer.defines.begin() };
  while (r != reader.uses.end() && w != writer.defines.end()) {
    if (*r < *w) {
      ++r;
    } else if (*w < *r) {
      ++w;
    } else {
      return true;
    }
  }
  return false;
}

std::set<std::string> const &dependency_graph::defines_of(std::string const &id) const {
  return node_at(id).defines;
}

std::set<std::string> const &dependency_graph::uses_of(std::string const &id) const {
  return node_at(id).uses;
}

std::optional<std::size_t> dependency_graph::position_of(std::string const &id) const {
  auto const it{ std::find(order_.begin(), order_.end(), id) };
  if (it == order_.end()) { return std::nullopt; }
  return static_cast<std::size_t>(it - order_.begin());
}

std::vector<std::string> dependency_graph::definers_of(std::string const &symbol) const {
  std::vector<std::string> result;
  for (auto const &id : order_) {
    if (nodes_.at(id).defines.contains(symbol)) { result.push_back(id); }
  }
  return result;
}

std::set<std::string> dependency_graph::dependencies_of(std::string const &id) const {
  auto const &reader{ node_at(id) };
  std::set<std::string> result;
  for (auto const &other : order_) {
    if (other != id && depends_on(reader, nodes_.at(other))) { result.insert(other); }
  }
  return result;
}

std::vector<std::string> dependency_graph::dependents_of(std::string const &id) const {
  auto const &writer{ node_at(id) };
  std::vector<std::string> result;
  for (auto const &other : order_) {
    if (other != id && depends_on(nodes_.at(other), writer)) { result.push_back(other); }
  }
  return result;
}

std::set<std::string> dependency_graph::downstream_of(std::string const &id) const {
  std::set<std::string> visited;
  std::deque<std::string> frontier{ id };
  while (!frontier.empty()) {
    auto const current{ std::move(frontier.front()) };
    frontier.pop_front();
    for (auto &next : dependents_of(current)) {
      if (next != id && visited.insert(next).second) { frontier.push_back(std::move(next)); }
    }
  }
  return visited;
}

std::optional<graph_fault> dependency_graph::validate() const {
  std::map<std::string, std::vector<std::string>> definers;
  for (auto const &id : order_) {
    for (auto const &symbol : nodes_.at(id).defines) { definers[symbol].push_back(id); }
  }

  duplicate_symbol_fault duplicates;
  for (auto &[symbol, cells] : definers) {
    if (cells.size() > 1) {
      duplicates.duplicates.push_back(
          duplicate_symbol{ .symbol = symbol, .cell_ids = std::move(cells) });
    }
  }
  if (!duplicates.duplicates.empty()) { return graph_fault{ std::move(duplicates) }; }

  // Depth-first over "reads from" edges, roots and neighbours in display order.
  enum class mark { unvisited, in_progress, done };
  std::unordered_map<std::string, mark> marks;
  std::vector<std::string> path;

  std::function<std::optional<std::vector<std::string>>(std::string const &)> visit{
    [&](std::string const &id) -> std::optional<std::vector<std::string>> {
      marks[id] = mark::in_progress;
      path.push_back(id);

      auto const &reader{ nodes_.at(id) };
      for (auto const &dep : order_) {
        if (dep == id || !depends_on(reader, nodes_.at(dep))) { continue; }

        auto const state{ marks[dep] };
        if (state == mark::in_progress) {
          auto const start{ std::find(path.begin(), path.end(), dep) };
          std::vector<std::string> cycle{ start, path.end() };
          cycle.push_back(dep);
          return cycle;
        }
        if (state == mark::unvisited) {
          if (auto cycle{ visit(dep) }) { return cycle; }
        }
      }

      path.pop_back();
      marks[id] = mark::done;
      return std::nullopt;
    }
  };

  for (auto const &id : order_) {
    if (marks[id] != mark::unvisited) { continue; }
    if (auto cycle{ visit(id) }) {
      return graph_fault{ circular_dependency_fault{ .cycle = std::move(*cycle) } };
    }
  }

  return std::nullopt;
}

char const *graph_fault_kind(graph_fault const &fault) {
  return std::visit(match{
                        [](duplicate_symbol_fault const &) { return "duplicate_symbol"; },
                        [](circular_dependency_fault const &) {
                          return "circular_dependency";
                        },
                    },
                    fault);
}

std::vector<std::string> graph_fault_cells(graph_fault const &fault,
                                           dependency_graph const &graph) {
  std::set<std::string> involved;
  std::visit(match{
                 [&](duplicate_symbol_fault const &f) {
                   for (auto const &d : f.duplicates) {
                     involved.insert(d.cell_ids.begin(), d.cell_ids.end());
                   }
                 },
                 [&](circular_dependency_fault const &f) {
                   involved.insert(f.cycle.begin(), f.cycle.end());
                 },
             },
             fault);

  std::vector<std::string> result;
  for (auto const &id : graph.order()) {
    if (involved.contains(id)) { result.push_back(id); }
  }
  return result;
}

namespace {

std::string cell_label(dependency_graph const &graph, std::string const &id) {
  if (auto const pos{ graph.position_of(id) }) { return "cell " + std::to_string(*pos + 1); }
  return id;
}

}  // namespace

std::string graph_fault_describe(graph_fault const &fault, dependency_graph const &graph) {
  return std::visit(
      match{
          [&](duplicate_symbol_fault const &f) {
            std::string out{ "Each symbol must be defined in exactly one cell." };
            for (auto const &d : f.duplicates) {
              out += "\nSymbol '" + d.symbol + "' is defined in multiple cells: ";
              for (std::size_t i{ 0 }; i < d.cell_ids.size(); ++i) {
                if (i) { out += ", "; }
                out += cell_label(graph, d.cell_ids[i]);
              }
            }
            return out;
          },
          [&](circular_dependency_fault const &f) {
            std::string out{ "Circular dependency detected: " };
            for (std::size_t i{ 0 }; i < f.cycle.size(); ++i) {
              if (i) { out += " -> "; }
              out += cell_label(graph, f.cycle[i]);
            }
            return out;
          },
      },
      fault);
}

}  // namespace cascade
