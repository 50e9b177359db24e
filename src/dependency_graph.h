#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cascade {

struct duplicate_symbol {
  std::string symbol;
  std::vector<std::string> cell_ids;  // display order
};

struct duplicate_symbol_fault {
  std::vector<duplicate_symbol> duplicates;  // sorted by symbol
};

struct circular_dependency_fault {
  std::vector<std::string> cycle;  // closed: first cell repeated at the end
};

using graph_fault = std::variant<duplicate_symbol_fault, circular_dependency_fault>;

// Symbol-level dependency graph over cells. Cell B depends on cell A when B uses a
// symbol A defines. Edges are derived from the symbol sets on every query, so an
// upsert is all it takes to rewire a cell.
class dependency_graph {
 public:
  // Inserts an empty cell at `position` in display order (appends when absent or past
  // the end). Throws std::invalid_argument if the id already exists.
  void insert(std::string const &id, std::optional<std::size_t> position = std::nullopt);

  // Replaces a cell's symbol sets; unknown ids are appended.
  void upsert(std::string const &id, std::set<std::string> defines, std::set<std::string> uses);

  bool remove(std::string const &id);
  bool contains(std::string const &id) const;

  std::optional<graph_fault> validate() const;

  // Every cell reachable through dependent edges, excluding `id` itself.
  std::set<std::string> downstream_of(std::string const &id) const;

  // Cells `id` reads from directly.
  std::set<std::string> dependencies_of(std::string const &id) const;

  // Cells reading from `id` directly, in display order.
  std::vector<std::string> dependents_of(std::string const &id) const;

  std::optional<std::size_t> position_of(std::string const &id) const;
  std::vector<std::string> const &order() const { return order_; }

  std::set<std::string> const &defines_of(std::string const &id) const;
  std::set<std::string> const &uses_of(std::string const &id) const;

  // Cells defining `symbol`, in display order.
  std::vector<std::string> definers_of(std::string const &symbol) const;

 private:
  struct node {
    std::set<std::string> defines;
    std::set<std::string> uses;
  };

  node const &node_at(std::string const &id) const;
  bool depends_on(node const &reader, node const &writer) const;

  std::unordered_map<std::string, node> nodes_;
  std::vector<std::string> order_;
};

// "duplicate_symbol" or "circular_dependency".
char const *graph_fault_kind(graph_fault const &fault);

// Cells involved in the fault, deduplicated, in display order.
std::vector<std::string> graph_fault_cells(graph_fault const &fault,
                                           dependency_graph const &graph);

// User-facing message naming cells by 1-based display number.
std::string graph_fault_describe(graph_fault const &fault, dependency_graph const &graph);

}  // namespace cascade
