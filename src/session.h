#pragma once

#include "dependency_graph.h"
#include "kernel.h"
#include "namespace_store.h"
#include "session_events.h"
#include "util.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cascade {

enum class cell_status { idle, running, success, error };

char const *cell_status_name(cell_status status);

struct cell {
  std::string id;
  std::string source;
  cell_status status{ cell_status::idle };
  std::string output_text;
  std::optional<std::string> rich_output;
  std::optional<std::string> error;

  std::optional<std::string> analysis_error;  // source does not parse
  bool structural_fault{ false };             // error above came from graph validation
  std::optional<std::size_t> trailing_expr_offset;
  std::set<std::string> committed_defines;  // symbols the last successful run published
};

struct session_cfg {
  kernel_cfg kernel;
  bool auto_run{ true };  // edits rerun the changed cell and its dependents
};

// Owns the notebook: cells, dependency graph, namespace and kernel. Edits mutate the
// graph on the caller's thread; runs happen one plan at a time on an executor thread.
class session : unmovable {
 public:
  explicit session(session_cfg cfg = {}, session_sink sink = {});
  ~session();

  // Throws std::invalid_argument if `id` is already taken.
  std::string cell_added(std::optional<std::size_t> position = std::nullopt,
                         std::optional<std::string> id = std::nullopt,
                         std::string source = {});

  // Unknown ids are created at the end of the notebook. Throws std::invalid_argument
  // for an empty id.
  void cell_edited(std::string const &id, std::string source);

  // Throws std::invalid_argument for unknown ids.
  void execute_cell(std::string const &id);

  bool cell_deleted(std::string const &id);

  // Stops the running cell and abandons the rest of its plan. False when idle.
  bool interrupt();

  void execute_all();
  void reset();

  // Blocks until no request is pending and nothing runs.
  void wait_idle();

  std::vector<cell> cells() const;  // display order
  std::optional<cell> find_cell(std::string const &id) const;
  namespace_store namespace_snapshot() const;

 private:
  struct request {
    std::optional<std::string> cell_id;  // run-all when absent
  };

  void executor_loop();
  void run_plan(std::unique_lock<std::mutex> &lock, request const &req);
  // Runs one planned cell with the lock released around the kernel call. Returns
  // nullopt when a reset made the result stale.
  std::optional<execution_result> run_cell(std::unique_lock<std::mutex> &lock,
                                           std::string const &id,
                                           std::uint64_t generation);

  void analyze_locked(cell &c);
  bool validate_locked(std::string const &trigger, std::vector<session_event> &events);
  void enqueue_locked(std::optional<std::string> cell_id);
  void requeue_deferred_locked();
  void apply_erasures_locked();
  std::string fresh_id_locked() const;
  void emit(session_event const &event);
  void emit(std::vector<session_event> const &events);

  session_sink sink_;
  std::mutex sink_mutex_;

  kernel kernel_;
  bool const auto_run_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::unordered_map<std::string, cell> cells_;
  dependency_graph graph_;
  namespace_store ns_;
  std::deque<request> queue_;
  std::set<std::string> pending_ids_;
  bool run_all_pending_{ false };
  std::set<std::string> deferred_ids_;  // dequeued while the graph was invalid
  bool deferred_all_{ false };
  std::vector<std::string> pending_erasures_;
  std::string running_cell_;
  bool busy_{ false };
  bool abandon_{ false };
  bool stop_{ false };
  bool executor_done_{ false };
  std::uint64_t generation_{ 0 };

  std::thread executor_;
};

}  // namespace cascade
