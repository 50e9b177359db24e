#pragma once

#include "namespace_store.h"
#include "rich_output.h"
#include "util.h"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cascade {

enum class execution_status { success, error, interrupted };

enum class fault_kind {
  syntax,
  unresolved_symbol,
  runtime,
  namespace_error,
  timeout,
  interrupted,
  worker_crash,
};

char const *execution_status_name(execution_status status);  // "success", ...
char const *fault_kind_name(fault_kind kind);                // "TimeoutError", ...

struct execution_error {
  fault_kind kind;
  std::string message;  // full rendering: "RuntimeError: boom (line 3)"
};

struct execution_result {
  execution_status status{ execution_status::success };
  std::string output_text;
  std::optional<std::string> rich_output;  // JSON
  std::optional<execution_error> error;

  bool ok() const { return status == execution_status::success; }
};

struct kernel_cfg {
  std::chrono::milliseconds timeout{ 5000 };
  std::size_t max_output_bytes{ 1024 * 1024 };
  rich_limits rich;
};

struct run_request {
  std::string cell_id;
  std::string source;
  std::optional<std::size_t> trailing_expr_offset;  // executed as `return <expr>`
  std::vector<std::string> retired_symbols;         // removed from the namespace first
};

// Runs cells in forked worker processes. The namespace is copied into the worker and
// replaced only when the worker reports success; timeouts, faults, interrupts and
// crashes leave it untouched. Every run uses a fresh worker.
class kernel : unmovable {
 public:
  explicit kernel(kernel_cfg cfg = {});

  // Blocks until the worker finishes, faults, crashes, times out or is interrupted.
  // Throws std::system_error if the worker cannot be started.
  execution_result run(run_request const &request,
                       namespace_store &ns,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Kills the in-flight worker. The request is latched: a run that has not forked its
  // worker yet returns interrupted instead. Returns false when nothing is running.
  bool interrupt();

  // Drops a latched interrupt that no run has consumed.
  void clear_interrupt();

  bool busy() const;
  kernel_cfg const &cfg() const { return cfg_; }

 private:
  kernel_cfg cfg_;
  mutable std::mutex mutex_;
  int active_pid_{ -1 };
  bool interrupt_requested_{ false };
};

}  // namespace cascade
