#include "kernel.h"

#include "kernel_worker.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <system_error>

#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cascade {
namespace {

constexpr int kSignalExitBase{ 128 };
constexpr std::chrono::milliseconds kPollTick{ 50 };
constexpr char kTruncationMarker[]{ "\n... output truncated" };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

struct child_exit {
  int exit_code;
  std::optional<int> signal;
};

child_exit wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result = ::waitpid(child, &status, 0);
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }

  if (WIFEXITED(status)) { return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt }; }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

struct pipe_state {
  int fd;
  std::string *sink;
  std::size_t limit;  // bytes kept; the rest is read and dropped
  bool overflowed;
  bool closed;
};

enum class drain_outcome { finished, deadline, interrupted };

std::string duration_text(std::chrono::milliseconds ms) {
  return std::to_string(ms.count()) + " ms";
}

std::string finish_output(std::string const &captured, bool truncated) {
  std::string out{ util_trim_trailing_newlines(captured) };
  if (truncated) { out += kTruncationMarker; }
  return out;
}

execution_result interrupted_result(std::string output) {
  return { .status = execution_status::interrupted,
           .output_text = std::move(output),
           .rich_output = std::nullopt,
           .error = execution_error{ fault_kind::interrupted,
                                     "InterruptedError: execution interrupted" } };
}

}  // namespace

char const *execution_status_name(execution_status status) {
  switch (status) {
    case execution_status::success: return "success";
    case execution_status::error: return "error";
    case execution_status::interrupted: return "interrupted";
  }
  return "unknown";
}

char const *fault_kind_name(fault_kind kind) {
  switch (kind) {
    case fault_kind::syntax: return "SyntaxError";
    case fault_kind::unresolved_symbol: return "UnresolvedSymbol";
    case fault_kind::runtime: return "RuntimeError";
    case fault_kind::namespace_error: return "NamespaceError";
    case fault_kind::timeout: return "TimeoutError";
    case fault_kind::interrupted: return "InterruptedError";
    case fault_kind::worker_crash: return "WorkerCrash";
  }
  return "UnknownError";
}

kernel::kernel(kernel_cfg cfg) : cfg_{ std::move(cfg) } {}

bool kernel::busy() const {
  std::lock_guard lock{ mutex_ };
  return active_pid_ != -1;
}

bool kernel::interrupt() {
  std::lock_guard lock{ mutex_ };
  interrupt_requested_ = true;
  if (active_pid_ == -1) { return false; }
  // The worker is reaped only after active_pid_ is cleared, so the pid is still ours.
  ::kill(active_pid_, SIGKILL);
  return true;
}

void kernel::clear_interrupt() {
  std::lock_guard lock{ mutex_ };
  interrupt_requested_ = false;
}

execution_result kernel::run(run_request const &request,
                             namespace_store &ns,
                             std::optional<std::chrono::milliseconds> timeout) {
  {
    std::lock_guard lock{ mutex_ };
    if (interrupt_requested_) {
      interrupt_requested_ = false;
      tui::debug("cell %s: interrupted before start", request.cell_id.c_str());
      return interrupted_result({});
    }
  }

  auto const budget{ timeout.value_or(cfg_.timeout) };
  if (!request.retired_symbols.empty()) {
    CASCADE_TRACE_SYMBOLS_RETIRED(request.cell_id, request.retired_symbols.size());
  }

  int capture_pipefd[2];
  if (::pipe(capture_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup capture_read{ capture_pipefd[0] };
  fd_cleanup capture_write{ capture_pipefd[1] };

  int result_pipefd[2];
  if (::pipe(result_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup result_read{ result_pipefd[0] };
  fd_cleanup result_write{ result_pipefd[1] };

  // Buffered output would otherwise be flushed a second time by the worker.
  std::fflush(nullptr);

  auto const start{ std::chrono::steady_clock::now() };
  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {  // worker exits in kernel_worker_main
    capture_read.release();
    result_read.release();
    kernel_worker_main(capture_write.get(), result_write.get(), request, ns, cfg_);
  }

  capture_write.release();
  result_write.release();

  {
    std::lock_guard lock{ mutex_ };
    active_pid_ = child;
  }
  CASCADE_TRACE_WORKER_SPAWNED(request.cell_id, child);
  tui::debug("cell %s: worker %d started", request.cell_id.c_str(), static_cast<int>(child));

  std::string captured;
  std::string result_bytes;
  std::array<pipe_state, 2> pipes{
    pipe_state{ capture_read.get(), &captured, cfg_.max_output_bytes, false, false },
    pipe_state{ result_read.get(), &result_bytes, std::string::npos, false, false },
  };

  auto const deadline{ start + budget };
  drain_outcome outcome{ drain_outcome::finished };

  try {
    std::array<pollfd, 2> poll_fds{};
    for (std::size_t i{ 0 }; i < pipes.size(); ++i) {
      poll_fds[i].fd = pipes[i].fd;
      poll_fds[i].events = POLLIN;
    }
    std::string chunk(65536, '\0');
    std::size_t closed_count{ 0 };

    while (closed_count < pipes.size()) {
      {
        std::lock_guard lock{ mutex_ };
        if (interrupt_requested_) {
          outcome = drain_outcome::interrupted;
          break;
        }
      }

      auto const now{ std::chrono::steady_clock::now() };
      if (now >= deadline) {
        outcome = drain_outcome::deadline;
        break;
      }
      auto const remaining{ std::chrono::ceil<std::chrono::milliseconds>(deadline - now) };
      int const wait_ms{ static_cast<int>(std::min(remaining, kPollTick).count()) };

      int const poll_result{ ::poll(poll_fds.data(), poll_fds.size(), wait_ms) };
      if (poll_result == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "poll failed");
      }

      for (std::size_t i{ 0 }; i < pipes.size(); ++i) {
        auto &p{ pipes[i] };
        if (p.closed || poll_fds[i].revents == 0) { continue; }
        if (poll_fds[i].revents & POLLNVAL) {
          throw std::runtime_error("poll failed on worker pipe");
        }

        ssize_t const read_bytes{ ::read(p.fd, chunk.data(), chunk.size()) };
        if (read_bytes == -1) {
          if (errno == EINTR) { continue; }
          throw std::system_error(errno, std::generic_category(), "read failed");
        }

        if (read_bytes == 0) {
          p.closed = true;
          ++closed_count;
          poll_fds[i].fd = -1;
          poll_fds[i].events = 0;
          continue;
        }

        auto const n{ static_cast<std::size_t>(read_bytes) };
        std::size_t const room{ p.limit - std::min(p.limit, p.sink->size()) };
        if (n > room) { p.overflowed = true; }
        p.sink->append(chunk.data(), std::min(n, room));
      }
    }
  } catch (...) {
    ::kill(child, SIGKILL);
    {
      std::lock_guard lock{ mutex_ };
      active_pid_ = -1;
    }
    wait_for_child(child);
    throw;
  }

  // An interrupt latched before the fork never reached the worker.
  if (outcome != drain_outcome::finished) { ::kill(child, SIGKILL); }

  bool interrupted{ false };
  {
    std::lock_guard lock{ mutex_ };
    active_pid_ = -1;
    interrupted = interrupt_requested_;
    interrupt_requested_ = false;
  }

  auto const exited{ wait_for_child(child) };
  auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start) };

  auto const output{ finish_output(captured, pipes[0].overflowed) };

  if (interrupted) {
    CASCADE_TRACE_WORKER_KILLED(request.cell_id, child, "interrupt");
    tui::debug("cell %s: worker %d interrupted", request.cell_id.c_str(), static_cast<int>(child));
    return interrupted_result(output);
  }

  if (outcome == drain_outcome::deadline) {
    CASCADE_TRACE_WORKER_KILLED(request.cell_id, child, "timeout");
    tui::debug("cell %s: worker %d timed out", request.cell_id.c_str(), static_cast<int>(child));
    return { .status = execution_status::error,
             .output_text = output,
             .rich_output = std::nullopt,
             .error = execution_error{ fault_kind::timeout,
                                       "TimeoutError: cell execution timed out after " +
                                           duration_text(budget) } };
  }

  CASCADE_TRACE_WORKER_EXITED(request.cell_id, child, exited.exit_code, elapsed.count());

  auto const crash{ [&](std::string why) {
    return execution_result{ .status = execution_status::error,
                             .output_text = output,
                             .rich_output = std::nullopt,
                             .error = execution_error{ fault_kind::worker_crash,
                                                       "WorkerCrash: " + why } };
  } };

  if (result_bytes.empty()) {
    if (exited.signal) {
      return crash("worker terminated by signal " + std::to_string(*exited.signal));
    }
    return crash("worker exited with code " + std::to_string(exited.exit_code) +
                 " before reporting a result");
  }

  worker_message message;
  namespace_store next;
  try {
    message = worker_message_decode(result_bytes);
    if (message.ok) { next = namespace_store::decode(message.namespace_bytes); }
  } catch (worker_protocol_error const &e) {
    return crash(e.what());
  } catch (namespace_decode_error const &e) {
    return crash(e.what());
  }

  if (!message.ok) {
    return { .status = execution_status::error,
             .output_text = output,
             .rich_output = std::nullopt,
             .error = execution_error{ message.kind, std::move(message.error) } };
  }

  ns = std::move(next);
  CASCADE_TRACE_NAMESPACE_COMMITTED(request.cell_id, ns.size(), message.namespace_bytes.size());
  tui::debug("cell %s: committed %zu globals (%s)",
             request.cell_id.c_str(),
             ns.size(),
             util_format_bytes(message.namespace_bytes.size()).c_str());

  std::string text{ output };
  if (!message.display.empty()) {
    if (!text.empty()) { text += '\n'; }
    text += message.display;
  }

  return { .status = execution_status::success,
           .output_text = std::move(text),
           .rich_output = std::move(message.rich_json),
           .error = std::nullopt };
}

}  // namespace cascade
