#include "session.h"

#include "planner.h"
#include "symbol_extract.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace cascade {
namespace {

constexpr std::size_t kCellIdDigits{ 8 };
constexpr std::chrono::milliseconds kShutdownTick{ 10 };

std::string join_ids(std::vector<std::string> const &ids) {
  std::string out;
  for (auto const &id : ids) {
    if (!out.empty()) { out += ','; }
    out += id;
  }
  return out;
}

execution_result failed_result(fault_kind kind, std::string message) {
  return { .status = execution_status::error,
           .output_text = {},
           .rich_output = std::nullopt,
           .error = execution_error{ kind, std::move(message) } };
}

}  // namespace

char const *cell_status_name(cell_status status) {
  switch (status) {
    case cell_status::idle: return "idle";
    case cell_status::running: return "running";
    case cell_status::success: return "success";
    case cell_status::error: return "error";
  }
  return "unknown";
}

session::session(session_cfg cfg, session_sink sink)
    : sink_{ std::move(sink) }, kernel_{ std::move(cfg.kernel) }, auto_run_{ cfg.auto_run } {
  executor_ = std::thread{ [this] { executor_loop(); } };
}

session::~session() {
  {
    std::lock_guard lock{ mutex_ };
    stop_ = true;
    queue_.clear();
  }
  work_cv_.notify_all();

  // A worker may start right after the stop flag is set; keep killing until the
  // executor has noticed.
  {
    std::unique_lock lock{ mutex_ };
    while (!executor_done_) {
      lock.unlock();
      kernel_.interrupt();
      lock.lock();
      idle_cv_.wait_for(lock, kShutdownTick);
    }
  }
  executor_.join();
}

std::string session::cell_added(std::optional<std::size_t> position,
                                std::optional<std::string> id,
                                std::string source) {
  std::vector<session_event> events;
  std::string new_id;
  {
    std::lock_guard lock{ mutex_ };
    if (id && id->empty()) { throw std::invalid_argument("cell id must not be empty"); }
    new_id = id ? *id : fresh_id_locked();
    if (cells_.contains(new_id)) {
      throw std::invalid_argument("cell '" + new_id + "' already exists");
    }

    graph_.insert(new_id, position);
    auto &stored{ cells_.emplace(new_id, cell{ .id = new_id, .source = std::move(source) })
                      .first->second };
    events.push_back(session_events::cell_added{ new_id, *graph_.position_of(new_id) });

    if (!stored.source.empty()) {
      analyze_locked(stored);
      if (validate_locked(new_id, events) && auto_run_) { enqueue_locked(new_id); }
    }
  }
  emit(events);
  return new_id;
}

void session::cell_edited(std::string const &id, std::string source) {
  std::vector<session_event> events;
  {
    std::lock_guard lock{ mutex_ };
    if (id.empty()) { throw std::invalid_argument("cell id must not be empty"); }
    auto it{ cells_.find(id) };
    if (it == cells_.end()) {
      graph_.insert(id);
      it = cells_.emplace(id, cell{ .id = id }).first;
      events.push_back(session_events::cell_added{ id, *graph_.position_of(id) });
    }

    it->second.source = std::move(source);
    analyze_locked(it->second);
    if (validate_locked(id, events) && auto_run_) { enqueue_locked(id); }
  }
  emit(events);
}

void session::execute_cell(std::string const &id) {
  std::vector<session_event> events;
  {
    std::lock_guard lock{ mutex_ };
    if (!cells_.contains(id)) { throw std::invalid_argument("unknown cell '" + id + "'"); }
    if (validate_locked(id, events)) { enqueue_locked(id); }
  }
  emit(events);
}

bool session::cell_deleted(std::string const &id) {
  std::vector<session_event> events;
  {
    std::lock_guard lock{ mutex_ };
    auto const it{ cells_.find(id) };
    if (it == cells_.end()) { return false; }

    if (running_cell_ == id) {
      abandon_ = true;
      kernel_.interrupt();
    }

    for (auto const &symbol : it->second.committed_defines) {
      pending_erasures_.push_back(symbol);
    }
    pending_ids_.erase(id);
    deferred_ids_.erase(id);
    std::erase_if(queue_, [&id](request const &r) { return r.cell_id == id; });

    graph_.remove(id);
    cells_.erase(it);
    if (running_cell_.empty()) { apply_erasures_locked(); }

    events.push_back(session_events::cell_deleted{ id });
    validate_locked(id, events);
  }
  emit(events);
  return true;
}

bool session::interrupt() {
  std::lock_guard lock{ mutex_ };
  if (!busy_) { return false; }
  abandon_ = true;
  kernel_.interrupt();
  return true;
}

void session::execute_all() {
  std::vector<session_event> events;
  {
    std::lock_guard lock{ mutex_ };
    if (validate_locked("*", events)) { enqueue_locked(std::nullopt); }
  }
  emit(events);
}

void session::reset() {
  std::lock_guard lock{ mutex_ };
  ++generation_;
  queue_.clear();
  pending_ids_.clear();
  run_all_pending_ = false;
  deferred_ids_.clear();
  deferred_all_ = false;
  if (busy_) {
    abandon_ = true;
    kernel_.interrupt();
  }

  ns_.clear();
  pending_erasures_.clear();
  for (auto &[id, c] : cells_) {
    c.status = cell_status::idle;
    c.output_text.clear();
    c.rich_output.reset();
    c.error.reset();
    c.structural_fault = false;
    c.committed_defines.clear();
  }
  tui::debug("session reset");
  if (!busy_) { idle_cv_.notify_all(); }
}

void session::wait_idle() {
  std::unique_lock lock{ mutex_ };
  idle_cv_.wait(lock, [this] { return executor_done_ || (queue_.empty() && !busy_); });
}

std::vector<cell> session::cells() const {
  std::lock_guard lock{ mutex_ };
  std::vector<cell> out;
  out.reserve(graph_.order().size());
  for (auto const &id : graph_.order()) { out.push_back(cells_.at(id)); }
  return out;
}

std::optional<cell> session::find_cell(std::string const &id) const {
  std::lock_guard lock{ mutex_ };
  auto const it{ cells_.find(id) };
  if (it == cells_.end()) { return std::nullopt; }
  return it->second;
}

namespace_store session::namespace_snapshot() const {
  std::lock_guard lock{ mutex_ };
  return ns_;
}

void session::executor_loop() {
  std::unique_lock lock{ mutex_ };
  while (true) {
    work_cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
    if (stop_) { break; }

    request const req{ std::move(queue_.front()) };
    queue_.pop_front();
    if (req.cell_id) {
      pending_ids_.erase(*req.cell_id);
    } else {
      run_all_pending_ = false;
    }

    busy_ = true;
    abandon_ = false;
    kernel_.clear_interrupt();  // requested before this plan started
    try {
      run_plan(lock, req);
    } catch (std::exception const &e) {
      if (!lock.owns_lock()) { lock.lock(); }
      tui::error("executor: %s", e.what());
    }
    running_cell_.clear();
    busy_ = false;
    if (queue_.empty()) { idle_cv_.notify_all(); }
  }

  busy_ = false;
  executor_done_ = true;
  idle_cv_.notify_all();
}

void session::run_plan(std::unique_lock<std::mutex> &lock, request const &req) {
  std::vector<std::string> plan;
  try {
    if (req.cell_id) {
      if (!graph_.contains(*req.cell_id)) { return; }
      plan = planner_plan(graph_, *req.cell_id);
    } else {
      plan = planner_plan_all(graph_);
    }
  } catch (structural_error const &e) {
    // The mutation that broke the graph has already reported it. The request runs once
    // the graph validates again.
    tui::debug("plan deferred: %s", e.what());
    if (req.cell_id) {
      deferred_ids_.insert(*req.cell_id);
    } else {
      deferred_all_ = true;
    }
    return;
  }

  std::string const trigger{ req.cell_id.value_or("*") };
  CASCADE_TRACE_PLAN_COMPUTED(trigger, join_ids(plan), plan.size());
  if (plan.empty()) { return; }

  auto const generation{ generation_ };
  lock.unlock();
  emit(session_events::plan_queued{ plan });
  lock.lock();

  for (std::size_t i{ 0 }; i < plan.size(); ++i) {
    if (stop_ || generation != generation_) { return; }
    if (!cells_.contains(plan[i])) { continue; }

    auto const result{ run_cell(lock, plan[i], generation) };
    if (!result) { return; }
    if (result->ok() && !abandon_) { continue; }

    std::vector<std::string> rest;
    for (std::size_t j{ i + 1 }; j < plan.size(); ++j) {
      auto const it{ cells_.find(plan[j]) };
      if (it == cells_.end()) { continue; }
      it->second.status = cell_status::idle;
      rest.push_back(plan[j]);
    }
    if (rest.empty()) { return; }

    CASCADE_TRACE_PLAN_ABANDONED(plan[i], rest.size());
    tui::debug("plan abandoned after %s (%zu cells)", plan[i].c_str(), rest.size());
    lock.unlock();
    emit(session_events::plan_abandoned{ plan[i], std::move(rest) });
    lock.lock();
    return;
  }
}

std::optional<execution_result> session::run_cell(std::unique_lock<std::mutex> &lock,
                                                  std::string const &id,
                                                  std::uint64_t generation) {
  apply_erasures_locked();

  cell &c{ cells_.at(id) };
  auto const syntax_error{ c.analysis_error };
  auto const ran_defines{ graph_.defines_of(id) };

  run_request req{ .cell_id = id,
                   .source = c.source,
                   .trailing_expr_offset = c.trailing_expr_offset,
                   .retired_symbols = {} };
  for (auto const &symbol : c.committed_defines) {
    if (graph_.definers_of(symbol).empty()) { req.retired_symbols.push_back(symbol); }
  }

  c.status = cell_status::running;
  running_cell_ = id;
  namespace_store working{ ns_ };
  lock.unlock();

  emit(session_events::execution_started{ id });

  execution_result result;
  {
    cell_run_trace_scope scope{ id };
    if (syntax_error) {
      result = failed_result(fault_kind::syntax, *syntax_error);
    } else {
      try {
        result = kernel_.run(req, working);
      } catch (std::exception const &e) {
        tui::error("cell %s: %s", id.c_str(), e.what());
        result = failed_result(fault_kind::worker_crash, std::string{ "WorkerCrash: " } + e.what());
      }
    }
    scope.status = execution_status_name(result.status);
  }

  lock.lock();
  running_cell_.clear();
  if (generation != generation_) { return std::nullopt; }

  if (auto const it{ cells_.find(id) }; it != cells_.end()) {
    auto &ran{ it->second };
    ran.status = result.ok() ? cell_status::success : cell_status::error;
    ran.output_text = result.output_text;
    ran.rich_output = result.rich_output;
    ran.structural_fault = false;
    if (result.error) {
      ran.error = result.error->message;
    } else {
      ran.error.reset();
    }
    if (result.ok()) {
      ran.committed_defines = ran_defines;
      ns_ = std::move(working);
    }
  }
  apply_erasures_locked();

  lock.unlock();
  emit(session_events::execution_result{ id, result });
  lock.lock();
  return result;
}

void session::analyze_locked(cell &c) {
  std::set<std::string> defines;
  std::set<std::string> uses;
  try {
    auto symbols{ symbol_extract(c.source) };
    defines = std::move(symbols.defines);
    uses = std::move(symbols.uses);
    c.trailing_expr_offset = symbols.trailing_expr_offset;
    c.analysis_error.reset();
    CASCADE_TRACE_CELL_ANALYZED(c.id, defines.size(), uses.size(), true);
  } catch (analysis_error const &e) {
    c.trailing_expr_offset.reset();
    c.analysis_error = std::string{ "SyntaxError: " } + e.what() + " (line " +
                       std::to_string(e.line()) + ")";
    CASCADE_TRACE_CELL_ANALYZED(c.id, 0, 0, false);
    tui::debug("cell %s: %s", c.id.c_str(), c.analysis_error->c_str());
  }
  graph_.upsert(c.id, std::move(defines), std::move(uses));
}

bool session::validate_locked(std::string const &trigger, std::vector<session_event> &events) {
  auto const fault{ graph_.validate() };
  if (!fault) {
    CASCADE_TRACE_GRAPH_VALIDATED(trigger, true, std::string{});
    for (auto &[id, c] : cells_) {
      if (!c.structural_fault) { continue; }
      c.structural_fault = false;
      c.status = cell_status::idle;
      c.error.reset();
    }
    requeue_deferred_locked();
    return true;
  }

  std::string const kind{ graph_fault_kind(*fault) };
  auto const detail{ graph_fault_describe(*fault, graph_) };
  auto involved{ graph_fault_cells(*fault, graph_) };
  CASCADE_TRACE_GRAPH_VALIDATED(trigger, false, kind);
  tui::debug("structural error: %s", detail.c_str());

  auto const mark{ [&](std::string const &id) {
    auto const it{ cells_.find(id) };
    if (it == cells_.end()) { return; }
    it->second.status = cell_status::error;
    it->second.error = detail;
    it->second.structural_fault = true;
  } };

  if (cells_.contains(trigger)) {
    mark(trigger);
  } else {
    for (auto const &id : involved) { mark(id); }
  }

  events.push_back(session_events::structural_error{ kind, detail, std::move(involved) });
  return false;
}

void session::enqueue_locked(std::optional<std::string> cell_id) {
  if (cell_id) {
    if (!pending_ids_.insert(*cell_id).second) {
      CASCADE_TRACE_REQUEST_COALESCED(*cell_id);
      return;
    }
  } else {
    if (run_all_pending_) {
      CASCADE_TRACE_REQUEST_COALESCED(std::string{ "*" });
      return;
    }
    run_all_pending_ = true;
  }
  queue_.push_back(request{ std::move(cell_id) });
  work_cv_.notify_one();
}

void session::requeue_deferred_locked() {
  if (deferred_all_) {
    deferred_all_ = false;
    deferred_ids_.clear();
    enqueue_locked(std::nullopt);
    return;
  }
  auto deferred{ std::move(deferred_ids_) };
  deferred_ids_.clear();
  for (auto const &id : deferred) {
    if (cells_.contains(id)) { enqueue_locked(id); }
  }
}

void session::apply_erasures_locked() {
  for (auto const &symbol : pending_erasures_) {
    if (graph_.definers_of(symbol).empty()) { ns_.erase(symbol); }
  }
  pending_erasures_.clear();
}

std::string session::fresh_id_locked() const {
  while (true) {
    auto id{ "cell-" + util_random_hex(kCellIdDigits) };
    if (!cells_.contains(id)) { return id; }
  }
}

void session::emit(session_event const &event) {
  std::lock_guard lock{ sink_mutex_ };
  if (sink_) { sink_(event); }
}

void session::emit(std::vector<session_event> const &events) {
  if (events.empty()) { return; }
  std::lock_guard lock{ sink_mutex_ };
  if (!sink_) { return; }
  for (auto const &event : events) { sink_(event); }
}

}  // namespace cascade
