#include "cmd_run.h"

#include "notebook.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace cascade {

void cmd_run::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("run", "Execute every cell of a notebook file") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("notebook", cfg_ptr->notebook_path, "Notebook file (cells split by -- %%)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_run::cmd_run(cmd_run::cfg cfg, session_cfg const &session)
    : cfg_{ std::move(cfg) }, session_cfg_{ session } {
  session_cfg_.auto_run = false;
}

bool cmd_run::execute() {
  auto const cells{ notebook_load(cfg_.notebook_path) };
  tui::debug("notebook %s: %zu cells", cfg_.notebook_path.string().c_str(), cells.size());

  std::mutex mutex;
  std::vector<session_events::structural_error> structural;

  session s{ session_cfg_, [&](session_event const &event) {
              std::lock_guard lock{ mutex };
              if (auto const *e{ std::get_if<session_events::structural_error>(&event) }) {
                structural.push_back(*e);
              }
            } };

  for (auto const &c : cells) { s.cell_added(std::nullopt, c.id, c.source); }
  s.execute_all();
  s.wait_idle();

  {
    std::lock_guard lock{ mutex };
    if (!structural.empty()) {
      tui::error("%s", structural.back().detail.c_str());
      return false;
    }
  }

  bool ok{ true };
  for (auto const &c : s.cells()) {
    tui::print_stdout("-- %%%% %s [%s]\n", c.id.c_str(), cell_status_name(c.status));
    if (!c.output_text.empty()) { tui::print_stdout("%s\n", c.output_text.c_str()); }
    if (c.status != cell_status::success) {
      ok = false;
      if (c.error) { tui::error("%s: %s", c.id.c_str(), c.error->c_str()); }
    }
  }
  return ok;
}

}  // namespace cascade
