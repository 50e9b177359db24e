#pragma once

#include "session.h"
#include "util.h"

#include <memory>

namespace cascade {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;

  // Returns false when the command ran but the notebook or its input failed.
  virtual bool execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, session_cfg const &session);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, session_cfg const &session) {
  return std::make_unique<typename config::cmd_t>(cfg, session);
}

}  // namespace cascade
