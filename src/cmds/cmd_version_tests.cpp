#include "cmds/cmd_version.h"

#include "doctest.h"

#include <type_traits>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  using config_type = cascade::cmd_version::cfg;
  using expected_command = cascade::cmd_version;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd_version executes") {
  auto cmd{ cascade::cmd::create(cascade::cmd_version::cfg{}, cascade::session_cfg{}) };
  CHECK(cmd->execute());
}
