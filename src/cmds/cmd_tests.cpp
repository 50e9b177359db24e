#include "cmd.h"

#include "doctest.h"

#include <chrono>
#include <type_traits>

namespace {

class test_cmd : public cascade::cmd {
 public:
  struct cfg : cascade::cmd_cfg<test_cmd> {
    bool result{ true };
  };

  test_cmd(cfg c, cascade::session_cfg const &session) : cfg_{ c }, session_{ session } {}
  bool execute() override { return cfg_.result; }

  cascade::session_cfg const &session() const { return session_; }

 private:
  cfg cfg_;
  cascade::session_cfg session_;
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  using config_type = test_cmd::cfg;
  using expected_command = test_cmd;
  using actual_command = config_type::cmd_t;
  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd factory creates command from cfg") {
  test_cmd::cfg cfg{};
  cfg.result = false;
  cascade::session_cfg session{};
  session.kernel.timeout = std::chrono::milliseconds{ 42 };

  auto cmd{ cascade::cmd::create(cfg, session) };
  REQUIRE(cmd);
  auto const *typed{ dynamic_cast<test_cmd *>(cmd.get()) };
  REQUIRE(typed);
  CHECK(typed->session().kernel.timeout == std::chrono::milliseconds{ 42 });
  CHECK_FALSE(cmd->execute());
}
