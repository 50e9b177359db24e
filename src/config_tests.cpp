#include "config.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace cascade {

TEST_CASE("config_load keeps defaults for unset keys") {
  auto const cfg{ config_load("", "cascade.lua") };
  CHECK(cfg.kernel.timeout == std::chrono::milliseconds{ 5000 });
  CHECK(cfg.kernel.max_output_bytes == 1024 * 1024);
  CHECK(cfg.kernel.rich.max_rows == 100);
  CHECK(cfg.kernel.rich.max_array_elements == 1000);
}

TEST_CASE("config_load reads every setting") {
  auto const cfg{ config_load(R"lua(
timeout_ms = 2 * 1000
max_output_bytes = 4096
max_rows = 20
max_array_elements = 400
)lua",
                              "cascade.lua") };
  CHECK(cfg.kernel.timeout == std::chrono::milliseconds{ 2000 });
  CHECK(cfg.kernel.max_output_bytes == 4096);
  CHECK(cfg.kernel.rich.max_rows == 20);
  CHECK(cfg.kernel.rich.max_array_elements == 400);
}

TEST_CASE("config_load overlays a base configuration") {
  session_cfg base;
  base.kernel.max_output_bytes = 77;
  auto const cfg{ config_load("timeout_ms = 900", "cascade.lua", base) };
  CHECK(cfg.kernel.timeout == std::chrono::milliseconds{ 900 });
  CHECK(cfg.kernel.max_output_bytes == 77);
}

TEST_CASE("config_load rejects bad values") {
  try {
    config_load("timeout_ms = 'soon'", "cascade.lua");
    FAIL("expected a type error");
  } catch (std::runtime_error const &e) {
    CHECK(std::string{ e.what() } == "cascade.lua: timeout_ms must be a number");
  }

  try {
    config_load("max_rows = 0", "cascade.lua");
    FAIL("expected a range error");
  } catch (std::runtime_error const &e) {
    CHECK(std::string{ e.what() } == "cascade.lua: max_rows must be positive");
  }
}

TEST_CASE("config_load reports script errors") {
  try {
    config_load("timeout_ms = ", "cascade.lua");
    FAIL("expected a script error");
  } catch (std::runtime_error const &e) {
    CHECK(std::string{ e.what() }.starts_with("Failed to execute config script: "));
  }

  CHECK_THROWS_AS(config_load("io.open('x')", "cascade.lua"), std::runtime_error);
}

TEST_CASE("config_load reads files") {
  auto const path{ std::filesystem::temp_directory_path() / "cascade_config_tests.lua" };
  {
    std::ofstream out{ path };
    out << "max_output_bytes = 512\n";
  }
  auto const cfg{ config_load(path) };
  std::filesystem::remove(path);
  CHECK(cfg.kernel.max_output_bytes == 512);

  CHECK_THROWS_AS(config_load(std::filesystem::path{ "/nonexistent/cascade.lua" }),
                  std::runtime_error);
}

}  // namespace cascade
