#include "tile_link/core/errors.hpp"
#include "tile_link/io/actuator.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <vector>

namespace io = tile_link::io;
using tile_link::PixelPoint;
using tile_link::test::make_config;

TEST_CASE("dry_run_prints_clicks_and_still_waits") {
  auto cfg = make_config(2, 3);  // origin (100, 50), 40 px cells
  cfg.clicker.dry_run = true;
  cfg.clicker.click_pause_ms = 80;
  cfg.clicker.post_click_wait_ms = 250;

  std::ostringstream out;
  std::vector<PixelPoint> clicks;
  std::vector<int> sleeps;
  io::ClickActuator actuator(
      cfg, &out, [&](const PixelPoint &p) { clicks.push_back(p); },
      [&](int ms) { sleeps.push_back(ms); });

  actuator.click_pair({{0, 0}, {1, 2}});

  REQUIRE(out.str() == "[dry-run] click_cell row=0 col=0 -> x=120 y=70\n"
                       "[dry-run] click_cell row=1 col=2 -> x=200 y=110\n");
  REQUIRE(clicks.empty());
  REQUIRE((sleeps == std::vector<int>{80, 250}));
}

TEST_CASE("live_clicks_go_to_cell_centers") {
  auto cfg = make_config(2, 3);
  cfg.clicker.dry_run = false;
  cfg.clicker.click_pause_ms = 0;
  cfg.clicker.post_click_wait_ms = 0;

  std::vector<PixelPoint> clicks;
  std::vector<int> sleeps;
  io::ClickActuator actuator(
      cfg, nullptr, [&](const PixelPoint &p) { clicks.push_back(p); },
      [&](int ms) { sleeps.push_back(ms); });

  actuator.click_pair({{1, 0}, {0, 1}});
  REQUIRE(clicks.size() == 2);
  REQUIRE(clicks[0].x == 120);
  REQUIRE(clicks[0].y == 110);
  REQUIRE(clicks[1].x == 160);
  REQUIRE(clicks[1].y == 70);
  REQUIRE(sleeps.empty());
}

TEST_CASE("click_outside_board_is_validation_error") {
  auto cfg = make_config(2, 3);
  io::ClickActuator actuator(cfg, nullptr, nullptr, [](int) {});
  REQUIRE_THROWS_AS(actuator.click_cell({2, 0}), tile_link::ValidationError);
}

TEST_CASE("failing_click_command_is_actuation_error") {
  auto cfg = make_config(1, 1);
  cfg.clicker.dry_run = false;
  cfg.clicker.click_command = "exit 1 # {x} {y}";
  io::ClickActuator actuator(cfg, nullptr, nullptr, [](int) {});
  REQUIRE_THROWS_AS(actuator.click_cell({0, 0}), tile_link::ActuationError);
}

TEST_CASE("click_command_placeholders_are_filled") {
  tile_link::test::TempDir dir("clicks");
  auto cfg = make_config(1, 1);
  cfg.clicker.dry_run = false;
  cfg.clicker.click_command = "echo {x} {y} >> " + (dir.path() / "clicks.txt").string();
  io::ClickActuator actuator(cfg, nullptr, nullptr, [](int) {});

  actuator.click_cell({0, 0});
  REQUIRE(tile_link::core::read_text(dir.path() / "clicks.txt") == "120 70\n");
}
