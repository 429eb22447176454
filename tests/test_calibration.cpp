#include "tile_link/config/configuration.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/io/calibration.hpp"

#include <catch2/catch_test_macros.hpp>

namespace io = tile_link::io;

TEST_CASE("calibration_accepts_corners_in_any_order") {
  auto roi = io::calibrate_from_corners({300, 400}, {100, 150});
  REQUIRE(roi.x == 100);
  REQUIRE(roi.y == 150);
  REQUIRE(roi.width == 200);
  REQUIRE(roi.height == 250);
}

TEST_CASE("calibration_rejects_degenerate_region") {
  REQUIRE_THROWS_AS(io::calibrate_from_corners({10, 10}, {10, 50}), tile_link::ValidationError);
  REQUIRE_THROWS_AS(io::calibrate_from_corners({10, 10}, {40, 10}), tile_link::ValidationError);
}

TEST_CASE("roi_yaml_loads_back_as_board_section") {
  const std::string text = io::format_roi_yaml({12, 34, 560, 420});
  auto cfg = tile_link::config::Config::from_yaml(YAML::Load(text));
  REQUIRE(cfg.board.board_x == 12);
  REQUIRE(cfg.board.board_y == 34);
  REQUIRE(cfg.board.board_w == 560);
  REQUIRE(cfg.board.board_h == 420);
}

TEST_CASE("parse_point_reads_x_comma_y") {
  auto p = io::parse_point(" 15, 27");
  REQUIRE(p.x == 15);
  REQUIRE(p.y == 27);
  REQUIRE_THROWS_AS(io::parse_point("15"), tile_link::ValidationError);
  REQUIRE_THROWS_AS(io::parse_point("a,b"), tile_link::ValidationError);
  REQUIRE_THROWS_AS(io::parse_point("1,2x"), tile_link::ValidationError);
}
