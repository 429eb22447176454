#include "tile_link/core/errors.hpp"
#include "tile_link/core/utils.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <thread>

namespace core = tile_link::core;

TEST_CASE("substitute_placeholders_replaces_known_keys_only") {
  const std::string out = core::substitute_placeholders(
      "xdotool mousemove {x} {y} click 1 {other}", {{"x", "12"}, {"y", "34"}});
  REQUIRE(out == "xdotool mousemove 12 34 click 1 {other}");
}

TEST_CASE("glob_match_supports_alternatives_case_insensitively") {
  REQUIRE(core::glob_match("*.png;*.jpg", "tile.PNG"));
  REQUIRE(core::glob_match("*.png;*.jpg", "tile.jpg"));
  REQUIRE_FALSE(core::glob_match("*.png;*.jpg", "tile.bmp"));
  REQUIRE_FALSE(core::glob_match("*.png", "tilexpng"));
}

TEST_CASE("discover_files_returns_sorted_matches") {
  tile_link::test::TempDir dir("discover");
  core::write_text(dir.path() / "b.png", "b");
  core::write_text(dir.path() / "a.png", "a");
  core::write_text(dir.path() / "notes.txt", "n");

  auto files = core::discover_files(dir.path(), "*.png");
  REQUIRE(files.size() == 2);
  REQUIRE(files[0].filename() == "a.png");
  REQUIRE(files[1].filename() == "b.png");
  REQUIRE(core::discover_files(dir.path() / "missing", "*.png").empty());
}

TEST_CASE("sha256_of_known_input") {
  const std::string abc = "abc";
  std::vector<uint8_t> bytes(abc.begin(), abc.end());
  REQUIRE(core::sha256_bytes(bytes) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("read_text_of_missing_file_throws_io_error") {
  REQUIRE_THROWS_AS(core::read_text("/nonexistent/tile_link/file.txt"), tile_link::IOError);
}

TEST_CASE("string_helpers") {
  REQUIRE(core::trim("  a b \n") == "a b");
  REQUIRE((core::split("a,b,,c", ',') == std::vector<std::string>{"a", "b", "", "c"}));
  REQUIRE(core::join({"periodic", "low_confidence"}, ",") == "periodic,low_confidence");
  REQUIRE(core::join({}, ",").empty());
}

TEST_CASE("compute_worker_count_is_bounded_by_tasks") {
  REQUIRE(core::compute_worker_count(8, 1) == 1);
  REQUIRE(core::compute_worker_count(0, 10) == 1);
  const int hw = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  REQUIRE(core::compute_worker_count(64, 1000) <= hw);
  REQUIRE(core::compute_worker_count(2, 1000) == std::min(2, hw));
}

TEST_CASE("shell_quote_survives_spaces_and_quotes") {
  REQUIRE(core::shell_quote("a b") == "'a b'");
  REQUIRE(core::shell_quote("it's") == "'it'\\''s'");
  REQUIRE(core::run_shell_command("test " + core::shell_quote("x y") + " = 'x y'") == 0);
}

TEST_CASE("run_shell_command_reports_exit_status") {
  REQUIRE(core::run_shell_command("true") == 0);
  REQUIRE(core::run_shell_command("exit 3") == 3);
}

TEST_CASE("cli_errors_are_prefixed_and_mapped_to_exit_codes") {
  const tile_link::ConfigError config("missing board");
  REQUIRE(tile_link::cli_error_line(config) == "Error: Config error: missing board");
  REQUIRE(tile_link::cli_exit_code(config) == 2);
  REQUIRE(tile_link::cli_exit_code(tile_link::ValidationError("rows")) == 2);
  REQUIRE(tile_link::cli_exit_code(tile_link::TemplateError("no block.png")) == 2);
  REQUIRE(tile_link::cli_exit_code(tile_link::CaptureError("no display")) == 1);
  REQUIRE(tile_link::cli_error_line(std::runtime_error("boom")) == "Error: boom");
  REQUIRE(tile_link::cli_exit_code(std::runtime_error("boom")) == 1);
}
