#include "tile_link/core/errors.hpp"
#include "tile_link/core/events.hpp"
#include "tile_link/runner/run_logger.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace fs = std::filesystem;
namespace runner = tile_link::runner;
using json = nlohmann::json;

namespace {

std::vector<json> read_events(const fs::path &path) {
  std::istringstream in(tile_link::core::read_text(path));
  std::vector<json> events;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) events.push_back(json::parse(line));
  }
  return events;
}

} // namespace

TEST_CASE("run_logger_creates_run_dir_and_event_log") {
  tile_link::test::TempDir dir("logger");
  runner::RunLogger logger(dir.path(), "run", "abc123");
  REQUIRE(logger.run_dir() == dir.path() / "run_abc123");
  REQUIRE(fs::is_directory(logger.run_dir()));

  logger.log("hello");
  tile_link::core::EventEmitter events("abc123", nullptr, logger.event_stream());
  events.cycle_start(1, 0);

  auto lines = read_events(logger.events_path());
  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0]["type"].get<std::string>() == "log");
  REQUIRE(lines[0]["message"].get<std::string>() == "hello");
  REQUIRE(lines[1]["type"].get<std::string>() == "cycle_start");
  REQUIRE(lines[1]["run_id"].get<std::string>() == "abc123");
  REQUIRE(lines[1]["cycle"].get<int>() == 1);
  REQUIRE(lines[1].contains("ts"));
}

TEST_CASE("run_logger_saves_png_snapshots") {
  tile_link::test::TempDir dir("snapshots");
  runner::RunLogger logger(dir.path(), "run", "xyz");
  cv::Mat frame = tile_link::test::draw_cell(tile_link::test::Look::SQUARE);

  fs::path out = logger.save_snapshot(frame, "cycle_1");
  REQUIRE(fs::exists(out));
  REQUIRE(out.parent_path() == logger.run_dir());
  REQUIRE(out.extension() == ".png");
  REQUIRE(out.filename().string().rfind("cycle_1_", 0) == 0);
}

TEST_CASE("snapshot_names_replace_spaces") {
  tile_link::test::TempDir dir("snapshot_names");
  cv::Mat frame = tile_link::test::draw_cell(tile_link::test::Look::HBAR);
  fs::path out = runner::save_debug_snapshot(frame, "dead board", dir.path());
  REQUIRE(fs::exists(out));
  REQUIRE(out.filename().string().rfind("dead_board_", 0) == 0);
  REQUIRE(out.filename().string().find(' ') == std::string::npos);
}

TEST_CASE("empty_snapshot_is_io_error") {
  tile_link::test::TempDir dir("snapshot_empty");
  REQUIRE_THROWS_AS(runner::save_debug_snapshot(cv::Mat(), "x", dir.path()), tile_link::IOError);
}

TEST_CASE("event_emitter_writes_pair_and_board_json") {
  std::ostringstream out;
  tile_link::core::EventEmitter events("r1", &out);
  events.pair_found({{0, 0}, {1, 2}}, 4);

  json line = json::parse(out.str());
  REQUIRE(line["type"].get<std::string>() == "pair_found");
  REQUIRE(line["pair"].dump() == "[[0,0],[1,2]]");
  REQUIRE(line["tile_id"].get<int>() == 4);

  auto board = tile_link::core::board_to_json(tile_link::test::make_board({{1, -1}, {0, 2}}));
  REQUIRE(board.dump() == "[[1,-1],[0,2]]");
}

TEST_CASE("event_emitter_writes_warning_and_low_confidence") {
  std::ostringstream out;
  tile_link::core::EventEmitter events("r2", &out);
  events.warning("single template");
  events.low_confidence(3, 2, 1);

  std::istringstream in(out.str());
  std::string first, second;
  std::getline(in, first);
  std::getline(in, second);
  json warning = json::parse(first);
  json low = json::parse(second);
  REQUIRE(warning["type"].get<std::string>() == "warning");
  REQUIRE(warning["message"].get<std::string>() == "single template");
  REQUIRE(low["type"].get<std::string>() == "low_confidence");
  REQUIRE(low["unknown_cells"].get<int>() == 2);
  REQUIRE(low["consecutive_failures"].get<int>() == 1);
}
