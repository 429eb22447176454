#include "tile_link/core/errors.hpp"
#include "tile_link/runner/automation.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace io = tile_link::io;
namespace runner = tile_link::runner;
using json = nlohmann::json;
using tile_link::Pair;
using tile_link::test::Look;
using tile_link::test::draw_cell;
using tile_link::test::draw_frame;
using tile_link::test::make_config;

namespace {

// Board whose tiles disappear when clicked
class FakeBoard : public io::FrameSource, public io::Actuator {
public:
  explicit FakeBoard(std::vector<std::vector<Look>> layout) : layout_(std::move(layout)) {}

  cv::Mat capture() override {
    ++captures;
    return draw_frame(layout_);
  }

  void click_pair(const Pair &pair) override {
    if (fail_clicks) {
      throw tile_link::ActuationError("pointer unavailable");
    }
    clicked.push_back(pair);
    layout_[pair.first.row][pair.first.col] = Look::EMPTY;
    layout_[pair.second.row][pair.second.col] = Look::EMPTY;
  }

  int captures = 0;
  bool fail_clicks = false;
  std::vector<Pair> clicked;

private:
  std::vector<std::vector<Look>> layout_;
};

io::ReferenceSet catalog() {
  io::TemplateCatalog c;
  c.templates.push_back(io::make_template(1, "a_hbar", draw_cell(Look::HBAR)));
  c.templates.push_back(io::make_template(2, "b_vbar", draw_cell(Look::VBAR)));
  c.templates.push_back(io::make_template(0, "background", draw_cell(Look::EMPTY)));
  c.templates.push_back(io::make_template(-1, "block", draw_cell(Look::BLOCK)));
  return c;
}

io::ReferenceSet anchors() {
  io::AnchorTemplates a;
  a.block = io::make_template(-1, "block", draw_cell(Look::BLOCK));
  a.background = io::make_template(0, "background", draw_cell(Look::EMPTY));
  return a;
}

std::vector<json> parse_events(const std::string &text) {
  std::istringstream in(text);
  std::vector<json> events;
  std::string line;
  while (std::getline(in, line)) {
    events.push_back(json::parse(line));
  }
  return events;
}

long count_type(const std::vector<json> &events, const std::string &type) {
  return std::count_if(events.begin(), events.end(),
                       [&](const json &e) { return e["type"] == type; });
}

} // namespace

TEST_CASE("automation_clears_solvable_board") {
  auto cfg = make_config(2, 3, "catalog");
  FakeBoard world({{Look::HBAR, Look::EMPTY, Look::HBAR},
                   {Look::VBAR, Look::BLOCK, Look::VBAR}});
  std::ostringstream out;
  tile_link::core::EventEmitter events("test", &out);

  auto result = runner::run_automation(cfg, catalog(), world, world, events);

  REQUIRE(result.status == runner::kStatusCleared);
  REQUIRE(result.moves == 2);
  REQUIRE(result.cycles == 3);
  REQUIRE(world.captures == 1);
  REQUIRE(world.clicked.size() == 2);
  REQUIRE((world.clicked[0] == Pair{{0, 0}, {0, 2}}));
  REQUIRE((world.clicked[1] == Pair{{1, 0}, {1, 2}}));
  REQUIRE(result.state.consecutive_failures == 0);

  auto lines = parse_events(out.str());
  REQUIRE(count_type(lines, "move_success") == 2);
  REQUIRE(count_type(lines, "pair_found") == 2);
  REQUIRE(count_type(lines, "full_rescan") == 0);
}

TEST_CASE("automation_in_anchor_mode_clusters_and_clears") {
  auto cfg = make_config(2, 3, "anchors");
  FakeBoard world({{Look::HBAR, Look::EMPTY, Look::HBAR},
                   {Look::VBAR, Look::BLOCK, Look::VBAR}});
  std::ostringstream out;
  tile_link::core::EventEmitter events("test", &out);

  auto result = runner::run_automation(cfg, anchors(), world, world, events);
  REQUIRE(result.status == runner::kStatusCleared);
  REQUIRE(result.moves == 2);
}

TEST_CASE("automation_stops_on_dead_board_after_max_failures") {
  auto cfg = make_config(2, 3, "catalog");
  cfg.rescan.max_consecutive_failures = 3;
  FakeBoard world({{Look::HBAR, Look::BLOCK, Look::VBAR},
                   {Look::VBAR, Look::BLOCK, Look::HBAR}});
  std::ostringstream out;
  tile_link::core::EventEmitter events("test", &out);

  auto result = runner::run_automation(cfg, catalog(), world, world, events);

  REQUIRE(result.status == runner::kStatusMaxFailures);
  REQUIRE(result.cycles == 3);
  REQUIRE(result.moves == 0);
  REQUIRE(result.state.consecutive_failures == 3);
  // every failure forces a recapture on the next cycle
  REQUIRE(world.captures == 3);

  auto lines = parse_events(out.str());
  REQUIRE(count_type(lines, "dead_board") == 3);
  auto rescan = std::find_if(lines.begin(), lines.end(),
                             [](const json &e) { return e["type"] == "full_rescan"; });
  REQUIRE(rescan != lines.end());
  REQUIRE((*rescan)["reasons"].dump() == R"(["failure_or_mismatch"])");
}

TEST_CASE("automation_counts_actuation_errors_as_failures") {
  auto cfg = make_config(2, 3, "catalog");
  cfg.rescan.max_consecutive_failures = 2;
  FakeBoard world({{Look::HBAR, Look::EMPTY, Look::HBAR},
                   {Look::VBAR, Look::BLOCK, Look::VBAR}});
  world.fail_clicks = true;
  std::ostringstream out;
  tile_link::core::EventEmitter events("test", &out);

  auto result = runner::run_automation(cfg, catalog(), world, world, events);

  REQUIRE(result.status == runner::kStatusMaxFailures);
  REQUIRE(result.moves == 0);
  REQUIRE(result.state.last_event == tile_link::runtime::RuntimeEvent::FAILURE);
  REQUIRE(count_type(parse_events(out.str()), "actuation_failed") == 2);
}

TEST_CASE("automation_honors_cycle_limit") {
  auto cfg = make_config(2, 3, "catalog");
  cfg.runtime.max_cycles = 1;
  FakeBoard world({{Look::HBAR, Look::EMPTY, Look::HBAR},
                   {Look::VBAR, Look::BLOCK, Look::VBAR}});
  std::ostringstream out;
  tile_link::core::EventEmitter events("test", &out);

  auto result = runner::run_automation(cfg, catalog(), world, world, events);
  REQUIRE(result.status == runner::kStatusCycleLimit);
  REQUIRE(result.cycles == 1);
  REQUIRE(result.moves == 1);
}

TEST_CASE("automation_rescans_periodically") {
  auto cfg = make_config(2, 3, "catalog");
  cfg.rescan.full_rescan_every_n_moves = 1;
  FakeBoard world({{Look::HBAR, Look::EMPTY, Look::HBAR},
                   {Look::VBAR, Look::BLOCK, Look::VBAR}});
  std::ostringstream out;
  tile_link::core::EventEmitter events("test", &out);

  auto result = runner::run_automation(cfg, catalog(), world, world, events);
  REQUIRE(result.status == runner::kStatusCleared);
  REQUIRE(world.captures == 3);

  auto lines = parse_events(out.str());
  REQUIRE(count_type(lines, "full_rescan") == 2);
  for (const auto &e : lines) {
    if (e["type"] == "full_rescan") {
      REQUIRE(e["reasons"].dump() == R"(["periodic"])");
    }
  }
}

TEST_CASE("automation_propagates_capture_errors") {
  struct BrokenSource : io::FrameSource {
    cv::Mat capture() override { throw tile_link::CaptureError("no display"); }
  } source;
  FakeBoard world({{Look::HBAR}});
  auto cfg = make_config(1, 1, "catalog");
  std::ostringstream out;
  tile_link::core::EventEmitter events("test", &out);

  REQUIRE_THROWS_AS(runner::run_automation(cfg, catalog(), source, world, events),
                    tile_link::CaptureError);
}

TEST_CASE("automation_writes_debug_snapshots") {
  tile_link::test::TempDir dir("automation_debug");
  auto cfg = make_config(2, 3, "catalog");
  cfg.debug.enabled = true;
  cfg.debug.snapshot_every_cycle = true;
  FakeBoard world({{Look::HBAR, Look::EMPTY, Look::HBAR},
                   {Look::VBAR, Look::BLOCK, Look::VBAR}});
  std::ostringstream out;
  tile_link::core::EventEmitter events("dbg", &out);
  runner::RunLogger logger(dir.path(), "run", "dbg");
  events.set_log_file(logger.event_stream());

  auto result = runner::run_automation(cfg, catalog(), world, world, events, &logger);
  REQUIRE(result.status == runner::kStatusCleared);

  int pngs = 0;
  for (const auto &entry : std::filesystem::directory_iterator(logger.run_dir())) {
    if (entry.path().extension() == ".png") ++pngs;
  }
  // initial + one per cycle
  REQUIRE(pngs == 1 + result.cycles);
  REQUIRE(std::filesystem::exists(logger.events_path()));
}

TEST_CASE("automation_retries_unresolved_cells_instead_of_clearing") {
  auto cfg = make_config(1, 3, "anchors");
  cfg.rescan.max_consecutive_failures = 2;
  // The lone square never finds a partner and stays unresolved
  FakeBoard world({{Look::HBAR, Look::HBAR, Look::SQUARE}});
  std::ostringstream out;
  tile_link::core::EventEmitter events("test", &out);

  auto result = runner::run_automation(cfg, anchors(), world, world, events);

  REQUIRE(result.status == runner::kStatusMaxFailures);
  REQUIRE(result.cycles == 2);
  REQUIRE(result.moves == 0);
  REQUIRE(world.clicked.empty());
  REQUIRE(result.state.consecutive_failures == 2);
  REQUIRE(result.last_classification.board(0, 2) == tile_link::kEmptyTile);

  auto lines = parse_events(out.str());
  REQUIRE(count_type(lines, "low_confidence") == 2);
  REQUIRE(count_type(lines, "move_success") == 0);
  auto low = std::find_if(lines.begin(), lines.end(),
                          [](const json &e) { return e["type"] == "low_confidence"; });
  REQUIRE(low != lines.end());
  REQUIRE((*low)["unknown_cells"].get<int>() == 1);
}
