#include "tile_link/classify/classifier.hpp"
#include "tile_link/config/configuration.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/core/events.hpp"
#include "tile_link/core/utils.hpp"
#include "tile_link/image/grid.hpp"
#include "tile_link/io/actuator.hpp"
#include "tile_link/io/calibration.hpp"
#include "tile_link/io/capture.hpp"
#include "tile_link/io/templates.hpp"
#include "tile_link/runner/automation.hpp"
#include "tile_link/runner/run_logger.hpp"
#include "tile_link/solver/solver.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace tile_link;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRuntime = 1;

void print_json(const json &j) { std::cout << j.dump(2) << std::endl; }

config::Config load_config(const std::string &path) {
  config::Config cfg = config::Config::load(path);
  cfg.validate();
  return cfg;
}

fs::path config_base_dir(const std::string &config_path) {
  fs::path parent = fs::path(config_path).parent_path();
  return parent.empty() ? fs::current_path() : parent;
}

std::unique_ptr<io::FrameSource> make_frame_source(const config::Config &cfg,
                                                   const fs::path &base_dir) {
  if (cfg.capture.source == "command") {
    return std::make_unique<io::CommandCaptureSource>(
        cfg.capture.capture_command, cfg.board, fs::path(cfg.debug.debug_dir) / "capture");
  }
  fs::path image = cfg.capture.image_path;
  if (image.is_relative()) {
    image = base_dir / image;
  }
  return std::make_unique<io::ImageFileSource>(image, cfg.board);
}

// Accepts either [[...], ...] or {"board": [[...], ...]}
Board board_from_json(const json &j) {
  const json &rows = j.is_object() && j.contains("board") ? j.at("board") : j;
  if (!rows.is_array() || rows.empty() || !rows.at(0).is_array()) {
    throw ValidationError("board must be a non-empty array of rows");
  }
  const size_t n_rows = rows.size();
  const size_t n_cols = rows.at(0).size();
  Board board = Board::Zero(static_cast<Eigen::Index>(n_rows), static_cast<Eigen::Index>(n_cols));
  for (size_t r = 0; r < n_rows; ++r) {
    const json &row = rows.at(r);
    if (!row.is_array() || row.size() != n_cols) {
      throw ValidationError("board row " + std::to_string(r) + " has the wrong length");
    }
    for (size_t c = 0; c < n_cols; ++c) {
      if (!row.at(c).is_number_integer()) {
        throw ValidationError("board cell (" + std::to_string(r) + "," + std::to_string(c) +
                              ") is not an integer");
      }
      board(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row.at(c).get<int>();
    }
  }
  return board;
}

int run_command(const std::string &config_path, bool dry_run, std::optional<int> max_cycles) {
  config::Config cfg = config::Config::load(config_path);
  if (dry_run) {
    cfg.clicker.dry_run = true;
  }
  if (max_cycles) {
    cfg.runtime.max_cycles = *max_cycles;
  }
  cfg.validate();

  const fs::path base_dir = config_base_dir(config_path);
  const io::ReferenceSet refs = io::load_references(cfg.classifier, base_dir);

  core::EventEmitter events(core::get_run_id(), &std::cout);
  std::unique_ptr<runner::RunLogger> logger;
  if (cfg.debug.enabled) {
    logger = std::make_unique<runner::RunLogger>(cfg.debug.debug_dir, "run", events.run_id());
    events.set_log_file(logger->event_stream());
  }

  events.run_start({{"config_path", config_path},
                    {"config_sha256", core::sha256_file(config_path)},
                    {"mode", classifier_mode_to_string(cfg.classifier.classifier_mode())},
                    {"rows", cfg.board.rows},
                    {"cols", cfg.board.cols},
                    {"dry_run", cfg.clicker.dry_run}});
  for (const auto &message : io::reference_warnings(refs)) {
    events.warning(message);
  }

  try {
    auto source = make_frame_source(cfg, base_dir);
    // Dry-run lines go to stderr so stdout stays one JSON event per line
    io::ClickActuator actuator(cfg, &std::cerr);
    runner::AutomationResult result =
        runner::run_automation(cfg, refs, *source, actuator, events, logger.get());
    events.run_end(result.status == runner::kStatusCleared, result.status,
                   {{"cycles", result.cycles}, {"moves", result.moves}});
  } catch (const TileLinkError &e) {
    events.run_error(e.what());
    events.run_end(false, "error");
    return kExitRuntime;
  } catch (const cv::Exception &e) {
    events.run_error(e.what());
    events.run_end(false, "error");
    return kExitRuntime;
  }
  return kExitOk;
}

int classify_command(const std::string &config_path, const std::string &image_path,
                     const std::string &overlay_path) {
  const config::Config cfg = load_config(config_path);
  const io::ReferenceSet refs = io::load_references(cfg.classifier, config_base_dir(config_path));

  const cv::Mat frame = io::read_frame(image_path);
  const Classification result = classify::classify(frame, refs, cfg);

  if (!overlay_path.empty()) {
    const fs::path out(overlay_path);
    runner::save_debug_snapshot(image::draw_board_overlay(frame, result.board, cfg.board),
                                out.stem().string(),
                                out.parent_path().empty() ? fs::current_path() : out.parent_path());
  }

  print_json({{"board", core::board_to_json(result.board)},
              {"confidence", core::confidence_to_json(result.confidence)},
              {"unknown_cells",
               classify::count_uncertain_cells(result, cfg.classifier.match_threshold)}});
  return kExitOk;
}

int solve_command(const std::string &board_path) {
  json j;
  try {
    j = json::parse(core::read_text(board_path));
  } catch (const json::parse_error &e) {
    throw ValidationError("cannot parse board file " + board_path + ": " + e.what());
  }
  const Board board = board_from_json(j);
  const auto pair = solver::find_pair(board);
  if (!pair) {
    print_json(nullptr);
    return kExitOk;
  }
  print_json({{"pair", core::pair_to_json(*pair)},
              {"tile_id", board(pair->first.row, pair->first.col)}});
  return kExitOk;
}

int overlay_command(const std::string &config_path, const std::string &image_path) {
  const config::Config cfg = load_config(config_path);
  const cv::Mat frame = io::read_frame(image_path);
  const fs::path out =
      runner::save_debug_snapshot(image::draw_grid_overlay(frame, cfg.board), "grid_overlay",
                                  cfg.debug.debug_dir);
  print_json({{"overlay", out.string()}});
  return kExitOk;
}

int calibrate_command(const std::string &top_left, const std::string &bottom_right) {
  const CellRect roi =
      io::calibrate_from_corners(io::parse_point(top_left), io::parse_point(bottom_right));
  std::cout << io::format_roi_yaml(roi);
  return kExitOk;
}

int validate_command(const std::string &config_path) {
  const config::Config cfg = load_config(config_path);
  const io::ReferenceSet refs = io::load_references(cfg.classifier, config_base_dir(config_path));
  json labels = json::object();
  for (const auto &[id, name] : io::reference_labels(refs)) {
    labels[std::to_string(id)] = name;
  }
  print_json({{"valid", true},
              {"mode", classifier_mode_to_string(cfg.classifier.classifier_mode())},
              {"config_sha256", core::sha256_file(config_path)},
              {"references", labels},
              {"warnings", io::reference_warnings(refs)}});
  return kExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"tile_link - photographed matching-puzzle analyzer"};
  app.require_subcommand(1);

  std::string config_path, image_path, overlay_path, board_path;
  std::string top_left, bottom_right;
  bool dry_run = false;
  int max_cycles = -1;

  auto run_cmd = app.add_subcommand("run", "Capture, classify, solve and click until done");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  run_cmd->add_flag("--dry-run", dry_run, "Print clicks instead of issuing them");
  run_cmd->add_option("--max-cycles", max_cycles, "Cycle limit (0 = unbounded)");

  auto classify_cmd = app.add_subcommand("classify", "Classify one captured frame");
  classify_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  classify_cmd->add_option("--image", image_path, "Board image")->required();
  classify_cmd->add_option("--overlay", overlay_path, "Write a labeled overlay PNG");

  auto solve_cmd = app.add_subcommand("solve", "Find the next legal pair of a board");
  solve_cmd->add_option("--board", board_path, "Board JSON file")->required();

  auto overlay_cmd = app.add_subcommand("overlay", "Save the grid overlay of a frame");
  overlay_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  overlay_cmd->add_option("--image", image_path, "Board image")->required();

  auto calibrate_cmd = app.add_subcommand("calibrate", "Board region from two corners");
  calibrate_cmd->add_option("--top-left", top_left, "X,Y")->required();
  calibrate_cmd->add_option("--bottom-right", bottom_right, "X,Y")->required();

  auto validate_cmd = app.add_subcommand("validate", "Validate config and references");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")->required();

  CLI11_PARSE(app, argc, argv);

  try {
    if (run_cmd->parsed()) {
      return run_command(config_path, dry_run,
                         max_cycles >= 0 ? std::optional<int>(max_cycles) : std::nullopt);
    }
    if (classify_cmd->parsed()) {
      return classify_command(config_path, image_path, overlay_path);
    }
    if (solve_cmd->parsed()) {
      return solve_command(board_path);
    }
    if (overlay_cmd->parsed()) {
      return overlay_command(config_path, image_path);
    }
    if (calibrate_cmd->parsed()) {
      return calibrate_command(top_left, bottom_right);
    }
    if (validate_cmd->parsed()) {
      return validate_command(config_path);
    }
  } catch (const std::exception &e) {
    std::cerr << cli_error_line(e) << std::endl;
    return cli_exit_code(e);
  }

  std::cout << app.help() << std::endl;
  return kExitRuntime;
}
