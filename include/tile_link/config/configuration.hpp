#pragma once

#include "tile_link/core/types.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tile_link::config {

namespace fs = std::filesystem;

struct BoardConfig {
  // Capture region in screen coordinates
  int board_x = 0;
  int board_y = 0;
  int board_w = 0;
  int board_h = 0;
  int rows = 0;
  int cols = 0;
  // Explicit cell layout; cell_w/cell_h == 0 divides the region uniformly
  int cell_w = 0;
  int cell_h = 0;
  int gap_x = 0;
  int gap_y = 0;
};

struct ClassifierConfig {
  std::string mode = "anchors"; // anchors | catalog
  std::string templates_dir = "templates";

  // catalog mode
  float match_threshold = 0.75f;
  float min_margin_to_second_best = 0.05f;

  // anchors mode
  float block_match_threshold = 0.85f;
  float background_match_threshold = 0.8f; // reserved, not consulted
  float empty_marked_ratio_threshold = 0.5f;
  float empty_texture_threshold = 12.0f;
  float tile_similarity_threshold = 0.8f;
  std::vector<std::array<int, 2>> marked_hue_ranges{{0, 12}, {170, 179}};
  int marked_min_saturation = 80;
  int marked_min_value = 80;
  float center_crop_ratio = 0.6f;

  // Parsed mode; ValidationError for anything but anchors | catalog
  ClassifierMode classifier_mode() const;
};

struct RescanConfig {
  int full_rescan_every_n_moves = 5;
  int max_consecutive_failures = 4;
  int max_rescan_attempts = 2;
};

struct ClickerConfig {
  int click_pause_ms = 80;
  int post_click_wait_ms = 250;
  bool dry_run = true;
  std::string click_command = "xdotool mousemove {x} {y} click 1";
};

struct CaptureConfig {
  std::string source = "file"; // file | command
  std::string image_path;
  std::string capture_command =
      "import -window root -crop {w}x{h}+{x}+{y} +repage {out}";
};

struct DebugConfig {
  bool enabled = false;
  std::string debug_dir = "debug";
  bool snapshot_every_cycle = false;
};

struct RuntimeConfig {
  int parallel_workers = 1;
  int max_cycles = 0; // 0 = until cleared or stopped
};

struct Config {
  BoardConfig board;
  ClassifierConfig classifier;
  RescanConfig rescan;
  ClickerConfig clicker;
  CaptureConfig capture;
  DebugConfig debug;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace tile_link::config
