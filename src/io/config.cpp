#include "tile_link/config/configuration.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/core/utils.hpp"

namespace tile_link::config {

static void read_int_pairs(const YAML::Node& n, std::vector<std::array<int, 2>>& out) {
    if (!n || !n.IsSequence()) {
        return;
    }
    out.clear();
    for (const auto& item : n) {
        if (!item.IsSequence() || item.size() != 2) {
            throw ConfigError("hue ranges must be [lo, hi] pairs");
        }
        out.push_back({item[0].as<int>(), item[1].as<int>()});
    }
}

static void require_unit_interval(float v, const std::string& key) {
    if (!(v >= 0.0f && v <= 1.0f)) {
        throw ValidationError(key + " must be between 0.0 and 1.0");
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("YAML parse error in " + path.string() + ": " + e.what());
    }
    if (!node.IsMap()) {
        throw ConfigError("Config root must be a mapping");
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["board"]) {
            auto b = node["board"];
            if (b["board_x"]) cfg.board.board_x = b["board_x"].as<int>();
            if (b["board_y"]) cfg.board.board_y = b["board_y"].as<int>();
            if (b["board_w"]) cfg.board.board_w = b["board_w"].as<int>();
            if (b["board_h"]) cfg.board.board_h = b["board_h"].as<int>();
            if (b["rows"]) cfg.board.rows = b["rows"].as<int>();
            if (b["cols"]) cfg.board.cols = b["cols"].as<int>();
            if (b["cell_w"]) cfg.board.cell_w = b["cell_w"].as<int>();
            if (b["cell_h"]) cfg.board.cell_h = b["cell_h"].as<int>();
            if (b["gap_x"]) cfg.board.gap_x = b["gap_x"].as<int>();
            if (b["gap_y"]) cfg.board.gap_y = b["gap_y"].as<int>();
        }

        if (node["classifier"]) {
            auto c = node["classifier"];
            if (c["mode"]) cfg.classifier.mode = c["mode"].as<std::string>();
            if (c["templates_dir"]) cfg.classifier.templates_dir = c["templates_dir"].as<std::string>();
            if (c["match_threshold"]) cfg.classifier.match_threshold = c["match_threshold"].as<float>();
            if (c["min_margin_to_second_best"]) {
                cfg.classifier.min_margin_to_second_best = c["min_margin_to_second_best"].as<float>();
            }
            if (c["block_match_threshold"]) {
                cfg.classifier.block_match_threshold = c["block_match_threshold"].as<float>();
            }
            if (c["background_match_threshold"]) {
                cfg.classifier.background_match_threshold = c["background_match_threshold"].as<float>();
            }
            if (c["empty_marked_ratio_threshold"]) {
                cfg.classifier.empty_marked_ratio_threshold = c["empty_marked_ratio_threshold"].as<float>();
            }
            if (c["empty_texture_threshold"]) {
                cfg.classifier.empty_texture_threshold = c["empty_texture_threshold"].as<float>();
            }
            if (c["tile_similarity_threshold"]) {
                cfg.classifier.tile_similarity_threshold = c["tile_similarity_threshold"].as<float>();
            }
            read_int_pairs(c["marked_hue_ranges"], cfg.classifier.marked_hue_ranges);
            if (c["marked_min_saturation"]) {
                cfg.classifier.marked_min_saturation = c["marked_min_saturation"].as<int>();
            }
            if (c["marked_min_value"]) cfg.classifier.marked_min_value = c["marked_min_value"].as<int>();
            if (c["center_crop_ratio"]) cfg.classifier.center_crop_ratio = c["center_crop_ratio"].as<float>();
        }

        if (node["rescan"]) {
            auto r = node["rescan"];
            if (r["full_rescan_every_n_moves"]) {
                cfg.rescan.full_rescan_every_n_moves = r["full_rescan_every_n_moves"].as<int>();
            }
            if (r["max_consecutive_failures"]) {
                cfg.rescan.max_consecutive_failures = r["max_consecutive_failures"].as<int>();
            }
            if (r["max_rescan_attempts"]) cfg.rescan.max_rescan_attempts = r["max_rescan_attempts"].as<int>();
        }

        if (node["clicker"]) {
            auto k = node["clicker"];
            if (k["click_pause_ms"]) cfg.clicker.click_pause_ms = k["click_pause_ms"].as<int>();
            if (k["post_click_wait_ms"]) cfg.clicker.post_click_wait_ms = k["post_click_wait_ms"].as<int>();
            if (k["dry_run"]) cfg.clicker.dry_run = k["dry_run"].as<bool>();
            if (k["click_command"]) cfg.clicker.click_command = k["click_command"].as<std::string>();
        }

        if (node["capture"]) {
            auto p = node["capture"];
            if (p["source"]) cfg.capture.source = p["source"].as<std::string>();
            if (p["image_path"]) cfg.capture.image_path = p["image_path"].as<std::string>();
            if (p["capture_command"]) cfg.capture.capture_command = p["capture_command"].as<std::string>();
        }

        if (node["debug"]) {
            auto d = node["debug"];
            if (d["enabled"]) cfg.debug.enabled = d["enabled"].as<bool>();
            if (d["debug_dir"]) cfg.debug.debug_dir = d["debug_dir"].as<std::string>();
            if (d["snapshot_every_cycle"]) cfg.debug.snapshot_every_cycle = d["snapshot_every_cycle"].as<bool>();
        }

        if (node["runtime"]) {
            auto rt = node["runtime"];
            if (rt["parallel_workers"]) cfg.runtime.parallel_workers = rt["parallel_workers"].as<int>();
            if (rt["max_cycles"]) cfg.runtime.max_cycles = rt["max_cycles"].as<int>();
        }
    } catch (const YAML::BadConversion& e) {
        throw ConfigError(std::string("wrong value type: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Emitter out;
    out << to_yaml();
    core::write_text(path, std::string(out.c_str()) + "\n");
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["board"]["board_x"] = board.board_x;
    node["board"]["board_y"] = board.board_y;
    node["board"]["board_w"] = board.board_w;
    node["board"]["board_h"] = board.board_h;
    node["board"]["rows"] = board.rows;
    node["board"]["cols"] = board.cols;
    node["board"]["cell_w"] = board.cell_w;
    node["board"]["cell_h"] = board.cell_h;
    node["board"]["gap_x"] = board.gap_x;
    node["board"]["gap_y"] = board.gap_y;

    node["classifier"]["mode"] = classifier.mode;
    node["classifier"]["templates_dir"] = classifier.templates_dir;
    node["classifier"]["match_threshold"] = classifier.match_threshold;
    node["classifier"]["min_margin_to_second_best"] = classifier.min_margin_to_second_best;
    node["classifier"]["block_match_threshold"] = classifier.block_match_threshold;
    node["classifier"]["background_match_threshold"] = classifier.background_match_threshold;
    node["classifier"]["empty_marked_ratio_threshold"] = classifier.empty_marked_ratio_threshold;
    node["classifier"]["empty_texture_threshold"] = classifier.empty_texture_threshold;
    node["classifier"]["tile_similarity_threshold"] = classifier.tile_similarity_threshold;
    for (const auto& range : classifier.marked_hue_ranges) {
        YAML::Node pair;
        pair.push_back(range[0]);
        pair.push_back(range[1]);
        node["classifier"]["marked_hue_ranges"].push_back(pair);
    }
    node["classifier"]["marked_min_saturation"] = classifier.marked_min_saturation;
    node["classifier"]["marked_min_value"] = classifier.marked_min_value;
    node["classifier"]["center_crop_ratio"] = classifier.center_crop_ratio;

    node["rescan"]["full_rescan_every_n_moves"] = rescan.full_rescan_every_n_moves;
    node["rescan"]["max_consecutive_failures"] = rescan.max_consecutive_failures;
    node["rescan"]["max_rescan_attempts"] = rescan.max_rescan_attempts;

    node["clicker"]["click_pause_ms"] = clicker.click_pause_ms;
    node["clicker"]["post_click_wait_ms"] = clicker.post_click_wait_ms;
    node["clicker"]["dry_run"] = clicker.dry_run;
    node["clicker"]["click_command"] = clicker.click_command;

    node["capture"]["source"] = capture.source;
    node["capture"]["image_path"] = capture.image_path;
    node["capture"]["capture_command"] = capture.capture_command;

    node["debug"]["enabled"] = debug.enabled;
    node["debug"]["debug_dir"] = debug.debug_dir;
    node["debug"]["snapshot_every_cycle"] = debug.snapshot_every_cycle;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["max_cycles"] = runtime.max_cycles;

    return node;
}

void Config::validate() const {
    if (board.board_x < 0 || board.board_y < 0) {
        throw ValidationError("board.board_x and board.board_y must be >= 0");
    }
    if (board.board_w <= 0 || board.board_h <= 0) {
        throw ValidationError("board.board_w and board.board_h must be > 0");
    }
    if (board.rows <= 0 || board.cols <= 0) {
        throw ValidationError("board.rows and board.cols must be > 0");
    }
    if (board.cell_w < 0 || board.cell_h < 0 || board.gap_x < 0 || board.gap_y < 0) {
        throw ValidationError("board.cell_w/cell_h/gap_x/gap_y must be >= 0");
    }

    classifier.classifier_mode();  // throws on an unknown mode
    if (core::trim(classifier.templates_dir).empty()) {
        throw ValidationError("classifier.templates_dir must be a non-empty string");
    }
    require_unit_interval(classifier.match_threshold, "classifier.match_threshold");
    require_unit_interval(classifier.min_margin_to_second_best,
                          "classifier.min_margin_to_second_best");
    require_unit_interval(classifier.block_match_threshold, "classifier.block_match_threshold");
    require_unit_interval(classifier.background_match_threshold,
                          "classifier.background_match_threshold");
    require_unit_interval(classifier.empty_marked_ratio_threshold,
                          "classifier.empty_marked_ratio_threshold");
    require_unit_interval(classifier.tile_similarity_threshold,
                          "classifier.tile_similarity_threshold");
    if (!(classifier.empty_texture_threshold >= 0.0f)) {
        throw ValidationError("classifier.empty_texture_threshold must be >= 0");
    }
    if (classifier.marked_hue_ranges.empty()) {
        throw ValidationError("classifier.marked_hue_ranges must not be empty");
    }
    for (const auto& range : classifier.marked_hue_ranges) {
        if (range[0] < 0 || range[1] > 179 || range[0] > range[1]) {
            throw ValidationError("classifier.marked_hue_ranges entries must satisfy 0 <= lo <= hi <= 179");
        }
    }
    if (classifier.marked_min_saturation < 0 || classifier.marked_min_saturation > 255 ||
        classifier.marked_min_value < 0 || classifier.marked_min_value > 255) {
        throw ValidationError("classifier.marked_min_saturation/value must be in [0,255]");
    }
    if (!(classifier.center_crop_ratio > 0.0f) || classifier.center_crop_ratio > 1.0f) {
        throw ValidationError("classifier.center_crop_ratio must be in (0,1]");
    }

    if (rescan.full_rescan_every_n_moves <= 0) {
        throw ValidationError("rescan.full_rescan_every_n_moves must be > 0");
    }
    if (rescan.max_consecutive_failures <= 0) {
        throw ValidationError("rescan.max_consecutive_failures must be > 0");
    }
    if (rescan.max_rescan_attempts < 1) {
        throw ValidationError("rescan.max_rescan_attempts must be >= 1");
    }

    if (clicker.click_pause_ms < 0 || clicker.post_click_wait_ms < 0) {
        throw ValidationError("clicker.click_pause_ms and clicker.post_click_wait_ms must be >= 0");
    }
    if (!clicker.dry_run && core::trim(clicker.click_command).empty()) {
        throw ValidationError("clicker.click_command must be set unless clicker.dry_run is true");
    }

    if (capture.source == "file") {
        if (core::trim(capture.image_path).empty()) {
            throw ValidationError("capture.image_path must be set for capture.source 'file'");
        }
    } else if (capture.source == "command") {
        if (core::trim(capture.capture_command).empty()) {
            throw ValidationError("capture.capture_command must be set for capture.source 'command'");
        }
    } else {
        throw ValidationError("capture.source must be 'file' or 'command'");
    }

    if (core::trim(debug.debug_dir).empty()) {
        throw ValidationError("debug.debug_dir must be a non-empty string");
    }

    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 64) {
        throw ValidationError("runtime.parallel_workers must be in [1,64]");
    }
    if (runtime.max_cycles < 0) {
        throw ValidationError("runtime.max_cycles must be >= 0");
    }
}

ClassifierMode ClassifierConfig::classifier_mode() const {
    auto parsed = string_to_classifier_mode(mode);
    if (!parsed) {
        throw ValidationError("classifier.mode must be 'anchors' or 'catalog'");
    }
    return *parsed;
}

} // namespace tile_link::config
