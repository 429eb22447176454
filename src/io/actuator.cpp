#include "tile_link/io/actuator.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/core/utils.hpp"
#include "tile_link/image/grid.hpp"

#include <chrono>
#include <thread>

namespace tile_link::io {

ClickActuator::ClickActuator(const config::Config& cfg, std::ostream* out,
                             ClickFn click_fn, SleepFn sleep_fn)
    : board_(cfg.board),
      clicker_(cfg.clicker),
      out_(out),
      click_fn_(std::move(click_fn)),
      sleep_fn_(std::move(sleep_fn)) {
    if (!sleep_fn_) {
        sleep_fn_ = [](int ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        };
    }
}

void ClickActuator::click_point(const PixelPoint& point) {
    if (click_fn_) {
        click_fn_(point);
        return;
    }
    const std::string command = core::substitute_placeholders(
        clicker_.click_command, {{"x", std::to_string(point.x)}, {"y", std::to_string(point.y)}});
    const int status = core::run_shell_command(command);
    if (status != 0) {
        throw ActuationError("click command failed with status " + std::to_string(status) +
                             ": " + command);
    }
}

void ClickActuator::click_cell(const Cell& cell) {
    image::require_valid_cell(cell, board_);
    const PixelPoint p = image::cell_center_on_screen(cell, board_);
    if (clicker_.dry_run) {
        if (out_) {
            *out_ << "[dry-run] click_cell row=" << cell.row << " col=" << cell.col
                  << " -> x=" << p.x << " y=" << p.y << "\n";
        }
        return;
    }
    click_point(p);
}

void ClickActuator::click_pair(const Pair& pair) {
    click_cell(pair.first);
    if (clicker_.click_pause_ms > 0) {
        sleep_fn_(clicker_.click_pause_ms);
    }
    click_cell(pair.second);
    if (clicker_.post_click_wait_ms > 0) {
        sleep_fn_(clicker_.post_click_wait_ms);
    }
}

} // namespace tile_link::io
