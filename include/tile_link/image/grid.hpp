#pragma once

#include "tile_link/config/configuration.hpp"
#include "tile_link/core/types.hpp"

#include <opencv2/core.hpp>

namespace tile_link::image {

// Throws ValidationError naming "row" or "col" when the cell is off the board.
void require_valid_cell(const Cell& cell, const config::BoardConfig& board);

// Cell rectangle inside a frame of frame_w x frame_h, clipped to the frame.
// With cell_w/cell_h set, the grid (cells plus gaps) is centered in the frame;
// otherwise the frame is divided uniformly.
CellRect cell_rect_in_frame(const Cell& cell, const config::BoardConfig& board,
                            int frame_w, int frame_h);

// Absolute screen rectangle / center of a cell, using the capture region.
CellRect cell_rect_on_screen(const Cell& cell, const config::BoardConfig& board);
PixelPoint cell_center_on_screen(const Cell& cell, const config::BoardConfig& board);

// Crop view of one cell (may be empty when the cell falls outside the frame)
cv::Mat crop_cell(const cv::Mat& frame, const Cell& cell, const config::BoardConfig& board);

// Converts BGRA / gray captures to 8-bit BGR; BGR input is returned as-is.
cv::Mat to_bgr(const cv::Mat& frame);

// Cell outlines (green) and centers (red) on a copy of the frame
cv::Mat draw_grid_overlay(const cv::Mat& frame, const config::BoardConfig& board);

// Grid overlay plus the classified id of each cell
cv::Mat draw_board_overlay(const cv::Mat& frame, const Board& board,
                           const config::BoardConfig& board_cfg);

} // namespace tile_link::image
