#include "tile_link/image/grid.hpp"
#include "tile_link/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace tile_link::image {

namespace {

int round_div(long num, long den) {
    return static_cast<int>(std::lround(static_cast<double>(num) / static_cast<double>(den)));
}

CellRect clip_rect(const CellRect& r, int frame_w, int frame_h) {
    int x0 = std::max(0, r.x);
    int y0 = std::max(0, r.y);
    int x1 = std::min(frame_w, r.x + r.width);
    int y1 = std::min(frame_h, r.y + r.height);
    if (x1 <= x0 || y1 <= y0) {
        return {x0, y0, 0, 0};
    }
    return {x0, y0, x1 - x0, y1 - y0};
}

} // namespace

void require_valid_cell(const Cell& cell, const config::BoardConfig& board) {
    if (cell.row < 0 || cell.row >= board.rows) {
        throw ValidationError("row " + std::to_string(cell.row) + " out of range [0, " +
                              std::to_string(board.rows - 1) + "]");
    }
    if (cell.col < 0 || cell.col >= board.cols) {
        throw ValidationError("col " + std::to_string(cell.col) + " out of range [0, " +
                              std::to_string(board.cols - 1) + "]");
    }
}

CellRect cell_rect_in_frame(const Cell& cell, const config::BoardConfig& board,
                            int frame_w, int frame_h) {
    require_valid_cell(cell, board);

    CellRect r;
    if (board.cell_w > 0 && board.cell_h > 0) {
        const int grid_w = board.cols * board.cell_w + (board.cols - 1) * board.gap_x;
        const int grid_h = board.rows * board.cell_h + (board.rows - 1) * board.gap_y;
        const int left = (frame_w - grid_w) / 2;
        const int top = (frame_h - grid_h) / 2;
        r.x = left + cell.col * (board.cell_w + board.gap_x);
        r.y = top + cell.row * (board.cell_h + board.gap_y);
        r.width = board.cell_w;
        r.height = board.cell_h;
    } else {
        const int x0 = round_div(static_cast<long>(cell.col) * frame_w, board.cols);
        const int x1 = round_div(static_cast<long>(cell.col + 1) * frame_w, board.cols);
        const int y0 = round_div(static_cast<long>(cell.row) * frame_h, board.rows);
        const int y1 = round_div(static_cast<long>(cell.row + 1) * frame_h, board.rows);
        r = {x0, y0, x1 - x0, y1 - y0};
    }
    return clip_rect(r, frame_w, frame_h);
}

CellRect cell_rect_on_screen(const Cell& cell, const config::BoardConfig& board) {
    CellRect r = cell_rect_in_frame(cell, board, board.board_w, board.board_h);
    r.x += board.board_x;
    r.y += board.board_y;
    return r;
}

PixelPoint cell_center_on_screen(const Cell& cell, const config::BoardConfig& board) {
    CellRect r = cell_rect_on_screen(cell, board);
    return {r.x + r.width / 2, r.y + r.height / 2};
}

cv::Mat crop_cell(const cv::Mat& frame, const Cell& cell, const config::BoardConfig& board) {
    CellRect r = cell_rect_in_frame(cell, board, frame.cols, frame.rows);
    if (r.empty()) {
        return cv::Mat();
    }
    return frame(cv::Rect(r.x, r.y, r.width, r.height));
}

cv::Mat to_bgr(const cv::Mat& frame) {
    if (frame.empty()) {
        return frame;
    }
    cv::Mat src = frame;
    if (src.depth() != CV_8U) {
        src.convertTo(src, CV_8U);
    }
    cv::Mat out;
    switch (src.channels()) {
        case 1: cv::cvtColor(src, out, cv::COLOR_GRAY2BGR); break;
        case 4: cv::cvtColor(src, out, cv::COLOR_BGRA2BGR); break;
        case 3: out = src; break;
        default:
            throw TileLinkError("Unsupported frame channel count: " +
                                std::to_string(src.channels()));
    }
    return out;
}

cv::Mat draw_grid_overlay(const cv::Mat& frame, const config::BoardConfig& board) {
    cv::Mat out = to_bgr(frame).clone();
    const cv::Scalar line_color(0, 255, 0);
    const cv::Scalar center_color(0, 0, 255);

    for (int r = 0; r < board.rows; ++r) {
        for (int c = 0; c < board.cols; ++c) {
            CellRect rect = cell_rect_in_frame({r, c}, board, out.cols, out.rows);
            if (rect.empty()) continue;
            cv::rectangle(out, cv::Rect(rect.x, rect.y, rect.width, rect.height), line_color, 1);
            cv::circle(out, cv::Point(rect.x + rect.width / 2, rect.y + rect.height / 2), 2,
                       center_color, cv::FILLED);
        }
    }
    return out;
}

cv::Mat draw_board_overlay(const cv::Mat& frame, const Board& board,
                           const config::BoardConfig& board_cfg) {
    cv::Mat out = draw_grid_overlay(frame, board_cfg);
    const int rows = std::min<int>(board_cfg.rows, static_cast<int>(board.rows()));
    const int cols = std::min<int>(board_cfg.cols, static_cast<int>(board.cols()));

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            CellRect rect = cell_rect_in_frame({r, c}, board_cfg, out.cols, out.rows);
            if (rect.empty()) continue;
            const int id = board(r, c);
            std::string label = id == kBlockTile ? "block" : id == kEmptyTile ? "bg" : std::to_string(id);
            cv::putText(out, label, cv::Point(rect.x + 2, rect.y + rect.height - 4),
                        cv::FONT_HERSHEY_SIMPLEX, 0.35, cv::Scalar(255, 255, 0), 1, cv::LINE_AA);
        }
    }
    return out;
}

} // namespace tile_link::image
