#include "tile_link/io/capture.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/core/utils.hpp"
#include "tile_link/image/grid.hpp"

#include <opencv2/imgcodecs.hpp>

#include <system_error>

namespace tile_link::io {

cv::Mat read_frame(const fs::path& path) {
    if (!fs::exists(path)) {
        throw CaptureError("frame not found: " + path.string());
    }
    cv::Mat raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (raw.empty()) {
        throw CaptureError("cannot decode frame: " + path.string());
    }
    return image::to_bgr(raw);
}

void check_frame_size(const cv::Mat& frame, const config::BoardConfig& board) {
    if (frame.cols != board.board_w || frame.rows != board.board_h) {
        throw CaptureError("frame is " + std::to_string(frame.cols) + "x" +
                           std::to_string(frame.rows) + ", expected " +
                           std::to_string(board.board_w) + "x" + std::to_string(board.board_h));
    }
}

ImageFileSource::ImageFileSource(fs::path path, const config::BoardConfig& board)
    : path_(std::move(path)), board_(board) {}

cv::Mat ImageFileSource::capture() {
    cv::Mat frame = read_frame(path_);
    check_frame_size(frame, board_);
    return frame;
}

CommandCaptureSource::CommandCaptureSource(std::string command_template,
                                           const config::BoardConfig& board,
                                           fs::path scratch_dir)
    : command_template_(std::move(command_template)),
      board_(board),
      scratch_dir_(std::move(scratch_dir)) {}

std::string CommandCaptureSource::render_command(const fs::path& out) const {
    return core::substitute_placeholders(command_template_,
                                         {{"x", std::to_string(board_.board_x)},
                                          {"y", std::to_string(board_.board_y)},
                                          {"w", std::to_string(board_.board_w)},
                                          {"h", std::to_string(board_.board_h)},
                                          {"out", core::shell_quote(out.string())}});
}

cv::Mat CommandCaptureSource::capture() {
    std::error_code ec;
    fs::create_directories(scratch_dir_, ec);
    if (ec) {
        throw CaptureError("cannot create " + scratch_dir_.string() + ": " + ec.message());
    }

    const fs::path out = scratch_dir_ / ("capture_" + core::get_file_timestamp() + ".png");
    const std::string command = render_command(out);
    const int status = core::run_shell_command(command);
    if (status != 0) {
        throw CaptureError("capture command failed with status " + std::to_string(status) +
                           ": " + command);
    }

    cv::Mat frame = read_frame(out);
    fs::remove(out, ec);
    check_frame_size(frame, board_);
    return frame;
}

} // namespace tile_link::io
