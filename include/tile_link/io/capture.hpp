#pragma once

#include "tile_link/config/configuration.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <string>

namespace tile_link::io {

namespace fs = std::filesystem;

/**
 * Supplies frames of the configured board region. Every returned frame is
 * 8-bit BGR and exactly board_w x board_h; anything else is a CaptureError.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual cv::Mat capture() = 0;
};

// Re-reads an image file on every capture (offline replays, tests)
class ImageFileSource : public FrameSource {
public:
    ImageFileSource(fs::path path, const config::BoardConfig& board);
    cv::Mat capture() override;

private:
    fs::path path_;
    config::BoardConfig board_;
};

// Runs a screenshot command ({x} {y} {w} {h} {out}) and reads {out}
class CommandCaptureSource : public FrameSource {
public:
    CommandCaptureSource(std::string command_template, const config::BoardConfig& board,
                         fs::path scratch_dir);
    cv::Mat capture() override;

    std::string render_command(const fs::path& out) const;

private:
    std::string command_template_;
    config::BoardConfig board_;
    fs::path scratch_dir_;
};

// Reads an image as 8-bit BGR; CaptureError when it cannot be decoded
cv::Mat read_frame(const fs::path& path);

// CaptureError unless the frame is board_w x board_h
void check_frame_size(const cv::Mat& frame, const config::BoardConfig& board);

} // namespace tile_link::io
