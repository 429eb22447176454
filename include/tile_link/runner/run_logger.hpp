#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace tile_link::runner {

namespace fs = std::filesystem;

/**
 * Per-run diagnostics directory <debug_dir>/<run_name>_<run_id>/ holding
 * events.jsonl and PNG snapshots. Attach event_stream() to an EventEmitter
 * to mirror the event lines into the run directory.
 */
class RunLogger {
public:
    RunLogger(const fs::path& debug_dir, const std::string& run_name, const std::string& run_id);

    const fs::path& run_dir() const { return run_dir_; }
    fs::path events_path() const { return run_dir_ / "events.jsonl"; }
    std::ostream* event_stream() { return &events_; }

    // Appends a "log" event line
    void log(const std::string& message);

    // Writes <name>_<timestamp>.png, returns its path
    fs::path save_snapshot(const cv::Mat& frame, const std::string& name);

private:
    fs::path run_dir_;
    std::string run_id_;
    std::ofstream events_;
};

// Standalone snapshot into dir (created if missing). IOError on failure.
fs::path save_debug_snapshot(const cv::Mat& frame, const std::string& name, const fs::path& dir);

} // namespace tile_link::runner
