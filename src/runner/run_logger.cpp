#include "tile_link/runner/run_logger.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/core/utils.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <system_error>

namespace tile_link::runner {

namespace {

void ensure_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("cannot create directory " + dir.string() + ": " + ec.message());
    }
}

} // namespace

RunLogger::RunLogger(const fs::path& debug_dir, const std::string& run_name,
                     const std::string& run_id)
    : run_dir_(debug_dir / (run_name + "_" + run_id)), run_id_(run_id) {
    ensure_dir(run_dir_);
    events_.open(events_path(), std::ios::out | std::ios::app);
    if (!events_) {
        throw IOError("cannot open " + events_path().string());
    }
}

void RunLogger::log(const std::string& message) {
    nlohmann::json event = {
        {"type", "log"},
        {"run_id", run_id_},
        {"ts", core::get_iso_timestamp()},
        {"message", message}
    };
    events_ << event.dump() << "\n";
    events_.flush();
}

fs::path RunLogger::save_snapshot(const cv::Mat& frame, const std::string& name) {
    return save_debug_snapshot(frame, name, run_dir_);
}

fs::path save_debug_snapshot(const cv::Mat& frame, const std::string& name, const fs::path& dir) {
    if (frame.empty()) {
        throw IOError("cannot save empty snapshot '" + name + "'");
    }
    ensure_dir(dir);
    std::string safe_name = name;
    std::replace(safe_name.begin(), safe_name.end(), ' ', '_');
    const fs::path out = dir / (safe_name + "_" + core::get_file_timestamp() + ".png");
    bool ok = false;
    try {
        ok = cv::imwrite(out.string(), frame);
    } catch (const cv::Exception& e) {
        throw IOError("cannot write " + out.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("cannot write " + out.string());
    }
    return out;
}

} // namespace tile_link::runner
