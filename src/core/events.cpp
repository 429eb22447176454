#include "tile_link/core/events.hpp"
#include "tile_link/core/utils.hpp"

#include <utility>

namespace tile_link::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream* out, std::ostream* log_file)
    : run_id_(std::move(run_id)), out_(out), log_file_(log_file) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::write_line(const json& event) {
    std::string line = event.dump();

    if (out_) {
        (*out_) << line << "\n";
        out_->flush();
    }
    if (log_file_) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
}

void EventEmitter::emit(const std::string& type, const json& data) {
    json event = base_event(type);
    if (!data.empty() && data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }
    write_line(event);
}

void EventEmitter::run_start(const json& extra) {
    emit("run_start", extra);
}

void EventEmitter::run_end(bool success, const std::string& status, const json& extra) {
    json data = extra.is_object() ? extra : json::object();
    data["success"] = success;
    data["status"] = status;
    emit("run_end", data);
}

void EventEmitter::run_error(const std::string& error) {
    emit("run_error", {{"error", error}});
}

void EventEmitter::cycle_start(int cycle, int move_count) {
    emit("cycle_start", {{"cycle", cycle}, {"move_count", move_count}});
}

void EventEmitter::classified(int cycle, const Classification& result, int unknown_cells) {
    float min_conf = result.confidence.size() > 0 ? result.confidence.minCoeff() : 0.0f;
    emit("classified", {
        {"cycle", cycle},
        {"rows", result.board.rows()},
        {"cols", result.board.cols()},
        {"unknown_cells", unknown_cells},
        {"min_confidence", min_conf}
    });
}

void EventEmitter::full_rescan(int move_count, const std::vector<std::string>& reasons) {
    emit("full_rescan", {{"move_count", move_count}, {"reasons", reasons}});
}

void EventEmitter::pair_found(const Pair& pair, int tile_id) {
    emit("pair_found", {{"pair", pair_to_json(pair)}, {"tile_id", tile_id}});
}

void EventEmitter::dead_board(int move_count, int consecutive_failures) {
    emit("dead_board", {{"move_count", move_count},
                        {"consecutive_failures", consecutive_failures}});
}

void EventEmitter::low_confidence(int move_count, int unknown_cells, int consecutive_failures) {
    emit("low_confidence", {{"move_count", move_count},
                            {"unknown_cells", unknown_cells},
                            {"consecutive_failures", consecutive_failures}});
}

void EventEmitter::move_success(const Pair& pair, int move_count) {
    emit("move_success", {{"pair", pair_to_json(pair)}, {"move_count", move_count}});
}

void EventEmitter::actuation_failed(const std::string& message, int consecutive_failures) {
    emit("actuation_failed", {{"message", message},
                              {"consecutive_failures", consecutive_failures}});
}

void EventEmitter::warning(const std::string& message) {
    emit("warning", {{"message", message}});
}

void EventEmitter::log(const std::string& message) {
    emit("log", {{"message", message}});
}

json cell_to_json(const Cell& cell) {
    return json::array({cell.row, cell.col});
}

json pair_to_json(const Pair& pair) {
    return json::array({cell_to_json(pair.first), cell_to_json(pair.second)});
}

json board_to_json(const Board& board) {
    json rows = json::array();
    for (Eigen::Index r = 0; r < board.rows(); ++r) {
        json row = json::array();
        for (Eigen::Index c = 0; c < board.cols(); ++c) {
            row.push_back(board(r, c));
        }
        rows.push_back(row);
    }
    return rows;
}

json confidence_to_json(const ConfidenceMap& confidence) {
    json rows = json::array();
    for (Eigen::Index r = 0; r < confidence.rows(); ++r) {
        json row = json::array();
        for (Eigen::Index c = 0; c < confidence.cols(); ++c) {
            row.push_back(confidence(r, c));
        }
        rows.push_back(row);
    }
    return rows;
}

} // namespace tile_link::core
