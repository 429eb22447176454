#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace tile_link::core {

using json = nlohmann::json;

/**
 * JSON-lines event emission for automation runs.
 * Every event carries "type", "run_id" and an ISO-8601 "ts"; payload keys
 * are merged into the top-level object. Lines go to the primary stream and,
 * when set, to a log file stream.
 */
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream* out, std::ostream* log_file = nullptr);

    const std::string& run_id() const { return run_id_; }
    void set_log_file(std::ostream* log_file) { log_file_ = log_file; }

    void emit(const std::string& type, const json& data = json::object());

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status, const json& extra = json::object());
    void run_error(const std::string& error);

    void cycle_start(int cycle, int move_count);
    void classified(int cycle, const Classification& result, int unknown_cells);
    void full_rescan(int move_count, const std::vector<std::string>& reasons);
    void pair_found(const Pair& pair, int tile_id);
    void dead_board(int move_count, int consecutive_failures);
    void low_confidence(int move_count, int unknown_cells, int consecutive_failures);
    void move_success(const Pair& pair, int move_count);
    void actuation_failed(const std::string& message, int consecutive_failures);

    void warning(const std::string& message);
    void log(const std::string& message);

private:
    json base_event(const std::string& type) const;
    void write_line(const json& event);

    std::string run_id_;
    std::ostream* out_;
    std::ostream* log_file_;
};

json cell_to_json(const Cell& cell);
json pair_to_json(const Pair& pair);
json board_to_json(const Board& board);
json confidence_to_json(const ConfidenceMap& confidence);

} // namespace tile_link::core
