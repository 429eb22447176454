#include "tile_link/runner/automation.hpp"
#include "tile_link/classify/classifier.hpp"
#include "tile_link/core/errors.hpp"
#include "tile_link/image/grid.hpp"
#include "tile_link/solver/solver.hpp"

namespace tile_link::runner {

namespace {

class CycleScanner {
public:
    CycleScanner(const config::Config& cfg, const io::ReferenceSet& refs,
                 io::FrameSource& source, core::EventEmitter& events, RunLogger* logger)
        : cfg_(cfg), refs_(refs), source_(source), events_(events), logger_(logger) {}

    Classification scan(int cycle) {
        frame_ = source_.capture();
        Classification result = classify::classify(frame_, refs_, cfg_);
        events_.classified(cycle, result,
                           classify::count_uncertain_cells(result, cfg_.classifier.match_threshold));
        return result;
    }

    void snapshot(const Board& board, const std::string& name) {
        if (!logger_ || !cfg_.debug.enabled || frame_.empty()) {
            return;
        }
        logger_->save_snapshot(image::draw_board_overlay(frame_, board, cfg_.board), name);
    }

private:
    const config::Config& cfg_;
    const io::ReferenceSet& refs_;
    io::FrameSource& source_;
    core::EventEmitter& events_;
    RunLogger* logger_;
    cv::Mat frame_;
};

} // namespace

AutomationResult run_automation(const config::Config& cfg, const io::ReferenceSet& refs,
                                io::FrameSource& source, io::Actuator& actuator,
                                core::EventEmitter& events, RunLogger* logger) {
    AutomationResult result;
    result.state = runtime::init_runtime_state();
    runtime::RuntimeState& state = result.state;

    CycleScanner scanner(cfg, refs, source, events, logger);
    Classification current = scanner.scan(0);
    scanner.snapshot(current.board, "initial");

    while (true) {
        if (runtime::should_stop(state, cfg)) {
            result.status = kStatusMaxFailures;
            break;
        }
        if (cfg.runtime.max_cycles > 0 && result.cycles >= cfg.runtime.max_cycles) {
            result.status = kStatusCycleLimit;
            break;
        }

        ++result.cycles;
        events.cycle_start(result.cycles, state.move_count);

        for (int attempt = 0; attempt < cfg.rescan.max_rescan_attempts; ++attempt) {
            if (!runtime::should_full_rescan(state, current.confidence, cfg)) {
                break;
            }
            events.full_rescan(state.move_count, runtime::rescan_reason_names(state));
            current = scanner.scan(result.cycles);
        }
        if (cfg.debug.snapshot_every_cycle) {
            scanner.snapshot(current.board, "cycle_" + std::to_string(result.cycles));
        }

        // Unresolved cells after the rescan budget: retry, never report cleared
        const int uncertain =
            classify::count_uncertain_cells(current, cfg.classifier.match_threshold);
        if (uncertain > 0) {
            runtime::record_failure(state);
            events.low_confidence(state.move_count, uncertain, state.consecutive_failures);
            scanner.snapshot(current.board, "low_confidence");
            continue;
        }

        if (solver::count_tiles(current.board) == 0) {
            result.status = kStatusCleared;
            break;
        }

        const auto pair = solver::find_pair(current.board);
        if (!pair) {
            runtime::record_failure(state);
            events.dead_board(state.move_count, state.consecutive_failures);
            scanner.snapshot(current.board, "dead_board");
            continue;
        }

        events.pair_found(*pair, current.board(pair->first.row, pair->first.col));
        try {
            actuator.click_pair(*pair);
        } catch (const ActuationError& e) {
            runtime::record_failure(state);
            events.actuation_failed(e.what(), state.consecutive_failures);
            continue;
        }

        runtime::apply_successful_move(state, *pair);
        // Incremental update until the next full rescan
        for (const Cell& cell : {pair->first, pair->second}) {
            current.board(cell.row, cell.col) = kEmptyTile;
            current.confidence(cell.row, cell.col) = 1.0f;
        }
        events.move_success(*pair, state.move_count);
    }

    if (logger) {
        logger->log("automation finished: " + result.status + " after " +
                    std::to_string(result.cycles) + " cycles");
    }
    result.moves = state.move_count;
    result.last_classification = current;
    return result;
}

} // namespace tile_link::runner
