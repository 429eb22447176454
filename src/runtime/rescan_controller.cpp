#include "tile_link/runtime/rescan_controller.hpp"
#include "tile_link/core/utils.hpp"

namespace tile_link::runtime {

RuntimeState init_runtime_state() {
    return RuntimeState{};
}

bool should_full_rescan(RuntimeState& state, const ConfidenceMap& confidence,
                        const config::Config& cfg) {
    std::vector<RescanReason> reasons;

    const int moves_since = state.move_count - state.last_full_rescan_move;
    if (state.move_count > 0 && moves_since >= cfg.rescan.full_rescan_every_n_moves) {
        reasons.push_back(RescanReason::PERIODIC);
    }
    if (state.rescan_requested) {
        reasons.push_back(RescanReason::FAILURE_OR_MISMATCH);
    }
    if (confidence.size() == 0) {
        reasons.push_back(RescanReason::EMPTY_CONFIDENCE);
    } else if (confidence.minCoeff() < cfg.classifier.match_threshold) {
        reasons.push_back(RescanReason::LOW_CONFIDENCE);
    }

    if (reasons.empty()) {
        state.last_rescan_reasons.clear();
        return false;
    }

    state.last_full_rescan_move = state.move_count;
    state.rescan_requested = false;
    state.last_rescan_reasons = std::move(reasons);
    state.last_event = RuntimeEvent::FULL_RESCAN;
    return true;
}

void apply_successful_move(RuntimeState& state, const Pair& pair) {
    state.move_count += 1;
    state.consecutive_failures = 0;
    state.last_pair = pair;
    state.last_event = RuntimeEvent::MOVE_SUCCESS;
    state.rescan_requested = false;
}

void record_failure(RuntimeState& state) {
    state.consecutive_failures += 1;
    state.rescan_requested = true;
    state.last_event = RuntimeEvent::FAILURE;
}

bool should_stop(const RuntimeState& state, const config::Config& cfg) {
    return state.consecutive_failures >= cfg.rescan.max_consecutive_failures;
}

std::vector<std::string> rescan_reason_names(const RuntimeState& state) {
    std::vector<std::string> names;
    names.reserve(state.last_rescan_reasons.size());
    for (RescanReason reason : state.last_rescan_reasons) {
        names.push_back(rescan_reason_to_string(reason));
    }
    return names;
}

std::string rescan_reason_string(const RuntimeState& state) {
    return core::join(rescan_reason_names(state), ",");
}

} // namespace tile_link::runtime
