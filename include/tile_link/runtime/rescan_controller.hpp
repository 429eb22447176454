#pragma once

#include "tile_link/config/configuration.hpp"
#include "tile_link/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tile_link::runtime {

enum class RuntimeEvent {
    INIT,
    FULL_RESCAN,
    MOVE_SUCCESS,
    FAILURE
};

inline std::string runtime_event_to_string(RuntimeEvent event) {
    switch (event) {
        case RuntimeEvent::INIT: return "init";
        case RuntimeEvent::FULL_RESCAN: return "full_rescan";
        case RuntimeEvent::MOVE_SUCCESS: return "move_success";
        case RuntimeEvent::FAILURE: return "failure";
        default: return "unknown";
    }
}

// Rescan triggers, in evaluation order
enum class RescanReason {
    PERIODIC,
    FAILURE_OR_MISMATCH,
    EMPTY_CONFIDENCE,
    LOW_CONFIDENCE
};

inline std::string rescan_reason_to_string(RescanReason reason) {
    switch (reason) {
        case RescanReason::PERIODIC: return "periodic";
        case RescanReason::FAILURE_OR_MISMATCH: return "failure_or_mismatch";
        case RescanReason::EMPTY_CONFIDENCE: return "empty_confidence";
        case RescanReason::LOW_CONFIDENCE: return "low_confidence";
        default: return "unknown";
    }
}

// Automation counters owned by the cycle loop. Only the three functions
// below mutate it.
struct RuntimeState {
    int move_count = 0;
    int consecutive_failures = 0;
    int last_full_rescan_move = 0;
    bool rescan_requested = false;
    std::vector<RescanReason> last_rescan_reasons;  // empty = none
    RuntimeEvent last_event = RuntimeEvent::INIT;
    std::optional<Pair> last_pair;
};

RuntimeState init_runtime_state();

// Evaluates the rescan triggers against the current confidence map. When any
// fires, the request is consumed and the reasons are recorded; a second call
// with unchanged inputs then returns false.
bool should_full_rescan(RuntimeState& state, const ConfidenceMap& confidence,
                        const config::Config& cfg);

void apply_successful_move(RuntimeState& state, const Pair& pair);

void record_failure(RuntimeState& state);

// Stop condition, evaluated by the caller
bool should_stop(const RuntimeState& state, const config::Config& cfg);

// "periodic,low_confidence" or "" when no reason is recorded
std::string rescan_reason_string(const RuntimeState& state);
std::vector<std::string> rescan_reason_names(const RuntimeState& state);

} // namespace tile_link::runtime
