#pragma once

#include "tile_link/config/configuration.hpp"
#include "tile_link/core/events.hpp"
#include "tile_link/io/actuator.hpp"
#include "tile_link/io/capture.hpp"
#include "tile_link/io/templates.hpp"
#include "tile_link/runner/run_logger.hpp"
#include "tile_link/runtime/rescan_controller.hpp"

#include <string>

namespace tile_link::runner {

// Terminal statuses of an automation run
constexpr const char* kStatusCleared = "cleared";
constexpr const char* kStatusMaxFailures = "max_failures";
constexpr const char* kStatusCycleLimit = "cycle_limit";

struct AutomationResult {
    std::string status;
    int cycles = 0;
    int moves = 0;
    runtime::RuntimeState state;
    Classification last_classification;
};

// capture -> classify -> rescan check -> solve -> click -> record, until the
// board is cleared, the failure budget is spent or runtime.max_cycles is hit.
// Capture and configuration errors propagate. Actuation errors, dead boards
// and cells still unresolved after the rescan budget count as failures.
// logger may be null.
AutomationResult run_automation(const config::Config& cfg, const io::ReferenceSet& refs,
                                io::FrameSource& source, io::Actuator& actuator,
                                core::EventEmitter& events, RunLogger* logger = nullptr);

} // namespace tile_link::runner
