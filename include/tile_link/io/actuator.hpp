#pragma once

#include "tile_link/config/configuration.hpp"
#include "tile_link/core/types.hpp"

#include <functional>
#include <ostream>

namespace tile_link::io {

// Executes a move on the physical board. Failures throw ActuationError.
class Actuator {
public:
    virtual ~Actuator() = default;
    virtual void click_pair(const Pair& pair) = 0;
};

class ClickActuator : public Actuator {
public:
    using ClickFn = std::function<void(const PixelPoint&)>;
    using SleepFn = std::function<void(int)>;  // milliseconds

    // click_fn == nullptr runs clicker.click_command through the shell
    ClickActuator(const config::Config& cfg, std::ostream* out,
                  ClickFn click_fn = nullptr, SleepFn sleep_fn = nullptr);

    void click_cell(const Cell& cell);
    void click_pair(const Pair& pair) override;

private:
    void click_point(const PixelPoint& point);

    config::BoardConfig board_;
    config::ClickerConfig clicker_;
    std::ostream* out_;
    ClickFn click_fn_;
    SleepFn sleep_fn_;
};

} // namespace tile_link::io
