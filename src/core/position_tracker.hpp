#pragma once

#include <string>
#include <vector>
#include "strategy.hpp"

namespace strategy_sim {

enum class Position { LONG, FLAT, SHORT };

std::string position_to_string(Position position);

// +1 / 0 / -1, used as the exposure multiplier on period returns.
int position_exposure(Position position);

/**
 * Hysteresis position state machine. Starts FLAT; BUY moves to LONG and SELL
 * to SHORT from any other state (LONG and SHORT flip directly, without an
 * intermediate FLAT); a signal matching the current side and HOLD leave the
 * position unchanged.
 */
class PositionTracker {
public:
    PositionTracker() = default;

    // Apply one signal and return the resulting position.
    Position apply(Signal signal);

    Position current() const { return current_; }
    void reset() { current_ = Position::FLAT; }

    // Fresh left-to-right scan; does not touch this tracker's state.
    static std::vector<Position> track(const std::vector<Signal>& signals);

private:
    Position current_{Position::FLAT};
};

} // namespace strategy_sim
