#include "position_tracker.hpp"

namespace strategy_sim {

std::string position_to_string(Position position) {
    switch (position) {
        case Position::LONG: return "long";
        case Position::FLAT: return "flat";
        case Position::SHORT: return "short";
    }
    return "flat";
}

int position_exposure(Position position) {
    switch (position) {
        case Position::LONG: return 1;
        case Position::FLAT: return 0;
        case Position::SHORT: return -1;
    }
    return 0;
}

Position PositionTracker::apply(Signal signal) {
    switch (signal) {
        case Signal::BUY:
            current_ = Position::LONG;
            break;
        case Signal::SELL:
            current_ = Position::SHORT;
            break;
        case Signal::HOLD:
            break;
    }
    return current_;
}

std::vector<Position> PositionTracker::track(const std::vector<Signal>& signals) {
    PositionTracker tracker;
    std::vector<Position> out;
    out.reserve(signals.size());
    for (Signal s : signals) out.push_back(tracker.apply(s));
    return out;
}

} // namespace strategy_sim
