#include "position/TrailingController.h"
#include "common/Logger.h"

namespace trendpilot {
namespace position {

TrailingController::TrailingController(const TrailingConfig& trailing,
                                       const BreakevenConfig& breakeven,
                                       const TimeExitConfig& time_exit)
    : trailing_(trailing)
    , breakeven_(breakeven)
    , time_exit_(time_exit)
{
}

double TrailingController::unrealizedDistance(const PositionRecord& position, double price) {
    return (price - position.entry_price) * sideSign(position.side);
}

std::optional<StopCandidate> TrailingController::trailingStop(const PositionRecord& position, ManagedState& state,
                                                              double price, double atr) const {
    if (!trailing_.enabled || atr <= 0 || price <= 0) {
        return std::nullopt;
    }

    const double sign = sideSign(position.side);

    if (!state.trailing_active) {
        if (unrealizedDistance(position, price) < state.trail_activation * atr) {
            return std::nullopt;
        }
        state.trailing_active = true;
        state.best_price = price;
        LOG_INFO("Trailing activated for {} {} at {:.5f}", position.ticket, position.symbol, price);
    } else if ((price - state.best_price) * sign > 0) {
        state.best_price = price;
    }

    double stop = state.best_price - sign * state.trail_distance * atr;
    if ((price - stop) * sign <= 0) {
        return std::nullopt;
    }
    return StopCandidate(stop, AdjustmentKind::TRAILING, "trailing stop");
}

std::optional<StopCandidate> TrailingController::breakevenStop(const PositionRecord& position,
                                                               const ManagedState& state,
                                                               double price, double atr,
                                                               const SymbolSpec& spec) const {
    if (!breakeven_.enabled || state.breakeven_applied || atr <= 0) {
        return std::nullopt;
    }

    if (unrealizedDistance(position, price) < breakeven_.atr_threshold * atr) {
        return std::nullopt;
    }

    const double sign = sideSign(position.side);
    double level = position.entry_price + sign * spec.spread * breakeven_.spread_multiplier;
    if ((price - level) * sign <= 0) {
        return std::nullopt;
    }
    return StopCandidate(level, AdjustmentKind::BREAKEVEN, "breakeven");
}

bool TrailingController::shouldTimeExit(const PositionRecord& position, long long now_ms) const {
    if (!time_exit_.enabled || time_exit_.max_hold_minutes <= 0 || position.open_time <= 0) {
        return false;
    }
    long long age_ms = now_ms - position.open_time;
    return age_ms >= static_cast<long long>(time_exit_.max_hold_minutes) * 60 * 1000;
}

} // namespace position
} // namespace trendpilot
