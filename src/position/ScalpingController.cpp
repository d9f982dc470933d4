#include "position/ScalpingController.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace trendpilot {
namespace position {

const char* toString(ScalpExitType type) {
    switch (type) {
        case ScalpExitType::MOMENTUM: return "momentum_exit";
        case ScalpExitType::REVERSAL: return "reversal_exit";
        case ScalpExitType::TIME: return "time_exit";
        case ScalpExitType::TIME_LOSS: return "time_exit_loss";
        case ScalpExitType::BREAKEVEN: return "breakeven_exit";
    }
    return "momentum_exit";
}

namespace {

constexpr size_t kMinScalpBars = 20;

std::string describe(const char* what, double pips, double minutes = -1.0) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << what << " at " << (pips >= 0 ? "+" : "") << pips << " pips";
    if (minutes >= 0) {
        out << " (" << minutes << "m)";
    }
    return out.str();
}

} // namespace

ScalpingController::ScalpingController(const ScalpingConfig& config)
    : config_(config)
{
}

bool ScalpingController::appliesTo(const analytics::MarketSnapshot& snapshot) const {
    return config_.enabled && snapshot.timeframe == config_.timeframe;
}

double ScalpingController::pipSize(const SymbolSpec& spec) const {
    return config_.pip_size > 0 ? config_.pip_size : spec.tick_size;
}

double ScalpingController::profitPips(const PositionRecord& position, double price, double pip_size) {
    if (pip_size <= 0) return 0.0;
    return (price - position.entry_price) * sideSign(position.side) / pip_size;
}

std::optional<ScalpExit> ScalpingController::shouldExit(const PositionRecord& position,
                                                        const analytics::MarketSnapshot& snapshot,
                                                        double price, double pip_size, long long now_ms) const {
    if (snapshot.size() < kMinScalpBars || price <= 0 || pip_size <= 0) {
        return std::nullopt;
    }

    const double pips = profitPips(position, price, pip_size);
    const bool has_age = position.open_time > 0 && now_ms >= position.open_time;
    const double hold_minutes = has_age ? static_cast<double>(now_ms - position.open_time) / 60000.0 : 0.0;

    if (pips >= config_.min_profit_pips) {
        if (config_.momentum_exit && momentumWeakening(snapshot, position.side)) {
            return ScalpExit{ScalpExitType::MOMENTUM, pips, describe("Momentum weakening", pips)};
        }
        if (config_.reversal_exit && reversalSignal(snapshot, position.side)) {
            return ScalpExit{ScalpExitType::REVERSAL, pips, describe("Reversal signal", pips)};
        }
    }

    if (config_.time_exit && has_age && hold_minutes >= config_.max_hold_minutes) {
        if (pips > 0) {
            return ScalpExit{ScalpExitType::TIME, pips, describe("Time exit", pips, hold_minutes)};
        }
        // 작은 손실은 정리, 큰 손실은 손절에 맡김
        if (pips > -config_.min_profit_pips) {
            return ScalpExit{ScalpExitType::TIME_LOSS, pips, describe("Time exit", pips, hold_minutes)};
        }
    }

    if (has_age && std::abs(pips) < config_.breakeven_band_pips &&
        hold_minutes > config_.breakeven_min_minutes && momentumWeakening(snapshot, position.side)) {
        return ScalpExit{ScalpExitType::BREAKEVEN, pips, describe("Breakeven exit", pips, hold_minutes)};
    }

    return std::nullopt;
}

std::optional<StopCandidate> ScalpingController::trailingStop(const PositionRecord& position,
                                                              double price, double pip_size) const {
    if (pip_size <= 0 || price <= 0) {
        return std::nullopt;
    }
    if (profitPips(position, price, pip_size) <= config_.trail_after_pips) {
        return std::nullopt;
    }
    double stop = price - sideSign(position.side) * config_.trail_distance_pips * pip_size;
    return StopCandidate(stop, AdjustmentKind::TRAILING, "scalping trail");
}

bool ScalpingController::momentumWeakening(const analytics::MarketSnapshot& snapshot, OrderSide side) {
    const auto& hist = snapshot.macd_hist;
    if (hist.values.size() < 3) return false;
    const size_t last = hist.values.size() - 1;
    if (!hist.defined(last - 2)) return false;

    double h0 = hist.values[last];
    double h1 = hist.values[last - 1];
    double h2 = hist.values[last - 2];
    if (side == OrderSide::BUY) {
        return (h0 < h1 && h1 < h2) || (h0 < 0 && h1 > 0);
    }
    return (h0 > h1 && h1 > h2) || (h0 > 0 && h1 < 0);
}

bool ScalpingController::reversalSignal(const analytics::MarketSnapshot& snapshot, OrderSide side) const {
    const auto& fast = snapshot.sma_fast;
    const auto& slow = snapshot.sma_slow;
    const size_t n = snapshot.size();
    if (n >= 2 && fast.defined(n - 2) && slow.defined(n - 2)) {
        double f0 = fast.values[n - 1];
        double s0 = slow.values[n - 1];
        double f1 = fast.values[n - 2];
        double s1 = slow.values[n - 2];
        if (side == OrderSide::BUY && f0 < s0 && f1 >= s1) return true;
        if (side == OrderSide::SELL && f0 > s0 && f1 <= s1) return true;
    }

    if (snapshot.rsi.hasLast()) {
        double rsi = snapshot.rsi.values.back();
        if (side == OrderSide::BUY && rsi > config_.rsi_overbought) return true;
        if (side == OrderSide::SELL && rsi < config_.rsi_oversold) return true;
    }
    return false;
}

} // namespace position
} // namespace trendpilot
