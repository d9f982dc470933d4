#include "analytics/RegimeClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace trendpilot {
namespace analytics {

const char* toString(RegimeType type) {
    switch (type) {
        case RegimeType::STRONG_TREND: return "strong_trend";
        case RegimeType::WEAK_TREND: return "weak_trend";
        case RegimeType::RANGING: return "ranging";
        case RegimeType::VOLATILE: return "volatile";
    }
    return "ranging";
}

const char* toString(TrendDirection dir) {
    return dir == TrendDirection::UP ? "up" : "down";
}

const char* toString(PricePosition pos) {
    switch (pos) {
        case PricePosition::ABOVE_MAS: return "above_mas";
        case PricePosition::BELOW_MAS: return "below_mas";
        case PricePosition::BETWEEN: return "between";
    }
    return "between";
}

const char* toString(PriceAction action) {
    switch (action) {
        case PriceAction::BULLISH: return "bullish";
        case PriceAction::BEARISH: return "bearish";
        case PriceAction::CONSOLIDATING: return "consolidating";
    }
    return "consolidating";
}

RegimeType regimeTypeFromString(const std::string& name) {
    if (name == "strong_trend") return RegimeType::STRONG_TREND;
    if (name == "weak_trend") return RegimeType::WEAK_TREND;
    if (name == "volatile") return RegimeType::VOLATILE;
    return RegimeType::RANGING;
}

int trendRank(RegimeType type) {
    switch (type) {
        case RegimeType::STRONG_TREND: return 2;
        case RegimeType::WEAK_TREND: return 1;
        default: return 0;
    }
}

RegimeClassifier::RegimeClassifier(const RegimeConfig& config)
    : config_(config) {}

RegimeType RegimeClassifier::classify(double strength, double consistency, double volatility_ratio) const {
    if (strength > config_.strong_trend_strength && consistency > config_.strong_trend_consistency) {
        return RegimeType::STRONG_TREND;
    }
    if (strength > config_.weak_trend_strength && consistency > config_.weak_trend_consistency) {
        return RegimeType::WEAK_TREND;
    }
    if (volatility_ratio > config_.volatile_ratio) {
        return RegimeType::VOLATILE;
    }
    return RegimeType::RANGING;
}

void RegimeClassifier::requireHistory(const MarketSnapshot& snapshot) const {
    if (snapshot.bars.size() < static_cast<size_t>(config_.min_bars)) {
        throw InsufficientHistory(std::to_string(snapshot.bars.size()) + " bars, need " +
                                  std::to_string(config_.min_bars));
    }
    if (!snapshot.atr.hasLast()) {
        throw InsufficientHistory("ATR not yet defined");
    }
}

MarketRegime RegimeClassifier::classify(const MarketSnapshot& snapshot) const {
    MarketRegime result;
    const auto& bars = snapshot.bars;

    if (snapshot.ma_trend.hasLast()) {
        result.direction = snapshot.currentTrend() > 0 ? TrendDirection::UP : TrendDirection::DOWN;
    }

    try {
        requireHistory(snapshot);
    } catch (const InsufficientHistory& e) {
        LOG_DEBUG("{} regime neutral: {}", snapshot.symbol, e.what());
        result.description = "Insufficient Data";
        return result;
    }

    // 1. 추세 강도 (ADX)
    result.strength = std::clamp(snapshot.adx.lastOr(0.0), 0.0, 100.0);

    // 2. 변동성 비율: 현재 ATR / 최근 평균 ATR
    result.current_atr = snapshot.currentAtr();
    result.average_atr = TechnicalIndicators::calculateMean(
        snapshot.atr.tail(static_cast<size_t>(config_.trend_strength_period)));
    result.volatility_ratio = result.average_atr > 0 ? result.current_atr / result.average_atr : 1.0;

    // 3. 추세 일관성
    result.consistency = trendConsistency(snapshot, config_.consistency_window);

    // 4. 가격 위치 / 가격 행동
    double close = snapshot.lastClose();
    double fast = snapshot.sma_fast.lastOr(close);
    double slow = snapshot.sma_slow.lastOr(close);
    if (close > fast && close > slow) result.price_position = PricePosition::ABOVE_MAS;
    else if (close < fast && close < slow) result.price_position = PricePosition::BELOW_MAS;
    else result.price_position = PricePosition::BETWEEN;

    result.price_action = priceAction(bars, config_.price_action_window, config_.price_action_ratio);

    result.sr_proximity = supportResistanceProximity(bars, result.current_atr, config_.sr_lookback,
                                                     config_.sr_levels, config_.default_sr_proximity);

    // 5. 분류
    result.type = classify(result.strength, result.consistency, result.volatility_ratio);
    result.sufficient_history = true;
    result.description = std::string(toString(result.type)) + "/" + toString(result.direction);

    return result;
}

double RegimeClassifier::trendConsistency(const MarketSnapshot& snapshot, int window, int offset) {
    const auto& trend = snapshot.ma_trend;
    if (window <= 0 || offset < 0 || trend.values.size() <= static_cast<size_t>(offset)) {
        return 50.0;
    }
    size_t last = trend.values.size() - 1 - offset;
    if (!trend.defined(last)) return 50.0;

    double current = trend.values[last];
    int matched = 0;
    int counted = 0;
    for (int k = 0; k < window; ++k) {
        if (last < static_cast<size_t>(k)) break;
        size_t i = last - k;
        if (!trend.defined(i)) break;
        ++counted;
        if (trend.values[i] == current) ++matched;
    }
    if (counted == 0) return 50.0;
    return 100.0 * matched / counted;
}

PriceAction RegimeClassifier::priceAction(const std::vector<Candle>& bars, int window, double ratio) {
    if (window <= 0 || bars.size() < static_cast<size_t>(window + 1)) {
        return PriceAction::CONSOLIDATING;
    }
    int higher_highs = 0;
    int lower_lows = 0;
    for (size_t i = bars.size() - window; i < bars.size(); ++i) {
        if (bars[i].high > bars[i - 1].high) ++higher_highs;
        if (bars[i].low < bars[i - 1].low) ++lower_lows;
    }
    const double threshold = window * ratio;
    if (higher_highs > threshold) return PriceAction::BULLISH;
    if (lower_lows > threshold) return PriceAction::BEARISH;
    return PriceAction::CONSOLIDATING;
}

double RegimeClassifier::supportResistanceProximity(const std::vector<Candle>& bars, double atr,
                                                    int lookback, int levels, double fallback) {
    if (atr <= 0 || bars.size() < static_cast<size_t>(lookback)) {
        return fallback;
    }
    double close = bars.back().close;
    double nearest = std::numeric_limits<double>::max();
    for (double level : TechnicalIndicators::topHighs(bars, lookback, levels)) {
        nearest = std::min(nearest, std::abs(close - level) / atr);
    }
    for (double level : TechnicalIndicators::bottomLows(bars, lookback, levels)) {
        nearest = std::min(nearest, std::abs(close - level) / atr);
    }
    return nearest == std::numeric_limits<double>::max() ? fallback : nearest;
}

} // namespace analytics
} // namespace trendpilot
