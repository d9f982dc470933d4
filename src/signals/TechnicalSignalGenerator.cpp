#include "signals/TechnicalSignalGenerator.h"
#include "common/Logger.h"

#include <algorithm>

namespace trendpilot {
namespace signals {

using analytics::MarketRegime;
using analytics::MarketSnapshot;
using analytics::PriceAction;
using analytics::PricePosition;
using analytics::RegimeType;
using analytics::TrendDirection;

TechnicalSignalGenerator::TechnicalSignalGenerator(const TechnicalConfig& config,
                                                   const analytics::VolumeAnalyzer& volume)
    : config_(config)
    , volume_(volume)
{
}

SignalDirection TechnicalSignalGenerator::crossoverDirection(const MarketSnapshot& snapshot,
                                                             bool use_trend_confirmation) {
    if (snapshot.size() < 2 || !snapshot.ma_trend.hasLast()) {
        return SignalDirection::NEUTRAL;
    }

    const size_t last = snapshot.lastIndex();
    int cross = snapshot.currentCross();
    if (cross > 0) return SignalDirection::BUY;
    if (cross < 0) return SignalDirection::SELL;

    if (!use_trend_confirmation || !snapshot.ma_trend.defined(last - 1)) {
        return SignalDirection::NEUTRAL;
    }

    // 교차 봉이 아니어도 가격이 두 이동평균 위/아래에서 추세 전환 확인
    double close = snapshot.lastClose();
    double fast = snapshot.sma_fast.values[last];
    double slow = snapshot.sma_slow.values[last];
    double trend = snapshot.ma_trend.values[last];
    double prev_trend = snapshot.ma_trend.values[last - 1];

    if (close > fast && close > slow && trend > 0 && prev_trend < 0) return SignalDirection::BUY;
    if (close < fast && close < slow && trend < 0 && prev_trend > 0) return SignalDirection::SELL;
    return SignalDirection::NEUTRAL;
}

bool TechnicalSignalGenerator::passesFilters(const MarketSnapshot& snapshot, SignalDirection direction,
                                             std::string& reason) const {
    const bool is_buy = direction == SignalDirection::BUY;

    if (config_.use_rsi_filter && snapshot.rsi.hasLast()) {
        double rsi = snapshot.rsi.values.back();
        if (is_buy && rsi > config_.rsi_overbought) {
            reason = "RSI overbought";
            return false;
        }
        if (!is_buy && rsi < config_.rsi_oversold) {
            reason = "RSI oversold";
            return false;
        }
    }

    if (config_.use_macd_filter && snapshot.macd_hist.hasLast()) {
        double hist = snapshot.macd_hist.values.back();
        if (is_buy && hist <= 0) {
            reason = "MACD histogram not positive";
            return false;
        }
        if (!is_buy && hist >= 0) {
            reason = "MACD histogram not negative";
            return false;
        }
    }

    if (config_.min_adx > 0 && snapshot.adx.lastOr(0.0) < config_.min_adx) {
        reason = "ADX below minimum";
        return false;
    }

    return true;
}

double TechnicalSignalGenerator::alignmentScore(const MarketRegime& regime, SignalDirection direction,
                                                double sr_proximity_threshold) {
    if (direction == SignalDirection::NEUTRAL) {
        return 0.0;
    }
    const bool is_buy = direction == SignalDirection::BUY;
    double score = 0.5;

    // 추세 방향 정렬
    bool aligned = (is_buy && regime.direction == TrendDirection::UP) ||
                   (!is_buy && regime.direction == TrendDirection::DOWN);
    score += aligned ? 0.2 : -0.2;

    switch (regime.type) {
        case RegimeType::STRONG_TREND: score += 0.2; break;
        case RegimeType::RANGING: score -= 0.15; break;
        case RegimeType::VOLATILE: score -= 0.1; break;
        case RegimeType::WEAK_TREND: break;
    }

    if ((is_buy && regime.price_position == PricePosition::ABOVE_MAS) ||
        (!is_buy && regime.price_position == PricePosition::BELOW_MAS)) {
        score += 0.15;
    } else if (regime.price_position == PricePosition::BETWEEN) {
        score -= 0.1;
    }

    if ((is_buy && regime.price_action == PriceAction::BULLISH) ||
        (!is_buy && regime.price_action == PriceAction::BEARISH)) {
        score += 0.15;
    } else if ((is_buy && regime.price_action == PriceAction::BEARISH) ||
               (!is_buy && regime.price_action == PriceAction::BULLISH)) {
        score -= 0.15;
    }

    // 지지/저항 근접 시 감점
    if (regime.sr_proximity < sr_proximity_threshold) {
        score -= 0.2;
    }

    return std::clamp(score, 0.0, 1.0);
}

TechnicalEvaluation TechnicalSignalGenerator::evaluate(const MarketSnapshot& snapshot,
                                                       const MarketRegime& regime) const {
    TechnicalEvaluation eval;
    eval.component.source = SignalSource::TECHNICAL;

    eval.raw_direction = crossoverDirection(snapshot, config_.use_trend_confirmation);
    if (eval.raw_direction == SignalDirection::NEUTRAL) {
        eval.reason = "no crossover";
        return eval;
    }

    if (!passesFilters(snapshot, eval.raw_direction, eval.reason)) {
        LOG_INFO("{} {} signal rejected: {}", snapshot.symbol, toString(eval.raw_direction), eval.reason);
        return eval;
    }

    eval.alignment = alignmentScore(regime, eval.raw_direction, config_.sr_proximity_threshold);
    if (eval.alignment < config_.min_trade_confidence) {
        eval.reason = "regime alignment too low";
        LOG_INFO("{} {} signal rejected: alignment {:.2f} < {:.2f}", snapshot.symbol,
                 toString(eval.raw_direction), eval.alignment, config_.min_trade_confidence);
        return eval;
    }

    eval.volume = volume_.shouldTrade(snapshot, eval.raw_direction);
    if (!eval.volume.confirmed) {
        eval.reason = "volume not confirmed";
        LOG_INFO("{} {} signal rejected: volume not confirmed", snapshot.symbol, toString(eval.raw_direction));
        return eval;
    }

    eval.component.direction = eval.raw_direction;
    eval.component.confidence = std::clamp(eval.alignment + eval.volume.confidence_delta, 0.0, 1.0);
    eval.reason = "technical signal";
    return eval;
}

} // namespace signals
} // namespace trendpilot
