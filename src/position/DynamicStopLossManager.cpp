#include "position/DynamicStopLossManager.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace trendpilot {
namespace position {

using analytics::TechnicalIndicators;

DynamicStopLossManager::DynamicStopLossManager(const StopLossConfig& config)
    : config_(config)
{
}

std::vector<StopCandidate> DynamicStopLossManager::detect(const PositionRecord& position,
                                                          const analytics::MarketSnapshot& snapshot,
                                                          const analytics::MarketRegime& regime,
                                                          const std::optional<analytics::MarketRegime>& previous,
                                                          double price) const {
    std::vector<StopCandidate> candidates;
    const auto& bars = snapshot.bars;
    const double atr = snapshot.currentAtr();
    if (bars.size() < 2 || atr <= 0 || price <= 0) {
        return candidates;
    }

    const bool is_buy = position.side == OrderSide::BUY;
    const double sign = sideSign(position.side);
    const size_t n = bars.size();

    auto push = [&](double stop, const std::string& reason) {
        // 가격 반대편(이미 뚫린 손절)은 후보가 아니다
        if ((price - stop) * sign > 0) {
            candidates.emplace_back(stop, AdjustmentKind::STOP_LOSS, reason);
        }
    };

    // 1. 추세 반전: 최근 봉 대부분이 lower high(매수) / higher low(매도) + MA 추세 역전
    {
        size_t window = std::min(static_cast<size_t>(config_.reversal_window), n - 1);
        int against = 0;
        for (size_t i = n - window; i < n; ++i) {
            if (is_buy ? bars[i].high < bars[i - 1].high : bars[i].low > bars[i - 1].low) {
                ++against;
            }
        }
        int trend = snapshot.currentTrend();
        bool trend_against = is_buy ? trend == -1 : trend == 1;
        if (window > 0 && against > config_.reversal_ratio * window && trend_against) {
            push(price - sign * 0.5 * atr, "trend reversal");
        }
    }

    // 2. 이동평균 역방향 크로스
    {
        int cross = snapshot.currentCross();
        if ((is_buy && cross == -1) || (!is_buy && cross == 1)) {
            push(price - sign * 1.0 * atr, "ma crossover against position");
        }
    }

    // 3. 변동성 수축
    {
        auto recent = snapshot.atr.tail(config_.atr_average_window);
        double avg_atr = TechnicalIndicators::calculateMean(recent);
        if (avg_atr > 0 && atr / avg_atr < 0.7) {
            push(price - sign * 1.5 * atr, "volatility contraction");
        }
    }

    // 4. 유리한 쪽 스윙 레벨
    {
        size_t lookback = std::min(static_cast<size_t>(config_.swing_lookback), n);
        double swing = is_buy ? bars[n - lookback].low : bars[n - lookback].high;
        for (size_t i = n - lookback; i < n; ++i) {
            swing = is_buy ? std::min(swing, bars[i].low) : std::max(swing, bars[i].high);
        }
        bool beyond_latest = is_buy ? swing < bars.back().low : swing > bars.back().high;
        if (beyond_latest && (price - swing) * sign > 0.5 * atr) {
            push(swing - sign * 0.3 * atr, "new swing level");
        }
    }

    // 5. 지지(매수) / 저항(매도) 이탈
    {
        const double close = snapshot.lastClose();
        auto levels = is_buy
            ? TechnicalIndicators::bottomLows(bars, config_.support_lookback, config_.support_levels)
            : TechnicalIndicators::topHighs(bars, config_.support_lookback, config_.support_levels);
        std::optional<double> broken;
        for (double level : levels) {
            bool is_broken = is_buy ? close < level * 0.999 : close > level * 1.001;
            if (!is_broken) continue;
            // 가장 가까운 이탈 레벨
            if (!broken || std::abs(level - close) < std::abs(*broken - close)) {
                broken = level;
            }
        }
        if (broken) {
            push(*broken - sign * 0.5 * atr, is_buy ? "support break" : "resistance break");
        }
    }

    // 6. 추세 약화: 레짐 다운그레이드 또는 레짐 방향 역전
    {
        bool downgraded = previous && previous->sufficient_history && regime.sufficient_history &&
                          isDowngrade(*previous, regime);
        bool direction_against = regime.sufficient_history &&
            ((is_buy && regime.direction == analytics::TrendDirection::DOWN) ||
             (!is_buy && regime.direction == analytics::TrendDirection::UP));
        if (downgraded || direction_against) {
            push(price - sign * 1.0 * atr, downgraded ? "regime downgrade" : "regime direction against position");
        }
    }

    return candidates;
}

std::optional<StopCandidate> DynamicStopLossManager::selectTightest(const std::vector<StopCandidate>& candidates,
                                                                    OrderSide side) {
    std::optional<StopCandidate> best;
    for (const auto& c : candidates) {
        if (!best) {
            best = c;
            continue;
        }
        bool tighter = side == OrderSide::BUY ? c.price > best->price : c.price < best->price;
        if (tighter) {
            best = c;
        }
    }
    return best;
}

bool DynamicStopLossManager::isImprovement(OrderSide side, double current_stop, double candidate,
                                           double price, double min_change_ratio) {
    const double sign = sideSign(side);

    // 가격의 올바른 쪽
    if ((price - candidate) * sign <= 0) {
        return false;
    }

    // 손절이 없으면 어떤 유효 후보든 개선
    if (current_stop <= 0) {
        return true;
    }

    if ((candidate - current_stop) * sign <= 0) {
        return false;
    }

    return std::abs(candidate - current_stop) >= current_stop * min_change_ratio;
}

bool DynamicStopLossManager::isDowngrade(const analytics::MarketRegime& previous,
                                         const analytics::MarketRegime& current) {
    return analytics::trendRank(current.type) < analytics::trendRank(previous.type);
}

std::optional<StopCandidate> DynamicStopLossManager::evaluate(const PositionRecord& position,
                                                              const analytics::MarketSnapshot& snapshot,
                                                              const analytics::MarketRegime& regime,
                                                              const std::optional<analytics::MarketRegime>& previous,
                                                              double price) const {
    if (!config_.enabled) {
        return std::nullopt;
    }

    auto best = selectTightest(detect(position, snapshot, regime, previous, price), position.side);
    if (!best) {
        return std::nullopt;
    }

    if (!isImprovement(position.side, position.stop_loss, best->price, price, config_.min_change_ratio)) {
        return std::nullopt;
    }
    return best;
}

} // namespace position
} // namespace trendpilot
