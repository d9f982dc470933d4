#include "position/DynamicTakeProfitManager.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace trendpilot {
namespace position {

using analytics::RegimeClassifier;
using analytics::RegimeType;
using analytics::TechnicalIndicators;
using analytics::TrendDirection;

DynamicTakeProfitManager::DynamicTakeProfitManager(const TakeProfitConfig& config,
                                                   const analytics::VolumeAnalyzer& volume)
    : config_(config)
    , volume_(volume)
{
}

std::vector<TakeProfitCandidate> DynamicTakeProfitManager::detect(const PositionRecord& position,
                                                                  const analytics::MarketSnapshot& snapshot,
                                                                  const analytics::MarketRegime& regime,
                                                                  double price) const {
    std::vector<TakeProfitCandidate> candidates;
    const auto& bars = snapshot.bars;
    const double atr = snapshot.currentAtr();
    const bool is_buy = position.side == OrderSide::BUY;
    const double sign = sideSign(position.side);
    const double entry = position.entry_price;

    if (bars.size() < 2 || price <= 0) {
        return candidates;
    }

    // 수익 중일 때만
    if ((price - entry) * sign <= 0) {
        return candidates;
    }

    const size_t n = bars.size();
    const double close = snapshot.lastClose();
    double distance = position.take_profit > 0 ? std::abs(position.take_profit - entry)
                                               : std::abs(price - entry);

    auto extend = [&](double multiplier, const std::string& reason) {
        candidates.emplace_back(entry + sign * distance * multiplier, reason);
    };

    const bool aligned = (is_buy && regime.direction == TrendDirection::UP) ||
                         (!is_buy && regime.direction == TrendDirection::DOWN);

    // 1. 강한 추세 지속
    if (regime.sufficient_history && aligned && regime.consistency > 85.0 && regime.strength > 30.0) {
        extend(1.5, "strong trend continuation");
    }

    // 2. 추세 강화: 최근 20봉 일관성이 이전 20봉보다 10 이상 상승
    if (regime.sufficient_history && aligned && regime.type == RegimeType::STRONG_TREND &&
        regime.consistency > 70.0) {
        double recent = RegimeClassifier::trendConsistency(snapshot, 20, 0);
        double prior = RegimeClassifier::trendConsistency(snapshot, 20, 20);
        if (recent > prior + 10.0) {
            extend(1.3, "trend strengthening");
        }
    }

    // 3. 모멘텀 가속
    const size_t w = static_cast<size_t>(std::max(1, config_.momentum_window));
    if (n > 2 * w) {
        double recent_velocity = (bars[n - 1].close - bars[n - 1 - w].close) * sign;
        double prior_velocity = (bars[n - 1 - w].close - bars[n - 1 - 2 * w].close) * sign;
        if (prior_velocity > 0 && recent_velocity > 1.3 * prior_velocity) {
            extend(1.4, "momentum acceleration");
        }
    }

    // 레벨 계산은 현재 봉 제외
    std::vector<Candle> prior_bars(bars.begin(), bars.end() - 1);

    // 4. 돌파 확인 (거래량 동반)
    if (atr > 0) {
        auto extremes = is_buy
            ? TechnicalIndicators::topHighs(prior_bars, config_.breakout_lookback, config_.breakout_levels)
            : TechnicalIndicators::bottomLows(prior_bars, config_.breakout_lookback, config_.breakout_levels);
        if (!extremes.empty()) {
            double level = TechnicalIndicators::calculateMean(extremes);
            bool broke_out = is_buy ? close > level * 1.002 : close < level * 0.998;
            if (broke_out) {
                auto analysis = volume_.analyze(snapshot);
                if (!volume_.enabled() || analysis.above_average) {
                    candidates.emplace_back(level + sign * 2.0 * atr, "confirmed breakout");
                }
            }
        }
    }

    // 5. 유리한 변동성 확장
    if (atr > 0 && n > 5) {
        auto recent = snapshot.atr.tail(config_.atr_average_window);
        double avg_atr = TechnicalIndicators::calculateMean(recent);
        double past_close = bars[n - 6].close;
        if (avg_atr > 0 && atr > 1.2 * avg_atr && (close - past_close) * sign > 0) {
            extend(1.3, "favourable volatility expansion");
        }
    }

    // 6. 지속형 패턴 (깃발/페넌트): 최근 20봉의 앞 5봉에서 고점/저점 연속 갱신
    if (n > 20) {
        int hh = 0;
        int hl = 0;
        for (size_t i = n - 20; i < n - 15; ++i) {
            bool higher_high = bars[i].high > bars[i - 1].high;
            bool higher_low = bars[i].low > bars[i - 1].low;
            if (is_buy) {
                if (higher_high) ++hh;
                if (higher_low) ++hl;
            } else {
                if (bars[i].high < bars[i - 1].high) ++hh;
                if (bars[i].low < bars[i - 1].low) ++hl;
            }
        }
        if (hh >= 3 && hl >= 3) {
            extend(1.2, "continuation pattern");
        }
    }

    // 7. 지지/저항 돌파: 2회 이상 테스트된 레벨을 0.1% 넘어섬
    if (atr > 0) {
        auto levels = is_buy
            ? TechnicalIndicators::topHighs(prior_bars, config_.breakout_lookback, config_.sr_levels)
            : TechnicalIndicators::bottomLows(prior_bars, config_.breakout_lookback, config_.sr_levels);
        size_t start = prior_bars.size() > static_cast<size_t>(config_.breakout_lookback)
                     ? prior_bars.size() - config_.breakout_lookback : 0;
        std::optional<double> cleared;
        for (double level : levels) {
            bool beyond = is_buy ? close > level * 1.001 : close < level * 0.999;
            if (!beyond || level <= 0) continue;

            int touches = 0;
            for (size_t i = start; i < prior_bars.size(); ++i) {
                double extreme = is_buy ? prior_bars[i].high : prior_bars[i].low;
                if (std::abs(extreme - level) / level <= 0.002) ++touches;
            }
            if (touches < 2) continue;

            if (!cleared || (level - *cleared) * sign > 0) {
                cleared = level;
            }
        }
        if (cleared) {
            candidates.emplace_back(*cleared + sign * 1.5 * atr, "support/resistance cleared");
        }
    }

    // 8. 높은 추세 일관성
    if (regime.sufficient_history && aligned && regime.consistency > 80.0) {
        extend(1.2, "high trend consistency");
    }

    return candidates;
}

std::optional<TakeProfitCandidate> DynamicTakeProfitManager::selectFurthest(
    const std::vector<TakeProfitCandidate>& candidates, OrderSide side) {
    std::optional<TakeProfitCandidate> best;
    for (const auto& c : candidates) {
        if (!best || (c.price - best->price) * sideSign(side) > 0) {
            best = c;
        }
    }
    return best;
}

double DynamicTakeProfitManager::clampToCap(double candidate, double entry_price, OrderSide side,
                                            double tp_cap, double rung_scale) {
    if (tp_cap <= 0) {
        return candidate;
    }
    const double sign = sideSign(side);
    double max_distance = tp_cap * rung_scale;
    double distance = (candidate - entry_price) * sign;
    if (distance > max_distance) {
        return entry_price + sign * max_distance;
    }
    return candidate;
}

bool DynamicTakeProfitManager::isExtension(OrderSide side, double entry_price, double current_tp,
                                           double candidate, double price, double min_change_ratio) {
    const double sign = sideSign(side);
    if ((candidate - price) * sign <= 0) {
        return false;
    }
    if (current_tp <= 0) {
        return false;
    }
    if ((candidate - current_tp) * sign <= 0) {
        return false;
    }
    // 최소 변경폭은 진입가 기준 현재 TP 거리 대비
    return std::abs(candidate - current_tp) >= std::abs(current_tp - entry_price) * min_change_ratio;
}

std::optional<TakeProfitCandidate> DynamicTakeProfitManager::evaluate(const PositionRecord& position,
                                                                      const analytics::MarketSnapshot& snapshot,
                                                                      const analytics::MarketRegime& regime,
                                                                      double price,
                                                                      double tp_cap,
                                                                      double rung_scale) const {
    if (!config_.enabled || position.take_profit <= 0) {
        return std::nullopt;
    }

    auto best = selectFurthest(detect(position, snapshot, regime, price), position.side);
    if (!best) {
        return std::nullopt;
    }

    best->price = clampToCap(best->price, position.entry_price, position.side, tp_cap, rung_scale);
    if (!isExtension(position.side, position.entry_price, position.take_profit, best->price, price,
                     config_.min_change_ratio)) {
        return std::nullopt;
    }
    return best;
}

} // namespace position
} // namespace trendpilot
