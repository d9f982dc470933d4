#include "risk/RiskParameterAdapter.h"

#include <algorithm>

namespace trendpilot {
namespace risk {

using analytics::PriceAction;
using analytics::RegimeType;

RiskParameterAdapter::RiskParameterAdapter(const RiskConfig& config)
    : config_(config)
{
    // 최소/최대가 뒤집혀 있으면 교정
    if (config_.min_risk_multiplier > config_.max_risk_multiplier) {
        std::swap(config_.min_risk_multiplier, config_.max_risk_multiplier);
    }
}

double RiskParameterAdapter::clampMultiplier(double multiplier) const {
    return std::clamp(multiplier, config_.min_risk_multiplier, config_.max_risk_multiplier);
}

RiskProfile RiskParameterAdapter::adapt(const analytics::MarketRegime& regime,
                                        std::optional<OrderSide> side) const {
    const auto& params = config_.regime_table.get(regime.type);

    RiskProfile profile;
    profile.regime = regime.type;
    profile.risk_multiplier = clampMultiplier(params.risk_multiplier);
    profile.stop_distance_multiplier = params.stop_distance_multiplier;
    profile.tp_ladder = params.tp_ladder;
    profile.allocations = params.allocations;
    profile.trail_activation = params.trail_activation;
    profile.trail_distance = params.trail_distance;

    // 변동성에 따른 손절 거리 조정
    if (regime.volatility_ratio > 1.5) {
        profile.stop_distance_multiplier *= 1.2;
        profile.trail_distance *= 1.3;
    } else if (regime.volatility_ratio < 0.7) {
        profile.stop_distance_multiplier *= 0.9;
    }

    // 매우 일관된 강한 추세는 트레일링을 바짝
    if (regime.type == RegimeType::STRONG_TREND && regime.consistency > 85.0) {
        profile.trail_distance *= 0.8;
    }

    // 가격 행동이 방향과 일치하면 목표 확대, 반대면 축소
    if (side) {
        bool is_buy = *side == OrderSide::BUY;
        bool aligned = (is_buy && regime.price_action == PriceAction::BULLISH) ||
                       (!is_buy && regime.price_action == PriceAction::BEARISH);
        bool counter = (is_buy && regime.price_action == PriceAction::BEARISH) ||
                       (!is_buy && regime.price_action == PriceAction::BULLISH);
        double scale = aligned ? 1.2 : counter ? 0.8 : 1.0;
        for (auto& m : profile.tp_ladder) m *= scale;
    }

    return profile;
}

double RiskParameterAdapter::initialStopLoss(const analytics::MarketSnapshot& snapshot,
                                             const analytics::MarketRegime& regime,
                                             OrderSide side, double entry_price,
                                             const RiskProfile& profile, const SymbolSpec& spec) const {
    const double sign = sideSign(side);
    double atr = snapshot.currentAtr();

    double distance = atr * profile.stop_distance_multiplier;
    auto ov = config_.symbol_overrides.find(snapshot.symbol);
    if (ov != config_.symbol_overrides.end() && ov->second.fixed_stop_points > 0) {
        distance = ov->second.fixed_stop_points * spec.tick_size;
    }
    double stop = entry_price - sign * distance;

    // 지지/저항 근처면 최근 스윙 기준 손절과 비교해 더 가까운 쪽
    if (regime.sr_proximity < 1.5 && atr > 0 && snapshot.size() >= 20) {
        double swing = side == OrderSide::BUY ? snapshot.bars.back().low : snapshot.bars.back().high;
        for (size_t i = snapshot.size() - 20; i < snapshot.size(); ++i) {
            swing = side == OrderSide::BUY ? std::min(swing, snapshot.bars[i].low)
                                           : std::max(swing, snapshot.bars[i].high);
        }
        double structure_stop = swing - sign * 0.5 * atr;
        // 진입가 반대편에 있어야 유효
        if ((entry_price - structure_stop) * sign > 0) {
            stop = side == OrderSide::BUY ? std::max(stop, structure_stop) : std::min(stop, structure_stop);
        }
    }
    return stop;
}

} // namespace risk
} // namespace trendpilot
