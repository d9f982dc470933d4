#pragma once

#include <optional>
#include <vector>

#include "analytics/MarketSnapshot.h"
#include "analytics/RegimeClassifier.h"
#include "common/Types.h"
#include "risk/RiskConfig.h"

namespace trendpilot {
namespace risk {

struct RiskProfile {
    analytics::RegimeType regime = analytics::RegimeType::WEAK_TREND;
    double risk_multiplier = 1.0;
    double stop_distance_multiplier = 2.0;
    std::vector<double> tp_ladder;
    std::vector<double> allocations;
    double trail_activation = 1.5;
    double trail_distance = 1.5;
};

// 레짐 -> 리스크 프로파일 (순수 함수)
class RiskParameterAdapter {
public:
    explicit RiskParameterAdapter(const RiskConfig& config);

    RiskProfile adapt(const analytics::MarketRegime& regime,
                      std::optional<OrderSide> side = std::nullopt) const;

    // 전역 [min, max] 클램프. 테이블 설정과 무관하게 항상 적용
    double clampMultiplier(double multiplier) const;

    // 진입 손절가: ATR 기반 (또는 고정 tick), 지지/저항 근접 시 스윙 기반과 비교해 더 타이트한 쪽
    double initialStopLoss(const analytics::MarketSnapshot& snapshot,
                           const analytics::MarketRegime& regime,
                           OrderSide side, double entry_price,
                           const RiskProfile& profile, const SymbolSpec& spec) const;

private:
    RiskConfig config_;
};

} // namespace risk
} // namespace trendpilot
