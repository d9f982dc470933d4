#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"
#include "analytics/MarketSnapshot.h"
#include "analytics/RegimeClassifier.h"
#include "position/PositionConfig.h"
#include "position/PositionTypes.h"

namespace trendpilot {
namespace position {

// 동적 손절 관리
// 각 감지기가 후보 손절가를 내고, 가장 보수적인(가격에 가장 가까운) 후보를 채택.
// 기존 손절보다 조이는 경우에만 적용하므로 손절은 절대 느슨해지지 않는다
class DynamicStopLossManager {
public:
    explicit DynamicStopLossManager(const StopLossConfig& config = StopLossConfig());

    // 현재 가격 기준 올바른 쪽에 있는 후보만 반환 (감지기 순서 유지)
    std::vector<StopCandidate> detect(const PositionRecord& position,
                                      const analytics::MarketSnapshot& snapshot,
                                      const analytics::MarketRegime& regime,
                                      const std::optional<analytics::MarketRegime>& previous,
                                      double price) const;

    // 적용할 손절가. 개선이 아니면 nullopt
    std::optional<StopCandidate> evaluate(const PositionRecord& position,
                                          const analytics::MarketSnapshot& snapshot,
                                          const analytics::MarketRegime& regime,
                                          const std::optional<analytics::MarketRegime>& previous,
                                          double price) const;

    // 동률이면 앞선 후보 유지
    static std::optional<StopCandidate> selectTightest(const std::vector<StopCandidate>& candidates,
                                                       OrderSide side);

    // 더 조이고, 가격의 올바른 쪽이며, 최소 변경 비율 이상인가
    static bool isImprovement(OrderSide side, double current_stop, double candidate,
                              double price, double min_change_ratio);

    static bool isDowngrade(const analytics::MarketRegime& previous, const analytics::MarketRegime& current);

    const StopLossConfig& config() const { return config_; }

private:
    StopLossConfig config_;
};

} // namespace position
} // namespace trendpilot
