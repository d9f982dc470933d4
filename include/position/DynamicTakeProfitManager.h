#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"
#include "analytics/MarketSnapshot.h"
#include "analytics/RegimeClassifier.h"
#include "analytics/VolumeAnalyzer.h"
#include "position/PositionConfig.h"
#include "position/PositionTypes.h"

namespace trendpilot {
namespace position {

// 동적 익절 확장. 수익 중인 포지션에서만 동작하며 TP 는 절대 줄어들지 않는다
class DynamicTakeProfitManager {
public:
    DynamicTakeProfitManager(const TakeProfitConfig& config = TakeProfitConfig(),
                             const analytics::VolumeAnalyzer& volume = analytics::VolumeAnalyzer());

    std::vector<TakeProfitCandidate> detect(const PositionRecord& position,
                                            const analytics::MarketSnapshot& snapshot,
                                            const analytics::MarketRegime& regime,
                                            double price) const;

    // 가장 먼 후보를 cap * rung_scale 로 제한한 뒤, 현재 TP 보다 확장일 때만 반환
    std::optional<TakeProfitCandidate> evaluate(const PositionRecord& position,
                                                const analytics::MarketSnapshot& snapshot,
                                                const analytics::MarketRegime& regime,
                                                double price,
                                                double tp_cap,
                                                double rung_scale) const;

    static std::optional<TakeProfitCandidate> selectFurthest(const std::vector<TakeProfitCandidate>& candidates,
                                                             OrderSide side);

    static double clampToCap(double candidate, double entry_price, OrderSide side,
                             double tp_cap, double rung_scale);

    static bool isExtension(OrderSide side, double entry_price, double current_tp,
                            double candidate, double price, double min_change_ratio);

    const TakeProfitConfig& config() const { return config_; }

private:
    TakeProfitConfig config_;
    analytics::VolumeAnalyzer volume_;
};

} // namespace position
} // namespace trendpilot
