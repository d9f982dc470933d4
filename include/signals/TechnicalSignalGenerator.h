#pragma once

#include <string>

#include "analytics/MarketSnapshot.h"
#include "analytics/RegimeClassifier.h"
#include "analytics/VolumeAnalyzer.h"
#include "signals/SignalConfig.h"
#include "signals/SignalTypes.h"

namespace trendpilot {
namespace signals {

struct TechnicalEvaluation {
    SignalComponent component;                          // 최종 (필터 적용 후)
    SignalDirection raw_direction = SignalDirection::NEUTRAL;
    double alignment = 0.0;                             // 레짐 정합도 (거래량 가감 전)
    analytics::VolumeConfirmation volume;
    std::string reason;
};

// 이동평균 교차 + RSI/MACD/ADX 필터 + 레짐 정합도 + 거래량 확인
class TechnicalSignalGenerator {
public:
    TechnicalSignalGenerator(const TechnicalConfig& config, const analytics::VolumeAnalyzer& volume);

    TechnicalEvaluation evaluate(const analytics::MarketSnapshot& snapshot,
                                 const analytics::MarketRegime& regime) const;

    // 교차 또는 추세 전환 확인으로 방향 결정 (필터 전)
    static SignalDirection crossoverDirection(const analytics::MarketSnapshot& snapshot, bool use_trend_confirmation);

    // RSI / MACD / ADX 필터. 통과 못하면 사유 반환
    bool passesFilters(const analytics::MarketSnapshot& snapshot, SignalDirection direction, std::string& reason) const;

    // 레짐과 방향의 정합도 (0.5 기준 가감, 0~1)
    static double alignmentScore(const analytics::MarketRegime& regime, SignalDirection direction,
                                 double sr_proximity_threshold = 0.8);

private:
    TechnicalConfig config_;
    analytics::VolumeAnalyzer volume_;
};

} // namespace signals
} // namespace trendpilot
