#pragma once

#include "common/Types.h"
#include "analytics/AnalyticsConfig.h"
#include "analytics/MarketSnapshot.h"

namespace trendpilot {
namespace analytics {

enum class VolumeTrend { INCREASING, DECREASING, NEUTRAL };
enum class ObvSignal { BULLISH, BEARISH, NEUTRAL };
enum class VolumeDivergence { BULLISH, BEARISH, NONE };

struct VolumeAnalysis {
    double volume_ratio = 1.0;      // 현재 거래량 / 거래량 MA
    bool above_average = true;
    VolumeTrend trend = VolumeTrend::NEUTRAL;
    ObvSignal obv_signal = ObvSignal::NEUTRAL;
    VolumeDivergence divergence = VolumeDivergence::NONE;
};

struct VolumeConfirmation {
    bool confirmed = true;
    double confidence_delta = 0.0;
};

const char* toString(VolumeTrend trend);
const char* toString(ObvSignal signal);
const char* toString(VolumeDivergence divergence);

// 거래량 기반 신호 확인
class VolumeAnalyzer {
public:
    explicit VolumeAnalyzer(const VolumeConfig& config = VolumeConfig());

    VolumeAnalysis analyze(const MarketSnapshot& snapshot) const;

    // 방향에 대한 확인 여부 + 신뢰도 가감
    VolumeConfirmation confirm(const VolumeAnalysis& analysis, SignalDirection direction) const;

    // 필터 비활성 시 (true, 0)
    VolumeConfirmation shouldTrade(const MarketSnapshot& snapshot, SignalDirection direction) const;

    bool enabled() const { return config_.enabled; }

private:
    VolumeConfig config_;
};

} // namespace analytics
} // namespace trendpilot
