#include "analytics/VolumeAnalyzer.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>

namespace trendpilot {
namespace analytics {

const char* toString(VolumeTrend trend) {
    switch (trend) {
        case VolumeTrend::INCREASING: return "increasing";
        case VolumeTrend::DECREASING: return "decreasing";
        case VolumeTrend::NEUTRAL: return "neutral";
    }
    return "neutral";
}

const char* toString(ObvSignal signal) {
    switch (signal) {
        case ObvSignal::BULLISH: return "bullish";
        case ObvSignal::BEARISH: return "bearish";
        case ObvSignal::NEUTRAL: return "neutral";
    }
    return "neutral";
}

const char* toString(VolumeDivergence divergence) {
    switch (divergence) {
        case VolumeDivergence::BULLISH: return "bullish_divergence";
        case VolumeDivergence::BEARISH: return "bearish_divergence";
        case VolumeDivergence::NONE: return "none";
    }
    return "none";
}

VolumeAnalyzer::VolumeAnalyzer(const VolumeConfig& config)
    : config_(config) {}

VolumeAnalysis VolumeAnalyzer::analyze(const MarketSnapshot& snapshot) const {
    VolumeAnalysis result;
    const auto& bars = snapshot.bars;
    if (bars.empty()) {
        return result;
    }

    const auto volumes = TechnicalIndicators::extractVolumes(bars);
    const double current_volume = volumes.back();

    // 1. 평균 대비 거래량 (데이터 부족 시 통과)
    auto volume_ma = TechnicalIndicators::smaSeries(volumes, config_.ma_period);
    if (volume_ma.hasLast() && volume_ma.values.back() > 0) {
        result.volume_ratio = current_volume / volume_ma.values.back();
        result.above_average = result.volume_ratio >= config_.min_volume_ratio;
    }

    // 2. 거래량 추세 (최근 trend_window 봉 회귀 기울기)
    if (volumes.size() >= static_cast<size_t>(config_.trend_window) && config_.trend_window >= 2) {
        std::vector<double> recent(volumes.end() - config_.trend_window, volumes.end());
        double slope = TechnicalIndicators::linearRegressionSlope(recent);
        if (slope > 0) result.trend = VolumeTrend::INCREASING;
        else if (slope < 0) result.trend = VolumeTrend::DECREASING;
    }

    // 3. OBV vs OBV 이동평균
    auto obv_ma = TechnicalIndicators::smaSeries(snapshot.obv.values, config_.obv_period);
    if (snapshot.obv.hasLast() && obv_ma.hasLast()) {
        double obv = snapshot.obv.values.back();
        if (obv > obv_ma.values.back()) result.obv_signal = ObvSignal::BULLISH;
        else if (obv < obv_ma.values.back()) result.obv_signal = ObvSignal::BEARISH;
    }

    // 4. 가격-거래량 다이버전스: 고점 갱신인데 거래량 감소 -> 약세
    const size_t window = static_cast<size_t>(std::max(config_.divergence_window, 1));
    if (bars.size() >= window) {
        size_t start = bars.size() - window;
        size_t high_idx = start;
        size_t low_idx = start;
        for (size_t i = start; i < bars.size(); ++i) {
            if (bars[i].high > bars[high_idx].high) high_idx = i;
            if (bars[i].low < bars[low_idx].low) low_idx = i;
        }
        double close = bars.back().close;
        if (close >= bars[high_idx].high * 0.999 &&
            current_volume < bars[high_idx].volume * config_.divergence_volume_ratio) {
            result.divergence = VolumeDivergence::BEARISH;
        } else if (close <= bars[low_idx].low * 1.001 &&
                   current_volume < bars[low_idx].volume * config_.divergence_volume_ratio) {
            result.divergence = VolumeDivergence::BULLISH;
        }
    }

    return result;
}

VolumeConfirmation VolumeAnalyzer::confirm(const VolumeAnalysis& analysis, SignalDirection direction) const {
    VolumeConfirmation out;
    if (direction == SignalDirection::NEUTRAL) {
        out.confirmed = false;
        return out;
    }

    const bool is_buy = direction == SignalDirection::BUY;
    int positives = 0;

    if (analysis.above_average) {
        out.confidence_delta += 0.05;
        ++positives;
    }
    if (analysis.trend == VolumeTrend::INCREASING) {
        out.confidence_delta += 0.05;
        ++positives;
    }
    if ((is_buy && analysis.obv_signal == ObvSignal::BULLISH) ||
        (!is_buy && analysis.obv_signal == ObvSignal::BEARISH)) {
        out.confidence_delta += 0.05;
        ++positives;
    }

    const auto favorable = is_buy ? VolumeDivergence::BULLISH : VolumeDivergence::BEARISH;
    const auto adverse = is_buy ? VolumeDivergence::BEARISH : VolumeDivergence::BULLISH;
    if (analysis.divergence == favorable) out.confidence_delta += 0.10;
    else if (analysis.divergence == adverse) out.confidence_delta -= 0.10;

    out.confirmed = positives >= 2;
    return out;
}

VolumeConfirmation VolumeAnalyzer::shouldTrade(const MarketSnapshot& snapshot, SignalDirection direction) const {
    if (!config_.enabled) {
        return VolumeConfirmation{true, 0.0};
    }
    return confirm(analyze(snapshot), direction);
}

} // namespace analytics
} // namespace trendpilot
