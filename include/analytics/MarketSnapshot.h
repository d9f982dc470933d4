#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "analytics/AnalyticsConfig.h"
#include "analytics/TechnicalIndicators.h"

namespace trendpilot {
namespace analytics {

// 한 심볼/타임프레임의 봉 + 파생 지표. 사이클마다 새로 계산되며 생성 후 불변
struct MarketSnapshot {
    std::string symbol;
    std::string timeframe;
    std::vector<Candle> bars;
    IndicatorSettings settings;

    IndicatorSeries sma_fast;
    IndicatorSeries sma_slow;
    IndicatorSeries atr;
    IndicatorSeries rsi;
    IndicatorSeries macd;
    IndicatorSeries macd_signal;
    IndicatorSeries macd_hist;
    IndicatorSeries adx;
    IndicatorSeries bb_upper;
    IndicatorSeries bb_middle;
    IndicatorSeries bb_lower;
    IndicatorSeries obv;
    IndicatorSeries volume_ma;
    IndicatorSeries ma_trend;   // fast > slow 이면 +1, 아니면 -1
    IndicatorSeries ma_cross;   // 상향 돌파 +1, 하향 돌파 -1, 그 외 0

    static MarketSnapshot build(const std::string& symbol,
                                const std::string& timeframe,
                                std::vector<Candle> bars,
                                const IndicatorSettings& settings);

    bool empty() const { return bars.empty(); }
    size_t size() const { return bars.size(); }
    size_t lastIndex() const { return bars.empty() ? 0 : bars.size() - 1; }
    const Candle& lastBar() const { return bars.back(); }
    double lastClose() const { return bars.empty() ? 0.0 : bars.back().close; }

    double currentAtr() const { return atr.lastOr(0.0); }
    int currentTrend() const { return static_cast<int>(ma_trend.lastOr(0.0)); }
    int currentCross() const { return static_cast<int>(ma_cross.lastOr(0.0)); }
};

} // namespace analytics
} // namespace trendpilot
