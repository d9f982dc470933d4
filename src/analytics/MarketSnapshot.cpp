#include "analytics/MarketSnapshot.h"

#include <algorithm>

namespace trendpilot {
namespace analytics {

MarketSnapshot MarketSnapshot::build(const std::string& symbol,
                                     const std::string& timeframe,
                                     std::vector<Candle> bars,
                                     const IndicatorSettings& settings) {
    MarketSnapshot snap;
    snap.symbol = symbol;
    snap.timeframe = timeframe;
    snap.bars = std::move(bars);
    snap.settings = settings;

    const auto closes = TechnicalIndicators::extractClosePrices(snap.bars);
    const auto volumes = TechnicalIndicators::extractVolumes(snap.bars);
    const size_t n = snap.bars.size();

    snap.sma_fast = TechnicalIndicators::smaSeries(closes, settings.sma_fast);
    snap.sma_slow = TechnicalIndicators::smaSeries(closes, settings.sma_slow);
    snap.atr = TechnicalIndicators::atrSeries(snap.bars, settings.atr_period);
    snap.rsi = TechnicalIndicators::rsiSeries(closes, settings.rsi_period);

    auto macd = TechnicalIndicators::macdSeries(closes, settings.macd_fast, settings.macd_slow, settings.macd_signal);
    snap.macd = std::move(macd.macd);
    snap.macd_signal = std::move(macd.signal);
    snap.macd_hist = std::move(macd.histogram);

    snap.adx = TechnicalIndicators::adxSeries(snap.bars, settings.adx_period);

    auto bb = TechnicalIndicators::bollingerSeries(closes, settings.bb_period, settings.bb_std_dev);
    snap.bb_upper = std::move(bb.upper);
    snap.bb_middle = std::move(bb.middle);
    snap.bb_lower = std::move(bb.lower);

    snap.obv = TechnicalIndicators::obvSeries(snap.bars);
    snap.volume_ma = TechnicalIndicators::smaSeries(volumes, settings.volume_ma_period);

    // 추세 라벨: 두 이동평균이 모두 정의된 봉부터
    size_t trend_start = IndicatorSeries::npos;
    if (snap.sma_fast.first_valid != IndicatorSeries::npos &&
        snap.sma_slow.first_valid != IndicatorSeries::npos) {
        trend_start = std::max(snap.sma_fast.first_valid, snap.sma_slow.first_valid);
    }
    snap.ma_trend = IndicatorSeries(n, trend_start);
    if (trend_start != IndicatorSeries::npos) {
        for (size_t i = trend_start; i < n; ++i) {
            snap.ma_trend.values[i] = snap.sma_fast.values[i] > snap.sma_slow.values[i] ? 1.0 : -1.0;
        }
    }

    // 교차는 직전 봉 라벨이 있어야 정의됨
    size_t cross_start = trend_start == IndicatorSeries::npos ? IndicatorSeries::npos : trend_start + 1;
    snap.ma_cross = IndicatorSeries(n, cross_start);
    if (cross_start != IndicatorSeries::npos) {
        for (size_t i = cross_start; i < n; ++i) {
            double prev = snap.ma_trend.values[i - 1];
            double cur = snap.ma_trend.values[i];
            if (cur > 0 && prev < 0) snap.ma_cross.values[i] = 1.0;
            else if (cur < 0 && prev > 0) snap.ma_cross.values[i] = -1.0;
        }
    }

    return snap;
}

} // namespace analytics
} // namespace trendpilot
