#pragma once

#include <vector>
#include <string>
#include <limits>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace trendpilot {
namespace analytics {

// 봉 인덱스에 정렬된 지표 열. first_valid 이전 값은 정의되지 않음 (warm-up)
struct IndicatorSeries {
    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    std::vector<double> values;
    size_t first_valid = npos;

    IndicatorSeries() = default;
    IndicatorSeries(size_t size, size_t first)
        : values(size, 0.0), first_valid(first < size ? first : npos) {}

    bool defined(size_t i) const {
        return first_valid != npos && i >= first_valid && i < values.size();
    }

    std::optional<double> at(size_t i) const {
        if (!defined(i)) return std::nullopt;
        return values[i];
    }

    bool hasLast() const { return !values.empty() && defined(values.size() - 1); }

    double lastOr(double fallback) const {
        return hasLast() ? values.back() : fallback;
    }

    // 마지막 n 개의 정의된 값 (오래된 것 -> 최신)
    std::vector<double> tail(size_t n) const;
};

// Technical Indicators - 검증된 공식으로 구현
class TechnicalIndicators {
public:
    // 현재 ATR / 최근 period 봉의 평균 ATR. 데이터 부족 시 1.0
    static double calculateVolatilityRatio(const std::vector<Candle>& candles,
                                           int atr_period = 14, int period = 50);

    // ===== 시계열 (봉 정렬) =====

    static IndicatorSeries smaSeries(const std::vector<double>& values, int period);
    static IndicatorSeries emaSeries(const std::vector<double>& values, int period);
    static std::vector<double> trueRange(const std::vector<Candle>& candles);
    // TR 의 단순 이동평균
    static IndicatorSeries atrSeries(const std::vector<Candle>& candles, int period);
    // 상승/하락폭의 단순 이동평균 기반 RSI
    static IndicatorSeries rsiSeries(const std::vector<double>& closes, int period);

    struct MACDSeries {
        IndicatorSeries macd;
        IndicatorSeries signal;
        IndicatorSeries histogram;
    };
    static MACDSeries macdSeries(const std::vector<double>& closes, int fast, int slow, int signal_period);

    static IndicatorSeries adxSeries(const std::vector<Candle>& candles, int period);

    struct BollingerSeries {
        IndicatorSeries upper;
        IndicatorSeries middle;
        IndicatorSeries lower;
    };
    static BollingerSeries bollingerSeries(const std::vector<double>& closes, int period, double std_dev_mult);

    static IndicatorSeries obvSeries(const std::vector<Candle>& candles);

    // ===== 구조 분석 =====

    // 최근 lookback 봉에서 상위 count 개 고가 (내림차순)
    static std::vector<double> topHighs(const std::vector<Candle>& candles, int lookback, int count);
    // 최근 lookback 봉에서 하위 count 개 저가 (오름차순)
    static std::vector<double> bottomLows(const std::vector<Candle>& candles, int lookback, int count);

    // 최소자승 기울기 (x = 0..n-1)
    static double linearRegressionSlope(const std::vector<double>& values);

    // 지역 극값 인덱스 (좌우 window 봉 비교)
    static std::vector<size_t> findPeaks(const std::vector<double>& values, int window);
    static std::vector<size_t> findTroughs(const std::vector<double>& values, int window);

    // Helper: JSON 봉 배열을 Candle 구조체로 변환 (timestamp 오름차순 정렬)
    static std::vector<Candle> jsonToCandles(const nlohmann::json& json_candles);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractVolumes(const std::vector<Candle>& candles);
    static std::vector<double> extractHighs(const std::vector<Candle>& candles);
    static std::vector<double> extractLows(const std::vector<Candle>& candles);

    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace trendpilot
