#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <cstdlib>
#include <algorithm>
#include <numeric>
#include <functional>

namespace trendpilot {
namespace analytics {

std::vector<double> IndicatorSeries::tail(size_t n) const {
    std::vector<double> out;
    if (first_valid == npos || values.empty()) return out;
    size_t begin = first_valid;
    if (values.size() - begin > n) {
        begin = values.size() - n;
    }
    out.assign(values.begin() + begin, values.end());
    return out;
}

double TechnicalIndicators::calculateVolatilityRatio(
    const std::vector<Candle>& candles,
    int atr_period,
    int period
) {
    auto atr = atrSeries(candles, atr_period);
    if (!atr.hasLast()) {
        return 1.0;
    }

    auto window = atr.tail(static_cast<size_t>(std::max(period, 1)));
    double avg_atr = calculateMean(window);
    if (avg_atr < 1e-12) return 1.0;

    return atr.values.back() / avg_atr;
}

// ========== 시계열 ==========

IndicatorSeries TechnicalIndicators::smaSeries(const std::vector<double>& values, int period) {
    const size_t n = values.size();
    if (period <= 0 || n < static_cast<size_t>(period)) {
        return IndicatorSeries(n, IndicatorSeries::npos);
    }

    IndicatorSeries out(n, static_cast<size_t>(period - 1));
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += values[i];
        if (i >= static_cast<size_t>(period)) {
            sum -= values[i - period];
        }
        if (i + 1 >= static_cast<size_t>(period)) {
            out.values[i] = sum / period;
        }
    }
    return out;
}

IndicatorSeries TechnicalIndicators::emaSeries(const std::vector<double>& values, int period) {
    const size_t n = values.size();
    if (period <= 0 || n < static_cast<size_t>(period)) {
        return IndicatorSeries(n, IndicatorSeries::npos);
    }

    // 첫 값으로 시드한 재귀 EMA, period-1 이후부터 유효
    IndicatorSeries out(n, static_cast<size_t>(period - 1));
    const double alpha = 2.0 / (period + 1.0);
    double ema = values[0];
    out.values[0] = ema;
    for (size_t i = 1; i < n; ++i) {
        ema = alpha * values[i] + (1.0 - alpha) * ema;
        out.values[i] = ema;
    }
    return out;
}

std::vector<double> TechnicalIndicators::trueRange(const std::vector<Candle>& candles) {
    std::vector<double> tr;
    tr.reserve(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        double range = c.high - c.low;
        if (i == 0) {
            tr.push_back(range);
            continue;
        }
        double prev_close = candles[i - 1].close;
        tr.push_back(std::max({range, std::abs(c.high - prev_close), std::abs(c.low - prev_close)}));
    }
    return tr;
}

IndicatorSeries TechnicalIndicators::atrSeries(const std::vector<Candle>& candles, int period) {
    return smaSeries(trueRange(candles), period);
}

IndicatorSeries TechnicalIndicators::rsiSeries(const std::vector<double>& closes, int period) {
    const size_t n = closes.size();
    if (period <= 0 || n < static_cast<size_t>(period + 1)) {
        return IndicatorSeries(n, IndicatorSeries::npos);
    }

    IndicatorSeries out(n, static_cast<size_t>(period));
    double gain_sum = 0.0;
    double loss_sum = 0.0;
    for (size_t i = 1; i < n; ++i) {
        double change = closes[i] - closes[i - 1];
        gain_sum += change > 0 ? change : 0.0;
        loss_sum += change < 0 ? -change : 0.0;

        if (i > static_cast<size_t>(period)) {
            double old = closes[i - period] - closes[i - period - 1];
            gain_sum -= old > 0 ? old : 0.0;
            loss_sum -= old < 0 ? -old : 0.0;
        }

        if (i >= static_cast<size_t>(period)) {
            double avg_gain = std::max(gain_sum, 0.0) / period;
            double avg_loss = std::max(loss_sum, 0.0) / period;
            if (avg_loss < 1e-12) {
                out.values[i] = avg_gain < 1e-12 ? 50.0 : 100.0;
            } else {
                out.values[i] = 100.0 - (100.0 / (1.0 + avg_gain / avg_loss));
            }
        }
    }
    return out;
}

TechnicalIndicators::MACDSeries TechnicalIndicators::macdSeries(
    const std::vector<double>& closes, int fast, int slow, int signal_period
) {
    const size_t n = closes.size();
    MACDSeries out;
    out.macd = IndicatorSeries(n, IndicatorSeries::npos);
    out.signal = IndicatorSeries(n, IndicatorSeries::npos);
    out.histogram = IndicatorSeries(n, IndicatorSeries::npos);

    if (fast <= 0 || slow <= 0 || signal_period <= 0 || n < static_cast<size_t>(slow)) {
        return out;
    }

    auto fast_ema = emaSeries(closes, fast);
    auto slow_ema = emaSeries(closes, slow);

    const size_t macd_start = static_cast<size_t>(std::max(fast, slow) - 1);
    out.macd = IndicatorSeries(n, macd_start);
    for (size_t i = 0; i < n; ++i) {
        out.macd.values[i] = fast_ema.values[i] - slow_ema.values[i];
    }

    // Signal 은 MACD 유효 구간에 대한 EMA
    const size_t signal_start = macd_start + static_cast<size_t>(signal_period - 1);
    if (signal_start >= n) {
        return out;
    }
    out.signal = IndicatorSeries(n, signal_start);
    out.histogram = IndicatorSeries(n, signal_start);
    const double alpha = 2.0 / (signal_period + 1.0);
    double sig = out.macd.values[macd_start];
    for (size_t i = macd_start; i < n; ++i) {
        if (i > macd_start) {
            sig = alpha * out.macd.values[i] + (1.0 - alpha) * sig;
        }
        out.signal.values[i] = sig;
        out.histogram.values[i] = out.macd.values[i] - sig;
    }
    return out;
}

// ADX (Wilder 평활 DI, DX 의 단순 평균)
IndicatorSeries TechnicalIndicators::adxSeries(const std::vector<Candle>& candles, int period) {
    const size_t n = candles.size();
    const size_t p = static_cast<size_t>(std::max(period, 1));
    if (period <= 0 || n < 2 * p) {
        return IndicatorSeries(n, IndicatorSeries::npos);
    }

    std::vector<double> tr(n, 0.0), dm_plus(n, 0.0), dm_minus(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        double up_move = candles[i].high - candles[i - 1].high;
        double down_move = candles[i - 1].low - candles[i].low;
        double prev_close = candles[i - 1].close;

        tr[i] = std::max({candles[i].high - candles[i].low,
                          std::abs(candles[i].high - prev_close),
                          std::abs(candles[i].low - prev_close)});
        dm_plus[i] = (up_move > down_move && up_move > 0) ? up_move : 0.0;
        dm_minus[i] = (down_move > up_move && down_move > 0) ? down_move : 0.0;
    }

    std::vector<double> dx(n, 0.0);
    double tr_s = 0.0, plus_s = 0.0, minus_s = 0.0;
    for (size_t i = 1; i < n; ++i) {
        if (i <= p) {
            // 초기값은 합계
            tr_s += tr[i];
            plus_s += dm_plus[i];
            minus_s += dm_minus[i];
        } else {
            tr_s = tr_s - (tr_s / period) + tr[i];
            plus_s = plus_s - (plus_s / period) + dm_plus[i];
            minus_s = minus_s - (minus_s / period) + dm_minus[i];
        }

        if (i >= p && tr_s > 0) {
            double di_plus = (plus_s / tr_s) * 100.0;
            double di_minus = (minus_s / tr_s) * 100.0;
            double sum_di = di_plus + di_minus;
            dx[i] = sum_di > 0 ? (std::abs(di_plus - di_minus) / sum_di) * 100.0 : 0.0;
        }
    }

    IndicatorSeries out(n, 2 * p - 1);
    double dx_sum = 0.0;
    for (size_t i = p; i < n; ++i) {
        dx_sum += dx[i];
        if (i >= 2 * p) {
            dx_sum -= dx[i - p];
        }
        if (i >= 2 * p - 1) {
            out.values[i] = dx_sum / period;
        }
    }
    return out;
}

TechnicalIndicators::BollingerSeries TechnicalIndicators::bollingerSeries(
    const std::vector<double>& closes, int period, double std_dev_mult
) {
    BollingerSeries out;
    out.middle = smaSeries(closes, period);
    out.upper = IndicatorSeries(closes.size(), out.middle.first_valid);
    out.lower = IndicatorSeries(closes.size(), out.middle.first_valid);
    if (out.middle.first_valid == IndicatorSeries::npos) {
        return out;
    }

    for (size_t i = out.middle.first_valid; i < closes.size(); ++i) {
        std::vector<double> window(closes.begin() + (i + 1 - period), closes.begin() + i + 1);
        double sd = calculateStandardDeviation(window, out.middle.values[i]);
        out.upper.values[i] = out.middle.values[i] + sd * std_dev_mult;
        out.lower.values[i] = out.middle.values[i] - sd * std_dev_mult;
    }
    return out;
}

IndicatorSeries TechnicalIndicators::obvSeries(const std::vector<Candle>& candles) {
    const size_t n = candles.size();
    if (n == 0) {
        return IndicatorSeries();
    }
    IndicatorSeries out(n, 0);
    for (size_t i = 1; i < n; ++i) {
        double obv = out.values[i - 1];
        if (candles[i].close > candles[i - 1].close) obv += candles[i].volume;
        else if (candles[i].close < candles[i - 1].close) obv -= candles[i].volume;
        out.values[i] = obv;
    }
    return out;
}

// ========== 구조 분석 ==========

std::vector<double> TechnicalIndicators::topHighs(const std::vector<Candle>& candles, int lookback, int count) {
    std::vector<double> highs;
    if (candles.empty() || lookback <= 0 || count <= 0) return highs;

    size_t start = candles.size() > static_cast<size_t>(lookback) ? candles.size() - lookback : 0;
    for (size_t i = start; i < candles.size(); ++i) {
        highs.push_back(candles[i].high);
    }
    std::sort(highs.begin(), highs.end(), std::greater<double>());
    if (highs.size() > static_cast<size_t>(count)) highs.resize(count);
    return highs;
}

std::vector<double> TechnicalIndicators::bottomLows(const std::vector<Candle>& candles, int lookback, int count) {
    std::vector<double> lows;
    if (candles.empty() || lookback <= 0 || count <= 0) return lows;

    size_t start = candles.size() > static_cast<size_t>(lookback) ? candles.size() - lookback : 0;
    for (size_t i = start; i < candles.size(); ++i) {
        lows.push_back(candles[i].low);
    }
    std::sort(lows.begin(), lows.end());
    if (lows.size() > static_cast<size_t>(count)) lows.resize(count);
    return lows;
}

double TechnicalIndicators::linearRegressionSlope(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) return 0.0;

    double x_mean = (n - 1) / 2.0;
    double y_mean = calculateMean(values);
    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = static_cast<double>(i) - x_mean;
        num += dx * (values[i] - y_mean);
        den += dx * dx;
    }
    return den > 0 ? num / den : 0.0;
}

std::vector<size_t> TechnicalIndicators::findPeaks(const std::vector<double>& values, int window) {
    std::vector<size_t> peaks;
    const size_t w = static_cast<size_t>(std::max(window, 1));
    if (values.size() < 2 * w + 1) return peaks;

    for (size_t i = w; i + w < values.size(); ++i) {
        bool is_peak = true;
        for (size_t k = i - w; k <= i + w && is_peak; ++k) {
            if (k == i) continue;
            // 왼쪽은 strict, 오른쪽은 동률 허용 (평탄한 고점 중복 방지)
            if (k < i ? values[k] >= values[i] : values[k] > values[i]) is_peak = false;
        }
        if (is_peak) peaks.push_back(i);
    }
    return peaks;
}

std::vector<size_t> TechnicalIndicators::findTroughs(const std::vector<double>& values, int window) {
    std::vector<size_t> troughs;
    const size_t w = static_cast<size_t>(std::max(window, 1));
    if (values.size() < 2 * w + 1) return troughs;

    for (size_t i = w; i + w < values.size(); ++i) {
        bool is_trough = true;
        for (size_t k = i - w; k <= i + w && is_trough; ++k) {
            if (k == i) continue;
            if (k < i ? values[k] <= values[i] : values[k] < values[i]) is_trough = false;
        }
        if (is_trough) troughs.push_back(i);
    }
    return troughs;
}

// JSON → Candle 변환
std::vector<Candle> TechnicalIndicators::jsonToCandles(const nlohmann::json& json_candles) {
    std::vector<Candle> candles;
    if (!json_candles.is_array()) return candles;

    auto getDouble = [](const nlohmann::json& obj, const char* key) -> double {
        auto it = obj.find(key);
        if (it == obj.end()) return 0.0;
        if (it->is_number()) return it->get<double>();
        if (it->is_string()) {
            const std::string s = it->get<std::string>();
            return std::strtod(s.c_str(), nullptr);
        }
        return 0.0;
    };

    for (const auto& jc : json_candles) {
        if (!jc.is_object()) continue;
        Candle c;
        c.open = getDouble(jc, "open");
        c.high = getDouble(jc, "high");
        c.low = getDouble(jc, "low");
        c.close = getDouble(jc, "close");
        c.volume = getDouble(jc, "volume");
        c.timestamp = jc.value("time", jc.value("timestamp", 0LL));
        candles.push_back(c);
    }

    bool has_timestamp = std::any_of(candles.begin(), candles.end(),
                                     [](const Candle& c) { return c.timestamp != 0; });
    if (has_timestamp) {
        std::stable_sort(candles.begin(), candles.end(),
                         [](const Candle& a, const Candle& b) {
                             return a.timestamp < b.timestamp;
                         });
    }

    return candles;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Candle>& candles) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());
    for (const auto& candle : candles) {
        volumes.push_back(candle.volume);
    }
    return volumes;
}

std::vector<double> TechnicalIndicators::extractHighs(const std::vector<Candle>& candles) {
    std::vector<double> highs;
    highs.reserve(candles.size());
    for (const auto& candle : candles) {
        highs.push_back(candle.high);
    }
    return highs;
}

std::vector<double> TechnicalIndicators::extractLows(const std::vector<Candle>& candles) {
    std::vector<double> lows;
    lows.reserve(candles.size());
    for (const auto& candle : candles) {
        lows.push_back(candle.low);
    }
    return lows;
}

// ========== 헬퍼 ==========

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace analytics
} // namespace trendpilot
