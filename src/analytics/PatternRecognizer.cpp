#include "analytics/PatternRecognizer.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace trendpilot {
namespace analytics {

PatternRecognizer::PatternRecognizer(const PatternConfig& config)
    : config_(config) {}

std::vector<PatternMatch> PatternRecognizer::detect(const std::vector<Candle>& bars) const {
    std::vector<PatternMatch> out;
    if (bars.size() < static_cast<size_t>(config_.min_bars)) {
        return out;
    }
    detectDoubles(bars, out);
    detectHeadAndShoulders(bars, out);
    detectTrianglesAndWedges(bars, out);
    detectFlags(bars, out);
    return out;
}

PatternSignal PatternRecognizer::evaluate(const std::vector<Candle>& bars) const {
    return aggregate(detect(bars), config_.dominance_ratio);
}

PatternSignal PatternRecognizer::aggregate(std::vector<PatternMatch> matches, double dominance_ratio) {
    PatternSignal signal;
    signal.matches = std::move(matches);

    double buy_score = 0.0;
    double sell_score = 0.0;
    double total = 0.0;
    for (const auto& m : signal.matches) {
        total += m.confidence;
        if (m.direction == SignalDirection::BUY) buy_score += m.confidence;
        else if (m.direction == SignalDirection::SELL) sell_score += m.confidence;
    }
    if (total <= 0.0) {
        return signal;
    }

    if (buy_score > sell_score * dominance_ratio) {
        signal.direction = SignalDirection::BUY;
        signal.confidence = buy_score / total;
    } else if (sell_score > buy_score * dominance_ratio) {
        signal.direction = SignalDirection::SELL;
        signal.confidence = sell_score / total;
    }
    return signal;
}

void PatternRecognizer::detectDoubles(const std::vector<Candle>& bars, std::vector<PatternMatch>& out) const {
    const auto highs = TechnicalIndicators::extractHighs(bars);
    const auto lows = TechnicalIndicators::extractLows(bars);

    auto peaks = TechnicalIndicators::findPeaks(highs, config_.extrema_window);
    if (peaks.size() >= 2) {
        double p1 = highs[peaks[peaks.size() - 2]];
        double p2 = highs[peaks.back()];
        double diff = std::abs(p1 - p2) / std::max(p1, p2);
        if (diff < config_.double_tolerance) {
            out.emplace_back("double_top", SignalDirection::SELL, 1.0 - diff);
        }
    }

    auto troughs = TechnicalIndicators::findTroughs(lows, config_.extrema_window);
    if (troughs.size() >= 2) {
        double t1 = lows[troughs[troughs.size() - 2]];
        double t2 = lows[troughs.back()];
        double diff = std::abs(t1 - t2) / std::max(t1, t2);
        if (diff < config_.double_tolerance) {
            out.emplace_back("double_bottom", SignalDirection::BUY, 1.0 - diff);
        }
    }
}

void PatternRecognizer::detectHeadAndShoulders(const std::vector<Candle>& bars, std::vector<PatternMatch>& out) const {
    const auto highs = TechnicalIndicators::extractHighs(bars);
    const auto lows = TechnicalIndicators::extractLows(bars);

    auto peaks = TechnicalIndicators::findPeaks(highs, config_.extrema_window);
    if (peaks.size() >= 3) {
        double left = highs[peaks[peaks.size() - 3]];
        double head = highs[peaks[peaks.size() - 2]];
        double right = highs[peaks.back()];
        double diff = std::abs(left - right) / std::max(left, right);
        if (head > left && head > right && diff < config_.shoulder_tolerance) {
            out.emplace_back("head_and_shoulders", SignalDirection::SELL, 0.7 + 0.3 * (1.0 - diff));
        }
    }

    auto troughs = TechnicalIndicators::findTroughs(lows, config_.extrema_window);
    if (troughs.size() >= 3) {
        double left = lows[troughs[troughs.size() - 3]];
        double head = lows[troughs[troughs.size() - 2]];
        double right = lows[troughs.back()];
        double diff = std::abs(left - right) / std::max(left, right);
        if (head < left && head < right && diff < config_.shoulder_tolerance) {
            out.emplace_back("inverse_head_and_shoulders", SignalDirection::BUY, 0.7 + 0.3 * (1.0 - diff));
        }
    }
}

void PatternRecognizer::detectTrianglesAndWedges(const std::vector<Candle>& bars, std::vector<PatternMatch>& out) const {
    const size_t window = static_cast<size_t>(config_.triangle_window);
    if (bars.size() < window || window < 2) {
        return;
    }

    std::vector<Candle> recent(bars.end() - window, bars.end());
    const auto highs = TechnicalIndicators::extractHighs(recent);
    const auto lows = TechnicalIndicators::extractLows(recent);
    double mean_price = TechnicalIndicators::calculateMean(TechnicalIndicators::extractClosePrices(recent));
    if (mean_price <= 0) {
        return;
    }

    // 가격 대비 정규화된 기울기
    double high_slope = TechnicalIndicators::linearRegressionSlope(highs) / mean_price;
    double low_slope = TechnicalIndicators::linearRegressionSlope(lows) / mean_price;
    const double flat = config_.flat_slope;

    bool high_flat = std::abs(high_slope) < flat;
    bool low_flat = std::abs(low_slope) < flat;

    if (high_flat && low_slope > flat) {
        out.emplace_back("ascending_triangle", SignalDirection::BUY, 0.7);
    } else if (high_slope < -flat && low_flat) {
        out.emplace_back("descending_triangle", SignalDirection::SELL, 0.7);
    } else if (high_slope < -flat && low_slope > flat) {
        out.emplace_back("symmetrical_triangle", SignalDirection::NEUTRAL, 0.6);
    } else if (high_slope > flat && low_slope > flat && low_slope > high_slope) {
        out.emplace_back("rising_wedge", SignalDirection::SELL, 0.65);
    } else if (high_slope < -flat && low_slope < -flat && high_slope < low_slope) {
        out.emplace_back("falling_wedge", SignalDirection::BUY, 0.65);
    }
}

void PatternRecognizer::detectFlags(const std::vector<Candle>& bars, std::vector<PatternMatch>& out) const {
    const size_t window = static_cast<size_t>(config_.flag_window);
    const size_t flag_len = 10;
    if (bars.size() < window || window <= flag_len) {
        return;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    const size_t n = closes.size();
    double pole_start = closes[n - window];
    double pole_end = closes[n - flag_len];
    if (pole_start <= 0) {
        return;
    }
    double pole_change = (pole_end - pole_start) / pole_start;

    std::vector<double> flag(closes.end() - flag_len, closes.end());
    double mean = TechnicalIndicators::calculateMean(flag);
    if (mean <= 0) {
        return;
    }
    double volatility = TechnicalIndicators::calculateStandardDeviation(flag, mean) / mean;
    if (volatility >= config_.flag_max_volatility) {
        return;
    }

    if (pole_change > config_.flag_pole_change) {
        out.emplace_back("bull_flag", SignalDirection::BUY, 0.75);
    } else if (pole_change < -config_.flag_pole_change) {
        out.emplace_back("bear_flag", SignalDirection::SELL, 0.75);
    }
}

} // namespace analytics
} // namespace trendpilot
