#undef NDEBUG
#include "analytics/MarketSnapshot.h"
#include "analytics/RegimeClassifier.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>

using namespace trendpilot;
using namespace trendpilot::analytics;

namespace {

MarketSnapshot trendingSnapshot(size_t n, double step) {
    std::vector<Candle> bars;
    double price = 1000.0;
    for (size_t i = 0; i < n; ++i) {
        double open = price;
        price += step;
        bars.emplace_back(open, std::max(open, price) + 0.5, std::min(open, price) - 0.5, price,
                          1000.0, static_cast<long long>(i) * 3600000);
    }
    return MarketSnapshot::build("TEST", "H1", bars, IndicatorSettings());
}

void testThresholds() {
    RegimeClassifier classifier;

    assert(classifier.classify(35.0, 85.0, 1.0) == RegimeType::STRONG_TREND);
    assert(classifier.classify(25.0, 55.0, 1.0) == RegimeType::WEAK_TREND);
    assert(classifier.classify(10.0, 50.0, 1.8) == RegimeType::VOLATILE);
    assert(classifier.classify(10.0, 40.0, 1.2) == RegimeType::RANGING);

    // 임계값은 초과 비교
    assert(classifier.classify(30.0, 85.0, 1.0) == RegimeType::WEAK_TREND);
    assert(classifier.classify(20.0, 85.0, 1.0) == RegimeType::RANGING);
    assert(classifier.classify(10.0, 40.0, 1.5) == RegimeType::RANGING);

    // 추세 조건이 변동성보다 우선
    assert(classifier.classify(35.0, 85.0, 3.0) == RegimeType::STRONG_TREND);
    std::cout << "  thresholds OK\n";
}

void testInsufficientHistory() {
    RegimeClassifier classifier;
    auto regime = classifier.classify(trendingSnapshot(20, 1.0));

    assert(!regime.sufficient_history);
    assert(regime.type == RegimeType::RANGING);
    assert(regime.strength == 0.0);
    assert(regime.volatility_ratio == 1.0);
    assert(regime.consistency == 50.0);

    auto empty = classifier.classify(MarketSnapshot::build("TEST", "H1", {}, IndicatorSettings()));
    assert(!empty.sufficient_history);

    bool thrown = false;
    try {
        classifier.requireHistory(trendingSnapshot(20, 1.0));
    } catch (const InsufficientHistory&) {
        thrown = true;
    }
    assert(thrown);
    classifier.requireHistory(trendingSnapshot(120, 1.0));
    std::cout << "  insufficient history OK\n";
}

void testTrendingMarket() {
    RegimeClassifier classifier;
    auto snapshot = trendingSnapshot(120, 2.0);
    auto regime = classifier.classify(snapshot);

    assert(regime.sufficient_history);
    assert(regime.direction == TrendDirection::UP);
    assert(std::abs(regime.consistency - 100.0) < 1e-9);
    assert(regime.price_action == PriceAction::BULLISH);
    assert(regime.price_position == PricePosition::ABOVE_MAS);
    assert(regime.strength >= 0.0 && regime.strength <= 100.0);
    assert(regime.volatility_ratio > 0.0);

    auto down = classifier.classify(trendingSnapshot(120, -2.0));
    assert(down.direction == TrendDirection::DOWN);
    assert(down.price_action == PriceAction::BEARISH);
    std::cout << "  trending market OK (" << regime.description << ")\n";
}

void testConsistencyAndRank() {
    auto snapshot = trendingSnapshot(60, 1.0);
    assert(RegimeClassifier::trendConsistency(snapshot, 20) == 100.0);
    assert(RegimeClassifier::trendConsistency(snapshot, 20, 5) == 100.0);
    // 범위 밖
    assert(RegimeClassifier::trendConsistency(snapshot, 20, 1000) == 50.0);

    assert(trendRank(RegimeType::STRONG_TREND) > trendRank(RegimeType::WEAK_TREND));
    assert(trendRank(RegimeType::WEAK_TREND) > trendRank(RegimeType::RANGING));
    assert(trendRank(RegimeType::RANGING) == trendRank(RegimeType::VOLATILE));

    assert(std::strcmp(toString(RegimeType::STRONG_TREND), "strong_trend") == 0);
    assert(regimeTypeFromString("volatile") == RegimeType::VOLATILE);
    assert(regimeTypeFromString("unknown") == RegimeType::RANGING);
    std::cout << "  consistency/rank OK\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting RegimeClassifier Test..." << std::endl;

    testThresholds();
    testInsufficientHistory();
    testTrendingMarket();
    testConsistencyAndRank();

    std::cout << "[TEST] RegimeClassifier PASSED" << std::endl;
    return 0;
}
