#undef NDEBUG
#include "analytics/MarketSnapshot.h"
#include "position/DynamicTakeProfitManager.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using namespace trendpilot;
using namespace trendpilot::analytics;
using namespace trendpilot::position;

namespace {

std::vector<Candle> flatBars(size_t n, double price) {
    std::vector<Candle> bars;
    for (size_t i = 0; i < n; ++i) {
        bars.emplace_back(price, price + 1.0, price - 1.0, price, 1000.0, static_cast<long long>(i) * 3600000);
    }
    return bars;
}

MarketRegime strongUptrend() {
    MarketRegime regime;
    regime.type = RegimeType::STRONG_TREND;
    regime.direction = TrendDirection::UP;
    regime.strength = 40.0;
    regime.consistency = 90.0;
    regime.sufficient_history = true;
    return regime;
}

PositionRecord longPosition(double entry, double tp) {
    PositionRecord position;
    position.ticket = 1;
    position.symbol = "XAUUSD";
    position.side = OrderSide::BUY;
    position.entry_price = entry;
    position.stop_loss = entry - 10.0;
    position.take_profit = tp;
    return position;
}

void testStrongTrendExtension() {
    DynamicTakeProfitManager manager;
    auto snapshot = MarketSnapshot::build("XAUUSD", "H1", flatBars(80, 2000.0), IndicatorSettings());
    auto position = longPosition(1990.0, 2020.0);

    auto candidates = manager.detect(position, snapshot, strongUptrend(), 2000.0);
    assert(candidates.size() == 2);

    auto extended = manager.evaluate(position, snapshot, strongUptrend(), 2000.0, 0.0, 1.0);
    assert(extended.has_value());
    assert(std::abs(extended->price - 2035.0) < 1e-9);
    assert(extended->reason == "strong trend continuation");

    // 상한: 30 * 1.5 = 45 -> 그대로, 20 * 1.5 = 30 -> 현재 TP 와 같아 확장 아님
    auto within_cap = manager.evaluate(position, snapshot, strongUptrend(), 2000.0, 30.0, 1.5);
    assert(within_cap && std::abs(within_cap->price - 2035.0) < 1e-9);
    assert(!manager.evaluate(position, snapshot, strongUptrend(), 2000.0, 20.0, 1.5).has_value());
    std::cout << "  strong trend extension OK\n";
}

void testGuards() {
    DynamicTakeProfitManager manager;
    auto snapshot = MarketSnapshot::build("XAUUSD", "H1", flatBars(80, 2000.0), IndicatorSettings());

    // 손실 중이면 확장하지 않음
    auto losing = longPosition(2010.0, 2040.0);
    assert(manager.detect(losing, snapshot, strongUptrend(), 2000.0).empty());

    // TP 가 없으면 새로 만들지 않음
    auto no_tp = longPosition(1990.0, 0.0);
    assert(!manager.evaluate(no_tp, snapshot, strongUptrend(), 2000.0, 0.0, 1.0).has_value());

    TakeProfitConfig disabled;
    disabled.enabled = false;
    DynamicTakeProfitManager off(disabled);
    assert(!off.evaluate(longPosition(1990.0, 2020.0), snapshot, strongUptrend(), 2000.0, 0.0, 1.0));
    std::cout << "  guards OK\n";
}

void testHelpers() {
    assert(DynamicTakeProfitManager::clampToCap(2010.0, 2000.0, OrderSide::BUY, 2.0, 1.5) == 2003.0);
    assert(DynamicTakeProfitManager::clampToCap(1990.0, 2000.0, OrderSide::SELL, 2.0, 2.0) == 1996.0);
    assert(DynamicTakeProfitManager::clampToCap(2010.0, 2000.0, OrderSide::BUY, 0.0, 1.0) == 2010.0);

    assert(DynamicTakeProfitManager::isExtension(OrderSide::BUY, 1990.0, 2010.0, 2030.0, 2000.0, 0.05));
    assert(!DynamicTakeProfitManager::isExtension(OrderSide::BUY, 1990.0, 2010.0, 2005.0, 2000.0, 0.05));
    // 거리 20 의 5% = 1.0 미만 변경은 무시
    assert(!DynamicTakeProfitManager::isExtension(OrderSide::BUY, 1990.0, 2010.0, 2010.5, 2000.0, 0.05));
    assert(!DynamicTakeProfitManager::isExtension(OrderSide::BUY, 1990.0, 0.0, 2030.0, 2000.0, 0.05));
    assert(DynamicTakeProfitManager::isExtension(OrderSide::SELL, 2010.0, 1990.0, 1970.0, 2000.0, 0.05));

    // cap 2.0 x 1.5 로 잘린 금 TP 도 기본 비율에서 연장 가능
    double capped = DynamicTakeProfitManager::clampToCap(2010.0, 2000.0, OrderSide::BUY, 2.0, 1.5);
    assert(DynamicTakeProfitManager::isExtension(OrderSide::BUY, 2000.0, 2002.0, capped, 2001.0,
                                                 TakeProfitConfig().min_change_ratio));
    // EURUSD 규모 사다리
    assert(DynamicTakeProfitManager::isExtension(OrderSide::BUY, 1.0800, 1.0823, 1.08345, 1.0810,
                                                 TakeProfitConfig().min_change_ratio));

    std::vector<TakeProfitCandidate> candidates{
        TakeProfitCandidate(2010.0, "a"), TakeProfitCandidate(2030.0, "b"), TakeProfitCandidate(2020.0, "c")};
    assert(DynamicTakeProfitManager::selectFurthest(candidates, OrderSide::BUY)->reason == "b");
    assert(DynamicTakeProfitManager::selectFurthest(candidates, OrderSide::SELL)->reason == "a");
    std::cout << "  helpers OK\n";
}

void testMonotonicityAndCapProperty() {
    std::mt19937 rng(777);
    std::normal_distribution<double> noise(0.0, 1.2);
    std::uniform_real_distribution<double> wick(0.1, 1.5);
    std::uniform_real_distribution<double> pct(0.0, 100.0);
    std::uniform_int_distribution<int> coin(0, 1);

    DynamicTakeProfitManager manager;
    const double cap = 30.0;
    int extensions = 0;

    for (int trial = 0; trial < 30; ++trial) {
        const OrderSide side = trial % 2 == 0 ? OrderSide::BUY : OrderSide::SELL;
        const double sign = sideSign(side);
        const double rung_scale = 1.0 + 0.5 * (trial % 3);

        std::vector<Candle> bars;
        double price = 2000.0;
        for (int i = 0; i < 220; ++i) {
            double open = price;
            price += sign * 0.4 + noise(rng);
            bars.emplace_back(open, std::max(open, price) + wick(rng), std::min(open, price) - wick(rng),
                              price, 1000.0 + wick(rng) * 500.0, i * 3600000LL);
        }

        PositionRecord position;
        position.side = side;
        position.entry_price = bars[99].close;
        position.take_profit = position.entry_price + sign * 25.0;

        for (size_t k = 100; k < bars.size(); ++k) {
            std::vector<Candle> visible(bars.begin(), bars.begin() + k + 1);
            auto snapshot = MarketSnapshot::build("XAUUSD", "H1", std::move(visible), IndicatorSettings());

            MarketRegime regime;
            regime.type = coin(rng) ? RegimeType::STRONG_TREND : RegimeType::WEAK_TREND;
            regime.direction = coin(rng) ? TrendDirection::UP : TrendDirection::DOWN;
            regime.consistency = pct(rng);
            regime.strength = pct(rng);
            regime.sufficient_history = true;

            auto candidate = manager.evaluate(position, snapshot, regime, bars[k].close, cap, rung_scale);
            if (candidate) {
                assert((candidate->price - position.take_profit) * sign > 0);
                assert((candidate->price - position.entry_price) * sign <= cap * rung_scale + 1e-9);
                position.take_profit = candidate->price;
                ++extensions;
            }
        }
    }
    assert(extensions > 0);
    std::cout << "  monotonicity/cap property OK (" << extensions << " extensions)\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting DynamicTakeProfit Test..." << std::endl;

    testStrongTrendExtension();
    testGuards();
    testHelpers();
    testMonotonicityAndCapProperty();

    std::cout << "[TEST] DynamicTakeProfit PASSED" << std::endl;
    return 0;
}
