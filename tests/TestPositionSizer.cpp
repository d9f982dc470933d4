#undef NDEBUG
#include "common/Errors.h"
#include "common/TickSizeHelper.h"
#include "risk/PositionSizer.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using namespace trendpilot;
using namespace trendpilot::risk;

namespace {

SymbolSpec goldSpec() {
    SymbolSpec spec;
    spec.symbol = "XAUUSD";
    spec.digits = 2;
    spec.tick_size = 0.01;
    spec.tick_value = 1.0;
    spec.min_lot = 0.01;
    spec.max_lot = 100.0;
    spec.lot_step = 0.01;
    return spec;
}

SizingRequest baseRequest() {
    SizingRequest request;
    request.balance = 10000.0;
    request.risk_percent = 1.0;
    request.risk_multiplier = 1.0;
    request.stop_distance = 2.0;
    request.spec = goldSpec();
    return request;
}

void testRiskBudget() {
    PositionSizer sizer;
    auto result = sizer.size(baseRequest());
    assert(result.has_value());
    assert(std::abs(result->risk_amount - 100.0) < 1e-9);
    assert(std::abs(result->stop_ticks - 200.0) < 1e-6);
    assert(std::abs(result->quantity - 0.5) < 1e-9);

    auto confident = baseRequest();
    confident.confidence_multiplier = 1.25;
    auto scaled = sizer.size(confident);
    assert(scaled.has_value());
    // 0.625 -> 0.62 (step 내림)
    assert(std::abs(scaled->quantity - 0.62) < 1e-9);
    std::cout << "  risk budget OK\n";
}

void testBoundsProperty() {
    PositionSizer sizer;
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> balance(10.0, 1e7);
    std::uniform_real_distribution<double> stop(0.05, 500.0);
    std::uniform_real_distribution<double> conf(0.0, 2.0);
    const double steps[] = {0.01, 0.1, 1.0};

    for (int i = 0; i < 2000; ++i) {
        auto request = baseRequest();
        request.balance = balance(rng);
        request.stop_distance = stop(rng);
        request.confidence_multiplier = conf(rng);
        request.risk_multiplier = 0.5 + (i % 3) * 0.5;
        request.spec.lot_step = steps[i % 3];
        request.spec.min_lot = request.spec.lot_step;
        request.spec.max_lot = 50.0;

        auto result = sizer.size(request);
        assert(result.has_value());
        assert(result->quantity >= request.spec.min_lot - 1e-9);
        assert(result->quantity <= request.spec.max_lot + 1e-9);
        assert(common::isLotStepMultiple(result->quantity, request.spec.lot_step));
    }
    std::cout << "  sizing bounds property OK\n";
}

void testInfeasible() {
    PositionSizer sizer;

    auto broke = baseRequest();
    broke.balance = 0.0;
    assert(!sizer.size(broke).has_value());

    auto no_stop = baseRequest();
    no_stop.stop_distance = 0.0;
    assert(!sizer.size(no_stop).has_value());

    auto bad_tick = baseRequest();
    bad_tick.spec.tick_value = 0.0;
    assert(!sizer.size(bad_tick).has_value());

    auto bad_lots = baseRequest();
    bad_lots.spec.min_lot = 5.0;
    bad_lots.spec.max_lot = 1.0;
    bool thrown = false;
    try {
        sizer.sizeOrThrow(bad_lots);
    } catch (const SizingInfeasible&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "  infeasible cases OK\n";
}

void testTakeProfitLadder() {
    const std::vector<double> ladder{1.5, 2.5, 4.0};

    auto buy = PositionSizer::takeProfitLadder(2000.0, OrderSide::BUY, 2.0, ladder, 2.0);
    assert(buy.size() == 3);
    assert(std::abs(buy[0] - 2002.0) < 1e-9);
    assert(std::abs(buy[1] - 2003.0) < 1e-9);
    assert(std::abs(buy[2] - 2004.0) < 1e-9);
    for (size_t i = 0; i < buy.size(); ++i) {
        assert(buy[i] - 2000.0 <= PositionSizer::capDistance(2.0, i) + 1e-9);
    }

    auto sell = PositionSizer::takeProfitLadder(2000.0, OrderSide::SELL, 2.0, ladder, 2.0);
    assert(std::abs(sell[0] - 1998.0) < 1e-9);
    assert(std::abs(sell[2] - 1996.0) < 1e-9);

    // cap 없음
    auto uncapped = PositionSizer::takeProfitLadder(2000.0, OrderSide::BUY, 2.0, ladder, 0.0);
    assert(std::abs(uncapped[0] - 2003.0) < 1e-9);
    assert(std::abs(uncapped[1] - 2005.0) < 1e-9);
    assert(std::abs(uncapped[2] - 2008.0) < 1e-9);

    assert(PositionSizer::rungScale(0) == 1.0);
    assert(PositionSizer::rungScale(2) == 2.0);
    std::cout << "  take-profit ladder OK\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting PositionSizer Test..." << std::endl;

    testRiskBudget();
    testBoundsProperty();
    testInfeasible();
    testTakeProfitLadder();

    std::cout << "[TEST] PositionSizer PASSED" << std::endl;
    return 0;
}
