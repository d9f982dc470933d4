#undef NDEBUG
#include "position/TrailingController.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace trendpilot;
using namespace trendpilot::position;

namespace {

PositionRecord positionAt(OrderSide side, double entry) {
    PositionRecord position;
    position.ticket = 7;
    position.symbol = "XAUUSD";
    position.side = side;
    position.entry_price = entry;
    position.quantity = 0.1;
    return position;
}

ManagedState stateFor(double entry) {
    ManagedState state;
    state.best_price = entry;
    state.trail_activation = 1.5;
    state.trail_distance = 1.0;
    return state;
}

void testTrailingBuy() {
    TrailingController controller;
    auto position = positionAt(OrderSide::BUY, 2000.0);
    auto state = stateFor(2000.0);
    const double atr = 2.0;

    // 활성화 전 (2 < 1.5 * 2)
    assert(!controller.trailingStop(position, state, 2002.0, atr).has_value());
    assert(!state.trailing_active);

    auto first = controller.trailingStop(position, state, 2004.0, atr);
    assert(state.trailing_active);
    assert(first && std::abs(first->price - 2002.0) < 1e-9);
    assert(first->kind == AdjustmentKind::TRAILING);

    // 되돌림: 최고가 유지
    auto pullback = controller.trailingStop(position, state, 2003.0, atr);
    assert(pullback && std::abs(pullback->price - 2002.0) < 1e-9);
    assert(state.best_price == 2004.0);

    auto higher = controller.trailingStop(position, state, 2010.0, atr);
    assert(higher && std::abs(higher->price - 2008.0) < 1e-9);

    // 가격이 트레일 아래면 후보 없음
    assert(!controller.trailingStop(position, state, 2007.0, atr).has_value());
    std::cout << "  trailing buy OK\n";
}

void testTrailingSell() {
    TrailingController controller;
    auto position = positionAt(OrderSide::SELL, 2000.0);
    auto state = stateFor(2000.0);

    assert(!controller.trailingStop(position, state, 1998.0, 2.0).has_value());
    auto first = controller.trailingStop(position, state, 1996.0, 2.0);
    assert(first && std::abs(first->price - 1998.0) < 1e-9);
    auto lower = controller.trailingStop(position, state, 1990.0, 2.0);
    assert(lower && std::abs(lower->price - 1992.0) < 1e-9);
    assert(state.best_price == 1990.0);

    TrailingConfig disabled;
    disabled.enabled = false;
    TrailingController off(disabled);
    auto fresh = stateFor(2000.0);
    assert(!off.trailingStop(position, fresh, 1980.0, 2.0).has_value());
    assert(!fresh.trailing_active);
    std::cout << "  trailing sell OK\n";
}

void testBreakevenOneShot() {
    TrailingController controller;
    auto position = positionAt(OrderSide::BUY, 2000.0);
    auto state = stateFor(2000.0);
    SymbolSpec spec;
    spec.spread = 0.2;

    assert(!controller.breakevenStop(position, state, 2001.0, 2.0, spec).has_value());

    auto level = controller.breakevenStop(position, state, 2002.5, 2.0, spec);
    assert(level.has_value());
    assert(level->kind == AdjustmentKind::BREAKEVEN);
    assert(std::abs(level->price - 2000.2) < 1e-9);

    state.breakeven_applied = true;
    assert(!controller.breakevenStop(position, state, 2010.0, 2.0, spec).has_value());

    auto short_position = positionAt(OrderSide::SELL, 2000.0);
    auto short_state = stateFor(2000.0);
    auto short_level = controller.breakevenStop(short_position, short_state, 1997.0, 2.0, spec);
    assert(short_level && std::abs(short_level->price - 1999.8) < 1e-9);
    std::cout << "  breakeven one-shot OK\n";
}

void testTimeExit() {
    auto position = positionAt(OrderSide::BUY, 2000.0);
    position.open_time = 1000;

    TrailingController disabled;
    assert(!disabled.shouldTimeExit(position, position.open_time + 10LL * 24 * 3600 * 1000));

    TimeExitConfig config;
    config.enabled = true;
    config.max_hold_minutes = 240;
    TrailingController controller(TrailingConfig(), BreakevenConfig(), config);

    const long long limit = position.open_time + 240LL * 60 * 1000;
    assert(!controller.shouldTimeExit(position, limit - 1));
    assert(controller.shouldTimeExit(position, limit));

    // 진입 시각 미상
    position.open_time = 0;
    assert(!controller.shouldTimeExit(position, limit));
    std::cout << "  time exit OK\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting TrailingController Test..." << std::endl;

    testTrailingBuy();
    testTrailingSell();
    testBreakevenOneShot();
    testTimeExit();

    std::cout << "[TEST] TrailingController PASSED" << std::endl;
    return 0;
}
