#undef NDEBUG
#include "risk/RiskManager.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace trendpilot;
using namespace trendpilot::risk;

namespace {

const long long kNoon = 1717675200000LL;    // 2024-06-06 12:00 UTC

void testDailyLossGuard() {
    RiskConfig config;
    config.max_daily_loss_percent = 5.0;
    RiskManager manager(config);

    manager.updateDailyPnl(-300.0, 10000.0, kNoon);
    assert(!manager.isTradingPaused());
    assert(std::abs(manager.dailyLossPercent() - 3.0) < 1e-9);
    assert(manager.canEnterPosition("XAUUSD", 0).allowed);

    manager.updateDailyPnl(-500.0, 10000.0, kNoon + 1000);
    assert(manager.isTradingPaused());
    auto check = manager.canEnterPosition("XAUUSD", 0);
    assert(!check.allowed);
    assert(check.reason == "daily loss limit reached");

    // 같은 날 손실이 줄어도 정지 유지
    manager.updateDailyPnl(100.0, 10000.0, kNoon + 2000);
    assert(manager.isTradingPaused());

    // 다음 날 리셋
    manager.updateDailyPnl(0.0, 10000.0, kNoon + 24LL * 3600 * 1000);
    assert(!manager.isTradingPaused());
    assert(manager.dailyLossPercent() == 0.0);
    std::cout << "  daily loss guard OK\n";
}

void testTradesPerSymbol() {
    RiskConfig config;
    config.max_trades_per_symbol = 2;
    RiskManager manager(config);

    assert(manager.canEnterPosition("XAUUSD", 1).allowed);
    assert(!manager.canEnterPosition("XAUUSD", 2).allowed);

    config.max_trades_per_symbol = 3;
    manager.updateConfig(config);
    assert(manager.canEnterPosition("XAUUSD", 2).allowed);
    std::cout << "  trades per symbol OK\n";
}

void testLocalMidnight() {
    long long midnight = RiskManager::localMidnightMs(kNoon);
    assert(midnight <= kNoon);
    assert(kNoon - midnight < 24LL * 3600 * 1000);
    assert(RiskManager::localMidnightMs(midnight) == midnight);
    std::cout << "  local midnight OK\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting RiskManager Test..." << std::endl;

    testDailyLossGuard();
    testTradesPerSymbol();
    testLocalMidnight();

    std::cout << "[TEST] RiskManager PASSED" << std::endl;
    return 0;
}
