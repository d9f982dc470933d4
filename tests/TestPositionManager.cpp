#undef NDEBUG
#include "analytics/MarketSnapshot.h"
#include "broker/IBrokerGateway.h"
#include "common/Errors.h"
#include "position/PositionManager.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>

using namespace trendpilot;
using namespace trendpilot::analytics;
using namespace trendpilot::position;

namespace {

// 메모리 브로커: 주문/수정/청산 호출을 기록
class FakeBroker : public broker::IBrokerGateway {
public:
    std::map<Ticket, PositionRecord> positions;
    std::map<Ticket, int> modify_calls;
    std::set<std::string> reject_comments;
    std::set<Ticket> reject_modify;
    int place_calls = 0;
    int close_calls = 0;
    long long clock_ms = 1000;
    double fill_price = 2000.0;

    std::vector<Candle> getHistory(const std::string& symbol, const std::string&, int) override {
        throw DataUnavailable("no history for " + symbol);
    }

    AccountInfo getAccountBalance() override {
        AccountInfo info;
        info.balance = 10000.0;
        info.equity = 10000.0;
        return info;
    }

    PositionRecord placeOrder(const std::string& symbol, OrderSide side, double quantity,
                              double stop_loss, double take_profit, const std::string& comment) override {
        ++place_calls;
        if (reject_comments.count(comment)) {
            throw OrderRejected("not enough money", 10019);
        }
        PositionRecord record;
        record.ticket = next_ticket_++;
        record.symbol = symbol;
        record.side = side;
        record.entry_price = fill_price;
        record.quantity = quantity;
        record.stop_loss = stop_loss;
        record.take_profit = take_profit;
        record.open_time = clock_ms;
        record.comment = comment;
        positions[record.ticket] = record;
        return record;
    }

    void modifyPosition(Ticket ticket, std::optional<double> stop_loss,
                        std::optional<double> take_profit) override {
        modify_calls[ticket]++;
        if (reject_modify.count(ticket)) {
            throw ModifyRejected("invalid stops", 10016);
        }
        auto& record = positions.at(ticket);
        if (stop_loss) record.stop_loss = *stop_loss;
        if (take_profit) record.take_profit = *take_profit;
    }

    void closePosition(Ticket ticket, std::optional<double>) override {
        ++close_calls;
        if (positions.erase(ticket) == 0) {
            throw CloseRejected("unknown ticket");
        }
    }

    std::vector<PositionRecord> listOpenPositions() override {
        std::vector<PositionRecord> out;
        for (const auto& [ticket, record] : positions) out.push_back(record);
        return out;
    }

    SymbolSpec getSymbolSpec(const std::string& symbol) override {
        SymbolSpec spec;
        spec.symbol = symbol;
        return spec;
    }

    Quote getQuote(const std::string&) override {
        Quote quote;
        quote.bid = fill_price;
        quote.ask = fill_price;
        return quote;
    }

    double getRealizedPnlSince(long long) override { return 0.0; }

private:
    Ticket next_ticket_ = 100;
};

SymbolSpec goldSpec() {
    SymbolSpec spec;
    spec.symbol = "XAUUSD";
    spec.tick_size = 0.01;
    spec.min_lot = 0.01;
    spec.lot_step = 0.01;
    return spec;
}

EntryRequest entryRequest() {
    EntryRequest request;
    request.symbol = "XAUUSD";
    request.side = OrderSide::BUY;
    request.quantity = 1.0;
    request.stop_loss = 1990.004;
    request.tp_levels = {2004.0, 2006.0, 2008.0};
    request.allocations = {40.0, 35.0, 25.0};
    request.regime = RegimeType::WEAK_TREND;
    request.confidence = 0.7;
    return request;
}

MarketSnapshot flatSnapshot() {
    std::vector<Candle> bars;
    for (int i = 0; i < 80; ++i) {
        bars.emplace_back(2000.0, 2001.0, 1999.0, 2000.0, 1000.0, i * 3600000LL);
    }
    return MarketSnapshot::build("XAUUSD", "H1", bars, IndicatorSettings());
}

SymbolContext contextAt(double price) {
    SymbolContext context;
    context.regime.type = RegimeType::WEAK_TREND;
    context.regime.direction = TrendDirection::UP;
    context.regime.consistency = 60.0;
    context.regime.strength = 25.0;
    context.regime.sufficient_history = true;
    context.spec = goldSpec();
    context.quote.bid = price;
    context.quote.ask = price;
    context.tp_cap = 0.0;
    return context;
}

void testOpenGroup() {
    auto broker = std::make_shared<FakeBroker>();
    PositionManager manager(PositionConfig(), VolumeConfig(), broker);

    auto id = manager.openGroup(entryRequest(), goldSpec(), 1000);
    assert(id.has_value());
    const auto* group = manager.book().group(*id);
    assert(group && group->members.size() == 3);
    assert(manager.stats().orders_placed == 3);

    // 손절은 매수 기준 올림
    for (Ticket ticket : group->members) {
        assert(std::abs(broker->positions.at(ticket).stop_loss - 1990.01) < 1e-9);
    }
    assert(std::abs(broker->positions.at(group->members[0]).take_profit - 2004.0) < 1e-9);

    // 한 단계 거부: 나머지로 그룹 구성
    broker->reject_comments = {"tp2"};
    auto partial = manager.openGroup(entryRequest(), goldSpec(), 2000);
    assert(partial.has_value());
    assert(manager.book().group(*partial)->members.size() == 2);
    assert(manager.stats().orders_rejected == 1);

    // 전부 거부: 그룹 없음
    broker->reject_comments = {"tp1", "tp2", "tp3"};
    size_t groups_before = manager.book().groupCount();
    assert(!manager.openGroup(entryRequest(), goldSpec(), 3000).has_value());
    assert(manager.book().groupCount() == groups_before);

    // 너무 작은 수량은 브로커 호출 없이 건너뜀
    int calls = broker->place_calls;
    auto tiny = entryRequest();
    tiny.quantity = 0.001;
    assert(!manager.openGroup(tiny, goldSpec(), 4000).has_value());
    assert(broker->place_calls == calls);
    std::cout << "  open group OK\n";
}

void testGroupStopPropagation() {
    auto broker = std::make_shared<FakeBroker>();
    PositionManager manager(PositionConfig(), VolumeConfig(), broker);
    auto id = *manager.openGroup(entryRequest(), goldSpec(), 1000);
    auto members = manager.book().group(id)->members;

    // 외부에서 한 멤버만 조임
    broker->positions.at(members[1]).stop_loss = 1995.0;
    assert(manager.reconcile(1500) == 0);

    manager.manageGroup(id, flatSnapshot(), contextAt(2000.0), 2000);
    for (Ticket ticket : members) {
        assert(std::abs(manager.book().find(ticket)->record.stop_loss - 1995.0) < 1e-9);
        assert(broker->modify_calls[ticket] <= 1);
    }
    assert(broker->modify_calls[members[1]] == 0);
    assert(manager.stats().stop_modifications == 2);

    auto log = manager.recentAdjustments();
    assert(log.size() == 2);
    assert(log[0].reason == "group stop propagation");

    // 다시 관리해도 변경 없음
    manager.manageGroup(id, flatSnapshot(), contextAt(2000.0), 3000);
    assert(manager.stats().stop_modifications == 2);
    std::cout << "  group stop propagation OK\n";
}

void testTrailingAndBreakeven() {
    auto broker = std::make_shared<FakeBroker>();
    PositionManager manager(PositionConfig(), VolumeConfig(), broker);
    auto id = *manager.openGroup(entryRequest(), goldSpec(), 1000);
    auto members = manager.book().group(id)->members;

    // ATR 2, 진입 2000, 현재 2010 -> 트레일링 2007 이 본전(2000)보다 조임
    manager.manageGroup(id, flatSnapshot(), contextAt(2010.0), 2000);

    double first_sl = manager.book().find(members[0])->record.stop_loss;
    assert(first_sl >= 2007.0 - 1e-9 && first_sl < 2010.0);
    for (Ticket ticket : members) {
        const auto* entry = manager.book().find(ticket);
        assert(std::abs(entry->record.stop_loss - first_sl) < 1e-9);
        assert(entry->state.trailing_active);
        assert(entry->state.breakeven_applied);
        assert(broker->modify_calls[ticket] == 1);
        assert(std::abs(broker->positions.at(ticket).stop_loss - first_sl) < 1e-9);
    }

    // 되돌림에도 손절은 느슨해지지 않음
    manager.manageGroup(id, flatSnapshot(), contextAt(2008.0), 3000);
    for (Ticket ticket : members) {
        assert(manager.book().find(ticket)->record.stop_loss >= first_sl - 1e-9);
    }
    std::cout << "  trailing and breakeven OK\n";
}

void testModifyRejected() {
    auto broker = std::make_shared<FakeBroker>();
    PositionManager manager(PositionConfig(), VolumeConfig(), broker);
    auto id = *manager.openGroup(entryRequest(), goldSpec(), 1000);
    auto members = manager.book().group(id)->members;

    broker->reject_modify = {members[0]};
    manager.manageGroup(id, flatSnapshot(), contextAt(2010.0), 2000);

    assert(manager.stats().modify_failures == 1);
    assert(std::abs(manager.book().find(members[0])->record.stop_loss - 1990.01) < 1e-9);
    assert(manager.book().find(members[1])->record.stop_loss > 2000.0);
    std::cout << "  modify rejection OK\n";
}

void testTimeExitPrecedence() {
    PositionConfig config;
    config.time_exit.enabled = true;
    config.time_exit.max_hold_minutes = 60;

    auto broker = std::make_shared<FakeBroker>();
    PositionManager manager(config, VolumeConfig(), broker);
    auto id = *manager.openGroup(entryRequest(), goldSpec(), 1000);

    // 트레일링 조건이 있어도 보유시간 초과면 청산만
    manager.manageGroup(id, flatSnapshot(), contextAt(2010.0), broker->clock_ms + 61LL * 60 * 1000);

    assert(manager.book().group(id) == nullptr);
    assert(manager.book().empty());
    assert(broker->close_calls == 3);
    assert(broker->modify_calls.empty());
    assert(manager.stats().time_exits == 3);
    assert(manager.recentAdjustments().back().kind == AdjustmentKind::TIME_EXIT);
    std::cout << "  time exit precedence OK\n";
}

MarketSnapshot flatMinuteSnapshot() {
    std::vector<Candle> bars;
    for (int i = 0; i < 80; ++i) {
        bars.emplace_back(2000.0, 2000.5, 1999.5, 2000.0, 100.0, i * 60000LL);
    }
    return MarketSnapshot::build("XAUUSD", "M1", bars, IndicatorSettings());
}

void testScalpingExit() {
    PositionConfig config;
    config.scalping.enabled = true;

    auto broker = std::make_shared<FakeBroker>();
    PositionManager manager(config, VolumeConfig(), broker);
    auto id = *manager.openGroup(entryRequest(), goldSpec(), 1000);
    const long long late = broker->clock_ms + 31LL * 60 * 1000;

    // H1 스냅샷에서는 단타 규칙 미적용
    manager.manageGroup(id, flatSnapshot(), contextAt(2000.10), late);
    assert(manager.book().group(id) != nullptr);
    assert(broker->close_calls == 0);

    // M1: +10 pips 로 30 분 초과 보유 -> 전량 청산
    manager.manageGroup(id, flatMinuteSnapshot(), contextAt(2000.10), late);
    assert(manager.book().group(id) == nullptr);
    assert(broker->close_calls == 3);
    assert(manager.stats().scalp_exits == 3);
    assert(manager.stats().time_exits == 0);
    const auto last = manager.recentAdjustments().back();
    assert(last.kind == AdjustmentKind::SCALP_EXIT);
    assert(last.reason.find("Time exit") != std::string::npos);
    std::cout << "  scalping exit OK\n";
}

void testReconcileAndLogCapacity() {
    PositionConfig config;
    config.adjustment_log_capacity = 2;

    auto broker = std::make_shared<FakeBroker>();
    PositionManager manager(config, VolumeConfig(), broker);
    auto id = *manager.openGroup(entryRequest(), goldSpec(), 1000);
    auto members = manager.book().group(id)->members;

    // 브로커 측 TP 체결
    broker->positions.erase(members[0]);
    assert(manager.reconcile(2000) == 1);
    assert(manager.book().group(id)->members.size() == 2);
    assert(manager.stats().closes == 1);

    broker->positions.clear();
    assert(manager.reconcile(3000) == 2);
    assert(manager.book().group(id) == nullptr);
    assert(manager.recentAdjustments().size() == 2);
    assert(manager.recentAdjustments().back().kind == AdjustmentKind::CLOSED);
    std::cout << "  reconcile and log capacity OK\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting PositionManager Test..." << std::endl;

    testOpenGroup();
    testGroupStopPropagation();
    testTrailingAndBreakeven();
    testModifyRejected();
    testTimeExitPrecedence();
    testScalpingExit();
    testReconcileAndLogCapacity();

    std::cout << "[TEST] PositionManager PASSED" << std::endl;
    return 0;
}
