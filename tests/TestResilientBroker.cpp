#undef NDEBUG
#include "broker/ConnectionHealth.h"
#include "broker/ResilientBrokerGateway.h"
#include "common/Errors.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace trendpilot;
using namespace trendpilot::broker;

namespace {

// 앞의 N 번 호출은 연결 오류로 실패하는 브로커
class FlakyBroker : public IBrokerGateway {
public:
    std::atomic<int> failures_left{0};
    std::atomic<int> history_calls{0};
    std::atomic<int> place_calls{0};
    std::atomic<int> modify_calls{0};
    std::atomic<int> close_calls{0};
    std::atomic<int> mutate_delay_ms{0};
    std::atomic<int> quote_delay_ms{0};
    std::atomic<bool> reject_modify{false};

    std::vector<Candle> getHistory(const std::string& symbol, const std::string&, int bar_count) override {
        history_calls++;
        failIfScheduled("history " + symbol);
        return std::vector<Candle>(static_cast<size_t>(bar_count), Candle(1, 2, 0.5, 1.5, 10, 0));
    }

    AccountInfo getAccountBalance() override {
        failIfScheduled("balance");
        AccountInfo info;
        info.balance = 5000.0;
        return info;
    }

    PositionRecord placeOrder(const std::string& symbol, OrderSide side, double quantity,
                              double, double, const std::string&) override {
        place_calls++;
        failIfScheduled("order " + symbol);
        PositionRecord record;
        record.ticket = 1;
        record.symbol = symbol;
        record.side = side;
        record.quantity = quantity;
        return record;
    }

    void modifyPosition(Ticket, std::optional<double>, std::optional<double>) override {
        modify_calls++;
        delayMutation();
        if (reject_modify) {
            throw ModifyRejected("invalid stops", 10016);
        }
        failIfScheduled("modify");
    }

    void closePosition(Ticket, std::optional<double>) override {
        close_calls++;
        delayMutation();
        failIfScheduled("close");
    }
    std::vector<PositionRecord> listOpenPositions() override { return {}; }
    SymbolSpec getSymbolSpec(const std::string&) override { return SymbolSpec(); }

    Quote getQuote(const std::string&) override {
        if (quote_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(quote_delay_ms.load()));
        }
        Quote quote;
        quote.bid = 1.0;
        quote.ask = 1.1;
        return quote;
    }

    double getRealizedPnlSince(long long) override { return 0.0; }

private:
    void delayMutation() {
        if (mutate_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(mutate_delay_ms.load()));
        }
    }

    void failIfScheduled(const std::string& what) {
        if (failures_left.fetch_sub(1) > 0) {
            throw BrokerUnavailable("connection reset: " + what);
        }
    }
};

RetryPolicy fastPolicy() {
    RetryPolicy policy;
    policy.call_timeout_ms = 500;
    policy.max_attempts = 3;
    policy.initial_backoff_ms = 1;
    policy.max_backoff_ms = 4;
    return policy;
}

void testBackoffDelay() {
    RetryPolicy policy;
    assert(ResilientBrokerGateway::backoffDelayMs(policy, 0) == 200);
    assert(ResilientBrokerGateway::backoffDelayMs(policy, 1) == 400);
    assert(ResilientBrokerGateway::backoffDelayMs(policy, 3) == 1600);
    assert(ResilientBrokerGateway::backoffDelayMs(policy, 10) == 5000);
    assert(ResilientBrokerGateway::backoffDelayMs(policy, 60) == 5000);
    std::cout << "  backoff delay OK\n";
}

void testRetryRecovers() {
    auto inner = std::make_shared<FlakyBroker>();
    auto health = std::make_shared<ConnectionHealth>(2, 4);
    ResilientBrokerGateway gateway(inner, fastPolicy(), health);

    inner->failures_left = 2;
    auto bars = gateway.getHistory("XAUUSD", "H1", 5);
    assert(bars.size() == 5);
    assert(inner->history_calls == 3);
    assert(health->status() == ConnectionHealth::Status::CONNECTED);
    assert(health->state().total_failures == 2);
    std::cout << "  retry recovers OK\n";
}

void testRetryExhausted() {
    auto inner = std::make_shared<FlakyBroker>();
    auto health = std::make_shared<ConnectionHealth>(2, 4);
    ResilientBrokerGateway gateway(inner, fastPolicy(), health);

    inner->failures_left = 10;
    bool thrown = false;
    try {
        gateway.getHistory("XAUUSD", "H1", 5);
    } catch (const BrokerUnavailable&) {
        thrown = true;
    }
    assert(thrown);
    assert(inner->history_calls == 3);
    assert(health->status() == ConnectionHealth::Status::DEGRADED);

    // 한 번 더 실패 누적 -> 끊김
    thrown = false;
    try {
        gateway.getAccountBalance();
    } catch (const BrokerUnavailable&) {
        thrown = true;
    }
    assert(thrown);
    assert(health->isOutage());

    inner->failures_left = 0;
    assert(gateway.getAccountBalance().balance == 5000.0);
    assert(health->status() == ConnectionHealth::Status::CONNECTED);
    std::cout << "  retry exhausted OK\n";
}

void testOrdersNeverRetried() {
    auto inner = std::make_shared<FlakyBroker>();
    ResilientBrokerGateway gateway(inner, fastPolicy());

    inner->failures_left = 1;
    bool thrown = false;
    try {
        gateway.placeOrder("XAUUSD", OrderSide::BUY, 0.1, 0.0, 0.0, "tp1");
    } catch (const BrokerUnavailable&) {
        thrown = true;
    }
    assert(thrown);
    assert(inner->place_calls == 1);

    auto record = gateway.placeOrder("XAUUSD", OrderSide::SELL, 0.2, 0.0, 0.0, "tp1");
    assert(record.quantity == 0.2);
    assert(inner->place_calls == 2);
    std::cout << "  orders never retried OK\n";
}

void testRejectionsPassThrough() {
    auto inner = std::make_shared<FlakyBroker>();
    auto health = std::make_shared<ConnectionHealth>(2, 4);
    ResilientBrokerGateway gateway(inner, fastPolicy(), health);

    inner->reject_modify = true;
    bool thrown = false;
    try {
        gateway.modifyPosition(1, 1990.0, std::nullopt);
    } catch (const ModifyRejected& e) {
        thrown = true;
        assert(e.code() == 10016);
    }
    assert(thrown);
    // 거부는 재시도/장애 대상이 아님
    assert(inner->modify_calls == 1);
    assert(health->state().total_failures == 0);
    std::cout << "  rejections pass through OK\n";
}

void testTimeout() {
    auto inner = std::make_shared<FlakyBroker>();
    RetryPolicy policy = fastPolicy();
    policy.call_timeout_ms = 30;
    policy.max_attempts = 2;
    auto health = std::make_shared<ConnectionHealth>(2, 4);
    ResilientBrokerGateway gateway(inner, policy, health);

    inner->quote_delay_ms = 200;
    auto started = std::chrono::steady_clock::now();
    bool timed_out = false;
    try {
        gateway.getQuote("XAUUSD");
    } catch (const BrokerTimeout&) {
        timed_out = true;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    assert(timed_out);
    assert(elapsed < 200);
    assert(health->status() == ConnectionHealth::Status::DEGRADED);

    // 분리 스레드가 끝날 때까지 대기
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    inner->quote_delay_ms = 0;
    assert(gateway.getQuote("XAUUSD").ask == 1.1);
    std::cout << "  call timeout OK\n";
}

void testMutationsNotRetriedOnTimeout() {
    auto inner = std::make_shared<FlakyBroker>();
    RetryPolicy policy = fastPolicy();
    policy.call_timeout_ms = 30;
    ResilientBrokerGateway gateway(inner, policy);

    // 느린 청산: 브로커에 반영됐을 수 있으므로 한 번만 호출
    inner->mutate_delay_ms = 150;
    bool timed_out = false;
    try {
        gateway.closePosition(7, std::nullopt);
    } catch (const BrokerTimeout&) {
        timed_out = true;
    }
    assert(timed_out);
    assert(inner->close_calls == 1);

    timed_out = false;
    try {
        gateway.modifyPosition(7, 1990.0, std::nullopt);
    } catch (const BrokerTimeout&) {
        timed_out = true;
    }
    assert(timed_out);
    assert(inner->modify_calls == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    assert(inner->close_calls == 1);
    assert(inner->modify_calls == 1);

    // 연결 오류는 여전히 재시도
    inner->mutate_delay_ms = 0;
    inner->failures_left = 1;
    gateway.closePosition(7, std::nullopt);
    assert(inner->close_calls == 3);
    std::cout << "  mutations not retried on timeout OK\n";
}

void testHealthThresholds() {
    bool thrown = false;
    try {
        ConnectionHealth invalid(3, 3);
    } catch (const ConfigError&) {
        thrown = true;
    }
    assert(thrown);

    ConnectionHealth health(1, 2);
    health.reportFailure("a");
    assert(health.statusString() == "DEGRADED");
    health.reportFailure("b");
    assert(health.isOutage());
    assert(health.state().last_error_message == "b");
    health.reset();
    assert(health.status() == ConnectionHealth::Status::CONNECTED);
    std::cout << "  health thresholds OK\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting ResilientBroker Test..." << std::endl;

    testBackoffDelay();
    testRetryRecovers();
    testRetryExhausted();
    testOrdersNeverRetried();
    testRejectionsPassThrough();
    testTimeout();
    testMutationsNotRetriedOnTimeout();
    testHealthThresholds();

    std::cout << "[TEST] ResilientBroker PASSED" << std::endl;
    return 0;
}
