#include "broker/ResilientBrokerGateway.h"

#include <algorithm>

namespace trendpilot {
namespace broker {

ResilientBrokerGateway::ResilientBrokerGateway(std::shared_ptr<IBrokerGateway> inner,
                                               const RetryPolicy& policy,
                                               std::shared_ptr<ConnectionHealth> health)
    : inner_(std::move(inner))
    , policy_(policy)
    , health_(health ? std::move(health) : std::make_shared<ConnectionHealth>())
{
    if (!inner_) {
        throw ConfigError("ResilientBrokerGateway requires an inner gateway");
    }
}

int ResilientBrokerGateway::backoffDelayMs(const RetryPolicy& policy, int attempt) {
    long long delay = std::max(0, policy.initial_backoff_ms);
    for (int i = 0; i < attempt && delay < policy.max_backoff_ms; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<long long>(delay, policy.max_backoff_ms));
}

std::vector<Candle> ResilientBrokerGateway::getHistory(const std::string& symbol,
                                                       const std::string& timeframe,
                                                       int bar_count) {
    auto inner = inner_;
    return withRetry("getHistory(" + symbol + ")", [inner, symbol, timeframe, bar_count]() {
        return inner->getHistory(symbol, timeframe, bar_count);
    });
}

AccountInfo ResilientBrokerGateway::getAccountBalance() {
    auto inner = inner_;
    return withRetry("getAccountBalance", [inner]() {
        return inner->getAccountBalance();
    });
}

PositionRecord ResilientBrokerGateway::placeOrder(const std::string& symbol,
                                                  OrderSide side,
                                                  double quantity,
                                                  double stop_loss,
                                                  double take_profit,
                                                  const std::string& comment) {
    auto inner = inner_;
    const std::string op = "placeOrder(" + symbol + ")";
    // 중복 체결 위험 때문에 단 한 번만 호출
    try {
        PositionRecord record = callWithTimeout(op, [inner, symbol, side, quantity, stop_loss, take_profit, comment]() {
            return inner->placeOrder(symbol, side, quantity, stop_loss, take_profit, comment);
        });
        health_->reportSuccess();
        return record;
    } catch (const BrokerUnavailable& e) {
        health_->reportFailure(op + ": " + e.what());
        throw;
    }
}

void ResilientBrokerGateway::modifyPosition(Ticket ticket,
                                            std::optional<double> stop_loss,
                                            std::optional<double> take_profit) {
    auto inner = inner_;
    withRetry("modifyPosition(" + std::to_string(ticket) + ")", [inner, ticket, stop_loss, take_profit]() {
        inner->modifyPosition(ticket, stop_loss, take_profit);
    }, false);
}

void ResilientBrokerGateway::closePosition(Ticket ticket, std::optional<double> quantity) {
    auto inner = inner_;
    withRetry("closePosition(" + std::to_string(ticket) + ")", [inner, ticket, quantity]() {
        inner->closePosition(ticket, quantity);
    }, false);
}

std::vector<PositionRecord> ResilientBrokerGateway::listOpenPositions() {
    auto inner = inner_;
    return withRetry("listOpenPositions", [inner]() {
        return inner->listOpenPositions();
    });
}

SymbolSpec ResilientBrokerGateway::getSymbolSpec(const std::string& symbol) {
    auto inner = inner_;
    return withRetry("getSymbolSpec(" + symbol + ")", [inner, symbol]() {
        return inner->getSymbolSpec(symbol);
    });
}

Quote ResilientBrokerGateway::getQuote(const std::string& symbol) {
    auto inner = inner_;
    return withRetry("getQuote(" + symbol + ")", [inner, symbol]() {
        return inner->getQuote(symbol);
    });
}

double ResilientBrokerGateway::getRealizedPnlSince(long long since_ms) {
    auto inner = inner_;
    return withRetry("getRealizedPnlSince", [inner, since_ms]() {
        return inner->getRealizedPnlSince(since_ms);
    });
}

void ResilientBrokerGateway::beginCycle() {
    inner_->beginCycle();
}

} // namespace broker
} // namespace trendpilot
