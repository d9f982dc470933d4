#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

#include "broker/IBrokerGateway.h"
#include "broker/ConnectionHealth.h"
#include "common/Logger.h"

namespace trendpilot {
namespace broker {

struct RetryPolicy {
    int call_timeout_ms = 10000;    // 0 이하면 타임아웃 없음
    int max_attempts = 3;
    int initial_backoff_ms = 200;
    int max_backoff_ms = 5000;
};

// 브로커 호출마다 타임아웃 + 지수 백오프 재시도.
// 재시도는 연결 계열 오류(BrokerUnavailable, BrokerTimeout)만. 주문 발주는 재시도하지 않음
class ResilientBrokerGateway : public IBrokerGateway {
public:
    ResilientBrokerGateway(std::shared_ptr<IBrokerGateway> inner,
                           const RetryPolicy& policy,
                           std::shared_ptr<ConnectionHealth> health = nullptr);

    std::vector<Candle> getHistory(const std::string& symbol,
                                   const std::string& timeframe,
                                   int bar_count) override;
    AccountInfo getAccountBalance() override;
    PositionRecord placeOrder(const std::string& symbol,
                              OrderSide side,
                              double quantity,
                              double stop_loss,
                              double take_profit,
                              const std::string& comment) override;
    void modifyPosition(Ticket ticket,
                        std::optional<double> stop_loss,
                        std::optional<double> take_profit) override;
    void closePosition(Ticket ticket, std::optional<double> quantity) override;
    std::vector<PositionRecord> listOpenPositions() override;
    SymbolSpec getSymbolSpec(const std::string& symbol) override;
    Quote getQuote(const std::string& symbol) override;
    double getRealizedPnlSince(long long since_ms) override;
    void beginCycle() override;

    std::shared_ptr<ConnectionHealth> health() const { return health_; }
    const RetryPolicy& policy() const { return policy_; }

    // attempt 는 0 부터. min(initial * 2^attempt, max)
    static int backoffDelayMs(const RetryPolicy& policy, int attempt);

private:
    template <typename Fn>
    auto callWithTimeout(const std::string& op, Fn fn) -> decltype(fn());

    // retry_on_timeout=false: 타임아웃 시 실제 반영 여부를 알 수 없으므로 재호출하지 않음
    template <typename Fn>
    auto withRetry(const std::string& op, Fn fn, bool retry_on_timeout = true) -> decltype(fn());

    std::shared_ptr<IBrokerGateway> inner_;
    RetryPolicy policy_;
    std::shared_ptr<ConnectionHealth> health_;
};

// 호출은 분리 스레드에서 수행하고 결과는 promise 로 전달.
// 타임아웃이 나도 스레드는 끝까지 실행되므로 fn 은 inner_ 를 값으로 잡아야 한다
template <typename Fn>
auto ResilientBrokerGateway::callWithTimeout(const std::string& op, Fn fn) -> decltype(fn()) {
    using R = decltype(fn());

    if (policy_.call_timeout_ms <= 0) {
        return fn();
    }

    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();

    std::thread([promise, fn]() mutable {
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                promise->set_value();
            } else {
                promise->set_value(fn());
            }
        } catch (...) {
            // 호출 스레드로 전달
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(policy_.call_timeout_ms)) == std::future_status::timeout) {
        throw BrokerTimeout(op + " timed out after " + std::to_string(policy_.call_timeout_ms) + " ms");
    }
    return future.get();
}

template <typename Fn>
auto ResilientBrokerGateway::withRetry(const std::string& op, Fn fn, bool retry_on_timeout) -> decltype(fn()) {
    using R = decltype(fn());
    const int attempts = policy_.max_attempts > 0 ? policy_.max_attempts : 1;

    for (int attempt = 0; ; ++attempt) {
        try {
            if constexpr (std::is_void_v<R>) {
                callWithTimeout(op, fn);
                health_->reportSuccess();
                return;
            } else {
                R result = callWithTimeout(op, fn);
                health_->reportSuccess();
                return result;
            }
        } catch (const BrokerUnavailable& e) {
            health_->reportFailure(op + ": " + e.what());
            if (!retry_on_timeout && dynamic_cast<const BrokerTimeout*>(&e) != nullptr) {
                LOG_ERROR("{} timed out, not retried: {}", op, e.what());
                throw;
            }
            if (attempt + 1 >= attempts) {
                LOG_ERROR("{} failed after {} attempt(s): {}", op, attempts, e.what());
                throw;
            }
            int delay = backoffDelayMs(policy_, attempt);
            LOG_WARN("{} failed (attempt {}/{}): {} - retrying in {} ms",
                     op, attempt + 1, attempts, e.what(), delay);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }
}

} // namespace broker
} // namespace trendpilot
