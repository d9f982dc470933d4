#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace trendpilot {
namespace broker {

// 브로커 연결 상태 추적. 연속 실패 수로 CONNECTED -> DEGRADED -> DISCONNECTED
class ConnectionHealth {
public:
    enum class Status {
        CONNECTED,
        DEGRADED,
        DISCONNECTED
    };

    struct State {
        Status status = Status::CONNECTED;
        std::chrono::steady_clock::time_point last_success;
        std::chrono::steady_clock::time_point last_failure;
        int consecutive_failures = 0;
        long long total_failures = 0;
        std::string last_error_message;
    };

    explicit ConnectionHealth(int degraded_threshold = 3, int disconnected_threshold = 6);

    void reportSuccess();
    void reportFailure(const std::string& error_message);

    Status status() const;
    State state() const;
    std::string statusString() const;
    bool isOutage() const;
    void reset();

    static const char* toString(Status status);

private:
    mutable std::mutex mutex_;
    State state_;
    int degraded_threshold_;
    int disconnected_threshold_;
};

} // namespace broker
} // namespace trendpilot
