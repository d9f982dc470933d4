#include "broker/ConnectionHealth.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace trendpilot {
namespace broker {

ConnectionHealth::ConnectionHealth(int degraded_threshold, int disconnected_threshold)
    : degraded_threshold_(degraded_threshold)
    , disconnected_threshold_(disconnected_threshold)
{
    if (degraded_threshold_ <= 0 || disconnected_threshold_ <= degraded_threshold_) {
        throw ConfigError("connection health thresholds must satisfy 0 < degraded < disconnected");
    }
    state_.last_success = std::chrono::steady_clock::now();
}

void ConnectionHealth::reportSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != Status::CONNECTED) {
        LOG_INFO("Broker connection restored after {} failure(s)", state_.consecutive_failures);
    }
    state_.status = Status::CONNECTED;
    state_.last_success = std::chrono::steady_clock::now();
    state_.consecutive_failures = 0;
    state_.last_error_message.clear();
}

void ConnectionHealth::reportFailure(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.last_failure = std::chrono::steady_clock::now();
    state_.consecutive_failures++;
    state_.total_failures++;
    state_.last_error_message = error_message;

    Status previous = state_.status;
    if (state_.consecutive_failures >= disconnected_threshold_) {
        state_.status = Status::DISCONNECTED;
    } else if (state_.consecutive_failures >= degraded_threshold_) {
        state_.status = Status::DEGRADED;
    }

    if (state_.status != previous) {
        LOG_WARN("Broker connection {} -> {} ({} consecutive failures): {}",
                 toString(previous), toString(state_.status),
                 state_.consecutive_failures, error_message);
    }
}

ConnectionHealth::Status ConnectionHealth::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.status;
}

ConnectionHealth::State ConnectionHealth::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ConnectionHealth::statusString() const {
    return toString(status());
}

bool ConnectionHealth::isOutage() const {
    return status() == Status::DISCONNECTED;
}

void ConnectionHealth::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.status = Status::CONNECTED;
    state_.consecutive_failures = 0;
    state_.last_error_message.clear();
}

const char* ConnectionHealth::toString(Status status) {
    switch (status) {
        case Status::CONNECTED: return "CONNECTED";
        case Status::DEGRADED: return "DEGRADED";
        case Status::DISCONNECTED: return "DISCONNECTED";
    }
    return "UNKNOWN";
}

} // namespace broker
} // namespace trendpilot
