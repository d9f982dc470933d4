#include "risk/RiskManager.h"
#include "common/Logger.h"

#include <ctime>

namespace trendpilot {
namespace risk {

RiskManager::RiskManager(const RiskConfig& config)
    : config_(config)
{
}

void RiskManager::updateConfig(const RiskConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

long long RiskManager::localMidnightMs(long long now_ms) {
    std::time_t t = static_cast<std::time_t>(now_ms / 1000);
    std::tm local{};
    localtime_r(&t, &local);
    local.tm_hour = 0;
    local.tm_min = 0;
    local.tm_sec = 0;
    return static_cast<long long>(std::mktime(&local)) * 1000;
}

void RiskManager::updateDailyPnl(double realized_today, double equity, long long now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    long long midnight = localMidnightMs(now_ms);
    if (midnight != day_start_ms_) {
        if (day_start_ms_ != 0 && paused_) {
            LOG_INFO("New trading day, daily loss guard reset");
        }
        day_start_ms_ = midnight;
        paused_ = false;
        warned_ = false;
    }

    if (equity <= 0) {
        daily_loss_pct_ = 0.0;
        return;
    }

    daily_loss_pct_ = realized_today < 0 ? (-realized_today / equity) * 100.0 : 0.0;
    const double limit = config_.max_daily_loss_percent;

    if (daily_loss_pct_ >= limit) {
        if (!paused_) {
            LOG_ERROR("Daily loss limit reached: {:.2f}% >= {:.2f}%, new entries paused for the day",
                      daily_loss_pct_, limit);
        }
        paused_ = true;
    } else if (daily_loss_pct_ >= limit * config_.daily_loss_warning_ratio && !warned_) {
        LOG_WARN("Daily loss at {:.2f}% ({:.0f}% of limit {:.2f}%)",
                 daily_loss_pct_, config_.daily_loss_warning_ratio * 100.0, limit);
        warned_ = true;
    }
}

RiskManager::EntryCheck RiskManager::canEnterPosition(const std::string& symbol, int open_groups_for_symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    EntryCheck check;

    if (paused_) {
        check.allowed = false;
        check.reason = "daily loss limit reached";
        return check;
    }

    if (open_groups_for_symbol >= config_.max_trades_per_symbol) {
        check.allowed = false;
        check.reason = "max trades per symbol reached for " + symbol;
        return check;
    }

    return check;
}

bool RiskManager::isTradingPaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

double RiskManager::dailyLossPercent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_loss_pct_;
}

} // namespace risk
} // namespace trendpilot
