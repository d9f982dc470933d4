#pragma once

#include <mutex>
#include <string>

#include "risk/RiskConfig.h"

namespace trendpilot {
namespace risk {

// Risk Manager - 신규 진입 가드 (일일 손실 한도, 심볼당 최대 거래 수)
class RiskManager {
public:
    struct EntryCheck {
        bool allowed = true;
        std::string reason;
    };

    explicit RiskManager(const RiskConfig& config);

    void updateConfig(const RiskConfig& config);

    // 자정 이후 실현 손익으로 일일 손실 상태 갱신. 날짜가 바뀌면 리셋
    void updateDailyPnl(double realized_today, double equity, long long now_ms);

    EntryCheck canEnterPosition(const std::string& symbol, int open_groups_for_symbol) const;

    bool isTradingPaused() const;
    double dailyLossPercent() const;

    // 로컬 자정 (epoch ms)
    static long long localMidnightMs(long long now_ms);

private:
    RiskConfig config_;
    mutable std::mutex mutex_;

    long long day_start_ms_ = 0;
    double daily_loss_pct_ = 0.0;
    bool paused_ = false;
    bool warned_ = false;
};

} // namespace risk
} // namespace trendpilot
