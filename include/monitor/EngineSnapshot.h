#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "analytics/RegimeClassifier.h"
#include "position/PositionManager.h"
#include "position/PositionTypes.h"
#include "signals/SignalTypes.h"

namespace trendpilot {
namespace monitor {

struct SymbolStatus {
    std::string symbol;
    std::optional<analytics::MarketRegime> regime;
    std::optional<signals::FusedDecision> decision;
    std::string last_error;
    long long updated_ms = 0;
};

// 사이클 종료 시 발행되는 읽기 전용 복사본
struct EngineSnapshot {
    long long ts_ms = 0;
    long long cycle = 0;
    long long cycle_errors = 0;
    bool running = false;
    bool trading_paused = false;
    double daily_loss_percent = 0.0;

    AccountInfo account;
    std::string broker_status = "CONNECTED";
    int broker_consecutive_failures = 0;
    std::string broker_last_error;

    std::vector<SymbolStatus> symbols;
    std::vector<PositionRecord> positions;
    std::vector<position::AdjustmentLogEntry> adjustments;
    position::ManagerStats stats;

    nlohmann::json toJson() const;
};

nlohmann::json toJson(const analytics::MarketRegime& regime);
nlohmann::json toJson(const signals::FusedDecision& decision);
nlohmann::json toJson(const PositionRecord& position);
nlohmann::json toJson(const position::AdjustmentLogEntry& entry);

} // namespace monitor
} // namespace trendpilot
