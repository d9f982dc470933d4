#pragma once

#include <string>
#include <utility>
#include <vector>

#include "common/Types.h"
#include "analytics/RegimeClassifier.h"

namespace trendpilot {
namespace position {

// 티켓별 관리 상태
struct ManagedState {
    double best_price = 0.0;        // 진입 이후 가장 유리했던 가격
    bool trailing_active = false;
    bool breakeven_applied = false;
    size_t rung_index = 0;
    double rung_scale = 1.0;
    double trail_activation = 1.5;  // ATR 배수
    double trail_distance = 1.5;
};

// 하나의 진입 결정으로 열린 분할 주문 묶음. 손절 정책을 공유하고 TP 단계만 다름
struct PositionGroup {
    std::string id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    analytics::RegimeType regime = analytics::RegimeType::RANGING;
    std::vector<Ticket> members;
    long long created_ms = 0;
};

enum class AdjustmentKind {
    STOP_LOSS,
    TAKE_PROFIT,
    TRAILING,
    BREAKEVEN,
    TIME_EXIT,
    SCALP_EXIT,
    CLOSED
};

inline const char* toString(AdjustmentKind kind) {
    switch (kind) {
        case AdjustmentKind::STOP_LOSS: return "STOP_LOSS";
        case AdjustmentKind::TAKE_PROFIT: return "TAKE_PROFIT";
        case AdjustmentKind::TRAILING: return "TRAILING";
        case AdjustmentKind::BREAKEVEN: return "BREAKEVEN";
        case AdjustmentKind::TIME_EXIT: return "TIME_EXIT";
        case AdjustmentKind::SCALP_EXIT: return "SCALP_EXIT";
        case AdjustmentKind::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

struct AdjustmentLogEntry {
    long long ts_ms = 0;
    Ticket ticket = 0;
    std::string symbol;
    AdjustmentKind kind = AdjustmentKind::STOP_LOSS;
    double old_value = 0.0;
    double new_value = 0.0;
    std::string reason;
};

struct StopCandidate {
    double price = 0.0;
    AdjustmentKind kind = AdjustmentKind::STOP_LOSS;
    std::string reason;

    StopCandidate() = default;
    StopCandidate(double p, AdjustmentKind k, std::string r)
        : price(p), kind(k), reason(std::move(r)) {}
};

struct TakeProfitCandidate {
    double price = 0.0;
    std::string reason;

    TakeProfitCandidate() = default;
    TakeProfitCandidate(double p, std::string r) : price(p), reason(std::move(r)) {}
};

} // namespace position
} // namespace trendpilot
