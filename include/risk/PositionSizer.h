#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"

namespace trendpilot {
namespace risk {

struct SizingRequest {
    double balance = 0.0;
    double risk_percent = 1.0;          // %
    double risk_multiplier = 1.0;
    double stop_distance = 0.0;         // 가격 단위
    double confidence_multiplier = 1.0; // 0.5 ~ 1.25
    SymbolSpec spec;
};

struct SizingResult {
    double quantity = 0.0;
    double raw_quantity = 0.0;
    double risk_amount = 0.0;
    double stop_ticks = 0.0;
};

// 리스크 예산 기반 수량 계산
//   risk_amount = balance * risk% * multiplier
//   quantity    = risk_amount / (stop_ticks * tick_value)
class PositionSizer {
public:
    // 불가능하면 nullopt (사유는 로그)
    std::optional<SizingResult> size(const SizingRequest& request) const;

    // 불가능하면 SizingInfeasible
    SizingResult sizeOrThrow(const SizingRequest& request) const;

    // TP 사다리 -> 절대 가격. 각 단계 거리 = min(배수 * 손절거리, cap * rungScale(i))
    static std::vector<double> takeProfitLadder(double entry_price, OrderSide side, double stop_distance,
                                                const std::vector<double>& ladder, double tp_cap);

    // 1.0, 1.5, 2.0, ...
    static double rungScale(size_t index);

    // cap <= 0 이면 무제한
    static double capDistance(double tp_cap, size_t index);
};

} // namespace risk
} // namespace trendpilot
