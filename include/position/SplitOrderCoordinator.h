#pragma once

#include <vector>

#include "common/Types.h"
#include "position/PositionConfig.h"

namespace trendpilot {
namespace position {

struct OrderLeg {
    double quantity = 0.0;
    double take_profit = 0.0;
    size_t rung_index = 0;
    double rung_scale = 1.0;
    double allocation = 100.0;  // %
};

// 사이징된 수량을 TP 사다리 단계별로 분할
class SplitOrderCoordinator {
public:
    explicit SplitOrderCoordinator(const SplitOrderConfig& config = SplitOrderConfig());

    // 각 분할은 max_lot_per_order 로 제한 후 lot_step 내림, min_lot 미만은 제외.
    // 모두 제외되면 첫 단계에 단일 주문. 비활성이면 첫 단계 단일 주문
    std::vector<OrderLeg> plan(double total_quantity,
                               const std::vector<double>& tp_levels,
                               const std::vector<double>& allocations,
                               const SymbolSpec& spec) const;

    // 단계 수에 맞춰 자르거나 균등 분배 후 합계 100 으로 정규화
    static std::vector<double> normalizeAllocations(const std::vector<double>& allocations, size_t rungs);

private:
    OrderLeg singleLeg(double total_quantity, const std::vector<double>& tp_levels, const SymbolSpec& spec) const;
    double capQuantity(double quantity, const SymbolSpec& spec) const;

    SplitOrderConfig config_;
};

} // namespace position
} // namespace trendpilot
