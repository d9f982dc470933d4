#include "position/SplitOrderCoordinator.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include "risk/PositionSizer.h"

#include <algorithm>
#include <numeric>

namespace trendpilot {
namespace position {

SplitOrderCoordinator::SplitOrderCoordinator(const SplitOrderConfig& config)
    : config_(config)
{
}

std::vector<double> SplitOrderCoordinator::normalizeAllocations(const std::vector<double>& allocations,
                                                                size_t rungs) {
    std::vector<double> weights;
    if (rungs == 0) return weights;

    for (size_t i = 0; i < rungs; ++i) {
        double w = i < allocations.size() ? allocations[i] : 0.0;
        weights.push_back(std::max(0.0, w));
    }

    double sum = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (sum <= 0) {
        std::fill(weights.begin(), weights.end(), 100.0 / static_cast<double>(rungs));
        return weights;
    }
    for (auto& w : weights) {
        w = w / sum * 100.0;
    }
    return weights;
}

double SplitOrderCoordinator::capQuantity(double quantity, const SymbolSpec& spec) const {
    double cap = std::min(spec.max_lot, config_.max_lot_per_order > 0 ? config_.max_lot_per_order : spec.max_lot);
    return common::floorToLotStep(std::min(quantity, cap), spec.lot_step);
}

OrderLeg SplitOrderCoordinator::singleLeg(double total_quantity, const std::vector<double>& tp_levels,
                                          const SymbolSpec& spec) const {
    OrderLeg leg;
    leg.quantity = capQuantity(total_quantity, spec);
    leg.take_profit = tp_levels.empty() ? 0.0 : tp_levels.front();
    leg.rung_index = 0;
    leg.rung_scale = risk::PositionSizer::rungScale(0);
    leg.allocation = 100.0;
    return leg;
}

std::vector<OrderLeg> SplitOrderCoordinator::plan(double total_quantity,
                                                  const std::vector<double>& tp_levels,
                                                  const std::vector<double>& allocations,
                                                  const SymbolSpec& spec) const {
    std::vector<OrderLeg> legs;
    if (total_quantity <= 0) {
        return legs;
    }

    if (!config_.enabled || tp_levels.size() <= 1) {
        OrderLeg leg = singleLeg(total_quantity, tp_levels, spec);
        if (leg.quantity >= spec.min_lot - common::kStepEpsilon) {
            legs.push_back(leg);
        }
        return legs;
    }

    auto weights = normalizeAllocations(allocations, tp_levels.size());
    for (size_t i = 0; i < tp_levels.size(); ++i) {
        OrderLeg leg;
        leg.quantity = capQuantity(total_quantity * weights[i] / 100.0, spec);
        leg.take_profit = tp_levels[i];
        leg.rung_index = i;
        leg.rung_scale = risk::PositionSizer::rungScale(i);
        leg.allocation = weights[i];

        if (leg.quantity < spec.min_lot - common::kStepEpsilon) {
            LOG_DEBUG("Split leg {} dropped: {:.4f} < min lot {:.4f}", i, leg.quantity, spec.min_lot);
            continue;
        }
        legs.push_back(leg);
    }

    // 수량이 작아 모든 분할이 min_lot 미만이면 단일 주문
    if (legs.empty()) {
        OrderLeg leg = singleLeg(total_quantity, tp_levels, spec);
        if (leg.quantity >= spec.min_lot - common::kStepEpsilon) {
            legs.push_back(leg);
        }
    }
    return legs;
}

} // namespace position
} // namespace trendpilot
