#include "risk/PositionSizer.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"

#include <algorithm>
#include <limits>

namespace trendpilot {
namespace risk {

SizingResult PositionSizer::sizeOrThrow(const SizingRequest& request) const {
    const auto& spec = request.spec;

    if (request.balance <= 0) {
        throw SizingInfeasible("insufficient balance");
    }
    if (request.stop_distance <= 0) {
        throw SizingInfeasible("stop distance must be positive");
    }
    if (spec.tick_size <= 0 || spec.tick_value <= 0) {
        throw SizingInfeasible("invalid tick size/value for " + spec.symbol);
    }
    if (request.risk_percent <= 0 || request.risk_multiplier <= 0) {
        throw SizingInfeasible("risk budget must be positive");
    }

    SizingResult result;
    result.risk_amount = request.balance * (request.risk_percent / 100.0) * request.risk_multiplier;
    result.stop_ticks = request.stop_distance / spec.tick_size;
    result.raw_quantity = result.risk_amount / (result.stop_ticks * spec.tick_value);

    double confidence = std::clamp(request.confidence_multiplier, 0.5, 1.25);
    double quantity = result.raw_quantity * confidence;

    // min_lot 이 step 배수가 아니면 올림, max_lot 은 내림
    double min_lot = common::ceilToLotStep(spec.min_lot, spec.lot_step);
    double max_lot = common::floorToLotStep(spec.max_lot, spec.lot_step);
    if (max_lot < min_lot) {
        throw SizingInfeasible("lot limits inconsistent for " + spec.symbol);
    }

    quantity = std::clamp(quantity, min_lot, max_lot);
    quantity = common::floorToLotStep(quantity, spec.lot_step);
    quantity = std::max(quantity, min_lot);

    result.quantity = quantity;
    return result;
}

std::optional<SizingResult> PositionSizer::size(const SizingRequest& request) const {
    try {
        return sizeOrThrow(request);
    } catch (const SizingInfeasible& e) {
        LOG_WARN("Sizing infeasible for {}: {}", request.spec.symbol, e.what());
        return std::nullopt;
    }
}

double PositionSizer::rungScale(size_t index) {
    return 1.0 + 0.5 * static_cast<double>(index);
}

double PositionSizer::capDistance(double tp_cap, size_t index) {
    if (tp_cap <= 0) {
        return std::numeric_limits<double>::max();
    }
    return tp_cap * rungScale(index);
}

std::vector<double> PositionSizer::takeProfitLadder(double entry_price, OrderSide side, double stop_distance,
                                                    const std::vector<double>& ladder, double tp_cap) {
    std::vector<double> levels;
    levels.reserve(ladder.size());
    const double sign = sideSign(side);
    for (size_t i = 0; i < ladder.size(); ++i) {
        double distance = std::min(ladder[i] * stop_distance, capDistance(tp_cap, i));
        levels.push_back(entry_price + sign * distance);
    }
    return levels;
}

} // namespace risk
} // namespace trendpilot
