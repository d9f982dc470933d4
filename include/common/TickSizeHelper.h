#pragma once
// ===================================================================
// 심볼 명세(SymbolSpec) 기반 가격/수량 단위 헬퍼
//
// 브로커는 tick_size 배수가 아닌 가격, lot_step 배수가 아닌 수량을
// 거부하므로 주문/수정 전에 반드시 정규화한다.
// ===================================================================

#include <cmath>

#include "common/Types.h"

namespace trendpilot {
namespace common {

// 부동소수 오차 보정용
constexpr double kStepEpsilon = 1e-9;

inline double roundToTickSize(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::round(price / tick) * tick;
}

inline double roundUpToTickSize(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::ceil(price / tick - kStepEpsilon) * tick;
}

inline double roundDownToTickSize(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::floor(price / tick + kStepEpsilon) * tick;
}

// 수량은 항상 0 방향으로 내림
inline double floorToLotStep(double quantity, double step) {
    if (step <= 0.0) return quantity;
    return std::floor(quantity / step + kStepEpsilon) * step;
}

inline double ceilToLotStep(double quantity, double step) {
    if (step <= 0.0) return quantity;
    return std::ceil(quantity / step - kStepEpsilon) * step;
}

inline bool isLotStepMultiple(double quantity, double step) {
    if (step <= 0.0) return true;
    double ratio = quantity / step;
    return std::abs(ratio - std::round(ratio)) < 1e-6;
}

// 손절가는 포지션에 불리하지 않은 방향으로 정규화 (매수: 올림, 매도: 내림)
inline double roundStopForSide(double price, const SymbolSpec& spec, OrderSide side) {
    return side == OrderSide::BUY ? roundUpToTickSize(price, spec.tick_size)
                                  : roundDownToTickSize(price, spec.tick_size);
}

} // namespace common
} // namespace trendpilot
