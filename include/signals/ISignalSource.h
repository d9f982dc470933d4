#pragma once

#include <string>

#include "analytics/MarketSnapshot.h"
#include "signals/SignalTypes.h"

namespace trendpilot {
namespace signals {

// 선택적 신호 소스 계약. 실패 시 OptionalSourceFailure 를 던진다
class ISignalSource {
public:
    virtual ~ISignalSource() = default;

    virtual SignalSource source() const = 0;
    virtual std::string name() const = 0;
    virtual SignalComponent evaluate(const analytics::MarketSnapshot& snapshot) = 0;
};

} // namespace signals
} // namespace trendpilot
