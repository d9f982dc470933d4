#pragma once

#include <optional>

#include "common/Types.h"
#include "position/PositionConfig.h"
#include "position/PositionTypes.h"

namespace trendpilot {
namespace position {

// 트레일링 스탑 / 본전 이동 / 보유시간 청산
class TrailingController {
public:
    TrailingController(const TrailingConfig& trailing = TrailingConfig(),
                       const BreakevenConfig& breakeven = BreakevenConfig(),
                       const TimeExitConfig& time_exit = TimeExitConfig());

    // 최고 유리가 갱신 + 활성화 판정 후 트레일링 손절 후보
    std::optional<StopCandidate> trailingStop(const PositionRecord& position, ManagedState& state,
                                              double price, double atr) const;

    // 이미 적용됐으면 nullopt. 적용 플래그는 호출자가 수정 성공 후 설정
    std::optional<StopCandidate> breakevenStop(const PositionRecord& position, const ManagedState& state,
                                               double price, double atr, const SymbolSpec& spec) const;

    bool shouldTimeExit(const PositionRecord& position, long long now_ms) const;

    static double unrealizedDistance(const PositionRecord& position, double price);

private:
    TrailingConfig trailing_;
    BreakevenConfig breakeven_;
    TimeExitConfig time_exit_;
};

} // namespace position
} // namespace trendpilot
