#pragma once

#include <optional>
#include <string>

#include "common/Types.h"
#include "analytics/MarketSnapshot.h"
#include "position/PositionConfig.h"
#include "position/PositionTypes.h"

namespace trendpilot {
namespace position {

enum class ScalpExitType {
    MOMENTUM,
    REVERSAL,
    TIME,
    TIME_LOSS,
    BREAKEVEN
};

const char* toString(ScalpExitType type);

struct ScalpExit {
    ScalpExitType type = ScalpExitType::MOMENTUM;
    double profit_pips = 0.0;
    std::string reason;
};

// 단타 청산 판정
// 1. 최소 수익 이상에서 모멘텀 약화 / 반전 신호
// 2. 최대 보유시간 경과 (수익 또는 작은 손실)
// 3. 본전 부근에서 오래 머물고 모멘텀 약화
// 트레일링은 trail_after_pips 초과부터 pip 거리로 추적
class ScalpingController {
public:
    explicit ScalpingController(const ScalpingConfig& config = ScalpingConfig());

    bool appliesTo(const analytics::MarketSnapshot& snapshot) const;

    double pipSize(const SymbolSpec& spec) const;
    static double profitPips(const PositionRecord& position, double price, double pip_size);

    std::optional<ScalpExit> shouldExit(const PositionRecord& position,
                                        const analytics::MarketSnapshot& snapshot,
                                        double price, double pip_size, long long now_ms) const;

    std::optional<StopCandidate> trailingStop(const PositionRecord& position, double price, double pip_size) const;

    // MACD 히스토그램 2봉 연속 역행 또는 0 선 역방향 돌파
    static bool momentumWeakening(const analytics::MarketSnapshot& snapshot, OrderSide side);
    bool reversalSignal(const analytics::MarketSnapshot& snapshot, OrderSide side) const;

    const ScalpingConfig& config() const { return config_; }

private:
    ScalpingConfig config_;
};

} // namespace position
} // namespace trendpilot
