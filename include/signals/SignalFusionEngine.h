#pragma once

#include <array>
#include <memory>

#include "analytics/MarketSnapshot.h"
#include "analytics/RegimeClassifier.h"
#include "signals/ISignalSource.h"
#include "signals/SignalConfig.h"
#include "signals/SignalTypes.h"

namespace trendpilot {
namespace signals {

// 선택적 소스 제공자 (없으면 비활성)
using SignalSourceSet = std::array<std::shared_ptr<ISignalSource>, kOptionalSourceCount>;

// 다중 소스 가중 결합
//
// - 가중치는 생성 시 4개 소스 전체 합으로 한 번 정규화 (활성 여부와 무관)
// - 실패/비활성 소스는 빈 슬롯이며 재정규화하지 않는다 (달성 가능한 신뢰도가 낮아짐)
// - 선택 소스가 하나도 없거나, 유일한 선택 소스인 ML 이 임계 미만이면 기술적 신호 단독 경로
class SignalFusionEngine {
public:
    explicit SignalFusionEngine(const FusionConfig& config = FusionConfig());

    // 각 소스를 평가. 예외는 로그 후 빈 슬롯으로 처리
    OptionalComponents collect(const SignalSourceSet& sources, const analytics::MarketSnapshot& snapshot) const;

    FusedDecision fuse(const SignalComponent& technical, const OptionalComponents& optional) const;

    // 사이클 결정: 봉이 부족한 레짐이면 선택 소스를 평가하지 않고 기술적 신호 단독
    FusedDecision decide(const SignalComponent& technical,
                         const SignalSourceSet& sources,
                         const analytics::MarketSnapshot& snapshot,
                         const analytics::MarketRegime& regime) const;

    double weight(SignalSource source) const;

    // 신뢰도 -> 포지션 크기 배수 (0.5 ~ 1.25)
    static double sizeMultiplier(double confidence);

    const FusionConfig& config() const { return config_; }

private:
    FusionConfig config_;
    std::array<double, 4> weights_;     // TECHNICAL, ML, PATTERN, SENTIMENT
};

} // namespace signals
} // namespace trendpilot
