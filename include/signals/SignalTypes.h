#pragma once

#include <array>
#include <optional>
#include <string>

#include "common/Types.h"

namespace trendpilot {
namespace signals {

enum class SignalSource { TECHNICAL, ML, PATTERN, SENTIMENT };

constexpr size_t kOptionalSourceCount = 3;

const char* toString(SignalSource source);

// 선택적 소스 -> 고정 배열 인덱스
constexpr size_t optionalIndex(SignalSource source) {
    return source == SignalSource::ML ? 0 : source == SignalSource::PATTERN ? 1 : 2;
}

constexpr SignalSource optionalSourceAt(size_t index) {
    return index == 0 ? SignalSource::ML : index == 1 ? SignalSource::PATTERN : SignalSource::SENTIMENT;
}

struct SignalComponent {
    SignalSource source = SignalSource::TECHNICAL;
    SignalDirection direction = SignalDirection::NEUTRAL;
    double confidence = 0.0;    // 0~1

    SignalComponent() = default;
    SignalComponent(SignalSource s, SignalDirection d, double c)
        : source(s), direction(d), confidence(c) {}

    double signedConfidence() const { return directionSign(direction) * confidence; }
};

// 비활성 소스와 실패한 소스는 모두 빈 슬롯
using OptionalComponents = std::array<std::optional<SignalComponent>, kOptionalSourceCount>;

struct FusedDecision {
    std::string symbol;
    SignalDirection direction = SignalDirection::NEUTRAL;
    double confidence = 0.0;
    bool accepted = false;
    bool technical_only = false;
    bool disagreement_applied = false;
    double score = 0.0;
    double size_multiplier = 1.0;
    SignalComponent technical;
    OptionalComponents optional;
    std::string reason;
};

} // namespace signals
} // namespace trendpilot
