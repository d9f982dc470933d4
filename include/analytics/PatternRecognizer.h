#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "analytics/AnalyticsConfig.h"

namespace trendpilot {
namespace analytics {

struct PatternMatch {
    std::string name;
    SignalDirection direction;
    double confidence;

    PatternMatch(std::string n, SignalDirection d, double c)
        : name(std::move(n)), direction(d), confidence(c) {}
};

struct PatternSignal {
    SignalDirection direction = SignalDirection::NEUTRAL;
    double confidence = 0.0;
    std::vector<PatternMatch> matches;
};

// 차트 패턴 인식 (쌍봉/쌍바닥, 헤드앤숄더, 삼각수렴, 깃발, 쐐기)
class PatternRecognizer {
public:
    explicit PatternRecognizer(const PatternConfig& config = PatternConfig());

    std::vector<PatternMatch> detect(const std::vector<Candle>& bars) const;

    // 매수/매도 점수 우위 (dominance_ratio 배) 로 최종 방향 결정
    PatternSignal evaluate(const std::vector<Candle>& bars) const;

    static PatternSignal aggregate(std::vector<PatternMatch> matches, double dominance_ratio);

private:
    void detectDoubles(const std::vector<Candle>& bars, std::vector<PatternMatch>& out) const;
    void detectHeadAndShoulders(const std::vector<Candle>& bars, std::vector<PatternMatch>& out) const;
    void detectTrianglesAndWedges(const std::vector<Candle>& bars, std::vector<PatternMatch>& out) const;
    void detectFlags(const std::vector<Candle>& bars, std::vector<PatternMatch>& out) const;

    PatternConfig config_;
};

} // namespace analytics
} // namespace trendpilot
