#pragma once

#include <string>

#include "signals/ISignalSource.h"

namespace trendpilot {
namespace signals {

// 외부 프로세스가 갱신하는 심볼별 센티먼트 점수 파일 {"XAUUSD": 0.35, ...}
class SentimentFeedSource : public ISignalSource {
public:
    SentimentFeedSource(std::string feed_path, double neutral_band);

    SignalSource source() const override { return SignalSource::SENTIMENT; }
    std::string name() const override { return "sentiment"; }
    SignalComponent evaluate(const analytics::MarketSnapshot& snapshot) override;

    static SignalComponent fromScore(double score, double neutral_band);

private:
    std::string feed_path_;
    double neutral_band_;
};

} // namespace signals
} // namespace trendpilot
