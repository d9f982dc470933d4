#pragma once

#include "analytics/PatternRecognizer.h"
#include "signals/ISignalSource.h"

namespace trendpilot {
namespace signals {

class PatternSignalSource : public ISignalSource {
public:
    explicit PatternSignalSource(const analytics::PatternConfig& config = analytics::PatternConfig());

    SignalSource source() const override { return SignalSource::PATTERN; }
    std::string name() const override { return "pattern"; }
    SignalComponent evaluate(const analytics::MarketSnapshot& snapshot) override;

private:
    analytics::PatternRecognizer recognizer_;
    int min_bars_;
};

} // namespace signals
} // namespace trendpilot
