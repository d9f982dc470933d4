#include "signals/PatternSignalSource.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace trendpilot {
namespace signals {

PatternSignalSource::PatternSignalSource(const analytics::PatternConfig& config)
    : recognizer_(config)
    , min_bars_(config.min_bars)
{
}

SignalComponent PatternSignalSource::evaluate(const analytics::MarketSnapshot& snapshot) {
    if (snapshot.size() < static_cast<size_t>(min_bars_)) {
        throw OptionalSourceFailure("pattern: not enough bars for " + snapshot.symbol);
    }

    auto signal = recognizer_.evaluate(snapshot.bars);
    for (const auto& m : signal.matches) {
        LOG_DEBUG("{} pattern {} ({}, {:.2f})", snapshot.symbol, m.name, toString(m.direction), m.confidence);
    }
    return SignalComponent(SignalSource::PATTERN, signal.direction, signal.confidence);
}

} // namespace signals
} // namespace trendpilot
