#include "signals/SentimentFeedSource.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace trendpilot {
namespace signals {

SentimentFeedSource::SentimentFeedSource(std::string feed_path, double neutral_band)
    : feed_path_(std::move(feed_path))
    , neutral_band_(neutral_band)
{
}

SignalComponent SentimentFeedSource::fromScore(double score, double neutral_band) {
    score = std::clamp(score, -1.0, 1.0);
    if (score > neutral_band) {
        return SignalComponent(SignalSource::SENTIMENT, SignalDirection::BUY, std::abs(score));
    }
    if (score < -neutral_band) {
        return SignalComponent(SignalSource::SENTIMENT, SignalDirection::SELL, std::abs(score));
    }
    return SignalComponent(SignalSource::SENTIMENT, SignalDirection::NEUTRAL, std::abs(score));
}

SignalComponent SentimentFeedSource::evaluate(const analytics::MarketSnapshot& snapshot) {
    auto path = utils::PathUtils::resolveRelativePath(feed_path_);
    std::ifstream file(path);
    if (!file.is_open()) {
        throw OptionalSourceFailure("sentiment: feed not available: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw OptionalSourceFailure(std::string("sentiment: malformed feed: ") + e.what());
    }

    auto it = j.find(snapshot.symbol);
    if (it == j.end() || !it->is_number()) {
        throw OptionalSourceFailure("sentiment: no score for " + snapshot.symbol);
    }
    return fromScore(it->get<double>(), neutral_band_);
}

} // namespace signals
} // namespace trendpilot
