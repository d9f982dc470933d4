#include "signals/SignalFusionEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace trendpilot {
namespace signals {

const char* toString(SignalSource source) {
    switch (source) {
        case SignalSource::TECHNICAL: return "technical";
        case SignalSource::ML: return "ml";
        case SignalSource::PATTERN: return "pattern";
        case SignalSource::SENTIMENT: return "sentiment";
    }
    return "technical";
}

namespace {
size_t weightIndex(SignalSource source) {
    switch (source) {
        case SignalSource::TECHNICAL: return 0;
        case SignalSource::ML: return 1;
        case SignalSource::PATTERN: return 2;
        case SignalSource::SENTIMENT: return 3;
    }
    return 0;
}
}

SignalFusionEngine::SignalFusionEngine(const FusionConfig& config)
    : config_(config)
{
    weights_ = {
        std::max(config.technical_weight, 0.0),
        std::max(config.ml_weight, 0.0),
        std::max(config.pattern_weight, 0.0),
        std::max(config.sentiment_weight, 0.0)
    };
    double total = weights_[0] + weights_[1] + weights_[2] + weights_[3];
    if (total <= 0.0) {
        LOG_WARN("Fusion weights sum to zero, falling back to defaults");
        FusionConfig defaults;
        weights_ = {defaults.technical_weight, defaults.ml_weight, defaults.pattern_weight, defaults.sentiment_weight};
        total = weights_[0] + weights_[1] + weights_[2] + weights_[3];
    }
    for (auto& w : weights_) {
        w /= total;
    }
}

double SignalFusionEngine::weight(SignalSource source) const {
    return weights_[weightIndex(source)];
}

OptionalComponents SignalFusionEngine::collect(const SignalSourceSet& sources,
                                               const analytics::MarketSnapshot& snapshot) const {
    OptionalComponents out;
    for (size_t i = 0; i < kOptionalSourceCount; ++i) {
        const auto& src = sources[i];
        if (!src) {
            continue;
        }
        try {
            SignalComponent c = src->evaluate(snapshot);
            c.source = optionalSourceAt(i);
            c.confidence = std::clamp(c.confidence, 0.0, 1.0);
            out[i] = c;
        } catch (const OptionalSourceFailure& e) {
            LOG_WARN("{} source '{}' dropped this cycle: {}", snapshot.symbol, src->name(), e.what());
        } catch (const std::exception& e) {
            LOG_WARN("{} source '{}' failed unexpectedly, dropped this cycle: {}", snapshot.symbol, src->name(), e.what());
        }
    }
    return out;
}

FusedDecision SignalFusionEngine::fuse(const SignalComponent& technical, const OptionalComponents& optional) const {
    FusedDecision decision;
    decision.technical = technical;
    decision.optional = optional;

    // ML 임계 미만은 중립 취급
    OptionalComponents effective = optional;
    bool ml_weak = false;
    auto& ml = effective[optionalIndex(SignalSource::ML)];
    if (ml && (ml->direction == SignalDirection::NEUTRAL || ml->confidence < config_.ml_min_confidence)) {
        ml->direction = SignalDirection::NEUTRAL;
        ml->confidence = 0.0;
        ml_weak = true;
    }

    size_t present = 0;
    for (const auto& c : effective) {
        if (c) ++present;
    }

    if (present == 0 || (present == 1 && ml && ml_weak)) {
        decision.technical_only = true;
        decision.direction = technical.direction;
        decision.confidence = std::clamp(technical.confidence, 0.0, 1.0);
        decision.score = technical.signedConfidence();
    } else {
        double score = weight(SignalSource::TECHNICAL) * technical.signedConfidence();
        for (size_t i = 0; i < kOptionalSourceCount; ++i) {
            if (effective[i]) {
                score += weight(optionalSourceAt(i)) * effective[i]->signedConfidence();
            }
        }
        decision.score = score;
        decision.confidence = std::min(std::abs(score), 1.0);
        if (std::abs(score) > config_.acceptance_threshold) {
            decision.direction = score > 0 ? SignalDirection::BUY : SignalDirection::SELL;
        }

        // 기술적 방향에 동의하는 선택 소스가 없으면 감쇠 (거부 아님)
        if (technical.direction != SignalDirection::NEUTRAL) {
            bool any_agrees = false;
            for (const auto& c : effective) {
                if (c && c->direction == technical.direction) {
                    any_agrees = true;
                    break;
                }
            }
            if (!any_agrees) {
                decision.confidence *= config_.disagreement_factor;
                decision.disagreement_applied = true;
            }
        }
    }

    decision.accepted = decision.direction != SignalDirection::NEUTRAL &&
                        decision.confidence >= config_.min_confidence;
    decision.size_multiplier = sizeMultiplier(decision.confidence);

    if (decision.accepted) {
        decision.reason = decision.technical_only ? "accepted (technical only)" : "accepted";
    } else if (decision.direction == SignalDirection::NEUTRAL) {
        decision.reason = "neutral";
    } else {
        decision.reason = "confidence below minimum";
    }
    return decision;
}

FusedDecision SignalFusionEngine::decide(const SignalComponent& technical,
                                         const SignalSourceSet& sources,
                                         const analytics::MarketSnapshot& snapshot,
                                         const analytics::MarketRegime& regime) const {
    if (!regime.sufficient_history) {
        LOG_DEBUG("{} short history ({} bars), optional sources skipped", snapshot.symbol, snapshot.size());
        return fuse(technical, OptionalComponents{});
    }
    return fuse(technical, collect(sources, snapshot));
}

double SignalFusionEngine::sizeMultiplier(double confidence) {
    if (confidence < 0.5) return 0.5;
    if (confidence < 0.7) return 0.75;
    if (confidence < 0.85) return 1.0;
    return 1.25;
}

} // namespace signals
} // namespace trendpilot
