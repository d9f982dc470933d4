#undef NDEBUG
#include "common/Errors.h"
#include "analytics/RegimeClassifier.h"
#include "signals/SignalFusionEngine.h"
#include "signals/SentimentFeedSource.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

using namespace trendpilot;
using namespace trendpilot::signals;

namespace {

// 고정 결과 또는 실패를 돌려주는 소스
class FixedSource : public ISignalSource {
public:
    FixedSource(SignalSource source, SignalDirection direction, double confidence, bool fail = false)
        : source_(source), direction_(direction), confidence_(confidence), fail_(fail) {}

    SignalSource source() const override { return source_; }
    std::string name() const override { return toString(source_); }
    SignalComponent evaluate(const analytics::MarketSnapshot&) override {
        ++calls_;
        if (fail_) {
            throw OptionalSourceFailure("feed offline");
        }
        return SignalComponent(source_, direction_, confidence_);
    }

    int calls() const { return calls_; }

private:
    int calls_ = 0;
    SignalSource source_;
    SignalDirection direction_;
    double confidence_;
    bool fail_;
};

FusionConfig binaryWeights() {
    FusionConfig config;
    config.technical_weight = 0.5;
    config.ml_weight = 0.25;
    config.pattern_weight = 0.125;
    config.sentiment_weight = 0.125;
    config.acceptance_threshold = 0.3;
    config.min_confidence = 0.75;
    config.ml_min_confidence = 0.6;
    config.disagreement_factor = 0.8;
    return config;
}

const analytics::MarketSnapshot& emptySnapshot() {
    static const auto snapshot = analytics::MarketSnapshot::build("XAUUSD", "H1", {}, analytics::IndicatorSettings());
    return snapshot;
}

void testInclusiveThreshold() {
    SignalFusionEngine engine(binaryWeights());
    SignalComponent technical(SignalSource::TECHNICAL, SignalDirection::BUY, 1.0);

    OptionalComponents optional;
    optional[optionalIndex(SignalSource::ML)] = SignalComponent(SignalSource::ML, SignalDirection::BUY, 1.0);

    auto decision = engine.fuse(technical, optional);
    assert(decision.direction == SignalDirection::BUY);
    assert(decision.confidence == 0.75);
    assert(decision.accepted);
    assert(!decision.technical_only);
    assert(!decision.disagreement_applied);
    std::cout << "  inclusive threshold OK\n";
}

void testDisableEqualsFailure() {
    SignalFusionEngine engine(binaryWeights());
    SignalComponent technical(SignalSource::TECHNICAL, SignalDirection::SELL, 0.9);

    SignalSourceSet disabled;
    disabled[optionalIndex(SignalSource::ML)] =
        std::make_shared<FixedSource>(SignalSource::ML, SignalDirection::SELL, 0.8);

    SignalSourceSet failing = disabled;
    failing[optionalIndex(SignalSource::PATTERN)] =
        std::make_shared<FixedSource>(SignalSource::PATTERN, SignalDirection::BUY, 0.9, true);

    auto a = engine.fuse(technical, engine.collect(disabled, emptySnapshot()));
    auto b = engine.fuse(technical, engine.collect(failing, emptySnapshot()));

    assert(a.direction == b.direction);
    assert(a.confidence == b.confidence);
    assert(a.accepted == b.accepted);
    assert(a.score == b.score);
    assert(!b.optional[optionalIndex(SignalSource::PATTERN)].has_value());
    std::cout << "  disable == failure OK\n";
}

void testWeakMlFallsBackToTechnical() {
    SignalFusionEngine engine(binaryWeights());
    SignalComponent technical(SignalSource::TECHNICAL, SignalDirection::BUY, 0.8);

    OptionalComponents optional;
    optional[optionalIndex(SignalSource::ML)] = SignalComponent(SignalSource::ML, SignalDirection::SELL, 0.55);

    auto decision = engine.fuse(technical, optional);
    assert(decision.technical_only);
    assert(decision.direction == SignalDirection::BUY);
    assert(std::abs(decision.confidence - 0.8) < 1e-12);
    assert(decision.accepted);

    // 선택 소스가 하나도 없을 때도 기술적 단독
    auto alone = engine.fuse(technical, OptionalComponents{});
    assert(alone.technical_only);
    assert(std::abs(alone.confidence - 0.8) < 1e-12);
    std::cout << "  weak ML fallback OK\n";
}

void testDisagreementDegrades() {
    SignalFusionEngine engine(binaryWeights());
    SignalComponent technical(SignalSource::TECHNICAL, SignalDirection::BUY, 1.0);

    OptionalComponents optional;
    optional[optionalIndex(SignalSource::PATTERN)] = SignalComponent(SignalSource::PATTERN, SignalDirection::SELL, 0.2);

    auto decision = engine.fuse(technical, optional);
    assert(decision.disagreement_applied);
    assert(decision.direction == SignalDirection::BUY);
    assert(std::abs(decision.score - 0.475) < 1e-12);
    assert(std::abs(decision.confidence - 0.475 * 0.8) < 1e-12);
    assert(!decision.accepted);
    assert(decision.reason == "confidence below minimum");
    std::cout << "  disagreement degrade OK\n";
}

void testNeutralNeverAccepted() {
    FusionConfig config = binaryWeights();
    config.min_confidence = 0.0;
    SignalFusionEngine engine(config);

    SignalComponent technical(SignalSource::TECHNICAL, SignalDirection::BUY, 0.4);
    OptionalComponents optional;
    optional[optionalIndex(SignalSource::SENTIMENT)] =
        SignalComponent(SignalSource::SENTIMENT, SignalDirection::BUY, 0.4);

    // 0.5*0.4 + 0.125*0.4 = 0.25 <= 0.3
    auto decision = engine.fuse(technical, optional);
    assert(decision.direction == SignalDirection::NEUTRAL);
    assert(!decision.accepted);
    std::cout << "  neutral rejection OK\n";
}

void testShortHistoryIsTechnicalOnly() {
    std::vector<Candle> bars;
    double price = 2000.0;
    for (int i = 0; i < 30; ++i) {
        double open = price;
        price += 1.0;
        bars.emplace_back(open, price + 0.5, open - 0.5, price, 1000.0, static_cast<long long>(i) * 3600000);
    }
    auto snapshot = analytics::MarketSnapshot::build("XAUUSD", "H1", bars, analytics::IndicatorSettings());
    auto regime = analytics::RegimeClassifier().classify(snapshot);
    assert(!regime.sufficient_history);

    // 기본 가중치: 기술적 0.4 라서 패턴이 섞이면 0.9 신호도 통과 못 함
    SignalFusionEngine engine;
    SignalComponent technical(SignalSource::TECHNICAL, SignalDirection::BUY, 0.9);
    auto pattern = std::make_shared<FixedSource>(SignalSource::PATTERN, SignalDirection::NEUTRAL, 0.0);
    SignalSourceSet sources;
    sources[optionalIndex(SignalSource::PATTERN)] = pattern;

    auto decision = engine.decide(technical, sources, snapshot, regime);
    assert(pattern->calls() == 0);
    assert(decision.technical_only);
    assert(decision.accepted);
    assert(decision.direction == SignalDirection::BUY);
    assert(std::abs(decision.confidence - 0.9) < 1e-12);

    // 충분한 이력이면 선택 소스를 평가
    regime.sufficient_history = true;
    auto mixed = engine.decide(technical, sources, snapshot, regime);
    assert(pattern->calls() == 1);
    assert(!mixed.technical_only);
    assert(!mixed.accepted);
    std::cout << "  short history technical only OK\n";
}

void testHelpers() {
    assert(SignalFusionEngine::sizeMultiplier(0.49) == 0.5);
    assert(SignalFusionEngine::sizeMultiplier(0.5) == 0.75);
    assert(SignalFusionEngine::sizeMultiplier(0.7) == 1.0);
    assert(SignalFusionEngine::sizeMultiplier(0.85) == 1.25);

    FusionConfig unnormalized;
    unnormalized.technical_weight = 2.0;
    unnormalized.ml_weight = 2.0;
    unnormalized.pattern_weight = 0.0;
    unnormalized.sentiment_weight = 0.0;
    SignalFusionEngine engine(unnormalized);
    assert(std::abs(engine.weight(SignalSource::TECHNICAL) - 0.5) < 1e-12);

    auto bullish = SentimentFeedSource::fromScore(0.35, 0.1);
    assert(bullish.direction == SignalDirection::BUY);
    auto flat = SentimentFeedSource::fromScore(-0.05, 0.1);
    assert(flat.direction == SignalDirection::NEUTRAL);
    auto clamped = SentimentFeedSource::fromScore(-3.0, 0.1);
    assert(clamped.direction == SignalDirection::SELL && clamped.confidence == 1.0);
    std::cout << "  helpers OK\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting SignalFusion Test..." << std::endl;

    testInclusiveThreshold();
    testDisableEqualsFailure();
    testWeakMlFallsBackToTechnical();
    testDisagreementDegrades();
    testNeutralNeverAccepted();
    testShortHistoryIsTechnicalOnly();
    testHelpers();

    std::cout << "[TEST] SignalFusion PASSED" << std::endl;
    return 0;
}
