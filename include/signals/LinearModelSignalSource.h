#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "signals/ISignalSource.h"

namespace trendpilot {
namespace signals {

// 사전 학습된 로지스틱 회귀 모델 (JSON 가중치)
//   {"features": [...], "weights": [...], "bias": 0.0, "buy_threshold": 0.5}
// p = sigmoid(w.x + b). p >= buy_threshold 이면 BUY(p), p <= 1 - buy_threshold 이면 SELL(1-p),
// 그 사이는 NEUTRAL

class LinearModelSignalSource : public ISignalSource {
public:
    struct Model {
        std::vector<std::string> features;
        std::vector<double> weights;
        double bias = 0.0;
        double buy_threshold = 0.5;     // 0.5 ~ 1.0 미만
    };

    explicit LinearModelSignalSource(std::string model_path);

    SignalSource source() const override { return SignalSource::ML; }
    std::string name() const override { return "ml"; }
    SignalComponent evaluate(const analytics::MarketSnapshot& snapshot) override;

    // 테스트/재로딩용
    static Model parseModel(const nlohmann::json& j);
    void setModel(const Model& model) { model_ = model; }

    static std::map<std::string, double> extractFeatures(const analytics::MarketSnapshot& snapshot);
    static double predictProbability(const Model& model, const std::map<std::string, double>& features);
    static SignalComponent fromProbability(double p, double buy_threshold);

private:
    void loadModel();

    std::string model_path_;
    std::optional<Model> model_;
};

} // namespace signals
} // namespace trendpilot
