#include "signals/LinearModelSignalSource.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace trendpilot {
namespace signals {

LinearModelSignalSource::LinearModelSignalSource(std::string model_path)
    : model_path_(std::move(model_path))
{
}

LinearModelSignalSource::Model LinearModelSignalSource::parseModel(const nlohmann::json& j) {
    Model model;
    if (!j.is_object() || !j.contains("features") || !j.contains("weights")) {
        throw OptionalSourceFailure("ml: model requires 'features' and 'weights'");
    }
    try {
        model.features = j.at("features").get<std::vector<std::string>>();
        model.weights = j.at("weights").get<std::vector<double>>();
    } catch (const nlohmann::json::exception& e) {
        throw OptionalSourceFailure(std::string("ml: invalid model: ") + e.what());
    }
    model.bias = j.value("bias", 0.0);
    model.buy_threshold = j.value("buy_threshold", 0.5);
    if (model.features.size() != model.weights.size() || model.features.empty()) {
        throw OptionalSourceFailure("ml: features/weights size mismatch");
    }
    if (model.buy_threshold < 0.5 || model.buy_threshold >= 1.0) {
        throw OptionalSourceFailure("ml: buy_threshold must be in [0.5, 1.0)");
    }
    return model;
}

void LinearModelSignalSource::loadModel() {
    auto path = utils::PathUtils::resolveRelativePath(model_path_);
    if (!std::filesystem::exists(path)) {
        throw OptionalSourceFailure("ml: model file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw OptionalSourceFailure("ml: cannot open model file: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw OptionalSourceFailure(std::string("ml: malformed model file: ") + e.what());
    }
    model_ = parseModel(j);
    LOG_INFO("ML model loaded: {} features from {}", model_->features.size(), path.string());
}

std::map<std::string, double> LinearModelSignalSource::extractFeatures(const analytics::MarketSnapshot& snapshot) {
    std::map<std::string, double> f;
    double atr = snapshot.currentAtr();
    double close = snapshot.lastClose();
    double safe_atr = atr > 0 ? atr : 1.0;

    f["rsi"] = snapshot.rsi.lastOr(50.0) / 100.0;
    f["macd_hist_atr"] = snapshot.macd_hist.lastOr(0.0) / safe_atr;
    f["ma_spread_atr"] = (snapshot.sma_fast.lastOr(close) - snapshot.sma_slow.lastOr(close)) / safe_atr;
    f["volatility_ratio"] = analytics::TechnicalIndicators::calculateVolatilityRatio(
        snapshot.bars, snapshot.settings.atr_period, 50);

    double vol_ma = snapshot.volume_ma.lastOr(0.0);
    f["volume_ratio"] = vol_ma > 0 && !snapshot.empty() ? snapshot.lastBar().volume / vol_ma : 1.0;

    double ret5 = 0.0;
    if (snapshot.size() > 5) {
        ret5 = (close - snapshot.bars[snapshot.size() - 6].close) / safe_atr;
    }
    f["return5_atr"] = ret5;
    f["adx"] = snapshot.adx.lastOr(0.0) / 100.0;
    return f;
}

double LinearModelSignalSource::predictProbability(const Model& model, const std::map<std::string, double>& features) {
    double z = model.bias;
    for (size_t i = 0; i < model.features.size(); ++i) {
        auto it = features.find(model.features[i]);
        if (it == features.end()) {
            throw OptionalSourceFailure("ml: unknown feature '" + model.features[i] + "'");
        }
        z += model.weights[i] * it->second;
    }
    return 1.0 / (1.0 + std::exp(-z));
}

SignalComponent LinearModelSignalSource::evaluate(const analytics::MarketSnapshot& snapshot) {
    if (!model_) {
        loadModel();
    }
    if (!snapshot.atr.hasLast()) {
        throw OptionalSourceFailure("ml: indicators not warmed up for " + snapshot.symbol);
    }

    double p = predictProbability(*model_, extractFeatures(snapshot));
    auto component = fromProbability(p, model_->buy_threshold);
    LOG_DEBUG("{} ml p(buy)={:.3f} -> {}", snapshot.symbol, p, toString(component.direction));
    return component;
}

SignalComponent LinearModelSignalSource::fromProbability(double p, double buy_threshold) {
    if (p >= buy_threshold) {
        return SignalComponent(SignalSource::ML, SignalDirection::BUY, p);
    }
    if (p <= 1.0 - buy_threshold) {
        return SignalComponent(SignalSource::ML, SignalDirection::SELL, 1.0 - p);
    }
    return SignalComponent(SignalSource::ML, SignalDirection::NEUTRAL, std::max(p, 1.0 - p));
}

} // namespace signals
} // namespace trendpilot
