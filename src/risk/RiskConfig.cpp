#include "risk/RiskConfig.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace trendpilot {
namespace risk {

using analytics::RegimeType;

RegimeTable::RegimeTable() {
    for (auto type : {RegimeType::STRONG_TREND, RegimeType::WEAK_TREND, RegimeType::RANGING, RegimeType::VOLATILE}) {
        params_[index(type)] = defaultsFor(type);
    }
}

RegimeTable RegimeTable::defaults() {
    return RegimeTable();
}

RegimeRiskParams RegimeTable::defaultsFor(RegimeType type) {
    RegimeRiskParams p;
    switch (type) {
        case RegimeType::STRONG_TREND:
            p.risk_multiplier = 1.5;
            p.stop_distance_multiplier = 2.5;
            p.tp_ladder = {2.0, 3.0, 5.0};
            p.allocations = {30.0, 30.0, 40.0};
            p.trail_activation = 1.2;
            p.trail_distance = 1.5;
            break;
        case RegimeType::WEAK_TREND:
            p.risk_multiplier = 1.0;
            p.stop_distance_multiplier = 2.0;
            p.tp_ladder = {1.5, 2.0, 3.0};
            p.allocations = {40.0, 35.0, 25.0};
            p.trail_activation = 1.5;
            p.trail_distance = 1.5;
            break;
        case RegimeType::RANGING:
            p.risk_multiplier = 0.7;
            p.stop_distance_multiplier = 1.5;
            p.tp_ladder = {1.0, 1.5, 2.0};
            p.allocations = {50.0, 35.0, 15.0};
            p.trail_activation = 1.0;
            p.trail_distance = 1.0;
            break;
        case RegimeType::VOLATILE:
            p.risk_multiplier = 0.5;
            p.stop_distance_multiplier = 3.0;
            p.tp_ladder = {2.0, 3.5, 5.0};
            p.allocations = {50.0, 30.0, 20.0};
            p.trail_activation = 2.0;
            p.trail_distance = 2.5;
            break;
    }
    return p;
}

size_t RegimeTable::index(RegimeType type) {
    switch (type) {
        case RegimeType::STRONG_TREND: return 0;
        case RegimeType::WEAK_TREND: return 1;
        case RegimeType::RANGING: return 2;
        case RegimeType::VOLATILE: return 3;
    }
    return 1;
}

const RegimeRiskParams& RegimeTable::get(RegimeType type) const {
    return params_[index(type)];
}

RegimeRiskParams& RegimeTable::mutableGet(RegimeType type) {
    return params_[index(type)];
}

int RegimeTable::validate(double min_risk_multiplier, double max_risk_multiplier) {
    int fixes = 0;
    for (auto type : {RegimeType::STRONG_TREND, RegimeType::WEAK_TREND, RegimeType::RANGING, RegimeType::VOLATILE}) {
        auto& p = params_[index(type)];
        const auto defaults = defaultsFor(type);
        const char* name = analytics::toString(type);

        double clamped = std::clamp(p.risk_multiplier, min_risk_multiplier, max_risk_multiplier);
        if (clamped != p.risk_multiplier) {
            LOG_WARN("Regime table [{}]: risk_multiplier {:.2f} clamped to {:.2f}", name, p.risk_multiplier, clamped);
            p.risk_multiplier = clamped;
            ++fixes;
        }

        if (p.stop_distance_multiplier <= 0) {
            LOG_WARN("Regime table [{}]: invalid stop_distance_multiplier, using default", name);
            p.stop_distance_multiplier = defaults.stop_distance_multiplier;
            ++fixes;
        }

        bool ladder_ok = !p.tp_ladder.empty() && p.tp_ladder.front() > 0;
        for (size_t i = 1; ladder_ok && i < p.tp_ladder.size(); ++i) {
            if (p.tp_ladder[i] <= p.tp_ladder[i - 1]) ladder_ok = false;
        }
        if (!ladder_ok) {
            LOG_WARN("Regime table [{}]: tp_ladder must be positive and increasing, using default", name);
            p.tp_ladder = defaults.tp_ladder;
            ++fixes;
        }

        // 비율 목록은 사다리 길이에 맞추고 합계 100 으로 정규화
        bool alloc_ok = p.allocations.size() == p.tp_ladder.size() &&
                        std::all_of(p.allocations.begin(), p.allocations.end(), [](double a) { return a >= 0; });
        double total = std::accumulate(p.allocations.begin(), p.allocations.end(), 0.0);
        if (!alloc_ok || total <= 0) {
            p.allocations.assign(p.tp_ladder.size(), 100.0 / p.tp_ladder.size());
            LOG_WARN("Regime table [{}]: invalid allocations, using equal split", name);
            ++fixes;
        } else if (std::abs(total - 100.0) > 1e-9) {
            for (auto& a : p.allocations) a = a * 100.0 / total;
        }

        if (p.trail_activation <= 0) {
            p.trail_activation = defaults.trail_activation;
            ++fixes;
        }
        if (p.trail_distance <= 0) {
            p.trail_distance = defaults.trail_distance;
            ++fixes;
        }
    }
    return fixes;
}

double RiskConfig::tpCapFor(const std::string& symbol) const {
    auto ov = symbol_overrides.find(symbol);
    if (ov != symbol_overrides.end() && ov->second.tp_cap > 0) {
        return ov->second.tp_cap;
    }
    auto it = tp_caps.find(symbol);
    if (it != tp_caps.end()) {
        return it->second;
    }
    return default_tp_cap;
}

} // namespace risk
} // namespace trendpilot
