#include "monitor/EngineSnapshot.h"

namespace trendpilot {
namespace monitor {

nlohmann::json toJson(const analytics::MarketRegime& regime) {
    return {
        {"type", analytics::toString(regime.type)},
        {"direction", analytics::toString(regime.direction)},
        {"strength", regime.strength},
        {"volatility_ratio", regime.volatility_ratio},
        {"consistency", regime.consistency},
        {"price_position", analytics::toString(regime.price_position)},
        {"price_action", analytics::toString(regime.price_action)},
        {"sr_proximity", regime.sr_proximity},
        {"current_atr", regime.current_atr},
        {"sufficient_history", regime.sufficient_history}
    };
}

nlohmann::json toJson(const signals::FusedDecision& decision) {
    nlohmann::json sources = nlohmann::json::object();
    sources[signals::toString(decision.technical.source)] = {
        {"direction", toString(decision.technical.direction)},
        {"confidence", decision.technical.confidence}
    };
    for (size_t i = 0; i < decision.optional.size(); ++i) {
        const char* name = signals::toString(signals::optionalSourceAt(i));
        if (decision.optional[i]) {
            sources[name] = {
                {"direction", toString(decision.optional[i]->direction)},
                {"confidence", decision.optional[i]->confidence}
            };
        } else {
            sources[name] = nullptr;
        }
    }

    return {
        {"direction", toString(decision.direction)},
        {"confidence", decision.confidence},
        {"score", decision.score},
        {"accepted", decision.accepted},
        {"technical_only", decision.technical_only},
        {"disagreement_applied", decision.disagreement_applied},
        {"size_multiplier", decision.size_multiplier},
        {"reason", decision.reason},
        {"sources", sources}
    };
}

nlohmann::json toJson(const PositionRecord& position) {
    return {
        {"ticket", position.ticket},
        {"symbol", position.symbol},
        {"side", toString(position.side)},
        {"entry_price", position.entry_price},
        {"quantity", position.quantity},
        {"stop_loss", position.stop_loss},
        {"take_profit", position.take_profit},
        {"open_time", position.open_time},
        {"comment", position.comment}
    };
}

nlohmann::json toJson(const position::AdjustmentLogEntry& entry) {
    return {
        {"ts_ms", entry.ts_ms},
        {"ticket", entry.ticket},
        {"symbol", entry.symbol},
        {"kind", position::toString(entry.kind)},
        {"old", entry.old_value},
        {"new", entry.new_value},
        {"reason", entry.reason}
    };
}

nlohmann::json EngineSnapshot::toJson() const {
    nlohmann::json j;
    j["ts_ms"] = ts_ms;
    j["cycle"] = cycle;
    j["cycle_errors"] = cycle_errors;
    j["running"] = running;
    j["trading_paused"] = trading_paused;
    j["daily_loss_percent"] = daily_loss_percent;
    j["account"] = {
        {"balance", account.balance},
        {"equity", account.equity},
        {"margin_level", account.margin_level}
    };
    j["broker"] = {
        {"status", broker_status},
        {"consecutive_failures", broker_consecutive_failures},
        {"last_error", broker_last_error}
    };

    nlohmann::json symbols_json = nlohmann::json::object();
    for (const auto& s : symbols) {
        nlohmann::json sj;
        sj["regime"] = s.regime ? monitor::toJson(*s.regime) : nlohmann::json(nullptr);
        sj["decision"] = s.decision ? monitor::toJson(*s.decision) : nlohmann::json(nullptr);
        sj["last_error"] = s.last_error;
        sj["updated_ms"] = s.updated_ms;
        symbols_json[s.symbol] = sj;
    }
    j["symbols"] = symbols_json;

    j["positions"] = nlohmann::json::array();
    for (const auto& p : positions) {
        j["positions"].push_back(monitor::toJson(p));
    }

    j["adjustments"] = nlohmann::json::array();
    for (const auto& a : adjustments) {
        j["adjustments"].push_back(monitor::toJson(a));
    }

    j["stats"] = {
        {"orders_placed", stats.orders_placed},
        {"orders_rejected", stats.orders_rejected},
        {"stop_modifications", stats.stop_modifications},
        {"tp_modifications", stats.tp_modifications},
        {"modify_failures", stats.modify_failures},
        {"closes", stats.closes},
        {"time_exits", stats.time_exits},
        {"scalp_exits", stats.scalp_exits}
    };
    return j;
}

} // namespace monitor
} // namespace trendpilot
