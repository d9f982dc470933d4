#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace trendpilot {

namespace {

const analytics::RegimeType kRegimeTypes[] = {
    analytics::RegimeType::STRONG_TREND,
    analytics::RegimeType::WEAK_TREND,
    analytics::RegimeType::RANGING,
    analytics::RegimeType::VOLATILE
};

void parseRegimeTable(const nlohmann::json& t, risk::RegimeTable& table) {
    for (auto type : kRegimeTypes) {
        const char* name = analytics::toString(type);
        if (!t.contains(name)) continue;

        const auto& r = t[name];
        auto& p = table.mutableGet(type);
        p.risk_multiplier = r.value("risk_multiplier", p.risk_multiplier);
        p.stop_distance_multiplier = r.value("stop_distance_multiplier", p.stop_distance_multiplier);
        p.tp_ladder = r.value("tp_ladder", p.tp_ladder);
        p.allocations = r.value("allocations", p.allocations);
        p.trail_activation = r.value("trail_activation", p.trail_activation);
        p.trail_distance = r.value("trail_distance", p.trail_distance);
    }
}

void validate(TradingConfig& c) {
    auto& f = c.fusion;
    if (f.technical_weight < 0 || f.ml_weight < 0 || f.pattern_weight < 0 || f.sentiment_weight < 0) {
        throw ConfigError("fusion weights must be non-negative");
    }
    if (f.technical_weight + f.ml_weight + f.pattern_weight + f.sentiment_weight <= 0) {
        throw ConfigError("fusion weights must not all be zero");
    }
    if (f.min_confidence < 0 || f.min_confidence > 1) {
        throw ConfigError("fusion.min_confidence must be within [0, 1]");
    }
    if (c.risk.min_risk_multiplier > c.risk.max_risk_multiplier) {
        LOG_WARN("risk multiplier bounds inverted ({:.2f} > {:.2f}), swapping",
                 c.risk.min_risk_multiplier, c.risk.max_risk_multiplier);
        std::swap(c.risk.min_risk_multiplier, c.risk.max_risk_multiplier);
    }
    if (c.risk.min_risk_multiplier <= 0) {
        throw ConfigError("risk.min_risk_multiplier must be positive");
    }
    if (c.risk.risk_percent <= 0) {
        throw ConfigError("risk.risk_percent must be positive");
    }
    if (c.engine.symbols.empty()) {
        throw ConfigError("engine.symbols must not be empty");
    }
    if (c.engine.cycle_interval_seconds <= 0) {
        throw ConfigError("engine.cycle_interval_seconds must be positive");
    }

    const auto& sc = c.position.scalping;
    if (sc.pip_size < 0 || sc.trail_distance_pips <= 0 || sc.max_hold_minutes <= 0) {
        throw ConfigError("scalping pip_size must be >= 0, trail distance and max hold positive");
    }

    int fixes = c.risk.regime_table.validate(c.risk.min_risk_multiplier, c.risk.max_risk_multiplier);
    if (fixes > 0) {
        LOG_WARN("Regime table: {} value(s) corrected during validation", fixes);
    }
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

TradingConfig Config::parse(const nlohmann::json& j, TradingConfig c) {
    if (j.contains("engine")) {
        const auto& e = j["engine"];
        c.engine.symbols = e.value("symbols", c.engine.symbols);
        c.engine.timeframe = e.value("timeframe", c.engine.timeframe);
        c.engine.bar_count = e.value("bar_count", c.engine.bar_count);
        c.engine.cycle_interval_seconds = e.value("cycle_interval_seconds", c.engine.cycle_interval_seconds);
        c.engine.max_cycles = e.value("max_cycles", c.engine.max_cycles);
        c.engine.journal_path = e.value("journal_path", c.engine.journal_path);
    }

    if (j.contains("indicators")) {
        const auto& s = j["indicators"];
        auto& i = c.indicators;
        i.sma_fast = s.value("sma_fast", i.sma_fast);
        i.sma_slow = s.value("sma_slow", i.sma_slow);
        i.atr_period = s.value("atr_period", i.atr_period);
        i.rsi_period = s.value("rsi_period", i.rsi_period);
        i.macd_fast = s.value("macd_fast", i.macd_fast);
        i.macd_slow = s.value("macd_slow", i.macd_slow);
        i.macd_signal = s.value("macd_signal", i.macd_signal);
        i.adx_period = s.value("adx_period", i.adx_period);
        i.bb_period = s.value("bb_period", i.bb_period);
        i.bb_std_dev = s.value("bb_std_dev", i.bb_std_dev);
        i.volume_ma_period = s.value("volume_ma_period", i.volume_ma_period);
    }

    if (j.contains("regime")) {
        const auto& s = j["regime"];
        auto& r = c.regime;
        r.min_bars = s.value("min_bars", r.min_bars);
        r.trend_strength_period = s.value("trend_strength_period", r.trend_strength_period);
        r.consistency_window = s.value("consistency_window", r.consistency_window);
        r.price_action_window = s.value("price_action_window", r.price_action_window);
        r.price_action_ratio = s.value("price_action_ratio", r.price_action_ratio);
        r.sr_lookback = s.value("sr_lookback", r.sr_lookback);
        r.sr_levels = s.value("sr_levels", r.sr_levels);
        r.default_sr_proximity = s.value("default_sr_proximity", r.default_sr_proximity);
        r.strong_trend_strength = s.value("strong_trend_strength", r.strong_trend_strength);
        r.strong_trend_consistency = s.value("strong_trend_consistency", r.strong_trend_consistency);
        r.weak_trend_strength = s.value("weak_trend_strength", r.weak_trend_strength);
        r.weak_trend_consistency = s.value("weak_trend_consistency", r.weak_trend_consistency);
        r.volatile_ratio = s.value("volatile_ratio", r.volatile_ratio);
    }

    if (j.contains("volume")) {
        const auto& s = j["volume"];
        auto& v = c.volume;
        v.enabled = s.value("enabled", v.enabled);
        v.ma_period = s.value("ma_period", v.ma_period);
        v.min_volume_ratio = s.value("min_volume_ratio", v.min_volume_ratio);
        v.trend_window = s.value("trend_window", v.trend_window);
        v.obv_period = s.value("obv_period", v.obv_period);
        v.divergence_window = s.value("divergence_window", v.divergence_window);
        v.divergence_volume_ratio = s.value("divergence_volume_ratio", v.divergence_volume_ratio);
    }

    if (j.contains("pattern")) {
        const auto& s = j["pattern"];
        auto& p = c.pattern;
        p.min_bars = s.value("min_bars", p.min_bars);
        p.extrema_window = s.value("extrema_window", p.extrema_window);
        p.double_tolerance = s.value("double_tolerance", p.double_tolerance);
        p.shoulder_tolerance = s.value("shoulder_tolerance", p.shoulder_tolerance);
        p.triangle_window = s.value("triangle_window", p.triangle_window);
        p.flat_slope = s.value("flat_slope", p.flat_slope);
        p.flag_window = s.value("flag_window", p.flag_window);
        p.flag_pole_change = s.value("flag_pole_change", p.flag_pole_change);
        p.flag_max_volatility = s.value("flag_max_volatility", p.flag_max_volatility);
        p.dominance_ratio = s.value("dominance_ratio", p.dominance_ratio);
    }

    if (j.contains("technical")) {
        const auto& s = j["technical"];
        auto& t = c.technical;
        t.use_trend_confirmation = s.value("use_trend_confirmation", t.use_trend_confirmation);
        t.use_rsi_filter = s.value("use_rsi_filter", t.use_rsi_filter);
        t.rsi_overbought = s.value("rsi_overbought", t.rsi_overbought);
        t.rsi_oversold = s.value("rsi_oversold", t.rsi_oversold);
        t.use_macd_filter = s.value("use_macd_filter", t.use_macd_filter);
        t.min_adx = s.value("min_adx", t.min_adx);
        t.min_trade_confidence = s.value("min_trade_confidence", t.min_trade_confidence);
        t.sr_proximity_threshold = s.value("sr_proximity_threshold", t.sr_proximity_threshold);
    }

    if (j.contains("fusion")) {
        const auto& s = j["fusion"];
        auto& f = c.fusion;
        if (s.contains("weights")) {
            const auto& w = s["weights"];
            f.technical_weight = w.value("technical", f.technical_weight);
            f.ml_weight = w.value("ml", f.ml_weight);
            f.pattern_weight = w.value("pattern", f.pattern_weight);
            f.sentiment_weight = w.value("sentiment", f.sentiment_weight);
        }
        f.acceptance_threshold = s.value("acceptance_threshold", f.acceptance_threshold);
        f.min_confidence = s.value("min_confidence", f.min_confidence);
        f.ml_min_confidence = s.value("ml_min_confidence", f.ml_min_confidence);
        f.disagreement_factor = s.value("disagreement_factor", f.disagreement_factor);
    }

    if (j.contains("sources")) {
        const auto& s = j["sources"];
        auto& src = c.sources;
        src.ml_enabled = s.value("ml_enabled", src.ml_enabled);
        src.ml_model_path = s.value("ml_model_path", src.ml_model_path);
        src.pattern_enabled = s.value("pattern_enabled", src.pattern_enabled);
        src.sentiment_enabled = s.value("sentiment_enabled", src.sentiment_enabled);
        src.sentiment_path = s.value("sentiment_path", src.sentiment_path);
        src.sentiment_neutral_band = s.value("sentiment_neutral_band", src.sentiment_neutral_band);
    }

    if (j.contains("risk")) {
        const auto& s = j["risk"];
        auto& r = c.risk;
        r.risk_percent = s.value("risk_percent", r.risk_percent);
        r.min_risk_multiplier = s.value("min_risk_multiplier", r.min_risk_multiplier);
        r.max_risk_multiplier = s.value("max_risk_multiplier", r.max_risk_multiplier);
        r.max_daily_loss_percent = s.value("max_daily_loss_percent", r.max_daily_loss_percent);
        r.daily_loss_warning_ratio = s.value("daily_loss_warning_ratio", r.daily_loss_warning_ratio);
        r.max_trades_per_symbol = s.value("max_trades_per_symbol", r.max_trades_per_symbol);

        if (s.contains("regime_table")) {
            parseRegimeTable(s["regime_table"], r.regime_table);
        }
        if (s.contains("tp_caps")) {
            for (const auto& [symbol, cap] : s["tp_caps"].items()) {
                if (symbol == "DEFAULT") {
                    r.default_tp_cap = cap.get<double>();
                } else {
                    r.tp_caps[symbol] = cap.get<double>();
                }
            }
        }
        if (s.contains("symbol_overrides")) {
            for (const auto& [symbol, ov] : s["symbol_overrides"].items()) {
                auto& target = r.symbol_overrides[symbol];
                target.fixed_stop_points = ov.value("fixed_stop_points", target.fixed_stop_points);
                target.tp_cap = ov.value("tp_cap", target.tp_cap);
            }
        }
    }

    if (j.contains("sizing")) {
        c.risk.use_confidence_multiplier = j["sizing"].value("use_confidence_multiplier",
                                                             c.risk.use_confidence_multiplier);
    }

    auto& pos = c.position;
    if (j.contains("stop_loss")) {
        const auto& s = j["stop_loss"];
        auto& sl = pos.stop_loss;
        sl.enabled = s.value("enabled", sl.enabled);
        sl.min_change_ratio = s.value("min_change_ratio", sl.min_change_ratio);
        sl.reversal_window = s.value("reversal_window", sl.reversal_window);
        sl.reversal_ratio = s.value("reversal_ratio", sl.reversal_ratio);
        sl.swing_lookback = s.value("swing_lookback", sl.swing_lookback);
        sl.atr_average_window = s.value("atr_average_window", sl.atr_average_window);
        sl.support_lookback = s.value("support_lookback", sl.support_lookback);
        sl.support_levels = s.value("support_levels", sl.support_levels);
    }
    if (j.contains("take_profit")) {
        const auto& s = j["take_profit"];
        auto& tp = pos.take_profit;
        tp.enabled = s.value("enabled", tp.enabled);
        tp.min_change_ratio = s.value("min_change_ratio", tp.min_change_ratio);
        tp.momentum_window = s.value("momentum_window", tp.momentum_window);
        tp.atr_average_window = s.value("atr_average_window", tp.atr_average_window);
        tp.breakout_lookback = s.value("breakout_lookback", tp.breakout_lookback);
        tp.breakout_levels = s.value("breakout_levels", tp.breakout_levels);
        tp.sr_levels = s.value("sr_levels", tp.sr_levels);
    }
    if (j.contains("trailing")) {
        pos.trailing.enabled = j["trailing"].value("enabled", pos.trailing.enabled);
    }
    if (j.contains("breakeven")) {
        const auto& s = j["breakeven"];
        pos.breakeven.enabled = s.value("enabled", pos.breakeven.enabled);
        pos.breakeven.atr_threshold = s.value("atr_threshold", pos.breakeven.atr_threshold);
        pos.breakeven.spread_multiplier = s.value("spread_multiplier", pos.breakeven.spread_multiplier);
    }
    if (j.contains("time_exit")) {
        const auto& s = j["time_exit"];
        pos.time_exit.enabled = s.value("enabled", pos.time_exit.enabled);
        pos.time_exit.max_hold_minutes = s.value("max_hold_minutes", pos.time_exit.max_hold_minutes);
    }
    if (j.contains("scalping")) {
        const auto& s = j["scalping"];
        auto& sc = pos.scalping;
        sc.enabled = s.value("enabled", sc.enabled);
        sc.timeframe = s.value("timeframe", sc.timeframe);
        sc.pip_size = s.value("pip_size", sc.pip_size);
        sc.min_profit_pips = s.value("min_profit_pips", sc.min_profit_pips);
        sc.max_hold_minutes = s.value("max_hold_minutes", sc.max_hold_minutes);
        sc.trail_after_pips = s.value("trail_after_pips", sc.trail_after_pips);
        sc.trail_distance_pips = s.value("trail_distance_pips", sc.trail_distance_pips);
        sc.momentum_exit = s.value("momentum_exit", sc.momentum_exit);
        sc.reversal_exit = s.value("reversal_exit", sc.reversal_exit);
        sc.time_exit = s.value("time_exit", sc.time_exit);
        sc.breakeven_band_pips = s.value("breakeven_band_pips", sc.breakeven_band_pips);
        sc.breakeven_min_minutes = s.value("breakeven_min_minutes", sc.breakeven_min_minutes);
        sc.rsi_overbought = s.value("rsi_overbought", sc.rsi_overbought);
        sc.rsi_oversold = s.value("rsi_oversold", sc.rsi_oversold);
    }
    if (j.contains("split_orders")) {
        const auto& s = j["split_orders"];
        pos.split_orders.enabled = s.value("enabled", pos.split_orders.enabled);
        pos.split_orders.max_lot_per_order = s.value("max_lot_per_order", pos.split_orders.max_lot_per_order);
        pos.adjustment_log_capacity = s.value("adjustment_log_capacity", pos.adjustment_log_capacity);
    }

    if (j.contains("broker")) {
        const auto& s = j["broker"];
        auto& b = c.broker;
        b.call_timeout_ms = s.value("call_timeout_ms", b.call_timeout_ms);
        b.max_attempts = s.value("max_attempts", b.max_attempts);
        b.initial_backoff_ms = s.value("initial_backoff_ms", b.initial_backoff_ms);
        b.max_backoff_ms = s.value("max_backoff_ms", b.max_backoff_ms);
    }

    if (j.contains("paper")) {
        const auto& s = j["paper"];
        auto& p = c.paper;
        p.data_dir = s.value("data_dir", p.data_dir);
        p.initial_balance = s.value("initial_balance", p.initial_balance);
        p.warmup_bars = s.value("warmup_bars", p.warmup_bars);
        p.bars_per_cycle = s.value("bars_per_cycle", p.bars_per_cycle);
    }

    if (j.contains("monitor")) {
        const auto& s = j["monitor"];
        auto& m = c.monitor;
        m.enabled = s.value("enabled", m.enabled);
        m.status_path = s.value("status_path", m.status_path);
        m.overrides_path = s.value("overrides_path", m.overrides_path);
        m.interval_seconds = s.value("interval_seconds", m.interval_seconds);
    }

    if (j.contains("logging")) {
        const auto& s = j["logging"];
        c.log_level = s.value("level", c.log_level);
        c.log_dir = s.value("dir", c.log_dir);
    }

    validate(c);
    return c;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);
    std::cout << "Config file: " << config_path.string() << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "WARNING: config file not found, using defaults" << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "WARNING: cannot open config file, using defaults" << std::endl;
        return;
    }

    try {
        nlohmann::json j;
        file >> j;
        loadFromJson(j);
        std::cout << "Config loaded" << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config parse error (defaults kept): " << e.what() << std::endl;
    } catch (const ConfigError& e) {
        std::cerr << "Config invalid (defaults kept): " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    TradingConfig parsed = parse(j);
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(parsed);
}

TradingConfig Config::getTradingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void Config::setTradingConfig(const TradingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

std::string Config::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.log_level;
}

std::string Config::getLogDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.log_dir;
}

void Config::queueOverrides(const nlohmann::json& overrides) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_overrides_.push_back(overrides);
}

bool Config::hasPendingOverrides() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_overrides_.empty();
}

size_t Config::applyPendingOverrides() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t applied = 0;
    for (const auto& overrides : pending_overrides_) {
        try {
            config_ = parse(overrides, config_);
            ++applied;
            LOG_INFO("Config override applied: {}", overrides.dump());
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("Config override rejected (bad value): {}", e.what());
        } catch (const ConfigError& e) {
            LOG_ERROR("Config override rejected: {}", e.what());
        }
    }
    pending_overrides_.clear();
    return applied;
}

} // namespace trendpilot
