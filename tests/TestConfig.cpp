#undef NDEBUG
#include "common/Config.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace trendpilot;
using analytics::RegimeType;

namespace {

bool throwsConfigError(const nlohmann::json& j) {
    try {
        Config::parse(j);
    } catch (const ConfigError& e) {
        std::cout << "    rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

void testDefaults() {
    TradingConfig defaults = Config::parse(nlohmann::json::object());
    assert(defaults.engine.symbols.size() == 1);
    assert(defaults.engine.timeframe == "H1");
    assert(defaults.fusion.min_confidence == 0.6);
    assert(defaults.risk.tpCapFor("XAUUSD") == 2.0);
    assert(defaults.position.time_exit.enabled == false);
    assert(defaults.position.scalping.enabled == false);
    std::cout << "  defaults OK\n";
}

void testPartialParse() {
    nlohmann::json j = {
        {"engine", {{"symbols", {"XAUUSD", "EURUSD"}}, {"cycle_interval_seconds", 5}}},
        {"fusion", {{"weights", {{"ml", 0.5}}}, {"min_confidence", 0.7}}},
        {"risk", {
            {"risk_percent", 0.5},
            {"tp_caps", {{"EURUSD", 0.003}, {"DEFAULT", 0.02}}},
            {"symbol_overrides", {{"XAUUSD", {{"fixed_stop_points", 150}}}}},
            {"regime_table", {{"STRONG_TREND", {{"tp_ladder", {2.0, 3.0}}, {"allocations", {60, 40}}}}}}
        }},
        {"time_exit", {{"enabled", true}, {"max_hold_minutes", 90}}},
        {"scalping", {{"enabled", true}, {"timeframe", "M5"}, {"min_profit_pips", 12}}},
        {"logging", {{"level", "debug"}}}
    };

    TradingConfig c = Config::parse(j);
    assert(c.engine.symbols.size() == 2);
    assert(c.engine.cycle_interval_seconds == 5);
    assert(c.engine.bar_count == 300);

    // weights 는 지정한 항목만 덮어씀
    assert(c.fusion.ml_weight == 0.5);
    assert(c.fusion.technical_weight == 0.4);
    assert(c.fusion.min_confidence == 0.7);

    assert(c.risk.risk_percent == 0.5);
    assert(c.risk.tpCapFor("EURUSD") == 0.003);
    assert(c.risk.tpCapFor("XAUUSD") == 2.0);
    assert(c.risk.tpCapFor("GBPUSD") == 0.02);
    assert(c.risk.symbol_overrides.at("XAUUSD").fixed_stop_points == 150);

    const auto& strong = c.risk.regime_table.get(RegimeType::STRONG_TREND);
    assert(strong.tp_ladder.size() == 2);
    assert(std::abs(strong.allocations[0] - 60.0) < 1e-9);

    assert(c.position.time_exit.enabled);
    assert(c.position.time_exit.max_hold_minutes == 90);
    assert(c.position.scalping.enabled);
    assert(c.position.scalping.timeframe == "M5");
    assert(c.position.scalping.min_profit_pips == 12.0);
    assert(c.position.scalping.trail_distance_pips == 15.0);
    assert(c.log_level == "debug");
    assert(c.log_dir == "logs");

    // base 위에 덮어쓰기
    TradingConfig layered = Config::parse({{"risk", {{"risk_percent", 2.0}}}}, c);
    assert(layered.risk.risk_percent == 2.0);
    assert(layered.engine.symbols.size() == 2);
    std::cout << "  partial parse OK\n";
}

void testValidation() {
    assert(throwsConfigError({{"fusion", {{"weights", {{"technical", -0.1}}}}}}));
    assert(throwsConfigError({{"fusion", {{"weights",
        {{"technical", 0.0}, {"ml", 0.0}, {"pattern", 0.0}, {"sentiment", 0.0}}}}}}));
    assert(throwsConfigError({{"fusion", {{"min_confidence", 1.5}}}}));
    assert(throwsConfigError({{"risk", {{"risk_percent", 0.0}}}}));
    assert(throwsConfigError({{"risk", {{"min_risk_multiplier", 0.0}}}}));
    assert(throwsConfigError({{"engine", {{"symbols", nlohmann::json::array()}}}}));
    assert(throwsConfigError({{"engine", {{"cycle_interval_seconds", 0}}}}));
    assert(throwsConfigError({{"scalping", {{"pip_size", -0.1}}}}));
    assert(throwsConfigError({{"scalping", {{"trail_distance_pips", 0}}}}));

    // 뒤집힌 경계는 교정, 테이블은 경계로 클램프
    TradingConfig swapped = Config::parse({{"risk", {
        {"min_risk_multiplier", 1.5}, {"max_risk_multiplier", 0.5},
        {"regime_table", {{"VOLATILE", {{"risk_multiplier", 3.0}}}}}
    }}});
    assert(swapped.risk.min_risk_multiplier == 0.5);
    assert(swapped.risk.max_risk_multiplier == 1.5);
    assert(swapped.risk.regime_table.get(RegimeType::VOLATILE).risk_multiplier == 1.5);
    std::cout << "  validation OK\n";
}

void testOverrides() {
    Config& config = Config::getInstance();
    config.setTradingConfig(Config::parse(nlohmann::json::object()));
    assert(!config.hasPendingOverrides());

    config.queueOverrides({{"risk", {{"risk_percent", 0.25}}}});
    config.queueOverrides({{"fusion", {{"min_confidence", 7.0}}}});     // 거부됨
    config.queueOverrides({{"engine", {{"max_cycles", 3}}}});
    assert(config.hasPendingOverrides());

    // 적용 전에는 기존 값
    assert(config.getTradingConfig().risk.risk_percent == 1.0);

    size_t applied = config.applyPendingOverrides();
    assert(applied == 2);
    assert(!config.hasPendingOverrides());

    TradingConfig current = config.getTradingConfig();
    assert(current.risk.risk_percent == 0.25);
    assert(current.engine.max_cycles == 3);
    assert(current.fusion.min_confidence == 0.6);
    assert(config.applyPendingOverrides() == 0);
    std::cout << "  override queue OK\n";
}

void testLoadFile() {
    const auto dir = std::filesystem::temp_directory_path() / "trendpilot_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "config_test.json";

    {
        std::ofstream out(path);
        out << R"({"engine": {"symbols": ["EURUSD"], "timeframe": "M15"}, "logging": {"dir": "tmp_logs"}})";
    }

    Config& config = Config::getInstance();
    config.load(path.string());
    assert(config.getTradingConfig().engine.timeframe == "M15");
    assert(config.getLogDir() == "tmp_logs");

    // 잘못된 파일은 기존 값 유지
    {
        std::ofstream out(path);
        out << "{ broken";
    }
    config.load(path.string());
    assert(config.getTradingConfig().engine.timeframe == "M15");

    config.load((dir / "missing.json").string());
    assert(config.getTradingConfig().engine.symbols.front() == "EURUSD");

    std::filesystem::remove(path);
    std::cout << "  load file OK\n";
}

} // namespace

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    testDefaults();
    testPartialParse();
    testValidation();
    testOverrides();
    testLoadFile();

    std::cout << "[TEST] Config PASSED" << std::endl;
    return 0;
}
