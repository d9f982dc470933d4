#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/AnalyticsConfig.h"
#include "broker/PaperBroker.h"
#include "broker/ResilientBrokerGateway.h"
#include "engine/EngineConfig.h"
#include "monitor/StatusMonitor.h"
#include "position/PositionConfig.h"
#include "risk/RiskConfig.h"
#include "signals/SignalConfig.h"

namespace trendpilot {

// 설정 파일 전체를 담는 값 타입. 루프는 사이클 시작 시 복사본을 가져간다
struct TradingConfig {
    engine::EngineConfig engine;
    analytics::IndicatorSettings indicators;
    analytics::RegimeConfig regime;
    analytics::VolumeConfig volume;
    analytics::PatternConfig pattern;
    signals::TechnicalConfig technical;
    signals::FusionConfig fusion;
    signals::SourcesConfig sources;
    risk::RiskConfig risk;
    position::PositionConfig position;
    broker::RetryPolicy broker;
    broker::PaperBrokerConfig paper;
    monitor::MonitorConfig monitor;

    std::string log_level = "info";
    std::string log_dir = "logs";
};

class Config {
public:
    static Config& getInstance();

    // 파일이 없거나 잘못되면 기본값 유지 (경고 출력)
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    TradingConfig getTradingConfig() const;
    void setTradingConfig(const TradingConfig& config);

    std::string getLogLevel() const;
    std::string getLogDir() const;

    // 모니터 스레드에서 호출. 다음 사이클 시작 시 applyPendingOverrides 로 반영
    void queueOverrides(const nlohmann::json& overrides);
    size_t applyPendingOverrides();
    bool hasPendingOverrides() const;

    // base 위에 j 의 값만 덮어쓴다 (부분 JSON 허용). 레짐 테이블은 검증 후 반환
    static TradingConfig parse(const nlohmann::json& j, TradingConfig base = TradingConfig());

private:
    Config() = default;

    mutable std::mutex mutex_;
    TradingConfig config_;
    std::vector<nlohmann::json> pending_overrides_;
};

} // namespace trendpilot
