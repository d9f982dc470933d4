#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

#include "analytics/RegimeClassifier.h"

namespace trendpilot {
namespace risk {

// 레짐별 리스크 파라미터
struct RegimeRiskParams {
    double risk_multiplier = 1.0;
    double stop_distance_multiplier = 2.0;      // ATR 배수
    std::vector<double> tp_ladder{1.5, 2.0, 3.0};   // 손절 거리 대비 보상 배수
    std::vector<double> allocations{40.0, 35.0, 25.0};  // 분할 비율 (%)
    double trail_activation = 1.5;              // ATR 배수
    double trail_distance = 1.5;                // ATR 배수
};

// 레짐 -> 파라미터 조회 테이블 (데이터로 관리)
class RegimeTable {
public:
    RegimeTable();

    static RegimeTable defaults();
    static RegimeRiskParams defaultsFor(analytics::RegimeType type);

    const RegimeRiskParams& get(analytics::RegimeType type) const;
    RegimeRiskParams& mutableGet(analytics::RegimeType type);

    // 로드 시 검증: 배수 클램프, 잘못된 사다리/비율은 기본값, 비율은 100 으로 정규화
    // 수정된 항목 수 반환
    int validate(double min_risk_multiplier, double max_risk_multiplier);

private:
    static size_t index(analytics::RegimeType type);
    std::array<RegimeRiskParams, 4> params_;
};

struct SymbolRiskOverride {
    double fixed_stop_points = 0.0;     // > 0 이면 ATR 대신 고정 tick 수
    double tp_cap = 0.0;                // > 0 이면 심볼 TP 상한 재정의
};

struct RiskConfig {
    double risk_percent = 1.0;          // 잔고 대비 %
    double min_risk_multiplier = 0.5;
    double max_risk_multiplier = 1.5;
    RegimeTable regime_table;

    // 심볼별 TP 거리 상한 (가격 단위). 0 이하는 비활성
    std::map<std::string, double> tp_caps{
        {"XAUUSD", 2.0}, {"XAGUSD", 0.25}, {"XPTUSD", 3.0}, {"XPDUSD", 5.0}
    };
    double default_tp_cap = 0.01;
    std::map<std::string, SymbolRiskOverride> symbol_overrides;

    // 융합 신뢰도에 따른 수량 배수 (0.5 ~ 1.25) 사용 여부
    bool use_confidence_multiplier = true;

    // 진입 가드
    double max_daily_loss_percent = 5.0;
    double daily_loss_warning_ratio = 0.8;
    int max_trades_per_symbol = 1;

    double tpCapFor(const std::string& symbol) const;
};

} // namespace risk
} // namespace trendpilot
