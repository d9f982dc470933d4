#pragma once

#include "common/Types.h"
#include "analytics/AnalyticsConfig.h"
#include "analytics/MarketSnapshot.h"
#include <string>

namespace trendpilot {
namespace analytics {

enum class RegimeType {
    STRONG_TREND,
    WEAK_TREND,
    RANGING,
    VOLATILE
};

enum class TrendDirection { UP, DOWN };

enum class PricePosition { ABOVE_MAS, BELOW_MAS, BETWEEN };

enum class PriceAction { BULLISH, BEARISH, CONSOLIDATING };

struct MarketRegime {
    RegimeType type = RegimeType::RANGING;
    TrendDirection direction = TrendDirection::UP;
    double strength = 0.0;          // 0~100
    double volatility_ratio = 1.0;
    double consistency = 50.0;      // 0~100
    PricePosition price_position = PricePosition::BETWEEN;
    PriceAction price_action = PriceAction::CONSOLIDATING;
    double sr_proximity = 5.0;      // 가장 가까운 지지/저항까지 ATR 배수
    double current_atr = 0.0;
    double average_atr = 0.0;
    bool sufficient_history = false;
    std::string description;
};

const char* toString(RegimeType type);
const char* toString(TrendDirection dir);
const char* toString(PricePosition pos);
const char* toString(PriceAction action);
RegimeType regimeTypeFromString(const std::string& name);

// 추세 등급 (다운그레이드 판정용): strong > weak > ranging/volatile
int trendRank(RegimeType type);

class RegimeClassifier {
public:
    explicit RegimeClassifier(const RegimeConfig& config = RegimeConfig());

    // 스냅샷으로부터 레짐 계산. 봉이 부족하면 중립 레짐 (sufficient_history = false)
    MarketRegime classify(const MarketSnapshot& snapshot) const;

    // 분류에 필요한 봉 수 / ATR 확인. 부족하면 InsufficientHistory
    void requireHistory(const MarketSnapshot& snapshot) const;

    // 임계값 순서대로 첫 매칭: strong -> weak -> volatile -> ranging
    RegimeType classify(double strength, double consistency, double volatility_ratio) const;

    // 최근 window 봉 중 마지막 라벨과 같은 ma_trend 비율 (%). offset 만큼 과거로 이동
    static double trendConsistency(const MarketSnapshot& snapshot, int window, int offset = 0);

    static PriceAction priceAction(const std::vector<Candle>& bars, int window, double ratio);
    static double supportResistanceProximity(const std::vector<Candle>& bars, double atr,
                                             int lookback, int levels, double fallback);

    const RegimeConfig& config() const { return config_; }

private:
    RegimeConfig config_;
};

} // namespace analytics
} // namespace trendpilot
