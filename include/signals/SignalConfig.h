#pragma once

#include <string>

namespace trendpilot {
namespace signals {

// 기술적 신호 필터
struct TechnicalConfig {
    bool use_trend_confirmation = true;
    bool use_rsi_filter = true;
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;
    bool use_macd_filter = true;
    double min_adx = 0.0;                   // 0 이면 비활성
    double min_trade_confidence = 0.5;      // 레짐 정합도 하한
    double sr_proximity_threshold = 0.8;    // ATR 배수
};

struct FusionConfig {
    double technical_weight = 0.4;
    double ml_weight = 0.3;
    double pattern_weight = 0.15;
    double sentiment_weight = 0.15;

    double acceptance_threshold = 0.3;      // |score| 초과 시 방향 확정
    double min_confidence = 0.6;            // 포함 비교
    double ml_min_confidence = 0.6;
    double disagreement_factor = 0.8;
};

struct SourcesConfig {
    bool ml_enabled = false;
    std::string ml_model_path = "config/model.json";

    bool pattern_enabled = true;

    bool sentiment_enabled = false;
    std::string sentiment_path = "data/sentiment.json";
    double sentiment_neutral_band = 0.1;
};

} // namespace signals
} // namespace trendpilot
