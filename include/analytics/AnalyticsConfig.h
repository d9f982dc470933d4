#pragma once

namespace trendpilot {
namespace analytics {

// 지표 계산 기간
struct IndicatorSettings {
    int sma_fast = 5;
    int sma_slow = 10;
    int atr_period = 14;
    int rsi_period = 14;
    int macd_fast = 8;
    int macd_slow = 17;
    int macd_signal = 5;
    int adx_period = 14;
    int bb_period = 20;
    double bb_std_dev = 2.0;
    int volume_ma_period = 20;
};

// 레짐 분류 임계값
struct RegimeConfig {
    int min_bars = 50;
    int trend_strength_period = 50;     // 평균 ATR 윈도우
    int consistency_window = 20;
    int price_action_window = 10;
    double price_action_ratio = 0.6;    // 윈도우 대비 HH/LL 비율
    int sr_lookback = 50;
    int sr_levels = 5;
    double default_sr_proximity = 5.0;

    double strong_trend_strength = 30.0;
    double strong_trend_consistency = 70.0;
    double weak_trend_strength = 20.0;
    double weak_trend_consistency = 50.0;
    double volatile_ratio = 1.5;
};

struct VolumeConfig {
    bool enabled = true;
    int ma_period = 20;
    double min_volume_ratio = 1.2;
    int trend_window = 5;
    int obv_period = 14;
    int divergence_window = 10;
    double divergence_volume_ratio = 0.8;
};

struct PatternConfig {
    int min_bars = 20;
    int extrema_window = 5;
    double double_tolerance = 0.02;
    double shoulder_tolerance = 0.03;
    int triangle_window = 20;
    double flat_slope = 0.001;          // 가격 대비 정규화 기울기
    int flag_window = 30;
    double flag_pole_change = 0.05;
    double flag_max_volatility = 0.02;
    double dominance_ratio = 1.2;
};

} // namespace analytics
} // namespace trendpilot
