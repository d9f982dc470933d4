#pragma once

#include <cstddef>
#include <string>

namespace trendpilot {
namespace position {

struct StopLossConfig {
    bool enabled = true;
    double min_change_ratio = 0.001;    // 현재 손절가 대비 최소 변경 비율
    int reversal_window = 10;
    double reversal_ratio = 0.6;
    int swing_lookback = 20;
    int atr_average_window = 20;
    int support_lookback = 50;
    int support_levels = 5;
};

struct TakeProfitConfig {
    bool enabled = true;
    double min_change_ratio = 0.05;     // 진입가 기준 현재 TP 거리 대비
    int momentum_window = 10;
    int atr_average_window = 20;
    int breakout_lookback = 50;
    int breakout_levels = 5;
    int sr_levels = 10;
};

struct TrailingConfig {
    bool enabled = true;
};

struct BreakevenConfig {
    bool enabled = true;
    double atr_threshold = 1.0;
    double spread_multiplier = 1.0;
};

struct TimeExitConfig {
    bool enabled = false;
    int max_hold_minutes = 240;
};

// 단타 모드: 고정 TP 대신 동적 청산. pip 단위, timeframe 일치 시에만 동작
struct ScalpingConfig {
    bool enabled = false;
    std::string timeframe = "M1";
    double pip_size = 0.0;              // 0 이면 심볼 tick_size
    double min_profit_pips = 20.0;
    int max_hold_minutes = 30;
    double trail_after_pips = 30.0;
    double trail_distance_pips = 15.0;
    bool momentum_exit = true;
    bool reversal_exit = true;
    bool time_exit = true;
    double breakeven_band_pips = 5.0;
    int breakeven_min_minutes = 10;
    double rsi_overbought = 75.0;
    double rsi_oversold = 25.0;
};

struct SplitOrderConfig {
    bool enabled = true;
    double max_lot_per_order = 50.0;
};

struct PositionConfig {
    StopLossConfig stop_loss;
    TakeProfitConfig take_profit;
    TrailingConfig trailing;
    BreakevenConfig breakeven;
    TimeExitConfig time_exit;
    ScalpingConfig scalping;
    SplitOrderConfig split_orders;
    size_t adjustment_log_capacity = 100;
};

} // namespace position
} // namespace trendpilot
