#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace trendpilot {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Ticket = long long;

enum class OrderSide { BUY, SELL };
enum class SignalDirection { BUY, SELL, NEUTRAL };

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline const char* toString(SignalDirection dir) {
    switch (dir) {
        case SignalDirection::BUY: return "BUY";
        case SignalDirection::SELL: return "SELL";
        case SignalDirection::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

// +1 매수, -1 매도
inline double sideSign(OrderSide side) {
    return side == OrderSide::BUY ? 1.0 : -1.0;
}

inline double directionSign(SignalDirection dir) {
    if (dir == SignalDirection::BUY) return 1.0;
    if (dir == SignalDirection::SELL) return -1.0;
    return 0.0;
}

inline std::optional<OrderSide> toOrderSide(SignalDirection dir) {
    if (dir == SignalDirection::BUY) return OrderSide::BUY;
    if (dir == SignalDirection::SELL) return OrderSide::SELL;
    return std::nullopt;
}

inline long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// 브로커가 제공하는 심볼 거래 명세
struct SymbolSpec {
    std::string symbol;
    int digits = 2;
    double tick_size = 0.01;
    double tick_value = 1.0;    // 1 lot 기준 1 tick 당 계좌 통화 손익
    double min_lot = 0.01;
    double max_lot = 100.0;
    double lot_step = 0.01;
    double spread = 0.0;        // 가격 단위
};

struct AccountInfo {
    double balance = 0.0;
    double equity = 0.0;
    double margin_level = 0.0;
};

struct Quote {
    double bid = 0.0;
    double ask = 0.0;
    long long timestamp = 0;
};

struct PositionRecord {
    Ticket ticket = 0;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double entry_price = 0.0;
    double quantity = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    long long open_time = 0;    // epoch ms
    std::string comment;
};

} // namespace trendpilot
