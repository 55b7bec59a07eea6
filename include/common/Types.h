#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>

namespace gapswing {

using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, STOP_MARKET, TAKE_PROFIT_MARKET };
enum class OrderStatus { PENDING, SUBMITTED, FILLED, PARTIALLY_FILLED, CANCELLED, REJECTED };

// Gap direction doubles as trade direction: bullish gaps open longs.
enum class Direction { BULLISH, BEARISH };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long open_time;    // ms, UTC

    Candle() : open(0), high(0), low(0), close(0), volume(0), open_time(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), open_time(t) {}
};

// Exchange trading rules for one symbol.
struct SymbolMeta {
    double min_order_size;
    double min_notional;
    double size_step;
    double price_tick;
    int price_precision;
    int size_precision;

    SymbolMeta()
        : min_order_size(0.0)
        , min_notional(0.0)
        , size_step(0.0)
        , price_tick(0.0)
        , price_precision(2)
        , size_precision(3)
    {}
};

inline int directionSign(Direction direction) {
    return direction == Direction::BULLISH ? 1 : -1;
}

inline std::string directionToString(Direction direction) {
    return direction == Direction::BULLISH ? "bullish" : "bearish";
}

inline Direction directionFromString(const std::string& value) {
    if (value == "bullish") {
        return Direction::BULLISH;
    }
    if (value == "bearish") {
        return Direction::BEARISH;
    }
    throw std::invalid_argument("unknown direction: " + value);
}

inline OrderSide entrySide(Direction direction) {
    return direction == Direction::BULLISH ? OrderSide::BUY : OrderSide::SELL;
}

inline OrderSide exitSide(Direction direction) {
    return direction == Direction::BULLISH ? OrderSide::SELL : OrderSide::BUY;
}

inline long long currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace gapswing
