#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace gapswing {
namespace core {

enum class JournalEventType {
    GAP_CREATED,
    GAP_RETIRED,
    SIGNAL_CONFIRMED,
    SIGNAL_REJECTED,
    ORDER_FILLED,
    ORDER_FAILED,
    POSITION_OPENED,
    POSITION_CLOSED,
    DAILY_RESET,
    STATE_SAVE_FAILED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::SIGNAL_REJECTED;
    std::string symbol;
    std::string entity_id;
    nlohmann::json payload;
};

struct ExecutionRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Direction direction = Direction::BULLISH;
    double size = 0.0;
    double reference_price = 0.0;
    double stop_loss = 0.0;         // protective orders, 0 = none
    double take_profit = 0.0;
    double size_step = 0.0;
    double price_tick = 0.0;
    std::string client_order_id;
};

struct Fill {
    std::string order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderStatus status = OrderStatus::FILLED;
    double price = 0.0;
    double size = 0.0;
    long long timestamp = 0;
};

} // namespace core
} // namespace gapswing
