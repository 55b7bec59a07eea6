#pragma once

#include <map>
#include <string>
#include "common/Types.h"

namespace gapswing {
namespace risk {

enum class PositionStatus { OPEN, CLOSED };
enum class ExitReason { NONE, STOP_LOSS, TAKE_PROFIT, MANUAL, FORCED };

std::string positionStatusToString(PositionStatus status);
PositionStatus positionStatusFromString(const std::string& value);
std::string exitReasonToString(ExitReason reason);
ExitReason exitReasonFromString(const std::string& value);

struct Position {
    std::string id;
    std::string symbol;
    Direction direction;
    double entry_price;
    double size;
    double stop_loss;
    double take_profit;
    double initial_stop_loss;       // R is measured from this, not the moved stop
    long long opened_at;            // fill time, ms
    PositionStatus status;

    double exit_price;
    ExitReason exit_reason;
    long long closed_at;
    double realized_pnl;

    std::string gap_ref;
    std::string order_ref;
    long long last_checked_bar;     // newest bar already checked against SL/TP

    Position()
        : direction(Direction::BULLISH)
        , entry_price(0.0)
        , size(0.0)
        , stop_loss(0.0)
        , take_profit(0.0)
        , initial_stop_loss(0.0)
        , opened_at(0)
        , status(PositionStatus::OPEN)
        , exit_price(0.0)
        , exit_reason(ExitReason::NONE)
        , closed_at(0)
        , realized_pnl(0.0)
        , last_checked_bar(0)
    {}

    double riskPerUnit() const {
        return entry_price > initial_stop_loss ? entry_price - initial_stop_loss
                                               : initial_stop_loss - entry_price;
    }

    double pnlAt(double price) const {
        return (price - entry_price) * size * directionSign(direction);
    }
};

struct RiskState {
    double day_start_balance = 0.0;
    double current_balance = 0.0;
    long long last_reset_time = 0;          // ms, UTC
    bool daily_loss_guard_triggered = false;
    int portfolio_position_count = 0;
    std::map<std::string, bool> per_symbol_position_flag;
};

} // namespace risk
} // namespace gapswing
