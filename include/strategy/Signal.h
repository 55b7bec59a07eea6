#pragma once

#include <string>
#include "common/Types.h"

namespace gapswing {
namespace strategy {

// Why an entry did not happen. Not errors: logged and journaled, never retried.
enum class RejectReason {
    NONE,
    POSITION_OPEN,
    MACD_DISAGREEMENT,
    ALREADY_FILLED,
    INVALID_STOP,
    NO_RECENT_CROSSOVER,
    SIGNAL_SUPERSEDED,
    BELOW_MIN_SIZE,
    PORTFOLIO_CAP,
    DAILY_LOSS_GUARD,
    EXECUTION_FAILED
};

std::string rejectReasonToString(RejectReason reason);

enum class MacdState { CONFIRMED, PENDING, REJECTED };

std::string macdStateToString(MacdState state);

struct Signal {
    std::string symbol;
    Direction direction;
    double entry_price;
    double stop_loss;
    double take_profit;
    std::string gap_ref;
    MacdState macd_state;
    double macd;
    double macd_signal;
    double histogram;
    long long timestamp;        // open_time of the bar that produced the signal

    Signal()
        : direction(Direction::BULLISH)
        , entry_price(0.0)
        , stop_loss(0.0)
        , take_profit(0.0)
        , macd_state(MacdState::PENDING)
        , macd(0.0)
        , macd_signal(0.0)
        , histogram(0.0)
        , timestamp(0)
    {}

    double riskPerUnit() const {
        return entry_price > stop_loss ? entry_price - stop_loss : stop_loss - entry_price;
    }
};

struct SignalRejection {
    std::string symbol;
    std::string gap_ref;
    Direction direction;
    RejectReason reason;
    double reference_price;
    long long timestamp;

    SignalRejection()
        : direction(Direction::BULLISH)
        , reason(RejectReason::NONE)
        , reference_price(0.0)
        , timestamp(0)
    {}
};

} // namespace strategy
} // namespace gapswing
