#pragma once

#include <string>

#include "common/Types.h"

namespace gapswing {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_size = 0.0;
    bool terminal = false;

    // Terminal with nothing executed: no position results from the order.
    bool isNonFill() const { return terminal && filled_size <= 0.0; }
};

// Maps an exchange order status (NEW, PARTIALLY_FILLED, FILLED, CANCELED,
// REJECTED, EXPIRED, EXPIRED_IN_MATCH) plus executed quantity to our status.
class OrderLifecycleStateMachine {
public:
    static OrderLifecycleTransitionResult transition(
        const std::string& exchange_status,
        double current_filled_size,
        double order_size,
        double executed_size = 0.0
    );
};

} // namespace execution
} // namespace core
} // namespace gapswing
