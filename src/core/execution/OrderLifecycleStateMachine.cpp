#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>

namespace gapswing {
namespace core {
namespace execution {

namespace {
std::string normalizeStatus(std::string status) {
    std::transform(status.begin(), status.end(), status.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return status;
}
} // namespace

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    const std::string& exchange_status,
    double current_filled_size,
    double order_size,
    double executed_size
) {
    OrderLifecycleTransitionResult result;
    result.filled_size = std::max(current_filled_size, executed_size);

    const std::string status = normalizeStatus(exchange_status);

    if (status == "FILLED") {
        result.status = OrderStatus::FILLED;
        result.filled_size = (result.filled_size > 0.0) ? result.filled_size : order_size;
        result.terminal = true;
        return result;
    }

    // A market order whose remainder expired keeps whatever already executed.
    if (status == "CANCELED" || status == "CANCELLED" ||
        status == "EXPIRED" || status == "EXPIRED_IN_MATCH") {
        result.status = (result.filled_size > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::CANCELLED;
        result.terminal = true;
        return result;
    }

    if (status == "REJECTED") {
        result.status = OrderStatus::REJECTED;
        result.filled_size = 0.0;
        result.terminal = true;
        return result;
    }

    if (status == "PARTIALLY_FILLED") {
        if (result.filled_size >= order_size - 1e-12) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else {
            result.status = OrderStatus::PARTIALLY_FILLED;
        }
        return result;
    }

    // NEW and anything unrecognized: still working.
    result.status = (result.filled_size > 0.0) ? OrderStatus::PARTIALLY_FILLED : OrderStatus::SUBMITTED;
    return result;
}

} // namespace execution
} // namespace core
} // namespace gapswing
