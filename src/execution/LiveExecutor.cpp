#include "execution/LiveExecutor.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include <cmath>

namespace gapswing {
namespace execution {

namespace {
double numberField(const nlohmann::json& node, const char* key, double fallback = 0.0) {
    if (!node.contains(key)) {
        return fallback;
    }
    const auto& value = node.at(key);
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    return value.is_number() ? value.get<double>() : fallback;
}

std::string sideToString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}
}

LiveExecutor::LiveExecutor(std::shared_ptr<network::BinanceHttpClient> client)
    : market_data_(std::move(client))
{
}

long long LiveExecutor::currentTimeMs() const {
    return gapswing::currentTimeMs();
}

std::vector<Candle> LiveExecutor::getCandles(const std::string& symbol, const std::string& timeframe, int limit) {
    return market_data_.getCandles(symbol, timeframe, limit);
}

double LiveExecutor::getTicker(const std::string& symbol) {
    return market_data_.getTicker(symbol);
}

std::optional<SymbolMeta> LiveExecutor::symbolMeta(const std::string& symbol) {
    return market_data_.symbolMeta(symbol);
}

std::optional<core::Fill> LiveExecutor::parseOrderResponse(const nlohmann::json& response,
                                                           double requested_size,
                                                           double reference_price) {
    const std::string status = response.value("status", std::string("NEW"));
    const double executed = numberField(response, "executedQty");

    auto transition = core::execution::OrderLifecycleStateMachine::transition(
        status, 0.0, requested_size, executed);
    if (transition.filled_size <= 0.0 || transition.status == OrderStatus::REJECTED) {
        return std::nullopt;
    }

    core::Fill fill;
    if (response.contains("orderId")) {
        const auto& id = response["orderId"];
        fill.order_id = id.is_string() ? id.get<std::string>() : std::to_string(id.get<long long>());
    }
    fill.symbol = response.value("symbol", std::string());
    fill.side = response.value("side", std::string("BUY")) == "SELL" ? OrderSide::SELL : OrderSide::BUY;
    fill.status = transition.status;
    fill.size = transition.filled_size;
    const double avg_price = numberField(response, "avgPrice");
    fill.price = avg_price > 0.0 ? avg_price : reference_price;
    fill.timestamp = response.value("updateTime", gapswing::currentTimeMs());
    return fill;
}

std::optional<double> LiveExecutor::parseBalance(const nlohmann::json& balances, const std::string& asset) {
    if (!balances.is_array()) {
        return std::nullopt;
    }
    for (const auto& entry : balances) {
        if (entry.value("asset", std::string()) == asset) {
            return numberField(entry, "balance");
        }
    }
    return std::nullopt;
}

std::optional<core::Fill> LiveExecutor::placeOrder(const core::ExecutionRequest& request) {
    std::map<std::string, std::string> params;
    params["symbol"] = request.symbol;
    params["side"] = sideToString(request.side);
    params["type"] = "MARKET";
    params["quantity"] = common::quantityToString(request.size, request.size_step);
    params["newOrderRespType"] = "RESULT";
    if (!request.client_order_id.empty()) {
        // Same id on every retry: the exchange refuses a duplicate.
        params["newClientOrderId"] = request.client_order_id;
    }

    std::optional<core::Fill> fill;
    try {
        auto response = market_data_.client().placeOrder(params);
        fill = parseOrderResponse(response, request.size, request.reference_price);
        if (!fill) {
            LOG_WARN("{} market order not filled: {}", request.symbol, response.dump());
            market_data_.client().cancelAllOpenOrders(request.symbol);
            return std::nullopt;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("{} market order failed: {}", request.symbol, e.what());
        return std::nullopt;
    }

    if (fill->status == OrderStatus::PARTIALLY_FILLED) {
        LOG_WARN("{} partial fill {:.8f} of {:.8f}", request.symbol, fill->size, request.size);
    }
    LOG_INFO("[LIVE] {} {} {:.8f} @ {:.8f} (order {})", request.symbol, sideToString(request.side),
             fill->size, fill->price, fill->order_id);

    if (request.stop_loss > 0.0) {
        placeProtectiveOrder(request, "STOP_MARKET", request.stop_loss);
    }
    if (request.take_profit > 0.0) {
        placeProtectiveOrder(request, "TAKE_PROFIT_MARKET", request.take_profit);
    }
    return fill;
}

void LiveExecutor::placeProtectiveOrder(const core::ExecutionRequest& request, const std::string& type,
                                        double trigger_price) {
    std::map<std::string, std::string> params;
    params["symbol"] = request.symbol;
    params["side"] = sideToString(exitSide(request.direction));
    params["type"] = type;
    params["stopPrice"] = common::priceToString(trigger_price, request.price_tick);
    params["closePosition"] = "true";
    params["workingType"] = "MARK_PRICE";

    try {
        market_data_.client().placeOrder(params);
    } catch (const std::exception& e) {
        // The engine still checks SL/TP every tick.
        LOG_ERROR("{} {} at {} could not be placed: {}", request.symbol, type, params["stopPrice"], e.what());
    }
}

bool LiveExecutor::positionIsFlat(const std::string& symbol) {
    try {
        auto risk = market_data_.client().getPositionRisk(symbol);
        if (!risk.is_array()) {
            return false;
        }
        for (const auto& entry : risk) {
            if (entry.value("symbol", std::string()) == symbol &&
                std::fabs(numberField(entry, "positionAmt")) > 0.0) {
                return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("{} position check failed: {}", symbol, e.what());
        return false;
    }
}

std::optional<core::Fill> LiveExecutor::closePosition(const std::string& symbol, Direction direction,
                                                      double size, double reference_price) {
    try {
        market_data_.client().cancelAllOpenOrders(symbol);
    } catch (const std::exception& e) {
        LOG_WARN("{} cancel of protective orders failed: {}", symbol, e.what());
    }

    auto meta = market_data_.symbolMeta(symbol);
    const double step = meta ? meta->size_step : 0.0;

    std::map<std::string, std::string> params;
    params["symbol"] = symbol;
    params["side"] = sideToString(exitSide(direction));
    params["type"] = "MARKET";
    params["quantity"] = step > 0.0 ? common::quantityToString(size, step)
                                    : common::formatDecimal(size, 8);
    params["reduceOnly"] = "true";
    params["newOrderRespType"] = "RESULT";

    try {
        auto response = market_data_.client().placeOrder(params);
        auto fill = parseOrderResponse(response, size, reference_price);
        if (fill) {
            LOG_INFO("[LIVE] close {} {:.8f} @ {:.8f}", symbol, fill->size, fill->price);
            return fill;
        }
        LOG_WARN("{} close order not filled: {}", symbol, response.dump());
    } catch (const std::exception& e) {
        LOG_WARN("{} close order failed: {}", symbol, e.what());
    }

    // A protective order may already have flattened the position on the exchange.
    if (positionIsFlat(symbol)) {
        LOG_INFO("{} already flat on the exchange; recording exit at {:.8f}", symbol, reference_price);
        core::Fill fill;
        fill.order_id = "exchange-protective";
        fill.symbol = symbol;
        fill.side = exitSide(direction);
        fill.status = OrderStatus::FILLED;
        fill.price = reference_price;
        fill.size = size;
        fill.timestamp = currentTimeMs();
        return fill;
    }
    return std::nullopt;
}

std::optional<double> LiveExecutor::fetchBalance() {
    try {
        auto balance = parseBalance(market_data_.client().getBalance());
        if (!balance) {
            LOG_WARN("USDT balance missing from /fapi/v2/balance");
        }
        return balance;
    } catch (const std::exception& e) {
        LOG_WARN("Balance fetch failed: {}", e.what());
        return std::nullopt;
    }
}

} // namespace execution
} // namespace gapswing
