#include "execution/BinanceMarketData.h"
#include "execution/LiveExecutor.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace gapswing;
using gapswing::execution::BinanceMarketData;
using gapswing::execution::LiveExecutor;

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-12;
}
}

int main() {
    // exchangeInfo filters (futures layout)
    {
        const auto info = nlohmann::json::parse(R"({
            "symbols": [
                {
                    "symbol": "ETHUSDT",
                    "pricePrecision": 2,
                    "quantityPrecision": 3,
                    "filters": [
                        {"filterType": "PRICE_FILTER", "tickSize": "0.01"},
                        {"filterType": "LOT_SIZE", "stepSize": "0.001", "minQty": "0.001"},
                        {"filterType": "MIN_NOTIONAL", "notional": "20"}
                    ]
                },
                {
                    "symbol": "BTCUSDT",
                    "pricePrecision": 2,
                    "quantityPrecision": 3,
                    "filters": [
                        {"filterType": "PRICE_FILTER", "minPrice": "556.80", "tickSize": "0.10"},
                        {"filterType": "LOT_SIZE", "stepSize": "0.001", "minQty": "0.002"},
                        {"filterType": "MARKET_LOT_SIZE", "stepSize": "0.001", "minQty": "0.001"},
                        {"filterType": "MIN_NOTIONAL", "notional": "100"}
                    ]
                }
            ]
        })");

        auto meta = BinanceMarketData::parseSymbolMeta(info, "BTCUSDT");
        assert(meta.has_value());
        assert(near(meta->size_step, 0.001));
        assert(near(meta->min_order_size, 0.002));
        assert(near(meta->price_tick, 0.1));
        assert(near(meta->min_notional, 100.0));
        assert(meta->size_precision == 3);
        assert(meta->price_precision == 1);

        assert(!BinanceMarketData::parseSymbolMeta(info, "SOLUSDT").has_value());
        assert(!BinanceMarketData::parseSymbolMeta(nlohmann::json::object(), "BTCUSDT").has_value());
    }

    // Spot-style MIN_NOTIONAL and a malformed filter
    {
        const auto spot = nlohmann::json::parse(R"({"symbols": [{"symbol": "BTCUSDT", "filters": [
            {"filterType": "LOT_SIZE", "stepSize": "0.00001000", "minQty": "0.00001000"},
            {"filterType": "MIN_NOTIONAL", "minNotional": "5.00000000"}]}]})");
        auto meta = BinanceMarketData::parseSymbolMeta(spot, "BTCUSDT");
        assert(meta.has_value());
        assert(near(meta->min_notional, 5.0));
        assert(meta->size_precision == 5);

        const auto broken = nlohmann::json::parse(R"({"symbols": [{"symbol": "BTCUSDT", "filters": [
            {"filterType": "LOT_SIZE", "minQty": "0.001"}]}]})");
        assert(!BinanceMarketData::parseSymbolMeta(broken, "BTCUSDT").has_value());
    }

    // Ticker
    {
        assert(near(BinanceMarketData::parseTickerPrice(
            nlohmann::json::parse(R"({"symbol": "BTCUSDT", "price": "36512.40"})")), 36512.40));
        bool threw = false;
        try {
            BinanceMarketData::parseTickerPrice(nlohmann::json::parse(R"({"price": "0"})"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    // Order responses
    {
        const auto filled = nlohmann::json::parse(R"({
            "orderId": 283194212, "symbol": "BTCUSDT", "status": "FILLED",
            "side": "BUY", "executedQty": "0.012", "avgPrice": "36410.50",
            "updateTime": 1700000001234})");
        auto fill = LiveExecutor::parseOrderResponse(filled, 0.012, 36400.0);
        assert(fill.has_value());
        assert(fill->order_id == "283194212");
        assert(fill->side == OrderSide::BUY);
        assert(fill->status == OrderStatus::FILLED);
        assert(near(fill->size, 0.012));
        assert(near(fill->price, 36410.50));
        assert(fill->timestamp == 1700000001234LL);

        // Expired market order keeps what executed; avgPrice 0 falls back to the reference.
        const auto expired = nlohmann::json::parse(R"({
            "orderId": 7, "symbol": "ETHUSDT", "status": "EXPIRED", "side": "SELL",
            "executedQty": "0.5", "avgPrice": "0", "updateTime": 1700000002000})");
        auto partial = LiveExecutor::parseOrderResponse(expired, 1.0, 2000.0);
        assert(partial.has_value());
        assert(partial->status == OrderStatus::PARTIALLY_FILLED);
        assert(partial->side == OrderSide::SELL);
        assert(near(partial->size, 0.5));
        assert(near(partial->price, 2000.0));

        const auto rejected = nlohmann::json::parse(R"({"orderId": 8, "status": "REJECTED", "executedQty": "0"})");
        assert(!LiveExecutor::parseOrderResponse(rejected, 1.0, 2000.0).has_value());

        const auto open = nlohmann::json::parse(R"({"orderId": 9, "status": "NEW", "executedQty": "0"})");
        assert(!LiveExecutor::parseOrderResponse(open, 1.0, 2000.0).has_value());
    }

    // Balances
    {
        const auto balances = nlohmann::json::parse(R"([
            {"asset": "BNB", "balance": "0.10"},
            {"asset": "USDT", "balance": "1250.75", "availableBalance": "1100.00"}
        ])");
        auto usdt = LiveExecutor::parseBalance(balances);
        assert(usdt && near(*usdt, 1250.75));
        assert(!LiveExecutor::parseBalance(balances, "BUSD").has_value());
        assert(!LiveExecutor::parseBalance(nlohmann::json::object()).has_value());
    }

    std::cout << "[TEST] BinanceParsing PASSED\n";
    return 0;
}
