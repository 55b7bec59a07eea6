#pragma once

#include <memory>

#include "core/contracts/IExecutionProvider.h"
#include "execution/BinanceMarketData.h"

namespace gapswing {
namespace execution {

// Binance USD-M futures. Market entry followed by exchange-side STOP_MARKET
// and TAKE_PROFIT_MARKET orders (closePosition=true) so the position stays
// protected between ticks.
class LiveExecutor : public core::IExecutionProvider {
public:
    explicit LiveExecutor(std::shared_ptr<network::BinanceHttpClient> client);

    std::string name() const override { return "live"; }
    long long currentTimeMs() const override;

    std::vector<Candle> getCandles(const std::string& symbol, const std::string& timeframe, int limit) override;
    double getTicker(const std::string& symbol) override;

    std::optional<core::Fill> placeOrder(const core::ExecutionRequest& request) override;
    std::optional<core::Fill> closePosition(const std::string& symbol, Direction direction,
                                            double size, double reference_price) override;

    std::optional<SymbolMeta> symbolMeta(const std::string& symbol) override;
    std::optional<double> fetchBalance() override;

    // Order response -> fill. nullopt when nothing executed.
    static std::optional<core::Fill> parseOrderResponse(const nlohmann::json& response,
                                                        double requested_size,
                                                        double reference_price);
    // Wallet balance of `asset` from /fapi/v2/balance.
    static std::optional<double> parseBalance(const nlohmann::json& balances, const std::string& asset = "USDT");

private:
    void placeProtectiveOrder(const core::ExecutionRequest& request, const std::string& type, double trigger_price);
    bool positionIsFlat(const std::string& symbol);

    BinanceMarketData market_data_;
};

} // namespace execution
} // namespace gapswing
