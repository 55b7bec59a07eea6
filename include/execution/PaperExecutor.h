#pragma once

#include <memory>

#include "core/contracts/IExecutionProvider.h"
#include "execution/BinanceMarketData.h"

namespace gapswing {
namespace execution {

// Live market data, simulated fills at the current ticker price.
class PaperExecutor : public core::IExecutionProvider {
public:
    explicit PaperExecutor(std::shared_ptr<network::BinanceHttpClient> client);

    std::string name() const override { return "paper"; }
    long long currentTimeMs() const override;

    std::vector<Candle> getCandles(const std::string& symbol, const std::string& timeframe, int limit) override;
    double getTicker(const std::string& symbol) override;

    std::optional<core::Fill> placeOrder(const core::ExecutionRequest& request) override;
    std::optional<core::Fill> closePosition(const std::string& symbol, Direction direction,
                                            double size, double reference_price) override;

    std::optional<SymbolMeta> symbolMeta(const std::string& symbol) override;
    std::optional<double> fetchBalance() override { return std::nullopt; }

private:
    BinanceMarketData market_data_;
    long long order_seq_;
};

} // namespace execution
} // namespace gapswing
