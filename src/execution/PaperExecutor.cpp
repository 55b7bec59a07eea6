#include "execution/PaperExecutor.h"
#include "common/Logger.h"

namespace gapswing {
namespace execution {

PaperExecutor::PaperExecutor(std::shared_ptr<network::BinanceHttpClient> client)
    : market_data_(std::move(client))
    , order_seq_(0)
{
}

long long PaperExecutor::currentTimeMs() const {
    return gapswing::currentTimeMs();
}

std::vector<Candle> PaperExecutor::getCandles(const std::string& symbol, const std::string& timeframe, int limit) {
    return market_data_.getCandles(symbol, timeframe, limit);
}

double PaperExecutor::getTicker(const std::string& symbol) {
    return market_data_.getTicker(symbol);
}

std::optional<core::Fill> PaperExecutor::placeOrder(const core::ExecutionRequest& request) {
    double price = 0.0;
    try {
        price = market_data_.getTicker(request.symbol);
    } catch (const core::DataUnavailableError& e) {
        LOG_WARN("[PAPER] {} order not filled: {}", request.symbol, e.what());
        return std::nullopt;
    }

    core::Fill fill;
    fill.order_id = "paper-" + std::to_string(++order_seq_);
    fill.symbol = request.symbol;
    fill.side = request.side;
    fill.status = OrderStatus::FILLED;
    fill.price = price;
    fill.size = request.size;
    fill.timestamp = currentTimeMs();

    LOG_INFO("[PAPER] {} {} {:.8f} @ {:.8f}", request.symbol,
             request.side == OrderSide::BUY ? "BUY" : "SELL", fill.size, fill.price);
    return fill;
}

std::optional<core::Fill> PaperExecutor::closePosition(const std::string& symbol, Direction direction,
                                                       double size, double reference_price) {
    core::Fill fill;
    fill.order_id = "paper-" + std::to_string(++order_seq_);
    fill.symbol = symbol;
    fill.side = exitSide(direction);
    fill.status = OrderStatus::FILLED;
    fill.price = reference_price;
    fill.size = size;
    fill.timestamp = currentTimeMs();

    LOG_INFO("[PAPER] close {} {:.8f} @ {:.8f}", symbol, size, reference_price);
    return fill;
}

std::optional<SymbolMeta> PaperExecutor::symbolMeta(const std::string& symbol) {
    return market_data_.symbolMeta(symbol);
}

} // namespace execution
} // namespace gapswing
