#include "execution/BacktestExecutor.h"
#include "common/Logger.h"
#include <algorithm>
#include <cstddef>
#include <set>

namespace gapswing {
namespace execution {

BacktestExecutor::BacktestExecutor(const std::string& timeframe, const SymbolMeta& meta)
    : timeframe_ms_(analytics::CandleSeries::timeframeToMs(timeframe))
    , cursor_(0)
    , meta_(meta)
    , order_seq_(0)
{
}

void BacktestExecutor::loadSymbol(const std::string& symbol, std::vector<Candle> candles) {
    data_[symbol] = analytics::CandleSeries(std::move(candles));
    LOG_INFO("Backtest data for {}: {} bars", symbol, data_[symbol].size());
}

std::vector<long long> BacktestExecutor::timeline() const {
    std::set<long long> times;
    for (const auto& [symbol, series] : data_) {
        for (const auto& candle : series.candles()) {
            times.insert(candle.open_time);
        }
    }
    return std::vector<long long>(times.begin(), times.end());
}

const analytics::CandleSeries& BacktestExecutor::seriesFor(const std::string& symbol) const {
    auto it = data_.find(symbol);
    if (it == data_.end()) {
        throw core::DataUnavailableError("no backtest data for " + symbol);
    }
    return it->second;
}

std::vector<Candle> BacktestExecutor::getCandles(const std::string& symbol, const std::string& timeframe, int limit) {
    if (analytics::CandleSeries::timeframeToMs(timeframe) != timeframe_ms_) {
        throw core::DataUnavailableError("backtest data is not in timeframe " + timeframe);
    }

    const auto& series = seriesFor(symbol);
    const size_t end = series.firstAfter(cursor_);
    if (end == 0) {
        throw core::DataUnavailableError("no " + symbol + " bars at or before the replay cursor");
    }
    const size_t count = limit > 0 ? std::min(end, static_cast<size_t>(limit)) : end;
    const auto& all = series.candles();
    return std::vector<Candle>(all.begin() + static_cast<std::ptrdiff_t>(end - count),
                               all.begin() + static_cast<std::ptrdiff_t>(end));
}

double BacktestExecutor::getTicker(const std::string& symbol) {
    const auto& series = seriesFor(symbol);
    const size_t end = series.firstAfter(cursor_);
    if (end == 0) {
        throw core::DataUnavailableError("no " + symbol + " price at the replay cursor");
    }
    return series.at(end - 1).close;
}

std::optional<core::Fill> BacktestExecutor::placeOrder(const core::ExecutionRequest& request) {
    double price = 0.0;
    try {
        price = getTicker(request.symbol);
    } catch (const core::DataUnavailableError& e) {
        LOG_WARN("[BACKTEST] {} order not filled: {}", request.symbol, e.what());
        return std::nullopt;
    }

    core::Fill fill;
    fill.order_id = "bt-" + std::to_string(++order_seq_);
    fill.symbol = request.symbol;
    fill.side = request.side;
    fill.status = OrderStatus::FILLED;
    fill.price = price;
    fill.size = request.size;
    fill.timestamp = currentTimeMs();
    return fill;
}

std::optional<core::Fill> BacktestExecutor::closePosition(const std::string& symbol, Direction direction,
                                                          double size, double reference_price) {
    core::Fill fill;
    fill.order_id = "bt-" + std::to_string(++order_seq_);
    fill.symbol = symbol;
    fill.side = exitSide(direction);
    fill.status = OrderStatus::FILLED;
    fill.price = reference_price;
    fill.size = size;
    fill.timestamp = currentTimeMs();
    return fill;
}

std::optional<SymbolMeta> BacktestExecutor::symbolMeta(const std::string& symbol) {
    if (data_.find(symbol) == data_.end()) {
        return std::nullopt;
    }
    return meta_;
}

} // namespace execution
} // namespace gapswing
