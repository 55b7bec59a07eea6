#pragma once

#include <map>
#include <string>
#include <vector>

#include "analytics/CandleSeries.h"
#include "core/contracts/IExecutionProvider.h"

namespace gapswing {
namespace execution {

// Replays per-symbol history. The cursor is the open_time of the latest
// closed bar; data after it is invisible and fills happen at its close.
class BacktestExecutor : public core::IExecutionProvider {
public:
    BacktestExecutor(const std::string& timeframe, const SymbolMeta& meta);

    void loadSymbol(const std::string& symbol, std::vector<Candle> candles);

    // Sorted union of every loaded bar time.
    std::vector<long long> timeline() const;
    void setCursor(long long bar_open_time) { cursor_ = bar_open_time; }
    long long cursor() const { return cursor_; }

    std::string name() const override { return "backtest"; }
    // Close time of the cursor bar.
    long long currentTimeMs() const override { return cursor_ + timeframe_ms_; }

    std::vector<Candle> getCandles(const std::string& symbol, const std::string& timeframe, int limit) override;
    double getTicker(const std::string& symbol) override;

    std::optional<core::Fill> placeOrder(const core::ExecutionRequest& request) override;
    std::optional<core::Fill> closePosition(const std::string& symbol, Direction direction,
                                            double size, double reference_price) override;

    std::optional<SymbolMeta> symbolMeta(const std::string& symbol) override;
    std::optional<double> fetchBalance() override { return std::nullopt; }

private:
    const analytics::CandleSeries& seriesFor(const std::string& symbol) const;

    std::map<std::string, analytics::CandleSeries> data_;
    long long timeframe_ms_;
    long long cursor_;
    SymbolMeta meta_;
    long long order_seq_;
};

} // namespace execution
} // namespace gapswing
