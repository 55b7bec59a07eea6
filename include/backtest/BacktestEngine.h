#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "common/Types.h"
#include "common/Config.h"
#include "backtest/DataHistory.h"
#include "core/state/InMemoryStateStore.h"
#include "engine/EngineConfig.h"
#include "engine/TradingEngine.h"
#include "execution/BacktestExecutor.h"

namespace gapswing {
namespace backtest {

// Replays history bar by bar through the same TradingEngine that runs live.
class BacktestEngine {
public:
    BacktestEngine();

    // Initialize engine with configuration
    void init(const Config& config);
    void init(const engine::EngineConfig& engine_config, const engine::BacktestConfig& backtest_config);

    // Loads <data_dir>/<SYMBOL>.csv (or .json) for every configured symbol.
    // Returns the number of symbols with data.
    size_t loadData(const std::string& data_dir);
    void loadSymbol(const std::string& symbol, std::vector<Candle> candles);

    // Run the backtest simulation
    void run();

    struct Result {
        struct SymbolSummary {
            std::string symbol;
            int total_trades = 0;
            int winning_trades = 0;
            int losing_trades = 0;
            double win_rate = 0.0;
            double total_profit = 0.0;
            double profit_factor = 0.0;
        };
        struct EntryFunnelSummary {
            int ticks = 0;
            int gaps_created = 0;
            int gaps_retired = 0;
            int signals_confirmed = 0;
            int signals_rejected = 0;
            int entries_executed = 0;
        };

        double final_balance = 0.0;
        double total_profit = 0.0;
        double max_drawdown = 0.0;
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double profit_factor = 0.0;
        double expectancy = 0.0;
        int open_positions = 0;
        std::map<std::string, int> exit_reason_counts;
        std::map<std::string, int> rejection_counts;
        std::vector<SymbolSummary> symbol_summaries;
        EntryFunnelSummary entry_funnel;
    };
    Result getResult() const;

private:
    engine::EngineConfig engine_config_;
    engine::BacktestConfig backtest_config_;

    std::shared_ptr<execution::BacktestExecutor> executor_;
    std::shared_ptr<core::InMemoryStateStore> store_;
    core::EngineState final_state_;

    // Performance Metrics
    double max_balance_;
    double max_drawdown_;
    Result::EntryFunnelSummary entry_funnel_;
    std::map<std::string, int> rejection_counts_;
};

} // namespace backtest
} // namespace gapswing
