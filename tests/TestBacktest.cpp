#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace gapswing;
using namespace gapswing::backtest;

namespace {

constexpr long long kT0 = 1699920000000LL;      // 2023-11-14 00:00 UTC
constexpr long long kH4 = 4LL * 60 * 60 * 1000;

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

// Bullish gap [105, 107.5] from bars 4 and 6, midpoint touch on bar 7
// (entry 110, stop 105, target 120), outcome bar 8.
std::vector<Candle> scenario(double outcome_low) {
    const double rows[][4] = {
        {100, 101, 99, 100},
        {100, 102, 100, 101},
        {101, 103, 101, 102},
        {102, 104, 102, 103},
        {103, 105, 103, 104},
        {104, 107, 104, 106.5},
        {106.5, 109, 107.5, 108},
        {108, 110.5, 106, 110},
        {110, 121, outcome_low, 120.5},
        {120.5, 122, 119, 121}
    };
    std::vector<Candle> candles;
    for (size_t i = 0; i < sizeof(rows) / sizeof(rows[0]); ++i) {
        candles.emplace_back(rows[i][0], rows[i][1], rows[i][2], rows[i][3], 10.0,
                             kT0 + static_cast<long long>(i) * kH4);
    }
    return candles;
}

engine::EngineConfig engineConfig() {
    engine::EngineConfig config;
    config.symbols = {"BTCUSDT"};
    config.timeframe = "4h";
    config.starting_balance = 10000.0;
    config.strategy.macd_fast = 2;
    config.strategy.macd_slow = 3;
    config.strategy.macd_signal = 2;
    config.strategy.stop_buffer_pct = 0.0;
    return config;
}

engine::BacktestConfig backtestConfig() {
    engine::BacktestConfig config;
    config.warmup_bars = 5;
    config.size_step = 0.001;
    config.min_order_size = 0.001;
    config.min_notional = 5.0;
    return config;
}

} // namespace

int main() {
    // Winning trade
    {
        BacktestEngine bt;
        bt.init(engineConfig(), backtestConfig());
        bt.loadSymbol("BTCUSDT", scenario(109));
        bt.run();
        const auto result = bt.getResult();

        assert(result.entry_funnel.ticks == 5);
        assert(result.entry_funnel.gaps_created == 2);
        assert(result.entry_funnel.gaps_retired == 1);
        assert(result.entry_funnel.signals_confirmed == 1);
        assert(result.entry_funnel.signals_rejected == 0);
        assert(result.entry_funnel.entries_executed == 1);

        assert(result.total_trades == 1);
        assert(result.winning_trades == 1 && result.losing_trades == 0);
        assert(near(result.final_balance, 10200.0));
        assert(near(result.total_profit, 200.0));
        assert(near(result.win_rate, 1.0));
        assert(near(result.avg_win, 200.0));
        assert(near(result.expectancy, 200.0));
        assert(near(result.max_drawdown, 0.0));
        assert(result.open_positions == 0);
        assert(result.exit_reason_counts.at("take_profit") == 1);
        assert(result.symbol_summaries.size() == 1);
        assert(result.symbol_summaries.front().symbol == "BTCUSDT");
        assert(near(result.symbol_summaries.front().total_profit, 200.0));
    }

    // Outcome bar spans stop and target: the stop wins
    {
        BacktestEngine bt;
        bt.init(engineConfig(), backtestConfig());
        bt.loadSymbol("BTCUSDT", scenario(104));
        bt.run();
        const auto result = bt.getResult();

        assert(result.total_trades == 1);
        assert(result.losing_trades == 1);
        assert(result.exit_reason_counts.at("stop_loss") == 1);
        assert(near(result.final_balance, 9900.0));
        assert(near(result.avg_loss, 100.0));
        assert(near(result.expectancy, -100.0));
        assert(near(result.profit_factor, 0.0));
        assert(near(result.max_drawdown, 0.01));
    }

    // Data files: CSV with a header, second timestamps and a bad row; JSON klines
    {
        const auto dir = std::filesystem::temp_directory_path() / "gapswing_test_backtest";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir);

        {
            std::ofstream csv(dir / "BTCUSDT.csv");
            csv << "open_time,open,high,low,close,volume\n";
            for (const auto& c : scenario(109)) {
                csv << (c.open_time / 1000) << "," << c.open << "," << c.high << ","
                    << c.low << "," << c.close << "," << c.volume << "\n";
            }
            csv << "1699956000,abc,1,1,1,1\n";
        }
        const auto loaded = DataHistory::loadCSV((dir / "BTCUSDT.csv").string());
        assert(loaded.size() == 10);
        assert(loaded.front().open_time == kT0);
        assert(near(loaded[7].low, 106.0));

        {
            std::ofstream json(dir / "ETHUSDT.json");
            json << R"([[1699920000000,"2000.0","2010.5","1995.0","2005.0","12.5",1699934399999],)"
                 << R"([1699934400000,"2005.0","2020.0","2001.0","2018.0","9.1",1699948799999]])";
        }
        const auto klines = DataHistory::loadJSON((dir / "ETHUSDT.json").string());
        assert(klines.size() == 2);
        assert(klines[1].open_time == kT0 + kH4);
        assert(near(klines[1].close, 2018.0));

        assert(DataHistory::loadCSV((dir / "missing.csv").string()).empty());
        assert(DataHistory::toMsTimestamp(1699920000) == kT0);
        assert(DataHistory::toMsTimestamp(kT0) == kT0);

        auto config = engineConfig();
        config.symbols = {"BTCUSDT", "ETHUSDT", "SOLUSDT"};
        BacktestEngine bt;
        bt.init(config, backtestConfig());
        assert(bt.loadData(dir.string()) == 2);

        std::filesystem::remove_all(dir, ec);
    }

    std::cout << "[TEST] Backtest PASSED\n";
    return 0;
}
