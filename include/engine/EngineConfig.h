#pragma once

#include <string>
#include <vector>
#include "strategy/StrategyConfig.h"
#include "risk/RiskConfig.h"

namespace gapswing {
namespace engine {

enum class TradingMode {
    LIVE,           // real orders on the exchange
    PAPER,          // live market data, simulated fills
    BACKTEST        // historical replay
};

inline std::string tradingModeToString(TradingMode mode) {
    switch (mode) {
        case TradingMode::LIVE: return "LIVE";
        case TradingMode::PAPER: return "PAPER";
        case TradingMode::BACKTEST: return "BACKTEST";
    }
    return "PAPER";
}

struct BacktestConfig {
    std::string data_dir = "data/backtest";   // <data_dir>/<SYMBOL>.csv
    int warmup_bars = 50;                     // bars fed before the first tick

    // Symbol rules applied to every replayed symbol.
    double min_order_size = 0.001;
    double min_notional = 5.0;
    double size_step = 0.001;
    double price_tick = 0.01;
};

struct EngineConfig {
    TradingMode mode;
    std::vector<std::string> symbols;
    std::string timeframe;
    int candle_limit;
    int settle_buffer_seconds;
    double starting_balance;

    std::string state_file;
    std::string event_journal_file;

    strategy::FvgStrategyConfig strategy;
    risk::RiskConfig risk;

    EngineConfig()
        : mode(TradingMode::PAPER)
        , symbols{"BTCUSDT", "ETHUSDT"}
        , timeframe("4h")
        , candle_limit(200)
        , settle_buffer_seconds(30)
        , starting_balance(10000.0)
        , state_file("state/gapswing_state.json")
        , event_journal_file("logs/events.jsonl")
    {}
};

} // namespace engine
} // namespace gapswing
