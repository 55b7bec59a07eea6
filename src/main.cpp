#include "common/Logger.h"
#include "common/Config.h"
#include "network/BinanceHttpClient.h"
#include "execution/LiveExecutor.h"
#include "execution/PaperExecutor.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/StateStoreJson.h"
#include "engine/TradingEngine.h"
#include "backtest/BacktestEngine.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace gapswing;

namespace {

// Set from the signal handler, polled by the main thread.
std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

struct CliOptions {
    std::string config_path = "config/config.json";
    bool backtest = false;
    bool json = false;
    bool once = false;
};

void printUsage() {
    std::cerr << "usage: gapswing [--config PATH] [--backtest] [--json] [--once]\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--backtest") {
            options.backtest = true;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--once") {
            options.once = true;
        } else {
            std::cerr << "unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

int runBacktest(const Config& config, bool json_mode) {
    const auto bt_config = config.getBacktestConfig();
    LOG_INFO("Starting Backtest Mode with data in {}", bt_config.data_dir);

    backtest::BacktestEngine bt_engine;
    bt_engine.init(config);
    if (bt_engine.loadData(bt_config.data_dir) == 0) {
        std::cerr << "No backtest data found in " << bt_config.data_dir << "\n";
        return 1;
    }
    bt_engine.run();

    const auto result = bt_engine.getResult();
    if (json_mode) {
        nlohmann::json j;
        j["final_balance"] = result.final_balance;
        j["total_profit"] = result.total_profit;
        j["max_drawdown"] = result.max_drawdown;
        j["total_trades"] = result.total_trades;
        j["winning_trades"] = result.winning_trades;
        j["losing_trades"] = result.losing_trades;
        j["win_rate"] = result.win_rate;
        j["avg_win"] = result.avg_win;
        j["avg_loss"] = result.avg_loss;
        j["profit_factor"] = result.profit_factor;
        j["expectancy"] = result.expectancy;
        j["open_positions"] = result.open_positions;
        j["exit_reason_counts"] = result.exit_reason_counts;
        j["rejection_counts"] = result.rejection_counts;
        j["entry_funnel"] = {
            {"ticks", result.entry_funnel.ticks},
            {"gaps_created", result.entry_funnel.gaps_created},
            {"gaps_retired", result.entry_funnel.gaps_retired},
            {"signals_confirmed", result.entry_funnel.signals_confirmed},
            {"signals_rejected", result.entry_funnel.signals_rejected},
            {"entries_executed", result.entry_funnel.entries_executed}
        };
        j["symbol_summaries"] = nlohmann::json::array();
        for (const auto& s : result.symbol_summaries) {
            j["symbol_summaries"].push_back({
                {"symbol", s.symbol},
                {"total_trades", s.total_trades},
                {"winning_trades", s.winning_trades},
                {"losing_trades", s.losing_trades},
                {"win_rate", s.win_rate},
                {"total_profit", s.total_profit},
                {"profit_factor", s.profit_factor}
            });
        }
        std::cout << j.dump() << "\n";
        return 0;
    }

    std::cout << "\nBacktest result\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Final balance:  " << result.final_balance << "\n";
    std::cout << "Total profit:   " << result.total_profit << "\n";
    std::cout << "Max drawdown:   " << (result.max_drawdown * 100.0) << "%\n";
    std::cout << "Trades:         " << result.total_trades
              << " (" << result.winning_trades << " won, " << result.losing_trades << " lost)\n";
    std::cout << "Win rate:       " << (result.win_rate * 100.0) << "%\n";
    std::cout << "Avg win/loss:   " << result.avg_win << " / " << result.avg_loss << "\n";
    std::cout << "Profit factor:  " << std::setprecision(3) << result.profit_factor << "\n";
    std::cout << "Expectancy:     " << std::setprecision(2) << result.expectancy << " /trade\n";
    std::cout << "Still open:     " << result.open_positions << "\n";
    std::cout << "Funnel:         " << result.entry_funnel.gaps_created << " gaps, "
              << result.entry_funnel.signals_confirmed << " signals, "
              << result.entry_funnel.entries_executed << " entries\n";
    if (!result.rejection_counts.empty()) {
        std::cout << "Rejections:\n";
        for (const auto& entry : result.rejection_counts) {
            std::cout << "  - " << entry.first << ": " << entry.second << "\n";
        }
    }
    if (!result.symbol_summaries.empty()) {
        std::cout << "Per symbol:\n";
        for (const auto& s : result.symbol_summaries) {
            std::cout << "  - " << s.symbol
                      << " | trades=" << s.total_trades
                      << " | win=" << std::setprecision(1) << (s.win_rate * 100.0) << "%"
                      << " | pnl=" << std::setprecision(2) << s.total_profit
                      << " | pf=" << std::setprecision(3) << s.profit_factor << "\n";
        }
    }
    std::cout << "---------------------------------------------\n";
    return 0;
}

std::shared_ptr<core::IExecutionProvider> makeProvider(const Config& config, engine::TradingMode mode) {
    const auto& exchange = config.getExchangeConfig();
    auto http_client = std::make_shared<network::BinanceHttpClient>(
        config.getApiKey(), config.getApiSecret(),
        exchange.base_url, exchange.recv_window_ms, exchange.max_retries);

    if (mode == engine::TradingMode::LIVE) {
        return std::make_shared<execution::LiveExecutor>(http_client);
    }
    return std::make_shared<execution::PaperExecutor>(http_client);
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 1;
    }

    auto& config = Config::getInstance();
    try {
        config.load(options.config_path);
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << "Logger error: " << e.what() << "\n";
        return 1;
    }

    try {
        if (options.backtest) {
            config.setMode(engine::TradingMode::BACKTEST);
            return runBacktest(config, options.json);
        }

        const auto engine_config = config.getEngineConfig();
        if (engine_config.mode == engine::TradingMode::BACKTEST) {
            return runBacktest(config, options.json);
        }
        if (engine_config.mode == engine::TradingMode::LIVE && !config.hasApiCredentials()) {
            LOG_ERROR("LIVE mode requires GAPSWING_API_KEY and GAPSWING_API_SECRET");
            std::cerr << "LIVE mode requires GAPSWING_API_KEY and GAPSWING_API_SECRET\n";
            return 1;
        }

        std::cout << "\n";
        std::cout << "=============================================\n";
        std::cout << "       GapSwing " << engine::tradingModeToString(engine_config.mode) << "\n";
        std::cout << "=============================================\n\n";

        auto provider = makeProvider(config, engine_config.mode);
        auto store = std::make_shared<core::StateStoreJson>(engine_config.state_file);
        auto journal = std::make_shared<core::EventJournalJsonl>(engine_config.event_journal_file);

        engine::TradingEngine engine(engine_config, provider, store, journal);
        try {
            engine.initialize();
        } catch (const core::StateStoreError& e) {
            LOG_ERROR("State store unusable: {}", e.what());
            std::cerr << "State store unusable: " << e.what() << "\n";
            return 1;
        }

        if (options.once) {
            engine.runTick();
            LOG_INFO("Single tick finished");
            return 0;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!engine.start()) {
            LOG_ERROR("Engine start failed");
            return 1;
        }
        std::cout << "Engine running. Press Ctrl+C to stop.\n\n";

        while (engine.isRunning() && !g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LOG_INFO("Stop signal received");
        engine.stop();

        LOG_INFO("Program terminated");
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
