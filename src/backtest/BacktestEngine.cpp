#include "backtest/BacktestEngine.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace gapswing {
namespace backtest {

namespace {

SymbolMeta backtestMeta(const engine::BacktestConfig& cfg) {
    SymbolMeta meta;
    meta.min_order_size = cfg.min_order_size;
    meta.min_notional = cfg.min_notional;
    meta.size_step = cfg.size_step;
    meta.price_tick = cfg.price_tick;
    return meta;
}

} // namespace

BacktestEngine::BacktestEngine()
    : max_balance_(0.0)
    , max_drawdown_(0.0)
{
}

void BacktestEngine::init(const Config& config) {
    init(config.getEngineConfig(), config.getBacktestConfig());
}

void BacktestEngine::init(const engine::EngineConfig& engine_config, const engine::BacktestConfig& backtest_config) {
    engine_config_ = engine_config;
    engine_config_.mode = engine::TradingMode::BACKTEST;
    backtest_config_ = backtest_config;

    SymbolMeta meta = backtestMeta(backtest_config_);
    executor_ = std::make_shared<execution::BacktestExecutor>(engine_config_.timeframe, meta);
    store_ = std::make_shared<core::InMemoryStateStore>();
    final_state_ = core::EngineState();
    max_balance_ = engine_config_.starting_balance;
    max_drawdown_ = 0.0;
    entry_funnel_ = Result::EntryFunnelSummary();
    rejection_counts_.clear();
}

size_t BacktestEngine::loadData(const std::string& data_dir) {
    size_t loaded = 0;
    for (const auto& symbol : engine_config_.symbols) {
        const std::filesystem::path base = std::filesystem::path(data_dir) / symbol;
        std::vector<Candle> candles;
        if (std::filesystem::exists(base.string() + ".csv")) {
            candles = DataHistory::loadCSV(base.string() + ".csv");
        } else if (std::filesystem::exists(base.string() + ".json")) {
            candles = DataHistory::loadJSON(base.string() + ".json");
        } else {
            LOG_WARN("No backtest data for {} in {}", symbol, data_dir);
            continue;
        }
        if (candles.empty()) {
            continue;
        }
        loadSymbol(symbol, std::move(candles));
        loaded++;
    }
    return loaded;
}

void BacktestEngine::loadSymbol(const std::string& symbol, std::vector<Candle> candles) {
    executor_->loadSymbol(symbol, std::move(candles));
}

void BacktestEngine::run() {
    const auto timeline = executor_->timeline();
    if (timeline.empty()) {
        LOG_WARN("Backtest has no data to replay");
        return;
    }

    engine::TradingEngine engine(engine_config_, executor_, store_, nullptr);

    const size_t warmup = std::min(static_cast<size_t>(std::max(0, backtest_config_.warmup_bars)),
                                   timeline.size() - 1);
    executor_->setCursor(timeline[warmup]);
    engine.initialize();

    LOG_INFO("Backtest: {} bars, {} warm-up, balance {:.2f}",
             timeline.size(), warmup, engine_config_.starting_balance);

    for (size_t i = warmup; i < timeline.size(); ++i) {
        executor_->setCursor(timeline[i]);
        const auto report = engine.runTick();

        entry_funnel_.ticks++;
        entry_funnel_.gaps_created += report.gaps_created;
        entry_funnel_.gaps_retired += report.gaps_retired;
        entry_funnel_.signals_confirmed += report.signals_confirmed;
        entry_funnel_.signals_rejected += report.rejectionCount();
        entry_funnel_.entries_executed += report.positions_opened;
        for (const auto& entry : report.rejections) {
            rejection_counts_[strategy::rejectReasonToString(entry.first)] += entry.second;
        }

        const double balance = engine.state().risk.current_balance;
        max_balance_ = std::max(max_balance_, balance);
        if (max_balance_ > 0.0) {
            max_drawdown_ = std::max(max_drawdown_, (max_balance_ - balance) / max_balance_);
        }
    }

    final_state_ = engine.state();
    LOG_INFO("Backtest finished: balance {:.2f}, {} closed, {} still open",
             final_state_.risk.current_balance, final_state_.closed_positions.size(),
             final_state_.open_positions.size());
}

BacktestEngine::Result BacktestEngine::getResult() const {
    Result result;

    int wins = 0;
    int losses = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    std::map<std::string, Result::SymbolSummary> symbol_map;
    std::map<std::string, double> symbol_gross_loss;

    for (const auto& trade : final_state_.closed_positions) {
        auto& ss = symbol_map[trade.symbol];
        ss.symbol = trade.symbol;
        ss.total_trades++;
        ss.total_profit += trade.realized_pnl;
        result.exit_reason_counts[risk::exitReasonToString(trade.exit_reason)]++;

        if (trade.realized_pnl > 0.0) {
            ++wins;
            gross_profit += trade.realized_pnl;
            ss.winning_trades++;
        } else if (trade.realized_pnl < 0.0) {
            ++losses;
            gross_loss_abs += std::abs(trade.realized_pnl);
            ss.losing_trades++;
            symbol_gross_loss[trade.symbol] += std::abs(trade.realized_pnl);
        }
    }

    for (auto& entry : symbol_map) {
        auto& ss = entry.second;
        ss.win_rate = ss.total_trades > 0
            ? static_cast<double>(ss.winning_trades) / static_cast<double>(ss.total_trades)
            : 0.0;
        const double gross_loss = symbol_gross_loss[entry.first];
        const double gross_win = ss.total_profit + gross_loss;
        ss.profit_factor = gross_loss > 1e-12 ? gross_win / gross_loss : 0.0;
        result.symbol_summaries.push_back(ss);
    }
    std::sort(result.symbol_summaries.begin(), result.symbol_summaries.end(),
        [](const Result::SymbolSummary& a, const Result::SymbolSummary& b) {
            return a.total_profit > b.total_profit;
        });

    const int closed_trades = static_cast<int>(final_state_.closed_positions.size());
    result.final_balance = final_state_.risk.current_balance;
    result.total_profit = result.final_balance - engine_config_.starting_balance;
    result.max_drawdown = max_drawdown_;
    result.total_trades = closed_trades;
    result.winning_trades = wins;
    result.losing_trades = losses;
    result.win_rate = closed_trades > 0 ? static_cast<double>(wins) / static_cast<double>(closed_trades) : 0.0;
    result.avg_win = wins > 0 ? gross_profit / static_cast<double>(wins) : 0.0;
    result.avg_loss = losses > 0 ? gross_loss_abs / static_cast<double>(losses) : 0.0;
    result.profit_factor = gross_loss_abs > 1e-12 ? gross_profit / gross_loss_abs : 0.0;
    result.expectancy = closed_trades > 0 ? (gross_profit - gross_loss_abs) / static_cast<double>(closed_trades) : 0.0;
    result.open_positions = static_cast<int>(final_state_.open_positions.size());
    result.rejection_counts = rejection_counts_;
    result.entry_funnel = entry_funnel_;
    return result;
}

} // namespace backtest
} // namespace gapswing
