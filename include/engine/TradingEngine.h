#pragma once

#include "common/Types.h"
#include "analytics/CandleSeries.h"
#include "analytics/FvgDetector.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionProvider.h"
#include "core/contracts/IStateStore.h"
#include "core/model/EngineState.h"
#include "engine/EngineConfig.h"
#include "risk/RiskManager.h"
#include "strategy/SignalEvaluator.h"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gapswing {
namespace engine {

// What one tick did. Backtests aggregate these into their funnel.
struct TickReport {
    long long started_at = 0;
    bool daily_reset = false;
    bool aborted = false;
    int symbols_scanned = 0;
    int symbols_skipped = 0;
    int gaps_created = 0;
    int gaps_retired = 0;
    int signals_confirmed = 0;
    int positions_opened = 0;
    std::vector<risk::Position> closed_positions;
    std::map<strategy::RejectReason, int> rejections;

    int rejectionCount() const {
        int total = 0;
        for (const auto& entry : rejections) {
            total += entry.second;
        }
        return total;
    }
};

// Trading Engine: one tick per closed bar. Open positions are managed
// before any symbol is scanned for new entries. All trading state lives in a
// single EngineState snapshot that is saved after every mutation.
class TradingEngine {
public:
    TradingEngine(const EngineConfig& config,
                  std::shared_ptr<core::IExecutionProvider> provider,
                  std::shared_ptr<core::IStateStore> store,
                  std::shared_ptr<core::IEventJournal> journal);

    ~TradingEngine();

    // ===== Startup =====

    // Restores the last snapshot or seeds a fresh one and writes it.
    // Throws core::StateStoreError when the snapshot is unreadable or cannot be written.
    void initialize();

    // ===== Engine control =====

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // Main loop (blocking): tick, then sleep until the next bar close plus the settle buffer.
    void run();

    // One full manage + scan pass. `should_abort` is polled between symbols.
    TickReport runTick(const std::function<bool()>& should_abort = {});

    // ===== State =====

    core::EngineState state() const;
    bool isDirty() const { return dirty_; }

    // Manual exit at the current ticker.
    std::optional<risk::Position> forceClosePosition(const std::string& symbol,
                                                     risk::ExitReason reason = risk::ExitReason::MANUAL);

private:
    // ===== Tick phases =====

    void managePositions(TickReport& report, const std::function<bool()>& should_abort);
    void manageSymbol(const std::string& symbol, TickReport& report);
    void scanSymbol(const std::string& symbol, TickReport& report);
    void executeSignal(const strategy::Signal& signal, TickReport& report);

    // ===== Helpers =====

    // Closed bars for `symbol`, fetched once per tick. Throws core::DataUnavailableError.
    const analytics::CandleSeries& closedCandles(const std::string& symbol);
    risk::ExitExecutor exitExecutor();
    void recordClose(const risk::Position& position, TickReport& report);
    void recordRejection(const strategy::SignalRejection& rejection, const std::string& detail,
                         TickReport& report);
    void journal(core::JournalEventType type, const std::string& symbol,
                 const std::string& entity_id, nlohmann::json payload);
    bool persist();
    void logSummary() const;

    // ===== Members =====

    EngineConfig config_;
    long long timeframe_ms_;

    std::shared_ptr<core::IExecutionProvider> provider_;
    std::shared_ptr<core::IStateStore> store_;
    std::shared_ptr<core::IEventJournal> journal_;

    analytics::FvgDetector detector_;
    strategy::SignalEvaluator evaluator_;
    risk::RiskManager risk_manager_;

    core::EngineState state_;
    std::map<std::string, analytics::CandleSeries> tick_candles_;
    bool dirty_;

    // Thread control
    std::atomic<bool> running_;
    std::unique_ptr<std::thread> worker_thread_;
    mutable std::mutex mutex_;

    // Stats
    long long start_time_;
    int total_ticks_;
};

} // namespace engine
} // namespace gapswing
