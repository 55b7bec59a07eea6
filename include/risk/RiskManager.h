#pragma once

#include "common/Types.h"
#include "core/model/EngineState.h"
#include "core/model/ExecutionTypes.h"
#include "risk/Position.h"
#include "risk/RiskConfig.h"
#include "strategy/Signal.h"
#include <functional>
#include <optional>
#include <string>

namespace gapswing {
namespace risk {

struct SizingDecision {
    bool approved = false;
    strategy::RejectReason reason = strategy::RejectReason::NONE;
    double size = 0.0;
    double notional = 0.0;
    double risk_amount = 0.0;
    SymbolMeta meta;
    std::string detail;
};

struct ExitCheck {
    bool triggered = false;
    ExitReason reason = ExitReason::NONE;
    double exit_price = 0.0;
};

// Executes an exit on the venue. Returns the fill price, or nullopt when the
// close did not go through and the position must stay open.
using ExitExecutor = std::function<std::optional<double>(const Position&, const ExitCheck&)>;

// Risk & position manager. Holds only configuration: every call works on the
// EngineState passed in, so the caller decides when to persist.
class RiskManager {
public:
    explicit RiskManager(const RiskConfig& config);

    // ===== Trading day =====

    static long long utcDayIndex(long long ms);
    static bool isNewTradingDay(long long last_reset_time, long long now_ms);

    // Anchors a fresh state at `balance`.
    void initializeDay(RiskState& risk, double balance, long long now_ms) const;
    // Re-anchors the baseline and clears the guard on a new UTC day. Returns true on reset.
    bool refreshTradingDay(RiskState& risk, long long now_ms) const;
    void syncBalance(RiskState& risk, double balance) const;

    bool isDailyLossBreached(const RiskState& risk) const;
    // Latches the guard once breached. Returns true on the transition.
    bool updateDailyLossGuard(RiskState& risk) const;

    // ===== Entry =====

    SymbolMeta resolveMeta(const std::optional<SymbolMeta>& meta) const;

    // Caps first (position, portfolio, daily loss), then risk-based size
    // floored to the step, then exchange minimums.
    SizingDecision size(const strategy::Signal& signal,
                        const RiskState& risk,
                        const std::optional<SymbolMeta>& meta) const;

    Position& open(core::EngineState& state, const strategy::Signal& signal, const core::Fill& fill) const;

    // ===== Exit =====

    ExitCheck checkExit(const Position& position, double price) const;
    // Whole bar range. A bar through both levels counts as a stop-loss.
    ExitCheck checkExitBar(const Position& position, const Candle& bar) const;

    // Moves the stop to entry once `favorable_price` is breakeven_at_r R in profit.
    bool applyBreakeven(Position& position, double favorable_price) const;

    std::optional<Position> manage(core::EngineState& state, const std::string& symbol,
                                   double latest_price, long long now_ms,
                                   const ExitExecutor& execute) const;
    std::optional<Position> manageBar(core::EngineState& state, const std::string& symbol,
                                      const Candle& bar, long long bar_close_time,
                                      const ExitExecutor& execute) const;
    std::optional<Position> forceClose(core::EngineState& state, const std::string& symbol,
                                       double price, ExitReason reason, long long now_ms,
                                       const ExitExecutor& execute) const;

    // Archives the open position for `symbol`. Throws std::out_of_range when there is none.
    Position close(core::EngineState& state, const std::string& symbol,
                   double exit_price, ExitReason reason, long long closed_at) const;

    const RiskConfig& config() const { return config_; }

private:
    std::optional<Position> executeExit(core::EngineState& state, const std::string& symbol,
                                        const ExitCheck& check, long long now_ms,
                                        const ExitExecutor& execute) const;

    RiskConfig config_;
};

} // namespace risk
} // namespace gapswing
