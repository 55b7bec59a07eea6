#include "strategy/SignalEvaluator.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace gapswing {
namespace strategy {

std::string rejectReasonToString(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "none";
        case RejectReason::POSITION_OPEN: return "position_open";
        case RejectReason::MACD_DISAGREEMENT: return "macd_disagreement";
        case RejectReason::ALREADY_FILLED: return "already_filled";
        case RejectReason::INVALID_STOP: return "invalid_stop";
        case RejectReason::NO_RECENT_CROSSOVER: return "no_recent_crossover";
        case RejectReason::SIGNAL_SUPERSEDED: return "signal_superseded";
        case RejectReason::BELOW_MIN_SIZE: return "below_min_size";
        case RejectReason::PORTFOLIO_CAP: return "portfolio_cap";
        case RejectReason::DAILY_LOSS_GUARD: return "daily_loss_guard";
        case RejectReason::EXECUTION_FAILED: return "execution_failed";
    }
    return "none";
}

std::string macdStateToString(MacdState state) {
    switch (state) {
        case MacdState::CONFIRMED: return "confirmed";
        case MacdState::PENDING: return "pending";
        case MacdState::REJECTED: return "rejected";
    }
    return "pending";
}

SignalEvaluator::SignalEvaluator(const FvgStrategyConfig& config)
    : config_(config)
{
}

bool SignalEvaluator::touchesMidpoint(const analytics::FairValueGap& gap, const Candle& candle) {
    return gap.touchedBy(candle);
}

bool SignalEvaluator::macdAgrees(Direction direction, const analytics::TechnicalIndicators::MACDResult& macd) {
    if (!macd.valid) {
        return false;
    }
    return direction == Direction::BULLISH ? macd.histogram > 0.0 : macd.histogram < 0.0;
}

bool SignalEvaluator::hasRecentCrossover(Direction direction, const std::vector<double>& histogram, int lookback) {
    if (lookback <= 0 || histogram.size() < static_cast<size_t>(lookback) + 1) {
        return true;
    }

    const size_t begin = histogram.size() - static_cast<size_t>(lookback) - 1;
    for (size_t i = begin + 1; i < histogram.size(); ++i) {
        const double prev = histogram[i - 1];
        const double curr = histogram[i];
        if (direction == Direction::BULLISH && prev <= 0.0 && curr > 0.0) {
            return true;
        }
        if (direction == Direction::BEARISH && prev >= 0.0 && curr < 0.0) {
            return true;
        }
    }
    return false;
}

double SignalEvaluator::stopFor(const analytics::FairValueGap& gap) const {
    if (gap.direction == Direction::BULLISH) {
        return gap.bottom * (1.0 - config_.stop_buffer_pct);
    }
    return gap.top * (1.0 + config_.stop_buffer_pct);
}

double SignalEvaluator::takeProfitFor(Direction direction, double entry, double stop) const {
    const double risk = std::fabs(entry - stop);
    return entry + directionSign(direction) * config_.reward_risk * risk;
}

Evaluation SignalEvaluator::evaluate(const std::string& symbol,
                                     std::vector<analytics::FairValueGap>& active_gaps,
                                     const Candle& latest,
                                     const analytics::TechnicalIndicators::MACDResult& macd,
                                     bool has_open_position,
                                     const std::vector<double>& histogram) const {
    Evaluation result;

    // Newest first.
    std::vector<size_t> order(active_gaps.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return active_gaps[a].created_at > active_gaps[b].created_at;
    });

    for (size_t idx : order) {
        auto& gap = active_gaps[idx];
        if (!touchesMidpoint(gap, latest)) {
            continue;
        }

        const double entry = latest.close;
        const double stop = stopFor(gap);
        const double tp = takeProfitFor(gap.direction, entry, stop);
        const bool stop_valid = gap.direction == Direction::BULLISH ? stop < entry : stop > entry;

        RejectReason reason = RejectReason::NONE;
        if (has_open_position) {
            reason = RejectReason::POSITION_OPEN;
        } else if (!macdAgrees(gap.direction, macd)) {
            reason = RejectReason::MACD_DISAGREEMENT;
        } else if (gap.fill_count > 0) {
            reason = RejectReason::ALREADY_FILLED;
        } else if (!stop_valid) {
            reason = RejectReason::INVALID_STOP;
        } else if (config_.require_recent_crossover &&
                   !hasRecentCrossover(gap.direction, histogram, config_.crossover_lookback)) {
            reason = RejectReason::NO_RECENT_CROSSOVER;
        } else if (result.signal) {
            reason = RejectReason::SIGNAL_SUPERSEDED;
        }

        // The touch consumes the gap exactly once.
        if (gap.fill_count == 0) {
            gap.fill_count = 1;
            gap.status = analytics::GapStatus::FILLED;
            gap.last_touch_time = latest.open_time;
            result.gaps_consumed += 1;
        }

        if (reason == RejectReason::NONE) {
            Signal signal;
            signal.symbol = symbol;
            signal.direction = gap.direction;
            signal.entry_price = entry;
            signal.stop_loss = stop;
            signal.take_profit = tp;
            signal.gap_ref = gap.id;
            signal.macd_state = MacdState::CONFIRMED;
            signal.macd = macd.macd;
            signal.macd_signal = macd.signal;
            signal.histogram = macd.histogram;
            signal.timestamp = latest.open_time;
            result.signal = signal;
            LOG_INFO("{} {} gap {} confirmed: entry {:.8f} stop {:.8f} tp {:.8f} hist {:.8f}",
                     symbol, directionToString(gap.direction), gap.id, entry, stop, tp, macd.histogram);
            continue;
        }

        SignalRejection rejection;
        rejection.symbol = symbol;
        rejection.gap_ref = gap.id;
        rejection.direction = gap.direction;
        rejection.reason = reason;
        rejection.reference_price = gap.midpoint();
        rejection.timestamp = latest.open_time;
        result.rejections.push_back(rejection);
    }

    return result;
}

} // namespace strategy
} // namespace gapswing
