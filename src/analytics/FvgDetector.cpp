#include "analytics/FvgDetector.h"
#include "common/Logger.h"
#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace gapswing {
namespace analytics {

std::string gapStatusToString(GapStatus status) {
    switch (status) {
        case GapStatus::ACTIVE: return "active";
        case GapStatus::FILLED: return "filled";
        case GapStatus::EXPIRED: return "expired";
        case GapStatus::EVICTED: return "evicted";
    }
    return "active";
}

GapStatus gapStatusFromString(const std::string& value) {
    if (value == "active") return GapStatus::ACTIVE;
    if (value == "filled") return GapStatus::FILLED;
    if (value == "expired") return GapStatus::EXPIRED;
    if (value == "evicted") return GapStatus::EVICTED;
    throw std::invalid_argument("unknown gap status: " + value);
}

FvgDetector::FvgDetector(int max_active, int max_age_bars, int retired_history)
    : max_active_(std::max(1, max_active))
    , max_age_bars_(std::max(1, max_age_bars))
    , retired_history_(std::max(0, retired_history))
{
}

std::optional<FairValueGap> FvgDetector::detectAt(const std::string& symbol, const CandleSeries& series, size_t i) {
    if (i < 2 || i >= series.size()) {
        return std::nullopt;
    }

    const Candle& first = series.at(i - 2);
    const Candle& third = series.at(i);

    FairValueGap gap;
    gap.symbol = symbol;
    gap.created_at = third.open_time;

    if (first.high < third.low) {
        gap.direction = Direction::BULLISH;
        gap.top = third.low;
        gap.bottom = first.high;
    } else if (first.low > third.high) {
        gap.direction = Direction::BEARISH;
        gap.top = first.low;
        gap.bottom = third.high;
    } else {
        return std::nullopt;
    }

    gap.id = symbol + "-" + std::to_string(gap.created_at) + "-" + directionToString(gap.direction);
    return gap;
}

void FvgDetector::retire(SymbolGapBook& book, FairValueGap gap, GapStatus status,
                         long long bar_time, GapUpdate& update) const {
    gap.status = status;
    gap.retired_at = bar_time;
    update.retired.push_back(gap);

    book.retired.push_back(std::move(gap));
    if (book.retired.size() > static_cast<size_t>(retired_history_)) {
        book.retired.erase(book.retired.begin(),
                           book.retired.begin() + static_cast<std::ptrdiff_t>(book.retired.size() - retired_history_));
    }
}

GapUpdate FvgDetector::update(const std::string& symbol, SymbolGapBook& book, const CandleSeries& series) const {
    GapUpdate result;
    if (series.empty()) {
        return result;
    }

    size_t start = series.firstAfter(book.last_bar_time);
    if (start >= series.size()) {
        return result;
    }

    // Bars older than the age window cannot leave an active gap behind.
    // Skip them but keep the counter in step so existing gaps age correctly.
    const size_t window = static_cast<size_t>(max_age_bars_) + 2;
    const size_t pending = series.size() - start;
    if (pending > window) {
        const size_t skipped = pending - window;
        book.bar_counter += static_cast<long long>(skipped);
        start += skipped;
        LOG_DEBUG("{} detector skipped {} stale bars", symbol, skipped);
    }

    for (size_t i = start; i < series.size(); ++i) {
        const Candle& bar = series.at(i);
        book.bar_counter += 1;

        // 1. Retire gaps consumed on an earlier bar, then gaps past their age.
        std::vector<FairValueGap> still_active;
        still_active.reserve(book.active.size());
        for (auto& gap : book.active) {
            if (gap.fill_count > 0 && gap.last_touch_time < bar.open_time) {
                retire(book, gap, GapStatus::FILLED, bar.open_time, result);
            } else if (book.bar_counter - gap.created_index > max_age_bars_) {
                retire(book, gap, GapStatus::EXPIRED, bar.open_time, result);
            } else {
                still_active.push_back(gap);
            }
        }
        book.active = std::move(still_active);

        // 2. Newest window.
        if (auto gap = detectAt(symbol, series, i)) {
            gap->created_index = book.bar_counter;
            result.created.push_back(*gap);
            book.active.push_back(*gap);
        }

        // 3. Overflow: the oldest gap goes first, whatever its status.
        while (book.active.size() > static_cast<size_t>(max_active_)) {
            auto oldest = std::min_element(book.active.begin(), book.active.end(),
                                           [](const FairValueGap& a, const FairValueGap& b) {
                                               return a.created_at < b.created_at;
                                           });
            FairValueGap evicted = *oldest;
            book.active.erase(oldest);
            retire(book, std::move(evicted), GapStatus::EVICTED, bar.open_time, result);
        }

        // 4. Only the newest bar is left to the signal evaluator. A midpoint
        // crossed on an earlier bar consumes the gap here, and the next bar
        // retires it as filled.
        if (i + 1 < series.size()) {
            for (auto& gap : book.active) {
                if (gap.fill_count == 0 && gap.touchedBy(bar)) {
                    gap.fill_count = 1;
                    gap.status = GapStatus::FILLED;
                    gap.last_touch_time = bar.open_time;
                    result.touched_unevaluated += 1;
                    LOG_DEBUG("{} gap {} traded through on bar {} without evaluation", symbol, gap.id, bar.open_time);
                }
            }
        }

        book.last_bar_time = bar.open_time;
        result.bars_processed += 1;
    }

    return result;
}

} // namespace analytics
} // namespace gapswing
