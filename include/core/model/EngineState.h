#pragma once

#include <map>
#include <string>
#include <vector>

#include "analytics/FvgDetector.h"
#include "risk/Position.h"

namespace gapswing {
namespace core {

// Everything that survives a restart. Candles are never part of it.
struct EngineState {
    static constexpr int kSchemaVersion = 1;

    int schema_version = kSchemaVersion;
    long long saved_at_ms = 0;

    std::map<std::string, analytics::SymbolGapBook> gap_books;
    std::map<std::string, risk::Position> open_positions;   // at most one per symbol
    std::vector<risk::Position> closed_positions;           // newest last, bounded
    risk::RiskState risk;

    bool hasOpenPosition(const std::string& symbol) const {
        return open_positions.find(symbol) != open_positions.end();
    }
};

} // namespace core
} // namespace gapswing
