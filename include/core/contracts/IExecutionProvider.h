#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/ExecutionTypes.h"

namespace gapswing {
namespace core {

// Market data could not be obtained after retries. The engine skips the
// symbol for the current tick.
class DataUnavailableError : public std::runtime_error {
public:
    explicit DataUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

// The one seam between the engine and a venue (exchange, simulator, replay).
class IExecutionProvider {
public:
    virtual ~IExecutionProvider() = default;

    virtual std::string name() const = 0;

    // Wall clock for live venues, replay cursor for backtests (ms, UTC).
    virtual long long currentTimeMs() const = 0;

    // Oldest first. May include the still-forming bar. Throws DataUnavailableError.
    virtual std::vector<Candle> getCandles(const std::string& symbol, const std::string& timeframe, int limit) = 0;
    // Throws DataUnavailableError.
    virtual double getTicker(const std::string& symbol) = 0;

    // nullopt when nothing executed.
    virtual std::optional<Fill> placeOrder(const ExecutionRequest& request) = 0;
    // Flattens the position and cancels its protective orders. nullopt when the close failed.
    virtual std::optional<Fill> closePosition(const std::string& symbol, Direction direction,
                                              double size, double reference_price) = 0;

    virtual std::optional<SymbolMeta> symbolMeta(const std::string& symbol) = 0;
    // Only venues with a real account report a balance.
    virtual std::optional<double> fetchBalance() = 0;
};

} // namespace core
} // namespace gapswing
