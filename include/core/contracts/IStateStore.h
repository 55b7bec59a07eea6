#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "core/model/EngineState.h"

namespace gapswing {
namespace core {

// Snapshot exists but cannot be read back.
class StateStoreError : public std::runtime_error {
public:
    explicit StateStoreError(const std::string& what) : std::runtime_error(what) {}
};

class IStateStore {
public:
    virtual ~IStateStore() = default;

    // nullopt when no snapshot exists yet. Throws StateStoreError when it is corrupt.
    virtual std::optional<EngineState> load() = 0;
    virtual bool save(const EngineState& state) = 0;
};

} // namespace core
} // namespace gapswing
