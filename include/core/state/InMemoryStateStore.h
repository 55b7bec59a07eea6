#pragma once

#include <optional>

#include "core/contracts/IStateStore.h"

namespace gapswing {
namespace core {

// Backtests and tests: keeps the last snapshot in memory.
class InMemoryStateStore : public IStateStore {
public:
    std::optional<EngineState> load() override { return snapshot_; }

    bool save(const EngineState& state) override {
        if (fail_saves_) {
            return false;
        }
        snapshot_ = state;
        save_count_++;
        return true;
    }

    void setFailSaves(bool fail) { fail_saves_ = fail; }
    int saveCount() const { return save_count_; }
    const std::optional<EngineState>& snapshot() const { return snapshot_; }

private:
    std::optional<EngineState> snapshot_;
    bool fail_saves_ = false;
    int save_count_ = 0;
};

} // namespace core
} // namespace gapswing
