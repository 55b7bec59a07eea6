#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IStateStore.h"

namespace gapswing {
namespace core {

// Whole-state JSON snapshot, replaced atomically (write <file>.tmp, rename).
class StateStoreJson : public IStateStore {
public:
    explicit StateStoreJson(std::filesystem::path file_path);

    std::optional<EngineState> load() override;
    bool save(const EngineState& state) override;

    static nlohmann::json toJson(const EngineState& state);
    // Throws StateStoreError on missing fields or unknown enum values.
    static EngineState fromJson(const nlohmann::json& raw);

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace gapswing
