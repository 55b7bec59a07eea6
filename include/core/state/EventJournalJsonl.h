#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IEventJournal.h"

namespace gapswing {
namespace core {

// One JSON object per line: {seq, ts_ms, type, symbol, entity_id, payload}.
// Sequence numbers continue from the highest one already in the file.
class EventJournalJsonl : public IEventJournal {
public:
    explicit EventJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace gapswing
