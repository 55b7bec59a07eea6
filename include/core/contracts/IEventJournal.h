#pragma once

#include <cstdint>
#include <vector>

#include "core/model/ExecutionTypes.h"

namespace gapswing {
namespace core {

// Append-only audit trail. append() reports failure instead of throwing.
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

std::string journalEventTypeToString(JournalEventType type);
JournalEventType journalEventTypeFromString(const std::string& value);

} // namespace core
} // namespace gapswing
