#include "core/state/EventJournalJsonl.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace gapswing {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

std::string journalEventTypeToString(JournalEventType type) {
    switch (type) {
        case JournalEventType::GAP_CREATED: return "GAP_CREATED";
        case JournalEventType::GAP_RETIRED: return "GAP_RETIRED";
        case JournalEventType::SIGNAL_CONFIRMED: return "SIGNAL_CONFIRMED";
        case JournalEventType::SIGNAL_REJECTED: return "SIGNAL_REJECTED";
        case JournalEventType::ORDER_FILLED: return "ORDER_FILLED";
        case JournalEventType::ORDER_FAILED: return "ORDER_FAILED";
        case JournalEventType::POSITION_OPENED: return "POSITION_OPENED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::DAILY_RESET: return "DAILY_RESET";
        case JournalEventType::STATE_SAVE_FAILED: return "STATE_SAVE_FAILED";
    }
    return "SIGNAL_REJECTED";
}

JournalEventType journalEventTypeFromString(const std::string& value) {
    if (value == "GAP_CREATED") return JournalEventType::GAP_CREATED;
    if (value == "GAP_RETIRED") return JournalEventType::GAP_RETIRED;
    if (value == "SIGNAL_CONFIRMED") return JournalEventType::SIGNAL_CONFIRMED;
    if (value == "SIGNAL_REJECTED") return JournalEventType::SIGNAL_REJECTED;
    if (value == "ORDER_FILLED") return JournalEventType::ORDER_FILLED;
    if (value == "ORDER_FAILED") return JournalEventType::ORDER_FAILED;
    if (value == "POSITION_OPENED") return JournalEventType::POSITION_OPENED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    if (value == "DAILY_RESET") return JournalEventType::DAILY_RESET;
    if (value == "STATE_SAVE_FAILED") return JournalEventType::STATE_SAVE_FAILED;
    return JournalEventType::SIGNAL_REJECTED;
}

EventJournalJsonl::EventJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception&) {
            // A torn last line from a crash; keep scanning.
            continue;
        }
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = journalEventTypeToString(event.type);
    line["symbol"] = event.symbol;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload.is_null() ? nlohmann::json::object() : event.payload;

    out << line.dump() << "\n";
    out.flush();
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = journalEventTypeFromString(line.value("type", std::string("SIGNAL_REJECTED")));
        event.symbol = line.value("symbol", std::string());
        event.entity_id = line.value("entity_id", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace gapswing
