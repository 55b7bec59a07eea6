#include "core/state/StateStoreJson.h"

#include <fstream>
#include <system_error>

namespace gapswing {
namespace core {

namespace {
nlohmann::json gapToJson(const analytics::FairValueGap& gap) {
    nlohmann::json j;
    j["id"] = gap.id;
    j["symbol"] = gap.symbol;
    j["direction"] = directionToString(gap.direction);
    j["top"] = gap.top;
    j["bottom"] = gap.bottom;
    j["created_at"] = gap.created_at;
    j["created_index"] = gap.created_index;
    j["status"] = analytics::gapStatusToString(gap.status);
    j["fill_count"] = gap.fill_count;
    j["last_touch_time"] = gap.last_touch_time;
    j["retired_at"] = gap.retired_at;
    return j;
}

analytics::FairValueGap gapFromJson(const nlohmann::json& j) {
    analytics::FairValueGap gap;
    gap.id = j.at("id").get<std::string>();
    gap.symbol = j.at("symbol").get<std::string>();
    gap.direction = directionFromString(j.at("direction").get<std::string>());
    gap.top = j.at("top").get<double>();
    gap.bottom = j.at("bottom").get<double>();
    gap.created_at = j.at("created_at").get<long long>();
    gap.created_index = j.at("created_index").get<long long>();
    gap.status = analytics::gapStatusFromString(j.at("status").get<std::string>());
    gap.fill_count = j.at("fill_count").get<int>();
    gap.last_touch_time = j.value("last_touch_time", 0LL);
    gap.retired_at = j.value("retired_at", 0LL);
    return gap;
}

nlohmann::json positionToJson(const risk::Position& p) {
    nlohmann::json j;
    j["id"] = p.id;
    j["symbol"] = p.symbol;
    j["direction"] = directionToString(p.direction);
    j["entry_price"] = p.entry_price;
    j["size"] = p.size;
    j["stop_loss"] = p.stop_loss;
    j["take_profit"] = p.take_profit;
    j["initial_stop_loss"] = p.initial_stop_loss;
    j["opened_at"] = p.opened_at;
    j["status"] = risk::positionStatusToString(p.status);
    j["exit_price"] = p.exit_price;
    j["exit_reason"] = risk::exitReasonToString(p.exit_reason);
    j["closed_at"] = p.closed_at;
    j["realized_pnl"] = p.realized_pnl;
    j["gap_ref"] = p.gap_ref;
    j["order_ref"] = p.order_ref;
    j["last_checked_bar"] = p.last_checked_bar;
    return j;
}

risk::Position positionFromJson(const nlohmann::json& j) {
    risk::Position p;
    p.id = j.at("id").get<std::string>();
    p.symbol = j.at("symbol").get<std::string>();
    p.direction = directionFromString(j.at("direction").get<std::string>());
    p.entry_price = j.at("entry_price").get<double>();
    p.size = j.at("size").get<double>();
    p.stop_loss = j.at("stop_loss").get<double>();
    p.take_profit = j.at("take_profit").get<double>();
    p.initial_stop_loss = j.value("initial_stop_loss", p.stop_loss);
    p.opened_at = j.at("opened_at").get<long long>();
    p.status = risk::positionStatusFromString(j.at("status").get<std::string>());
    p.exit_price = j.value("exit_price", 0.0);
    p.exit_reason = risk::exitReasonFromString(j.value("exit_reason", std::string("none")));
    p.closed_at = j.value("closed_at", 0LL);
    p.realized_pnl = j.value("realized_pnl", 0.0);
    p.gap_ref = j.value("gap_ref", std::string());
    p.order_ref = j.value("order_ref", std::string());
    p.last_checked_bar = j.value("last_checked_bar", 0LL);
    return p;
}

nlohmann::json bookToJson(const analytics::SymbolGapBook& book) {
    nlohmann::json j;
    j["last_bar_time"] = book.last_bar_time;
    j["bar_counter"] = book.bar_counter;
    j["last_evaluated_bar_time"] = book.last_evaluated_bar_time;
    j["active"] = nlohmann::json::array();
    for (const auto& gap : book.active) {
        j["active"].push_back(gapToJson(gap));
    }
    j["retired"] = nlohmann::json::array();
    for (const auto& gap : book.retired) {
        j["retired"].push_back(gapToJson(gap));
    }
    return j;
}

analytics::SymbolGapBook bookFromJson(const nlohmann::json& j) {
    analytics::SymbolGapBook book;
    book.last_bar_time = j.at("last_bar_time").get<long long>();
    book.bar_counter = j.at("bar_counter").get<long long>();
    book.last_evaluated_bar_time = j.value("last_evaluated_bar_time", 0LL);
    for (const auto& gap : j.at("active")) {
        book.active.push_back(gapFromJson(gap));
    }
    for (const auto& gap : j.value("retired", nlohmann::json::array())) {
        book.retired.push_back(gapFromJson(gap));
    }
    return book;
}
}

StateStoreJson::StateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

nlohmann::json StateStoreJson::toJson(const EngineState& state) {
    nlohmann::json raw;
    raw["schema_version"] = state.schema_version;
    raw["saved_at_ms"] = state.saved_at_ms;

    nlohmann::json risk;
    risk["day_start_balance"] = state.risk.day_start_balance;
    risk["current_balance"] = state.risk.current_balance;
    risk["last_reset_time"] = state.risk.last_reset_time;
    risk["daily_loss_guard_triggered"] = state.risk.daily_loss_guard_triggered;
    risk["portfolio_position_count"] = state.risk.portfolio_position_count;
    risk["per_symbol_position_flag"] = state.risk.per_symbol_position_flag;
    raw["risk"] = risk;

    raw["gap_books"] = nlohmann::json::object();
    for (const auto& [symbol, book] : state.gap_books) {
        raw["gap_books"][symbol] = bookToJson(book);
    }

    raw["open_positions"] = nlohmann::json::object();
    for (const auto& [symbol, position] : state.open_positions) {
        raw["open_positions"][symbol] = positionToJson(position);
    }

    raw["closed_positions"] = nlohmann::json::array();
    for (const auto& position : state.closed_positions) {
        raw["closed_positions"].push_back(positionToJson(position));
    }
    return raw;
}

EngineState StateStoreJson::fromJson(const nlohmann::json& raw) {
    try {
        if (!raw.is_object()) {
            throw StateStoreError("state snapshot is not a JSON object");
        }

        EngineState state;
        state.schema_version = raw.at("schema_version").get<int>();
        if (state.schema_version > EngineState::kSchemaVersion) {
            throw StateStoreError("unsupported state schema_version " + std::to_string(state.schema_version));
        }
        state.saved_at_ms = raw.value("saved_at_ms", 0LL);

        const auto& risk = raw.at("risk");
        state.risk.day_start_balance = risk.at("day_start_balance").get<double>();
        state.risk.current_balance = risk.at("current_balance").get<double>();
        state.risk.last_reset_time = risk.at("last_reset_time").get<long long>();
        state.risk.daily_loss_guard_triggered = risk.value("daily_loss_guard_triggered", false);
        state.risk.portfolio_position_count = risk.value("portfolio_position_count", 0);
        state.risk.per_symbol_position_flag =
            risk.value("per_symbol_position_flag", std::map<std::string, bool>());

        for (const auto& item : raw.at("gap_books").items()) {
            state.gap_books[item.key()] = bookFromJson(item.value());
        }
        for (const auto& item : raw.at("open_positions").items()) {
            state.open_positions[item.key()] = positionFromJson(item.value());
        }
        for (const auto& position : raw.at("closed_positions")) {
            state.closed_positions.push_back(positionFromJson(position));
        }
        return state;
    } catch (const nlohmann::json::exception& e) {
        throw StateStoreError(std::string("corrupt state snapshot: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw StateStoreError(std::string("corrupt state snapshot: ") + e.what());
    }
}

std::optional<EngineState> StateStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        throw StateStoreError("cannot open state file " + file_path_.string());
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        throw StateStoreError("state file " + file_path_.string() + " is not valid JSON: " + e.what());
    }
    return fromJson(raw);
}

bool StateStoreJson::save(const EngineState& state) {
    const nlohmann::json raw = toJson(state);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        out.flush();
        if (!out) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Some filesystems refuse to rename over an existing file; fall back to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace gapswing
