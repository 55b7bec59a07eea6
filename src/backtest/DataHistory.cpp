#include "backtest/DataHistory.h"
#include "analytics/CandleSeries.h"
#include "common/Logger.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace gapswing {
namespace backtest {

long long DataHistory::toMsTimestamp(long long ts) {
    return ts < 100000000000LL ? ts * 1000LL : ts;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        // Accept quoted CSV cells.
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    int bad_rows = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row.
            continue;
        }

        try {
            candles.emplace_back(std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                                 std::stod(row[4]), std::stod(row[5]),
                                 toMsTimestamp(std::stoll(row[0])));
        } catch (const std::exception& e) {
            bad_rows++;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {}{}", candles.size(), file_path,
             bad_rows > 0 ? " (" + std::to_string(bad_rows) + " rows skipped)" : std::string());
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        candles = analytics::CandleSeries::klinesToCandles(j);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
    } catch (const std::logic_error& e) {
        // Non-numeric price string in a kline row.
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

} // namespace backtest
} // namespace gapswing
