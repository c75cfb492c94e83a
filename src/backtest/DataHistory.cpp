#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <iterator>
#include <limits>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace signalforge {
namespace backtest {

namespace {
// Anything below this is taken as epoch seconds
constexpr long long MS_THRESHOLD = 100000000000LL;

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
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
}

void finishCandle(Candle& candle, const std::string& symbol, Timeframe timeframe, bool has_close_time) {
    candle.symbol = symbol;
    candle.timeframe = timeframe;
    candle.open_time = DataHistory::toMsTimestamp(candle.open_time);
    if (has_close_time) {
        candle.close_time = DataHistory::toMsTimestamp(candle.close_time);
    } else {
        candle.close_time = candle.open_time + timeframeDurationMs(timeframe) - 1;
    }
}

template <typename T>
bool readField(const nlohmann::json& item, const char* long_key, const char* short_key, T& out) {
    if (item.contains(long_key)) {
        out = item[long_key].get<T>();
        return true;
    }
    if (item.contains(short_key)) {
        out = item[short_key].get<T>();
        return true;
    }
    return false;
}
}

Timestamp DataHistory::toMsTimestamp(long long ts) {
    if (ts > 0 && ts < MS_THRESHOLD) {
        return ts * 1000LL;
    }
    return ts;
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path,
                                         const std::string& symbol,
                                         Timeframe timeframe) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    std::string line;

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
            Candle candle;
            candle.open_time = std::stoll(row[0]);
            candle.open = std::stod(row[1]);
            candle.high = std::stod(row[2]);
            candle.low = std::stod(row[3]);
            candle.close = std::stod(row[4]);
            candle.volume = std::stod(row[5]);
            if (row.size() > 6 && !row[6].empty()) {
                candle.trade_count = std::stoll(row[6]);
            }
            const bool has_close_time = row.size() > 7 && !row[7].empty();
            if (has_close_time) {
                candle.close_time = std::stoll(row[7]);
            }
            finishCandle(candle, symbol, timeframe, has_close_time);
            candles.push_back(candle);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    LOG_DEBUG("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path,
                                          const std::string& symbol,
                                          Timeframe timeframe) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    nlohmann::json j;
    try {
        file >> j;
        for (const auto& item : j) {
            Candle candle;
            if (!readField(item, "open_time", "t", candle.open_time)) {
                readField(item, "timestamp", "t", candle.open_time);
            }
            readField(item, "open", "o", candle.open);
            readField(item, "high", "h", candle.high);
            readField(item, "low", "l", candle.low);
            readField(item, "close", "c", candle.close);
            readField(item, "volume", "v", candle.volume);
            readField(item, "trade_count", "n", candle.trade_count);
            const bool has_close_time = readField(item, "close_time", "T", candle.close_time);

            finishCandle(candle, symbol, timeframe, has_close_time);
            candles.push_back(candle);
        }
        normalizeSeries(candles);

    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
    }

    LOG_DEBUG("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              Timestamp start,
                                              Timestamp end) {
    std::vector<Candle> out;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(out), [&](const Candle& c) {
        return c.open_time >= start && c.open_time <= end;
    });
    return out;
}

std::vector<Candle> DataHistory::filterByDate(const std::vector<Candle>& candles,
                                              const std::string& start_date,
                                              const std::string& end_date) {
    Timestamp start = std::numeric_limits<Timestamp>::min();
    Timestamp end = std::numeric_limits<Timestamp>::max();

    if (!start_date.empty()) {
        if (auto ts = utils::TimeUtils::parseTimestamp(start_date)) {
            start = *ts;
        } else {
            LOG_WARN("Unparsable start date '{}', range left open", start_date);
        }
    }
    if (!end_date.empty()) {
        if (auto ts = utils::TimeUtils::parseTimestamp(end_date)) {
            end = *ts;
        } else {
            LOG_WARN("Unparsable end date '{}', range left open", end_date);
        }
    }

    return filterByDate(candles, start, end);
}

size_t DataHistory::normalizeSeries(std::vector<Candle>& candles) {
    const size_t before = candles.size();
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.open_time < b.open_time;
    });
    candles.erase(std::unique(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.open_time == b.open_time;
    }), candles.end());
    return before - candles.size();
}

} // namespace backtest
} // namespace signalforge
