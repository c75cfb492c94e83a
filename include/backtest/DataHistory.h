#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace signalforge {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: open_time,open,high,low,close,volume[,trade_count[,close_time]]
    // Header and malformed rows are skipped. Second-resolution timestamps
    // are converted to milliseconds.
    static std::vector<Candle> loadCSV(const std::string& file_path,
                                       const std::string& symbol = "",
                                       Timeframe timeframe = Timeframe::M5);

    // Load candles from a JSON array (long or single-letter keys)
    static std::vector<Candle> loadJSON(const std::string& file_path,
                                        const std::string& symbol = "",
                                        Timeframe timeframe = Timeframe::M5);

    // Filter candles by open_time range (inclusive)
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            Timestamp start,
                                            Timestamp end);

    // Dates as accepted by TimeUtils::parseTimestamp. Empty or unparsable
    // bounds are left open.
    static std::vector<Candle> filterByDate(const std::vector<Candle>& candles,
                                            const std::string& start_date,
                                            const std::string& end_date);

    // Sort ascending by open_time and drop duplicate open times.
    // Returns the number of rows removed.
    static size_t normalizeSeries(std::vector<Candle>& candles);

    static Timestamp toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace signalforge
