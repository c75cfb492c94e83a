#include "core/state/CsvCandleSource.h"
#include "backtest/DataHistory.h"

namespace signalforge {
namespace core {

CsvCandleSource::CsvCandleSource(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {
}

std::filesystem::path CsvCandleSource::seriesPath(const std::string& symbol, Timeframe timeframe) const {
    return data_dir_ / (symbol + "_" + timeframeToString(timeframe) + ".csv");
}

std::vector<Candle> CsvCandleSource::getCandles(const std::string& symbol,
                                                Timeframe timeframe,
                                                Timestamp start,
                                                Timestamp end) const {
    const auto path = seriesPath(symbol, timeframe);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw DataAccessError("candle file not found: " + path.string());
    }

    auto candles = backtest::DataHistory::loadCSV(path.string(), symbol, timeframe);
    return backtest::DataHistory::filterByDate(candles, start, end);
}

} // namespace core
} // namespace signalforge
