#pragma once

#include <filesystem>

#include "core/contracts/ICandleSource.h"

namespace signalforge {
namespace core {

// Reads <data_dir>/<SYMBOL>_<timeframe>.csv, e.g. BTCUSDT_5m.csv
class CsvCandleSource : public ICandleSource {
public:
    explicit CsvCandleSource(std::filesystem::path data_dir);

    std::vector<Candle> getCandles(const std::string& symbol,
                                   Timeframe timeframe,
                                   Timestamp start,
                                   Timestamp end) const override;

    std::filesystem::path seriesPath(const std::string& symbol, Timeframe timeframe) const;

private:
    std::filesystem::path data_dir_;
};

} // namespace core
} // namespace signalforge
