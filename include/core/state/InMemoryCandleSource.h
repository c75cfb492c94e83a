#pragma once

#include <map>
#include <mutex>
#include <set>
#include <utility>

#include "core/contracts/ICandleSource.h"

namespace signalforge {
namespace core {

class InMemoryCandleSource : public ICandleSource {
public:
    InMemoryCandleSource() = default;

    void addCandles(const std::string& symbol, Timeframe timeframe, std::vector<Candle> candles);

    // Subsequent reads for the symbol throw DataAccessError.
    void setFailure(const std::string& symbol, bool failing = true);

    std::vector<Candle> getCandles(const std::string& symbol,
                                   Timeframe timeframe,
                                   Timestamp start,
                                   Timestamp end) const override;

private:
    using SeriesKey = std::pair<std::string, Timeframe>;

    mutable std::mutex mutex_;
    std::map<SeriesKey, std::vector<Candle>> series_;
    std::set<std::string> failing_symbols_;
};

} // namespace core
} // namespace signalforge
