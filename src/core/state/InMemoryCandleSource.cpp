#include "core/state/InMemoryCandleSource.h"

#include <algorithm>

namespace signalforge {
namespace core {

void InMemoryCandleSource::addCandles(const std::string& symbol, Timeframe timeframe, std::vector<Candle> candles) {
    for (auto& candle : candles) {
        candle.symbol = symbol;
        candle.timeframe = timeframe;
    }
    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.open_time < b.open_time;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    series_[SeriesKey(symbol, timeframe)] = std::move(candles);
}

void InMemoryCandleSource::setFailure(const std::string& symbol, bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing) {
        failing_symbols_.insert(symbol);
    } else {
        failing_symbols_.erase(symbol);
    }
}

std::vector<Candle> InMemoryCandleSource::getCandles(const std::string& symbol,
                                                     Timeframe timeframe,
                                                     Timestamp start,
                                                     Timestamp end) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_symbols_.count(symbol) > 0) {
        throw DataAccessError("candle source unavailable for " + symbol);
    }

    std::vector<Candle> out;
    auto it = series_.find(SeriesKey(symbol, timeframe));
    if (it == series_.end()) {
        return out;
    }

    for (const auto& candle : it->second) {
        if (candle.open_time >= start && candle.open_time <= end) {
            out.push_back(candle);
        }
    }
    return out;
}

} // namespace core
} // namespace signalforge
