#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "common/Types.h"

namespace signalforge {
namespace core {

// Upstream data failure (missing file, broken store, network error).
class DataAccessError : public std::runtime_error {
public:
    explicit DataAccessError(const std::string& what) : std::runtime_error(what) {}
};

class ICandleSource {
public:
    virtual ~ICandleSource() = default;

    // Candles with start <= open_time <= end, ascending by open_time.
    // Throws DataAccessError when the data cannot be read.
    virtual std::vector<Candle> getCandles(const std::string& symbol,
                                           Timeframe timeframe,
                                           Timestamp start,
                                           Timestamp end) const = 0;
};

} // namespace core
} // namespace signalforge
