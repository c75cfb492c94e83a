#include "engine/SignalService.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace signalforge {
namespace engine {

namespace {
void keepTail(std::vector<Candle>& candles, size_t max_bars) {
    if (candles.size() > max_bars) {
        candles.erase(candles.begin(), candles.end() - static_cast<std::ptrdiff_t>(max_bars));
    }
}
}

SignalService::SignalService(std::shared_ptr<const strategy::StrategyManager> strategy_manager,
                             std::shared_ptr<const core::ICandleSource> candle_source,
                             std::shared_ptr<const core::IPositionStore> position_store,
                             const SignalServiceConfig& config)
    : strategy_manager_(std::move(strategy_manager))
    , candle_source_(std::move(candle_source))
    , position_store_(std::move(position_store))
    , config_(config)
{
    if (!strategy_manager_ || !candle_source_ || !position_store_) {
        throw std::invalid_argument("SignalService requires a strategy manager, candle source and position store");
    }
    config_.m5_bars = std::max(1, config_.m5_bars);
    config_.higher_tf_bars = std::max(1, config_.higher_tf_bars);
}

MultiTimeframeCandles SignalService::fetchWindows(const std::string& symbol, Timestamp now) const {
    MultiTimeframeCandles candles;
    for (Timeframe tf : allTimeframes()) {
        const int bars = (tf == Timeframe::M5) ? config_.m5_bars : config_.higher_tf_bars;
        const Timestamp start = now - static_cast<Timestamp>(bars) * timeframeDurationMs(tf);

        auto& series = candles.get(tf);
        series = candle_source_->getCandles(symbol, tf, start, now);
        backtest::DataHistory::normalizeSeries(series);
        keepTail(series, static_cast<size_t>(bars));
    }
    return candles;
}

strategy::StrategyResult SignalService::evaluate(const std::string& symbol, Timestamp now) const {
    try {
        const MultiTimeframeCandles candles = fetchWindows(symbol, now);
        const std::optional<Position> position = position_store_->getOpenPosition(symbol);

        strategy::StrategyResult result = strategy_manager_->analyze(position ? &*position : nullptr, candles);
        if (result.is_valid) {
            LOG_INFO("{} signal: {} @ {:.6f} (tp {:.6f}, sl {:.6f}, confidence {:.3f})",
                     symbol, directionToString(result.direction), result.entry_price,
                     result.take_profit, result.stop_loss, result.confidence);
        } else {
            LOG_DEBUG("{} no signal: {}", symbol, result.reason);
        }
        return result;
    } catch (const core::DataAccessError& e) {
        LOG_ERROR("{} data access failed: {}", symbol, e.what());
        return strategy::StrategyResult::invalid("data unavailable");
    }
}

} // namespace engine
} // namespace signalforge
