#pragma once

#include <memory>
#include <string>

#include "common/Types.h"
#include "core/contracts/ICandleSource.h"
#include "core/contracts/IPositionStore.h"
#include "strategy/StrategyManager.h"

namespace signalforge {
namespace engine {

struct SignalServiceConfig {
    // Trailing bars fetched per timeframe
    int m5_bars = 200;
    int higher_tf_bars = 60;
};

// Live-mode entry point: one evaluation per call, no scheduling.
class SignalService {
public:
    SignalService(std::shared_ptr<const strategy::StrategyManager> strategy_manager,
                  std::shared_ptr<const core::ICandleSource> candle_source,
                  std::shared_ptr<const core::IPositionStore> position_store,
                  const SignalServiceConfig& config = SignalServiceConfig());

    // Evaluates `symbol` as of `now`. A data access failure yields an
    // invalid "data unavailable" result.
    strategy::StrategyResult evaluate(const std::string& symbol, Timestamp now) const;

private:
    MultiTimeframeCandles fetchWindows(const std::string& symbol, Timestamp now) const;

    std::shared_ptr<const strategy::StrategyManager> strategy_manager_;
    std::shared_ptr<const core::ICandleSource> candle_source_;
    std::shared_ptr<const core::IPositionStore> position_store_;
    SignalServiceConfig config_;
};

} // namespace engine
} // namespace signalforge
