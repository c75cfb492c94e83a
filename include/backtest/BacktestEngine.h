#pragma once

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include "common/Types.h"
#include "backtest/BacktestConfig.h"
#include "backtest/BacktestTypes.h"
#include "backtest/CancellationToken.h"
#include "core/contracts/ICandleSource.h"
#include "strategy/StrategyManager.h"

namespace signalforge {
namespace backtest {

// Replays each symbol's 5m candles with a Flat -> Open -> Flat position
// per symbol. Symbols run on a bounded worker pool; statistics are
// computed from the merged trade set after every worker has joined.
class BacktestEngine {
public:
    BacktestEngine(const BacktestConfig& config,
                   std::shared_ptr<const strategy::StrategyManager> strategy_manager,
                   std::shared_ptr<const core::ICandleSource> candle_source);

    BacktestResults run(Timestamp start, Timestamp end, const std::vector<std::string>& symbols);
    BacktestResults run(Timestamp start, Timestamp end, const std::vector<std::string>& symbols,
                        const CancellationToken& token);

    const BacktestConfig& getConfig() const { return config_; }

    struct ExitSignal {
        ExitReason reason;
        double price;
    };

    // Take-profit is checked before stop-loss; fills at the level price.
    static std::optional<ExitSignal> checkExit(const Position& position, const Candle& candle);

    // size * leverage * signed return
    static double calculatePnl(const Position& position, double exit_price);

    static void closePosition(Position& position, double exit_price, Timestamp close_time, ExitReason reason);

    double calculatePositionSize(double entry_price) const;

    struct SymbolRun {
        SymbolReport report;
        std::vector<Trade> trades;
    };

    SymbolRun runSymbol(const std::string& symbol, Timestamp start, Timestamp end,
                        const CancellationToken& token) const;

private:
    struct SymbolData {
        MultiTimeframeCandles candles;
    };

    SymbolData loadSymbolData(const std::string& symbol, Timestamp start, Timestamp end) const;
    void simulate(const std::string& symbol, const SymbolData& data, Timestamp start, Timestamp end,
                  const CancellationToken& token, SymbolRun& outcome) const;
    Position openPosition(const std::string& symbol, const strategy::StrategyResult& signal,
                          const Candle& candle) const;
    size_t workerCount(size_t symbol_count) const;

    BacktestConfig config_;
    std::shared_ptr<const strategy::StrategyManager> strategy_manager_;
    std::shared_ptr<const core::ICandleSource> candle_source_;
};

} // namespace backtest
} // namespace signalforge
