#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "backtest/PerformanceMetrics.h"
#include "analytics/TechnicalAnalyzer.h"
#include "common/Logger.h"
#include <algorithm>
#include <atomic>
#include <initializer_list>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace signalforge {
namespace backtest {

namespace {
// Completed symbol runs, stored by symbol index so reports keep input order.
class ResultCollector {
public:
    explicit ResultCollector(size_t count) : runs_(count) {}

    void submit(size_t index, BacktestEngine::SymbolRun run) {
        std::lock_guard<std::mutex> lock(mutex_);
        runs_[index] = std::move(run);
    }

    std::vector<BacktestEngine::SymbolRun> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::move(runs_);
    }

private:
    std::mutex mutex_;
    std::vector<BacktestEngine::SymbolRun> runs_;
};

// Trailing window over a higher timeframe: candles that have closed by the
// end of the current primary bar, capped at max_bars.
class TimeframeCursor {
public:
    TimeframeCursor(const std::vector<Candle>& candles, Timeframe timeframe, size_t max_bars)
        : candles_(candles), duration_ms_(timeframeDurationMs(timeframe)), max_bars_(max_bars), end_(0) {}

    std::vector<Candle> windowAt(Timestamp primary_close) {
        while (end_ < candles_.size() && candles_[end_].open_time + duration_ms_ <= primary_close) {
            ++end_;
        }
        const size_t begin = (end_ > max_bars_) ? end_ - max_bars_ : 0;
        return std::vector<Candle>(candles_.begin() + begin, candles_.begin() + end_);
    }

private:
    const std::vector<Candle>& candles_;
    Timestamp duration_ms_;
    size_t max_bars_;
    size_t end_;
};
}

BacktestEngine::BacktestEngine(const BacktestConfig& config,
                               std::shared_ptr<const strategy::StrategyManager> strategy_manager,
                               std::shared_ptr<const core::ICandleSource> candle_source)
    : config_(config)
    , strategy_manager_(std::move(strategy_manager))
    , candle_source_(std::move(candle_source))
{
    if (!strategy_manager_ || !candle_source_) {
        throw std::invalid_argument("BacktestEngine requires a strategy manager and a candle source");
    }
    config_.warmup_bars = std::max(1, config_.warmup_bars);
    config_.higher_tf_bars = std::max(1, config_.higher_tf_bars);
}

BacktestResults BacktestEngine::run(Timestamp start, Timestamp end, const std::vector<std::string>& symbols) {
    CancellationToken token;
    return run(start, end, symbols, token);
}

BacktestResults BacktestEngine::run(Timestamp start, Timestamp end, const std::vector<std::string>& symbols,
                                    const CancellationToken& token) {
    LOG_INFO("Backtest start: {} symbols, leverage {:.1f}, initial balance {:.4f}",
             symbols.size(), config_.leverage, config_.initial_balance);

    ResultCollector collector(symbols.size());
    std::atomic<size_t> next_symbol{0};

    auto worker = [&]() {
        while (true) {
            const size_t index = next_symbol.fetch_add(1);
            if (index >= symbols.size()) {
                break;
            }
            collector.submit(index, runSymbol(symbols[index], start, end, token));
        }
    };

    const size_t worker_count = workerCount(symbols.size());
    std::vector<std::unique_ptr<std::thread>> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.push_back(std::make_unique<std::thread>(worker));
    }
    for (auto& t : workers) {
        if (t->joinable()) {
            t->join();
        }
    }

    auto runs = collector.take();

    std::vector<Trade> all_trades;
    std::vector<SymbolReport> reports;
    bool cancelled = token.isCancelled();
    for (auto& symbol_run : runs) {
        if (symbol_run.report.status == SymbolStatus::CANCELLED) {
            cancelled = true;
        }
        all_trades.insert(all_trades.end(), symbol_run.trades.begin(), symbol_run.trades.end());
        reports.push_back(symbol_run.report);
    }

    BacktestResults results = PerformanceMetrics::aggregate(std::move(all_trades), config_.initial_balance);
    results.symbol_reports = std::move(reports);
    results.cancelled = cancelled;

    LOG_INFO("Backtest complete: trades={}, win rate={:.2f}%, final balance={:.4f}, max drawdown={:.2f}%, sharpe={:.3f}",
             results.total_trades, results.win_rate * 100.0, results.final_balance,
             results.max_drawdown * 100.0, results.sharpe_ratio);
    return results;
}

size_t BacktestEngine::workerCount(size_t symbol_count) const {
    size_t workers = (config_.max_workers > 0)
        ? static_cast<size_t>(config_.max_workers)
        : static_cast<size_t>(std::thread::hardware_concurrency());
    workers = std::max<size_t>(1, workers);
    return std::max<size_t>(1, std::min(workers, symbol_count));
}

BacktestEngine::SymbolRun BacktestEngine::runSymbol(const std::string& symbol, Timestamp start, Timestamp end,
                                                    const CancellationToken& token) const {
    SymbolRun outcome;
    outcome.report.symbol = symbol;

    if (token.isCancelled()) {
        outcome.report.status = SymbolStatus::CANCELLED;
        outcome.report.message = "cancelled before start";
        return outcome;
    }

    try {
        const SymbolData data = loadSymbolData(symbol, start, end);

        const size_t warmup = static_cast<size_t>(config_.warmup_bars);
        if (data.candles.m5.size() < warmup + 1) {
            outcome.report.status = SymbolStatus::SKIPPED;
            outcome.report.message = "insufficient warm-up data";
            LOG_WARN("{} skipped: {} primary candles, need {}", symbol, data.candles.m5.size(), warmup + 1);
            return outcome;
        }

        for (Timeframe tf : {Timeframe::M15, Timeframe::H1, Timeframe::H4}) {
            const size_t available = data.candles.get(tf).size();
            if (available < analytics::TechnicalAnalyzer::MIN_CANDLES) {
                outcome.report.status = SymbolStatus::SKIPPED;
                outcome.report.message = "insufficient higher-timeframe data";
                LOG_WARN("{} skipped: {} {} candles, need {}", symbol, available, timeframeToString(tf),
                         analytics::TechnicalAnalyzer::MIN_CANDLES);
                return outcome;
            }
        }

        simulate(symbol, data, start, end, token, outcome);
    } catch (const core::DataAccessError& e) {
        outcome.report.status = SymbolStatus::FAILED;
        outcome.report.message = e.what();
        outcome.trades.clear();
        LOG_ERROR("{} data access failed: {}", symbol, e.what());
    } catch (const std::exception& e) {
        outcome.report.status = SymbolStatus::FAILED;
        outcome.report.message = e.what();
        outcome.trades.clear();
        LOG_ERROR("{} backtest failed: {}", symbol, e.what());
    }

    outcome.report.trades = static_cast<int>(outcome.trades.size());
    return outcome;
}

BacktestEngine::SymbolData BacktestEngine::loadSymbolData(const std::string& symbol, Timestamp start, Timestamp end) const {
    SymbolData data;
    const Timestamp warmup_span = static_cast<Timestamp>(config_.warmup_bars) * timeframeDurationMs(Timeframe::M5);

    for (Timeframe tf : allTimeframes()) {
        Timestamp span = warmup_span;
        if (tf != Timeframe::M5) {
            span = std::max(span, static_cast<Timestamp>(config_.higher_tf_bars) * timeframeDurationMs(tf));
        }

        auto& series = data.candles.get(tf);
        series = candle_source_->getCandles(symbol, tf, start - span, end);
        const size_t dropped = DataHistory::normalizeSeries(series);
        if (dropped > 0) {
            LOG_WARN("{} {}: dropped {} duplicate candles", symbol, timeframeToString(tf), dropped);
        }
    }
    return data;
}

void BacktestEngine::simulate(const std::string& symbol, const SymbolData& data, Timestamp start, Timestamp end,
                              const CancellationToken& token, SymbolRun& outcome) const {
    const auto& primary = data.candles.m5;
    const size_t warmup = static_cast<size_t>(config_.warmup_bars);
    const size_t higher_bars = static_cast<size_t>(config_.higher_tf_bars);

    const Timestamp primary_ms = timeframeDurationMs(Timeframe::M5);
    TimeframeCursor m15(data.candles.m15, Timeframe::M15, higher_bars);
    TimeframeCursor h1(data.candles.h1, Timeframe::H1, higher_bars);
    TimeframeCursor h4(data.candles.h4, Timeframe::H4, higher_bars);

    std::optional<Position> position;

    for (size_t i = warmup; i < primary.size(); ++i) {
        const Candle& candle = primary[i];
        if (candle.open_time < start || candle.open_time > end) {
            continue;
        }
        if (token.isCancelled()) {
            outcome.report.status = SymbolStatus::CANCELLED;
            outcome.report.message = "cancelled";
            LOG_WARN("{} cancelled after {} candles", symbol, outcome.report.candles_processed);
            break;
        }
        outcome.report.candles_processed++;

        // 1. Exit check on the open position
        if (position) {
            if (auto exit = checkExit(*position, candle)) {
                closePosition(*position, exit->price, candle.open_time, exit->reason);
                outcome.trades.push_back(*position);
                position.reset();
            }
        }

        MultiTimeframeCandles window;
        window.m5.assign(primary.begin() + static_cast<std::ptrdiff_t>(i + 1 - warmup),
                         primary.begin() + static_cast<std::ptrdiff_t>(i + 1));
        const Timestamp bar_close = candle.open_time + primary_ms;
        window.m15 = m15.windowAt(bar_close);
        window.h1 = h1.windowAt(bar_close);
        window.h4 = h4.windowAt(bar_close);

        // 2. Reversal check while still in a position
        if (position) {
            const strategy::StrategyResult signal = strategy_manager_->analyze(&*position, window);
            if (signal.is_valid && signal.direction != position->side) {
                closePosition(*position, candle.close, candle.open_time, ExitReason::REVERSAL);
                outcome.trades.push_back(*position);
                position.reset();
                position = openPosition(symbol, signal, candle);
            }
            continue;
        }

        // 3. Flat: look for a new entry
        const strategy::StrategyResult signal = strategy_manager_->analyze(nullptr, window);
        if (signal.is_valid) {
            position = openPosition(symbol, signal, candle);
        }
    }

    for (const auto& trade : outcome.trades) {
        Logger::getInstance().logTrade(trade.symbol, directionToString(trade.side),
                                       trade.entry_price, trade.exit_price, trade.size,
                                       trade.pnl, exitReasonToString(trade.exit_reason));
    }

    if (position) {
        outcome.report.open_position_at_end = true;
    }
    if (outcome.report.status == SymbolStatus::COMPLETED) {
        outcome.report.message = "ok";
    }
    LOG_INFO("{} done: {} candles, {} trades{}", symbol, outcome.report.candles_processed, outcome.trades.size(),
             outcome.report.open_position_at_end ? " (position left open)" : "");
}

Position BacktestEngine::openPosition(const std::string& symbol, const strategy::StrategyResult& signal,
                                      const Candle& candle) const {
    Position position;
    position.symbol = symbol;
    position.side = signal.direction;
    position.entry_price = candle.close;
    position.stop_loss_price = signal.stop_loss;
    position.take_profit_price = signal.take_profit;
    position.leverage = config_.leverage;
    position.size = calculatePositionSize(candle.close);
    position.open_time = candle.open_time;
    position.status = PositionStatus::OPEN;
    position.confidence = signal.confidence;

    LOG_DEBUG("{} open {} @ {:.6f} (tp {:.6f}, sl {:.6f}, conf {:.3f})",
              symbol, directionToString(position.side), position.entry_price,
              position.take_profit_price, position.stop_loss_price, position.confidence);
    return position;
}

double BacktestEngine::calculatePositionSize(double entry_price) const {
    if (config_.sizing_mode == SizingMode::FIXED) {
        return config_.fixed_size;
    }
    if (entry_price <= 0.0) {
        return 0.0;
    }
    return config_.risk_per_trade * config_.leverage / entry_price;
}

std::optional<BacktestEngine::ExitSignal> BacktestEngine::checkExit(const Position& position, const Candle& candle) {
    if (!position.isOpen()) {
        return std::nullopt;
    }

    if (position.side == Direction::LONG) {
        if (candle.high >= position.take_profit_price) {
            return ExitSignal{ExitReason::TAKE_PROFIT, position.take_profit_price};
        }
        if (candle.low <= position.stop_loss_price) {
            return ExitSignal{ExitReason::STOP_LOSS, position.stop_loss_price};
        }
    } else {
        if (candle.low <= position.take_profit_price) {
            return ExitSignal{ExitReason::TAKE_PROFIT, position.take_profit_price};
        }
        if (candle.high >= position.stop_loss_price) {
            return ExitSignal{ExitReason::STOP_LOSS, position.stop_loss_price};
        }
    }
    return std::nullopt;
}

double BacktestEngine::calculatePnl(const Position& position, double exit_price) {
    if (position.entry_price <= 0.0) {
        return 0.0;
    }
    double signed_return = (exit_price - position.entry_price) / position.entry_price;
    if (position.side == Direction::SHORT) {
        signed_return = -signed_return;
    }
    return position.size * position.leverage * signed_return;
}

void BacktestEngine::closePosition(Position& position, double exit_price, Timestamp close_time, ExitReason reason) {
    position.exit_price = exit_price;
    position.close_time = close_time;
    position.exit_reason = reason;
    position.pnl = calculatePnl(position, exit_price);
    position.status = PositionStatus::CLOSED;
}

} // namespace backtest
} // namespace signalforge
