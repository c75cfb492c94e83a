#include "backtest/BacktestEngine.h"
#include "core/state/InMemoryCandleSource.h"

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace signalforge;
using namespace signalforge::backtest;

namespace {
constexpr Timestamp BASE_TIME = 1700000000000LL;
constexpr Timestamp BAR_MS = 5 * 60 * 1000;

// Fires once, on the 5m bar that opens at trigger_time.
class TriggerStrategy : public strategy::IStrategy {
public:
    TriggerStrategy(Direction direction, Timestamp trigger_time, double confidence)
        : direction_(direction), trigger_time_(trigger_time), confidence_(confidence) {}

    std::string getName() const override { return "trigger"; }
    Direction getDirection() const override { return direction_; }

    strategy::StrategyResult analyze(const MultiTimeframeCandles& candles) const override {
        if (candles.m5.empty() || candles.m5.back().open_time != trigger_time_) {
            return strategy::StrategyResult::invalid("conditions not met");
        }
        strategy::StrategyResult r;
        r.is_valid = true;
        r.direction = direction_;
        r.confidence = confidence_;
        r.entry_price = candles.m5.back().close;
        if (direction_ == Direction::LONG) {
            r.take_profit = r.entry_price * 1.01;
            r.stop_loss = r.entry_price * 0.994;
        } else {
            r.take_profit = r.entry_price * 0.99;
            r.stop_loss = r.entry_price * 1.006;
        }
        return r;
    }

private:
    Direction direction_;
    Timestamp trigger_time_;
    double confidence_;
};

// Fires on the 5m bar at trigger_time only if the newest 1h bar in the
// window opened at expected_h1_open.
class HourlyWindowStrategy : public strategy::IStrategy {
public:
    HourlyWindowStrategy(Direction direction, Timestamp trigger_time, Timestamp expected_h1_open, double confidence)
        : direction_(direction), trigger_time_(trigger_time), expected_h1_open_(expected_h1_open),
          confidence_(confidence) {}

    std::string getName() const override { return "hourly"; }
    Direction getDirection() const override { return direction_; }

    strategy::StrategyResult analyze(const MultiTimeframeCandles& candles) const override {
        if (candles.m5.empty() || candles.m5.back().open_time != trigger_time_ ||
            candles.h1.empty() || candles.h1.back().open_time != expected_h1_open_) {
            return strategy::StrategyResult::invalid("conditions not met");
        }
        strategy::StrategyResult r;
        r.is_valid = true;
        r.direction = direction_;
        r.confidence = confidence_;
        r.entry_price = candles.m5.back().close;
        r.take_profit = (direction_ == Direction::LONG) ? r.entry_price * 1.01 : r.entry_price * 0.99;
        r.stop_loss = (direction_ == Direction::LONG) ? r.entry_price * 0.994 : r.entry_price * 1.006;
        return r;
    }

private:
    Direction direction_;
    Timestamp trigger_time_;
    Timestamp expected_h1_open_;
    double confidence_;
};

Timestamp barTime(size_t index) {
    return BASE_TIME + static_cast<Timestamp>(index) * BAR_MS;
}

std::vector<Candle> flatBars(size_t count) {
    std::vector<Candle> out;
    for (size_t i = 0; i < count; ++i) {
        Candle c(100.0, 100.2, 99.8, 100.0, 50.0, barTime(i));
        c.trade_count = 10;
        out.push_back(c);
    }
    return out;
}

// Flat history on 15m, 1h and 4h ending with a bar that opens at BASE_TIME.
std::vector<Candle> higherBars(Timeframe tf, size_t count) {
    const Timestamp duration = timeframeDurationMs(tf);
    std::vector<Candle> out;
    for (size_t i = 0; i < count; ++i) {
        const Timestamp open_time = BASE_TIME - static_cast<Timestamp>(count - 1 - i) * duration;
        out.push_back(Candle(100.0, 100.2, 99.8, 100.0, 50.0, open_time));
    }
    return out;
}

void addHigherTimeframes(core::InMemoryCandleSource& source, const std::string& symbol, size_t count = 30) {
    for (Timeframe tf : {Timeframe::M15, Timeframe::H1, Timeframe::H4}) {
        source.addCandles(symbol, tf, higherBars(tf, count));
    }
}

std::shared_ptr<const strategy::StrategyManager> scriptedManager(Timestamp long_trigger, double long_conf,
                                                                 Timestamp short_trigger, double short_conf) {
    return std::make_shared<const strategy::StrategyManager>(
        strategy::StrategyManagerConfig(),
        std::make_unique<TriggerStrategy>(Direction::LONG, long_trigger, long_conf),
        std::make_unique<TriggerStrategy>(Direction::SHORT, short_trigger, short_conf));
}

BacktestConfig smallConfig() {
    BacktestConfig config;
    config.warmup_bars = 5;
    config.higher_tf_bars = 30;
    config.max_workers = 2;
    return config;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

const SymbolReport* findReport(const BacktestResults& results, const std::string& symbol) {
    for (const auto& report : results.symbol_reports) {
        if (report.symbol == symbol) return &report;
    }
    return nullptr;
}

int testExitRules() {
    Position pos;
    pos.side = Direction::LONG;
    pos.entry_price = 100.0;
    pos.take_profit_price = 101.0;
    pos.stop_loss_price = 99.4;
    pos.size = 2.0;
    pos.leverage = 50.0;

    // Both levels inside the bar: take-profit wins
    auto both = BacktestEngine::checkExit(pos, Candle(100.0, 102.0, 99.0, 100.0, 1.0, 0));
    if (!both || both->reason != ExitReason::TAKE_PROFIT || both->price != 101.0) {
        std::cerr << "[TEST] take-profit should be checked first\n";
        return 1;
    }
    auto stop = BacktestEngine::checkExit(pos, Candle(100.0, 100.5, 99.0, 99.5, 1.0, 0));
    if (!stop || stop->reason != ExitReason::STOP_LOSS || stop->price != 99.4) {
        std::cerr << "[TEST] stop-loss should fill at its level\n";
        return 1;
    }
    if (BacktestEngine::checkExit(pos, Candle(100.0, 100.5, 99.5, 100.0, 1.0, 0))) {
        std::cerr << "[TEST] no exit expected inside the levels\n";
        return 1;
    }

    Position short_pos = pos;
    short_pos.side = Direction::SHORT;
    short_pos.take_profit_price = 99.0;
    short_pos.stop_loss_price = 100.6;
    auto short_both = BacktestEngine::checkExit(short_pos, Candle(100.0, 101.0, 98.5, 100.0, 1.0, 0));
    if (!short_both || short_both->reason != ExitReason::TAKE_PROFIT || short_both->price != 99.0) {
        std::cerr << "[TEST] short take-profit should be checked first\n";
        return 1;
    }

    // size * leverage * 1%
    if (!near(BacktestEngine::calculatePnl(pos, 101.0), 1.0)) {
        std::cerr << "[TEST] long pnl: " << BacktestEngine::calculatePnl(pos, 101.0) << "\n";
        return 1;
    }
    if (!near(BacktestEngine::calculatePnl(short_pos, 101.0), -1.0)) {
        std::cerr << "[TEST] short pnl: " << BacktestEngine::calculatePnl(short_pos, 101.0) << "\n";
        return 1;
    }

    BacktestEngine::closePosition(pos, 99.4, 1234, ExitReason::STOP_LOSS);
    if (pos.isOpen() || pos.close_time != 1234 || !near(pos.pnl, -0.6)) {
        std::cerr << "[TEST] closePosition did not record the exit\n";
        return 1;
    }
    if (BacktestEngine::checkExit(pos, Candle(100.0, 200.0, 1.0, 100.0, 1.0, 0))) {
        std::cerr << "[TEST] closed positions never exit again\n";
        return 1;
    }

    std::cout << "[TEST] Exit rules PASSED\n";
    return 0;
}

int testSingleTrade() {
    auto source = std::make_shared<core::InMemoryCandleSource>();
    auto bars = flatBars(12);
    bars[7].high = 101.5;
    source->addCandles("BTCUSDT", Timeframe::M5, bars);
    addHigherTimeframes(*source, "BTCUSDT");

    BacktestEngine engine(smallConfig(), scriptedManager(barTime(5), 0.8, -1, 0.0), source);
    const BacktestResults results = engine.run(BASE_TIME, barTime(100), {"BTCUSDT"});

    if (results.total_trades != 1 || results.winning_trades != 1 || !near(results.win_rate, 1.0)) {
        std::cerr << "[TEST] expected one winning trade, got " << results.total_trades << "\n";
        return 1;
    }
    if (!near(results.max_drawdown, 0.0)) {
        std::cerr << "[TEST] drawdown should be 0, got " << results.max_drawdown << "\n";
        return 1;
    }

    const Trade& trade = results.trades.front();
    // risk 0.02 * leverage 50 / entry 100
    if (!near(trade.size, 0.01) || trade.exit_reason != ExitReason::TAKE_PROFIT ||
        !near(trade.exit_price, 101.0) || trade.close_time != barTime(7)) {
        std::cerr << "[TEST] unexpected trade fields\n";
        return 1;
    }
    if (!near(trade.pnl, 0.01 * 50.0 * 0.01) || !near(results.final_balance, 10.005)) {
        std::cerr << "[TEST] unexpected pnl: " << trade.pnl << "\n";
        return 1;
    }

    const SymbolReport* report = findReport(results, "BTCUSDT");
    if (!report || report->status != SymbolStatus::COMPLETED || report->candles_processed != 7 ||
        report->open_position_at_end || report->trades != 1) {
        std::cerr << "[TEST] unexpected symbol report\n";
        return 1;
    }

    std::cout << "[TEST] Single trade PASSED\n";
    return 0;
}

int testReversal() {
    auto source = std::make_shared<core::InMemoryCandleSource>();
    source->addCandles("ETHUSDT", Timeframe::M5, flatBars(10));
    addHigherTimeframes(*source, "ETHUSDT");

    // Long at bar 5 (confidence 0.5), short at bar 6 clears 0.5 + 0.1
    BacktestEngine engine(smallConfig(), scriptedManager(barTime(5), 0.5, barTime(6), 0.9), source);
    const BacktestResults results = engine.run(BASE_TIME, barTime(100), {"ETHUSDT"});

    if (results.total_trades != 1 || results.trades.front().exit_reason != ExitReason::REVERSAL ||
        results.trades.front().side != Direction::LONG) {
        std::cerr << "[TEST] expected one reversal-closed long\n";
        return 1;
    }
    const SymbolReport* report = findReport(results, "ETHUSDT");
    if (!report || !report->open_position_at_end) {
        std::cerr << "[TEST] reversed short should be left open\n";
        return 1;
    }

    // Same setup but the short is not confident enough
    BacktestEngine weak(smallConfig(), scriptedManager(barTime(5), 0.5, barTime(6), 0.55), source);
    const BacktestResults held = weak.run(BASE_TIME, barTime(100), {"ETHUSDT"});
    if (held.total_trades != 0 || !held.symbol_reports.front().open_position_at_end) {
        std::cerr << "[TEST] weak reversal should keep the long open\n";
        return 1;
    }

    std::cout << "[TEST] Reversal PASSED\n";
    return 0;
}

int testHigherTimeframeCompletion() {
    constexpr Timestamp H1_MS = 60 * 60 * 1000;
    auto source = std::make_shared<core::InMemoryCandleSource>();
    source->addCandles("BTCUSDT", Timeframe::M5, flatBars(14));
    addHigherTimeframes(*source, "BTCUSDT");

    // The 1h bar opening at BASE_TIME is still forming on 5m bar 10 and
    // closes with 5m bar 11.
    auto manager = std::make_shared<const strategy::StrategyManager>(
        strategy::StrategyManagerConfig(),
        std::make_unique<HourlyWindowStrategy>(Direction::LONG, barTime(10), BASE_TIME - H1_MS, 0.5),
        std::make_unique<HourlyWindowStrategy>(Direction::SHORT, barTime(11), BASE_TIME, 0.9));

    BacktestEngine engine(smallConfig(), manager, source);
    const BacktestResults results = engine.run(BASE_TIME, barTime(100), {"BTCUSDT"});

    if (results.total_trades != 1) {
        std::cerr << "[TEST] expected a long opened on bar 10 and reversed on bar 11, got "
                  << results.total_trades << " trades\n";
        return 1;
    }
    const Trade& trade = results.trades.front();
    if (trade.side != Direction::LONG || trade.exit_reason != ExitReason::REVERSAL ||
        trade.open_time != barTime(10) || trade.close_time != barTime(11)) {
        std::cerr << "[TEST] 1h window should only hold closed bars\n";
        return 1;
    }

    std::cout << "[TEST] Higher timeframe completion PASSED\n";
    return 0;
}

int testFailuresAndSkips() {
    auto source = std::make_shared<core::InMemoryCandleSource>();
    auto bars = flatBars(12);
    bars[7].high = 101.5;
    source->addCandles("BTCUSDT", Timeframe::M5, bars);
    addHigherTimeframes(*source, "BTCUSDT");
    source->addCandles("SHORTUSDT", Timeframe::M5, flatBars(4));
    addHigherTimeframes(*source, "SHORTUSDT");
    // Enough 5m history but only ten 4h bars
    source->addCandles("THINUSDT", Timeframe::M5, flatBars(12));
    addHigherTimeframes(*source, "THINUSDT");
    source->addCandles("THINUSDT", Timeframe::H4, higherBars(Timeframe::H4, 10));
    source->addCandles("BADUSDT", Timeframe::M5, flatBars(12));
    source->setFailure("BADUSDT");

    BacktestEngine engine(smallConfig(), scriptedManager(barTime(5), 0.8, -1, 0.0), source);
    const BacktestResults results = engine.run(BASE_TIME, barTime(100),
                                               {"BTCUSDT", "SHORTUSDT", "THINUSDT", "BADUSDT"});

    if (results.symbol_reports.size() != 4 || results.symbol_reports[0].symbol != "BTCUSDT") {
        std::cerr << "[TEST] reports should follow input order\n";
        return 1;
    }
    const SymbolReport* skipped = findReport(results, "SHORTUSDT");
    if (!skipped || skipped->status != SymbolStatus::SKIPPED || skipped->message != "insufficient warm-up data") {
        std::cerr << "[TEST] short history should be skipped\n";
        return 1;
    }
    const SymbolReport* thin = findReport(results, "THINUSDT");
    if (!thin || thin->status != SymbolStatus::SKIPPED || thin->message != "insufficient higher-timeframe data" ||
        thin->candles_processed != 0) {
        std::cerr << "[TEST] short 4h history should be skipped\n";
        return 1;
    }
    const SymbolReport* failed = findReport(results, "BADUSDT");
    if (!failed || failed->status != SymbolStatus::FAILED || failed->trades != 0) {
        std::cerr << "[TEST] unreadable symbol should fail\n";
        return 1;
    }
    if (results.total_trades != 1 || results.cancelled) {
        std::cerr << "[TEST] healthy symbol should still trade\n";
        return 1;
    }

    std::cout << "[TEST] Failures and skips PASSED\n";
    return 0;
}

int testCancellation() {
    auto source = std::make_shared<core::InMemoryCandleSource>();
    source->addCandles("BTCUSDT", Timeframe::M5, flatBars(12));

    BacktestEngine engine(smallConfig(), scriptedManager(barTime(5), 0.8, -1, 0.0), source);
    CancellationToken token;
    token.cancel();
    const BacktestResults results = engine.run(BASE_TIME, barTime(100), {"BTCUSDT", "ETHUSDT"}, token);

    if (!results.cancelled || results.total_trades != 0) {
        std::cerr << "[TEST] cancelled run should report cancellation\n";
        return 1;
    }
    for (const auto& report : results.symbol_reports) {
        if (report.status != SymbolStatus::CANCELLED) {
            std::cerr << "[TEST] " << report.symbol << " should be cancelled\n";
            return 1;
        }
    }

    std::cout << "[TEST] Cancellation PASSED\n";
    return 0;
}

int testSizingAndConstruction() {
    auto source = std::make_shared<core::InMemoryCandleSource>();
    BacktestConfig config = smallConfig();
    config.sizing_mode = SizingMode::FIXED;
    config.fixed_size = 3.0;
    BacktestEngine fixed(config, scriptedManager(-1, 0.0, -1, 0.0), source);
    if (!near(fixed.calculatePositionSize(250.0), 3.0)) {
        std::cerr << "[TEST] fixed sizing ignores price\n";
        return 1;
    }

    BacktestEngine risk(smallConfig(), scriptedManager(-1, 0.0, -1, 0.0), source);
    if (!near(risk.calculatePositionSize(50.0), 0.02) || risk.calculatePositionSize(0.0) != 0.0) {
        std::cerr << "[TEST] unexpected risk sizing\n";
        return 1;
    }

    bool threw = false;
    try {
        BacktestEngine broken(smallConfig(), nullptr, source);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] missing strategy manager should throw\n";
        return 1;
    }

    std::cout << "[TEST] Sizing PASSED\n";
    return 0;
}
}

int main() {
    if (testExitRules() != 0) return 1;
    if (testSingleTrade() != 0) return 1;
    if (testReversal() != 0) return 1;
    if (testHigherTimeframeCompletion() != 0) return 1;
    if (testFailuresAndSkips() != 0) return 1;
    if (testCancellation() != 0) return 1;
    if (testSizingAndConstruction() != 0) return 1;

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
