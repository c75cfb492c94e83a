#pragma once

#include <string>
#include <vector>
#include <optional>

namespace signalforge {

// Epoch milliseconds
using Timestamp = long long;
using Price = double;
using Volume = double;

enum class Timeframe { M5, M15, H1, H4 };

enum class Direction { LONG, SHORT };

enum class PositionStatus { OPEN, CLOSED };

enum class ExitReason { NONE, TAKE_PROFIT, STOP_LOSS, REVERSAL, UNKNOWN };

struct Candle {
    std::string symbol;
    Timeframe timeframe;
    Timestamp open_time;
    Timestamp close_time;
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long trade_count;

    Candle()
        : timeframe(Timeframe::M5), open_time(0), close_time(0)
        , open(0), high(0), low(0), close(0), volume(0), trade_count(0) {}

    Candle(double o, double h, double l, double c, double v, Timestamp t)
        : timeframe(Timeframe::M5), open_time(t), close_time(t)
        , open(o), high(h), low(l), close(c), volume(v), trade_count(0) {}
};

// One symbol's candles for every timeframe the analyzers consume.
struct MultiTimeframeCandles {
    std::vector<Candle> m5;
    std::vector<Candle> m15;
    std::vector<Candle> h1;
    std::vector<Candle> h4;

    const std::vector<Candle>& get(Timeframe tf) const;
    std::vector<Candle>& get(Timeframe tf);
};

// Open or closed position. The backtest records closed ones as trades.
struct Position {
    std::string symbol;
    Direction side;
    double size;
    double leverage;
    Price entry_price;
    Price exit_price;
    Price stop_loss_price;
    Price take_profit_price;
    Timestamp open_time;
    std::optional<Timestamp> close_time;
    PositionStatus status;
    double pnl;
    ExitReason exit_reason;
    double confidence;

    Position()
        : side(Direction::LONG), size(0), leverage(1)
        , entry_price(0), exit_price(0), stop_loss_price(0), take_profit_price(0)
        , open_time(0), status(PositionStatus::OPEN), pnl(0)
        , exit_reason(ExitReason::NONE), confidence(0) {}

    bool isOpen() const { return status == PositionStatus::OPEN; }
};

using Trade = Position;

const std::vector<Timeframe>& allTimeframes();
std::string timeframeToString(Timeframe tf);
std::optional<Timeframe> timeframeFromString(const std::string& s);
Timestamp timeframeDurationMs(Timeframe tf);

std::string directionToString(Direction d);
Direction opposite(Direction d);

std::string exitReasonToString(ExitReason reason);

} // namespace signalforge
