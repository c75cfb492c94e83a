#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace signalforge {

const std::vector<Candle>& MultiTimeframeCandles::get(Timeframe tf) const {
    switch (tf) {
        case Timeframe::M5: return m5;
        case Timeframe::M15: return m15;
        case Timeframe::H1: return h1;
        case Timeframe::H4: return h4;
    }
    return m5;
}

std::vector<Candle>& MultiTimeframeCandles::get(Timeframe tf) {
    switch (tf) {
        case Timeframe::M5: return m5;
        case Timeframe::M15: return m15;
        case Timeframe::H1: return h1;
        case Timeframe::H4: return h4;
    }
    return m5;
}

const std::vector<Timeframe>& allTimeframes() {
    static const std::vector<Timeframe> frames{
        Timeframe::M5, Timeframe::M15, Timeframe::H1, Timeframe::H4
    };
    return frames;
}

std::string timeframeToString(Timeframe tf) {
    switch (tf) {
        case Timeframe::M5: return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::H1: return "1h";
        case Timeframe::H4: return "4h";
    }
    return "unknown";
}

std::optional<Timeframe> timeframeFromString(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "5m") return Timeframe::M5;
    if (lower == "15m") return Timeframe::M15;
    if (lower == "1h" || lower == "60m") return Timeframe::H1;
    if (lower == "4h" || lower == "240m") return Timeframe::H4;
    return std::nullopt;
}

Timestamp timeframeDurationMs(Timeframe tf) {
    constexpr Timestamp MINUTE_MS = 60LL * 1000LL;
    switch (tf) {
        case Timeframe::M5: return 5 * MINUTE_MS;
        case Timeframe::M15: return 15 * MINUTE_MS;
        case Timeframe::H1: return 60 * MINUTE_MS;
        case Timeframe::H4: return 240 * MINUTE_MS;
    }
    return 5 * MINUTE_MS;
}

std::string directionToString(Direction d) {
    return d == Direction::LONG ? "long" : "short";
}

Direction opposite(Direction d) {
    return d == Direction::LONG ? Direction::SHORT : Direction::LONG;
}

std::string exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::REVERSAL: return "reversal";
        case ExitReason::UNKNOWN: return "unknown";
        case ExitReason::NONE: return "";
    }
    return "unknown";
}

} // namespace signalforge
