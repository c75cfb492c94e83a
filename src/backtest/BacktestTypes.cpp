#include "backtest/BacktestTypes.h"
#include <algorithm>
#include <cctype>

namespace signalforge {
namespace backtest {

std::string sizingModeToString(SizingMode mode) {
    return mode == SizingMode::FIXED ? "fixed" : "risk";
}

SizingMode sizingModeFromString(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "fixed" ? SizingMode::FIXED : SizingMode::RISK;
}

std::string symbolStatusToString(SymbolStatus status) {
    switch (status) {
        case SymbolStatus::COMPLETED: return "completed";
        case SymbolStatus::SKIPPED: return "skipped";
        case SymbolStatus::FAILED: return "failed";
        case SymbolStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

nlohmann::json toJson(const Trade& trade) {
    nlohmann::json j;
    j["symbol"] = trade.symbol;
    j["side"] = directionToString(trade.side);
    j["size"] = trade.size;
    j["leverage"] = trade.leverage;
    j["entry_price"] = trade.entry_price;
    j["exit_price"] = trade.exit_price;
    j["stop_loss_price"] = trade.stop_loss_price;
    j["take_profit_price"] = trade.take_profit_price;
    j["open_time"] = trade.open_time;
    j["close_time"] = trade.close_time ? nlohmann::json(*trade.close_time) : nlohmann::json(nullptr);
    j["status"] = trade.isOpen() ? "open" : "closed";
    j["pnl"] = trade.pnl;
    j["exit_reason"] = exitReasonToString(trade.exit_reason);
    j["confidence"] = trade.confidence;
    return j;
}

nlohmann::json toJson(const SymbolReport& report) {
    nlohmann::json j;
    j["symbol"] = report.symbol;
    j["status"] = symbolStatusToString(report.status);
    j["message"] = report.message;
    j["candles_processed"] = report.candles_processed;
    j["trades"] = report.trades;
    j["open_position_at_end"] = report.open_position_at_end;
    return j;
}

nlohmann::json toJson(const BacktestResults& results) {
    nlohmann::json j;
    j["total_trades"] = results.total_trades;
    j["winning_trades"] = results.winning_trades;
    j["losing_trades"] = results.losing_trades;
    j["win_rate"] = results.win_rate;
    j["average_pnl"] = results.average_pnl;
    j["max_drawdown"] = results.max_drawdown;
    j["final_balance"] = results.final_balance;
    j["sharpe_ratio"] = results.sharpe_ratio;
    j["total_pnl"] = results.total_pnl;
    j["gross_profit"] = results.gross_profit;
    j["gross_loss"] = results.gross_loss;
    j["profit_factor"] = results.profit_factor;
    j["avg_win"] = results.avg_win;
    j["avg_loss"] = results.avg_loss;
    j["exit_reason_counts"] = results.exit_reason_counts;
    j["cancelled"] = results.cancelled;

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : results.trades) {
        j["trades"].push_back(toJson(trade));
    }

    j["equity_curve"] = nlohmann::json::array();
    for (const auto& point : results.equity_curve) {
        j["equity_curve"].push_back({{"timestamp", point.timestamp}, {"balance", point.balance}});
    }

    j["symbols"] = nlohmann::json::array();
    for (const auto& report : results.symbol_reports) {
        j["symbols"].push_back(toJson(report));
    }
    return j;
}

} // namespace backtest
} // namespace signalforge
