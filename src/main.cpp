#include "common/Logger.h"
#include "common/Config.h"
#include "common/TimeUtils.h"
#include "backtest/BacktestEngine.h"
#include "core/state/CsvCandleSource.h"
#include "strategy/StrategyManager.h"

#include <nlohmann/json.hpp>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace signalforge;

// Stop flag for Ctrl+C
backtest::CancellationToken g_cancel;

void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_cancel.cancel();
    }
}

namespace {
struct CliOptions {
    std::string config_path = "config/config.json";
    std::string data_dir = "data";
    std::vector<std::string> symbols;
    std::string start;
    std::string end;
    std::string output;
    bool json_mode = false;
};

void printUsage() {
    std::cout << "Usage: signalforge_backtest --symbols BTCUSDT,ETHUSDT [options]\n"
              << "  --config <path>     config file (default config/config.json)\n"
              << "  --data-dir <dir>    directory with <SYMBOL>_<tf>.csv files (default data)\n"
              << "  --start <time>      YYYY-MM-DD[ HH:MM:SS] UTC or epoch ms\n"
              << "  --end <time>        YYYY-MM-DD[ HH:MM:SS] UTC or epoch ms\n"
              << "  --output <path>     write results as JSON\n"
              << "  --json              print results as JSON\n";
}

std::string trimCopy(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitSymbols(const std::string& csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        const size_t comma = csv.find(',', start);
        std::string token = (comma == std::string::npos)
            ? csv.substr(start)
            : csv.substr(start, comma - start);
        token = trimCopy(token);
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--json") {
            options.json_mode = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }
        if (arg == "--config") {
            options.config_path = argv[++i];
        } else if (arg == "--data-dir") {
            options.data_dir = argv[++i];
        } else if (arg == "--symbols") {
            options.symbols = splitSymbols(argv[++i]);
        } else if (arg == "--start") {
            options.start = argv[++i];
        } else if (arg == "--end") {
            options.end = argv[++i];
        } else if (arg == "--output") {
            options.output = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return !options.symbols.empty();
}

bool resolveTime(const std::string& text, Timestamp fallback, const char* name, Timestamp& out) {
    if (text.empty()) {
        out = fallback;
        return true;
    }
    auto ts = utils::TimeUtils::parseTimestamp(text);
    if (!ts) {
        std::cerr << "Invalid " << name << " value: " << text << "\n";
        return false;
    }
    out = *ts;
    return true;
}
}

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 1;
    }

    Timestamp start = 0;
    Timestamp end = std::numeric_limits<Timestamp>::max();
    if (!resolveTime(options.start, 0, "--start", start) ||
        !resolveTime(options.end, std::numeric_limits<Timestamp>::max(), "--end", end)) {
        return 1;
    }
    if (start > end) {
        std::cerr << "--start is after --end\n";
        return 1;
    }

    try {
        auto& config = Config::getInstance();
        config.load(options.config_path);

        const auto logging = config.getLoggingConfig();
        Logger::getInstance().initialize(logging.dir, logging.level);

        std::signal(SIGINT, signalHandler);

        LOG_INFO("SignalForge backtest: {} symbols, data dir {}", options.symbols.size(), options.data_dir);
        LOG_INFO("Range: {} ~ {}", utils::TimeUtils::formatTimestamp(start),
                 end == std::numeric_limits<Timestamp>::max() ? std::string("open") : utils::TimeUtils::formatTimestamp(end));

        auto manager = std::make_shared<const strategy::StrategyManager>(
            config.getManagerConfig(), config.getLongConfig(), config.getShortConfig());
        auto source = std::make_shared<const core::CsvCandleSource>(options.data_dir);

        backtest::BacktestEngine engine(config.getBacktestConfig(), manager, source);
        const backtest::BacktestResults results = engine.run(start, end, options.symbols, g_cancel);

        for (const auto& report : results.symbol_reports) {
            LOG_INFO("  {:<12} {:<10} candles={} trades={} {}", report.symbol,
                     backtest::symbolStatusToString(report.status), report.candles_processed,
                     report.trades, report.message);
        }
        LOG_INFO("Trades: {} (win {} / loss {}), win rate {:.2f}%", results.total_trades,
                 results.winning_trades, results.losing_trades, results.win_rate * 100.0);
        LOG_INFO("Final balance: {:.4f}, avg pnl {:.6f}, profit factor {:.3f}",
                 results.final_balance, results.average_pnl, results.profit_factor);
        LOG_INFO("Max drawdown: {:.2f}%, Sharpe: {:.3f}{}", results.max_drawdown * 100.0,
                 results.sharpe_ratio, results.cancelled ? " (cancelled)" : "");

        const nlohmann::json j = backtest::toJson(results);
        if (options.json_mode) {
            std::cout << j.dump(2) << std::endl;
        }
        if (!options.output.empty()) {
            const std::filesystem::path out_path(options.output);
            if (out_path.has_parent_path()) {
                std::filesystem::create_directories(out_path.parent_path());
            }
            std::ofstream out(out_path);
            if (!out.is_open()) {
                LOG_ERROR("Cannot write results to {}", out_path.string());
                return 1;
            }
            out << j.dump(2) << "\n";
            LOG_INFO("Results written to {}", out_path.string());
        }

        return results.cancelled ? 130 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Backtest failed: " << e.what() << "\n";
        return 1;
    }
}
