#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"
#include "strategy/StrategyConfig.h"

namespace signalforge {

struct LoggingConfig {
    std::string level = "info";
    std::string dir = "logs";
};

class Config {
public:
    static Config& getInstance();

    // Missing file keeps the defaults. A malformed file is logged and
    // leaves the defaults in place.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void reset();

    LoggingConfig getLoggingConfig() const { return logging_config_; }
    std::string getLogLevel() const { return logging_config_.level; }

    strategy::DirectionalStrategyConfig getLongConfig() const { return long_config_; }
    strategy::DirectionalStrategyConfig getShortConfig() const { return short_config_; }
    strategy::StrategyManagerConfig getManagerConfig() const { return manager_config_; }

    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }

private:
    Config() = default;

    LoggingConfig logging_config_;
    strategy::DirectionalStrategyConfig long_config_;
    strategy::DirectionalStrategyConfig short_config_;
    strategy::StrategyManagerConfig manager_config_;
    backtest::BacktestConfig backtest_config_;
};

} // namespace signalforge
