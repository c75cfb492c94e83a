#include "common/Config.h"
#include "common/Logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace signalforge {

namespace {
void readDirectional(const nlohmann::json& s, strategy::DirectionalStrategyConfig& cfg) {
    const strategy::DirectionalStrategyConfig defaults;
    cfg.target_profit = s.value("target_profit", defaults.target_profit);
    cfg.stop_loss = s.value("stop_loss", defaults.stop_loss);
    cfg.min_confidence = s.value("min_confidence", defaults.min_confidence);
    cfg.volume_weight = s.value("volume_weight", defaults.volume_weight);
    cfg.technical_weight = s.value("technical_weight", defaults.technical_weight);
    cfg.price_weight = s.value("price_weight", defaults.price_weight);
    cfg.min_volume_ratio = s.value("min_volume_ratio", defaults.min_volume_ratio);
    cfg.rsi_lower = s.value("rsi_lower", defaults.rsi_lower);
    cfg.rsi_upper = s.value("rsi_upper", defaults.rsi_upper);
    cfg.volume_boost_ratio = s.value("volume_boost_ratio", defaults.volume_boost_ratio);
    cfg.high_volatility = s.value("high_volatility", defaults.high_volatility);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    logging_config_ = LoggingConfig();
    long_config_ = strategy::DirectionalStrategyConfig();
    short_config_ = strategy::DirectionalStrategyConfig();
    manager_config_ = strategy::StrategyManagerConfig();
    backtest_config_ = backtest::BacktestConfig();
}

void Config::load(const std::string& path) {
    try {
        const std::filesystem::path config_path = std::filesystem::absolute(path);
        LOG_INFO("Config path: {}", config_path.string());

        if (!std::filesystem::exists(config_path)) {
            LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            LOG_WARN("Cannot open config file: {} (using defaults)", config_path.string());
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        LOG_INFO("Config loaded: leverage={}, risk_per_trade={}, reversal_delta={}",
                 backtest_config_.leverage, backtest_config_.risk_per_trade,
                 manager_config_.reversal_delta);
    } catch (const std::exception& e) {
        LOG_ERROR("Config load error: {}", e.what());
        reset();
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& l = j["logging"];
        logging_config_.level = l.value("level", std::string("info"));
        logging_config_.dir = l.value("dir", std::string("logs"));
    }

    if (j.contains("strategy")) {
        auto& s = j["strategy"];
        manager_config_.reversal_delta = s.value("reversal_delta", 0.1);

        if (s.contains("long")) {
            readDirectional(s["long"], long_config_);
        }
        if (s.contains("short")) {
            readDirectional(s["short"], short_config_);
        }
    }

    if (j.contains("backtest")) {
        auto& b = j["backtest"];
        backtest_config_.initial_balance = b.value("initial_balance", 10.0);
        backtest_config_.leverage = b.value("leverage", 50.0);
        backtest_config_.risk_per_trade = b.value("risk_per_trade", 0.02);
        backtest_config_.sizing_mode = backtest::sizingModeFromString(b.value("sizing_mode", std::string("risk")));
        backtest_config_.fixed_size = b.value("fixed_size", 1.0);
        backtest_config_.warmup_bars = std::max(1, b.value("warmup_bars", 200));
        backtest_config_.higher_tf_bars = std::max(1, b.value("higher_tf_bars", 60));
        backtest_config_.max_workers = std::max(0, b.value("max_workers", 0));
    }
}

} // namespace signalforge
