#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace signalforge {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void setLevel(const std::string& level);

    // Falls back to spdlog's default logger until initialize() has run.
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

    void logTrade(const std::string& symbol, const std::string& side,
                  double entry_price, double exit_price, double size,
                  double pnl, const std::string& reason);

private:
    Logger() = default;
    spdlog::logger* logger() const {
        return main_logger_ ? main_logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) signalforge::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) signalforge::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) signalforge::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) signalforge::Logger::getInstance().error(__VA_ARGS__)

} // namespace signalforge
