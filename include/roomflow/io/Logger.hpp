#pragma once

#include "roomflow/core/Types.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>

namespace roomflow::io {

// Logger wrapper class
class Logger {
public:
    enum class Level {
        TRACE = SPDLOG_LEVEL_TRACE,
        DEBUG = SPDLOG_LEVEL_DEBUG,
        INFO = SPDLOG_LEVEL_INFO,
        WARN = SPDLOG_LEVEL_WARN,
        ERROR = SPDLOG_LEVEL_ERROR,
        CRITICAL = SPDLOG_LEVEL_CRITICAL,
        OFF = SPDLOG_LEVEL_OFF
    };

    // Get singleton instance
    static Logger* getInstance();

    // Add a file sink next to the console sink. The library itself only logs
    // to the console; applications call this once at startup.
    void initialize(const std::string& logFile,
                    Level consoleLevel = Level::INFO,
                    Level fileLevel = Level::DEBUG);

    // Logging functions
    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->critical(fmt, std::forward<Args>(args)...);
    }

    void setLevel(Level level);
    Level level() const;
    void flush();

    // Scoped wall-clock timer, logs the elapsed time on destruction
    class Timer {
    public:
        Timer(const std::string& name, Logger* logger = getInstance());
        ~Timer();

        // Seconds since construction
        Real elapsed() const;

    private:
        std::string name_;
        Logger* logger_;
        std::chrono::steady_clock::time_point start_;
    };

    std::unique_ptr<Timer> createTimer(const std::string& name) {
        return std::make_unique<Timer>(name, this);
    }

    // Progress indicator, rate limited to one line every 500 ms
    class Progress {
    public:
        Progress(const std::string& task, int total, Logger* logger = getInstance());

        void update(int current);
        void finish();

    private:
        std::string task_;
        int total_;
        int current_;
        Logger* logger_;
        std::chrono::steady_clock::time_point lastUpdate_;
    };

    std::unique_ptr<Progress> createProgress(const std::string& task, int total) {
        return std::make_unique<Progress>(task, total, this);
    }

    // Residual logging
    void logResidual(const std::string& field, int iteration, Real residual,
                     Real initialResidual = 1.0);

private:
    std::shared_ptr<spdlog::logger> logger_;

    Logger();

    // Delete copy constructor and assignment
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

// Convenience macros
#define LOG_TRACE(...) roomflow::io::Logger::getInstance()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) roomflow::io::Logger::getInstance()->debug(__VA_ARGS__)
#define LOG_INFO(...) roomflow::io::Logger::getInstance()->info(__VA_ARGS__)
#define LOG_WARN(...) roomflow::io::Logger::getInstance()->warn(__VA_ARGS__)
#define LOG_ERROR(...) roomflow::io::Logger::getInstance()->error(__VA_ARGS__)

#define ROOMFLOW_CONCAT_IMPL(a, b) a##b
#define ROOMFLOW_CONCAT(a, b) ROOMFLOW_CONCAT_IMPL(a, b)
#define LOG_TIMER(name) \
    auto ROOMFLOW_CONCAT(_timer_, __LINE__) = roomflow::io::Logger::getInstance()->createTimer(name)

} // namespace roomflow::io
