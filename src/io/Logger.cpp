#include "roomflow/io/Logger.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <iostream>
#include <vector>

namespace roomflow::io {

namespace {

spdlog::level::level_enum toSpdlog(Logger::Level level) {
    return static_cast<spdlog::level::level_enum>(level);
}

} // namespace

Logger::Logger() {
    // Console sink only until an application asks for a file
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    logger_ = std::make_shared<spdlog::logger>("roomflow", console_sink);
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::warn);
}

Logger* Logger::getInstance() {
    static Logger instance;
    return &instance;
}

void Logger::initialize(const std::string& logFile, Level consoleLevel, Level fileLevel) {
    try {
        // Console sink
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(toSpdlog(consoleLevel));
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        // File sink
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        file_sink->set_level(toSpdlog(fileLevel));
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        // Replace the logger with one writing to both sinks
        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        logger_ = std::make_shared<spdlog::logger>("roomflow", sinks.begin(), sinks.end());
        logger_->set_level(std::min(toSpdlog(consoleLevel), toSpdlog(fileLevel)));
        logger_->flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        throw;
    }
}

void Logger::setLevel(Level level) {
    logger_->set_level(toSpdlog(level));
    for (auto& sink : logger_->sinks()) {
        sink->set_level(std::min(sink->level(), toSpdlog(level)));
    }
}

Logger::Level Logger::level() const {
    return static_cast<Level>(logger_->level());
}

void Logger::flush() {
    logger_->flush();
}

void Logger::logResidual(const std::string& field, int iteration, Real residual,
                         Real initialResidual) {
    Real relResidual = residual / (initialResidual + SMALL);
    debug("Iteration {:4d}: {} residual = {:.6e} (rel = {:.6e})",
          iteration, field, residual, relResidual);
}

// Timer

Logger::Timer::Timer(const std::string& name, Logger* logger)
    : name_(name), logger_(logger), start_(std::chrono::steady_clock::now()) {
    logger_->debug("Timer '{}' started", name_);
}

Logger::Timer::~Timer() {
    logger_->info("Timer '{}' elapsed: {:.3f} ms", name_, elapsed() * 1000.0);
}

Real Logger::Timer::elapsed() const {
    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(now - start_);
    return duration.count() / Real(1.0e6);
}

// Progress

Logger::Progress::Progress(const std::string& task, int total, Logger* logger)
    : task_(task), total_(total), current_(0), logger_(logger),
      lastUpdate_(std::chrono::steady_clock::now()) {
    logger_->info("{} started (0/{})", task_, total_);
}

void Logger::Progress::update(int current) {
    current_ = current;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_);

    // Update every 500ms or at completion
    if (elapsed.count() > 500 || current_ >= total_) {
        int percent = total_ > 0 ? (current_ * 100) / total_ : 100;
        logger_->info("{}: {}% ({}/{})", task_, percent, current_, total_);
        lastUpdate_ = now;
    }
}

void Logger::Progress::finish() {
    logger_->info("{} finished at {}/{}", task_, current_, total_);
}

} // namespace roomflow::io
