#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <mutex>

namespace Episodic {

namespace {
std::mutex loggerInitMutex;

std::shared_ptr<spdlog::logger> makeConsoleLogger(const std::string& name) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    return std::make_shared<spdlog::logger>(name, console_sink);
}
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    std::lock_guard<std::mutex> lock(loggerInitMutex);
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("episodic",
            spdlog::sinks_init_list{console_sink, file_sink});
        logger->flush_on(spdlog::level::warn);
        logger->set_level(static_cast<spdlog::level::level_enum>(level));
        replaceLogger(logger);
        spdlog::register_logger(logger);

        logger->info("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        auto fallback = spdlog::get("episodic_fallback");
        if (!fallback) {
            fallback = spdlog::stdout_color_mt("episodic_fallback");
        }
        fallback->set_level(static_cast<spdlog::level::level_enum>(level));
        if (std::atomic_load(&logger_) != fallback) {
            replaceLogger(fallback);
        }
        fallback->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::initializeConsoleOnly(Level level) {
    std::lock_guard<std::mutex> lock(loggerInitMutex);
    auto logger = makeConsoleLogger("episodic_console");
    logger->set_level(static_cast<spdlog::level::level_enum>(level));
    replaceLogger(logger);
}

void Logger::setLevel(Level level) {
    ensureLogger()->set_level(static_cast<spdlog::level::level_enum>(level));
}

// Caller holds loggerInitMutex.
void Logger::replaceLogger(std::shared_ptr<spdlog::logger> logger) {
    auto previous = std::atomic_exchange(&logger_, std::move(logger));
    // Threads still logging through the previous logger keep their own reference
    if (previous && previous->name() != "episodic_fallback") {
        spdlog::drop(previous->name());
    }
}

std::shared_ptr<spdlog::logger> Logger::ensureLogger() {
    auto logger = std::atomic_load(&logger_);
    if (logger) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(loggerInitMutex);
    logger = std::atomic_load(&logger_);
    if (!logger) {
        logger = makeConsoleLogger("episodic_console");
        std::atomic_store(&logger_, logger);
    }
    return logger;
}

} // namespace Episodic
