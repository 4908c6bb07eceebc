#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Episodic {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    void initialize(const std::string& logFilePath = "episodic.log",
                    Level level = Level::Info);

    void setLevel(Level level);

    // Console output only, used before initialize() and when the log file cannot be opened.
    void initializeConsoleOnly(Level level = Level::Info);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        ensureLogger()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Loaded atomically; initialize() may replace the logger while other threads log.
    std::shared_ptr<spdlog::logger> ensureLogger();
    void replaceLogger(std::shared_ptr<spdlog::logger> logger);

    std::shared_ptr<spdlog::logger> logger_;
};

#define EPISODIC_TRACE(...) Episodic::Logger::instance().trace(__VA_ARGS__)
#define EPISODIC_DEBUG(...) Episodic::Logger::instance().debug(__VA_ARGS__)
#define EPISODIC_INFO(...) Episodic::Logger::instance().info(__VA_ARGS__)
#define EPISODIC_WARN(...) Episodic::Logger::instance().warn(__VA_ARGS__)
#define EPISODIC_ERROR(...) Episodic::Logger::instance().error(__VA_ARGS__)
#define EPISODIC_CRITICAL(...) Episodic::Logger::instance().critical(__VA_ARGS__)

} // namespace Episodic
