#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <optional>
#include <string>

namespace Sluice {

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

    void initialize(const std::string& logFilePath = "sluiced.log",
                   Level level = Level::Info);

    void setLevel(Level level);
    Level level() const;

    // Accepts trace, debug, info, warn, error, critical (case-insensitive)
    static std::optional<Level> parseLevel(const std::string& name);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        sink()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        sink()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        sink()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        sink()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        sink()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        sink()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    spdlog::logger* sink() const {
        return logger_ ? logger_.get() : spdlog::default_logger_raw();
    }

    std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros
#define SLUICE_TRACE(...) Sluice::Logger::instance().trace(__VA_ARGS__)
#define SLUICE_DEBUG(...) Sluice::Logger::instance().debug(__VA_ARGS__)
#define SLUICE_INFO(...) Sluice::Logger::instance().info(__VA_ARGS__)
#define SLUICE_WARN(...) Sluice::Logger::instance().warn(__VA_ARGS__)
#define SLUICE_ERROR(...) Sluice::Logger::instance().error(__VA_ARGS__)
#define SLUICE_CRITICAL(...) Sluice::Logger::instance().critical(__VA_ARGS__)

} // namespace Sluice
