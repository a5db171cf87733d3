#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>

namespace Sluice {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] [%s:%#] %v");

        if (logger_) {
            spdlog::drop(logger_->name());
        }
        logger_ = std::make_shared<spdlog::logger>("sluice",
            spdlog::sinks_init_list{console_sink, file_sink});

        setLevel(level);
        logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger_);

        SLUICE_INFO("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        spdlog::drop("sluice_fallback");
        logger_ = spdlog::stdout_color_mt("sluice_fallback");
        setLevel(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

Logger::Level Logger::level() const {
    return static_cast<Level>(sink()->level());
}

std::optional<Logger::Level> Logger::parseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return Level::Trace;
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info") return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "critical") return Level::Critical;
    return std::nullopt;
}

} // namespace Sluice
