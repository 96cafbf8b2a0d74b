#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>

namespace VoiceScribe {

namespace {
constexpr const char* kLoggerName = "voicescribe";
constexpr const char* kConsolePattern = "[%H:%M:%S] [%^%l%$] [%t] %v";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    logger_ = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
    setLevel(level_);
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern(kConsolePattern);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] [%s:%#] %v");

        logger_ = std::make_shared<spdlog::logger>(kLoggerName,
            spdlog::sinks_init_list{console_sink, file_sink});

        setLevel(level);

        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger_);

        VOICESCRIBE_INFO("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Keep the console logger from the constructor
        setLevel(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    level_ = level;
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

Logger::Level Logger::levelFromString(const QString& name, Level fallback) {
    const QString lowered = name.trimmed().toLower();
    if (lowered == "trace") return Level::Trace;
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info") return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "critical") return Level::Critical;
    return fallback;
}

} // namespace VoiceScribe
