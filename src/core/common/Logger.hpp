#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <QtCore/QString>
#include <memory>
#include <string>

namespace VoiceScribe {

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

    // Console-only logging is available before this is called
    void initialize(const std::string& logFilePath = "voicescribe.log",
                    Level level = Level::Info);

    void setLevel(Level level);
    Level level() const { return level_; }

    static Level levelFromString(const QString& name, Level fallback = Level::Info);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        logger_->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        logger_->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        logger_->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        logger_->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        logger_->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        logger_->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger();
    std::shared_ptr<spdlog::logger> logger_;
    Level level_ = Level::Info;
};

#define VOICESCRIBE_TRACE(...) VoiceScribe::Logger::instance().trace(__VA_ARGS__)
#define VOICESCRIBE_DEBUG(...) VoiceScribe::Logger::instance().debug(__VA_ARGS__)
#define VOICESCRIBE_INFO(...) VoiceScribe::Logger::instance().info(__VA_ARGS__)
#define VOICESCRIBE_WARN(...) VoiceScribe::Logger::instance().warn(__VA_ARGS__)
#define VOICESCRIBE_ERROR(...) VoiceScribe::Logger::instance().error(__VA_ARGS__)
#define VOICESCRIBE_CRITICAL(...) VoiceScribe::Logger::instance().critical(__VA_ARGS__)

} // namespace VoiceScribe
