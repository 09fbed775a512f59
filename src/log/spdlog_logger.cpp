#include "wcpp/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace wcpp {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";
constexpr const char* kBaseName = "wcpp";

std::string topic_logger_name(std::string_view base, LogTopic topic) {
    return std::format("{}.{}", base, to_string(topic));
}

}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

SpdlogLogger::SpdlogLogger(LogThreshold threshold)
    : SpdlogLogger(
          std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()},
          threshold)
{}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogThreshold threshold)
    : threshold_(threshold)
{
    for (std::size_t i = 0; i < kLogTopicCount; ++i) {
        const auto topic = static_cast<LogTopic>(i);
        auto logger = std::make_shared<spdlog::logger>(
            topic_logger_name(kBaseName, topic), sinks.begin(), sinks.end());
        logger->set_pattern(kPattern);
        loggers_[i] = std::move(logger);
    }
    set_threshold(threshold);
}

SpdlogLogger::SpdlogLogger(const std::shared_ptr<spdlog::logger>& base) {
    if (base == nullptr) {
        throw std::invalid_argument("SpdlogLogger: base logger cannot be null");
    }
    threshold_ = LogThreshold{from_spdlog_level(base->level())};
    for (std::size_t i = 0; i < kLogTopicCount; ++i) {
        loggers_[i] = base->clone(topic_logger_name(base->name(), static_cast<LogTopic>(i)));
    }
}

void SpdlogLogger::log(const LogRecord& record) {
    if (enabled(record.topic, record.level) == false) {
        return;
    }
    underlying(record.topic)->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        to_spdlog_level(record.level),
        "{}",
        record.message
    );
}

bool SpdlogLogger::enabled(LogTopic topic, LogLevel level) const noexcept {
    return threshold_.allows(topic, level);
}

void SpdlogLogger::set_threshold(LogThreshold threshold) {
    threshold_ = threshold;
    for (std::size_t i = 0; i < kLogTopicCount; ++i) {
        loggers_[i]->set_level(to_spdlog_level(threshold.level(static_cast<LogTopic>(i))));
    }
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    for (const auto& logger : loggers_) {
        logger->set_pattern(pattern);
    }
}

void SpdlogLogger::flush() {
    for (const auto& logger : loggers_) {
        logger->flush();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogThreshold threshold) {
    return std::make_unique<SpdlogLogger>(threshold);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogThreshold threshold) {
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename)};
    return std::make_unique<SpdlogLogger>(std::move(sinks), threshold);
}

std::unique_ptr<SpdlogLogger> make_spdlog_rotating_logger(
    const std::string& filename,
    std::size_t max_size,
    std::size_t max_files,
    LogThreshold threshold
) {
    std::vector<spdlog::sink_ptr> sinks{
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, max_size, max_files)
    };
    return std::make_unique<SpdlogLogger>(std::move(sinks), threshold);
}

}  // namespace wcpp
