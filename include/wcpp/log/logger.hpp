#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════
// Every record is tagged with the subsystem that produced it, so a caller can
// keep retry decisions at Info while silencing per-chunk stream chatter:
//
//   wcpp::set_logger(wcpp::make_spdlog_console_logger(
//       wcpp::LogThreshold{wcpp::LogLevel::Info}
//           .set(wcpp::LogTopic::Stream, wcpp::LogLevel::Warn)));
//
// The library never writes anywhere on its own; without set_logger() every
// record is dropped.

#include <tl/expected.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace wcpp {

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Lowercase names, plus spdlog's "warning" and "critical". Anything else is nullopt.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Topics
// ─────────────────────────────────────────────────────────────────────────────

enum class LogTopic : std::uint8_t {
    Client,     ///< Attempts, retries, interceptors
    Stream,     ///< Streaming response decoding
    Transfer,   ///< Download state changes
    Transport   ///< Concrete HTTP transport
};

inline constexpr std::size_t kLogTopicCount = 4;

[[nodiscard]] std::optional<LogTopic> parse_log_topic(std::string_view name) noexcept;

[[nodiscard]] constexpr std::string_view to_string(LogTopic topic) noexcept {
    switch (topic) {
        case LogTopic::Client:    return "client";
        case LogTopic::Stream:    return "stream";
        case LogTopic::Transfer:  return "transfer";
        case LogTopic::Transport: return "transport";
    }
    return "unknown";
}

/// Minimum level per topic.
class LogThreshold {
public:
    constexpr explicit LogThreshold(LogLevel level = LogLevel::Info) noexcept {
        levels_.fill(level);
    }

    constexpr LogThreshold& set(LogTopic topic, LogLevel level) noexcept {
        levels_[static_cast<std::size_t>(topic)] = level;
        return *this;
    }

    [[nodiscard]] constexpr LogLevel level(LogTopic topic) const noexcept {
        return levels_[static_cast<std::size_t>(topic)];
    }

    [[nodiscard]] constexpr bool allows(LogTopic topic, LogLevel level) const noexcept {
        return level != LogLevel::Off &&
               static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(this->level(topic));
    }

    /// Lowest level any topic lets through.
    [[nodiscard]] constexpr LogLevel lowest() const noexcept {
        LogLevel lowest = LogLevel::Off;
        for (const auto level : levels_) {
            if (static_cast<std::uint8_t>(level) < static_cast<std::uint8_t>(lowest)) {
                lowest = level;
            }
        }
        return lowest;
    }

    friend constexpr bool operator==(const LogThreshold&, const LogThreshold&) = default;

private:
    std::array<LogLevel, kLogTopicCount> levels_{};
};

/// "debug", "info,stream=warn", "transport=off,client=debug". A bare level sets
/// every topic not named explicitly; at most one may appear.
[[nodiscard]] tl::expected<LogThreshold, std::string> parse_log_threshold(std::string_view text);

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord / ILogger
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogTopic topic;
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(LogTopic t, LogLevel lvl, std::string msg,
              std::source_location loc = std::source_location::current())
        : topic(t)
        , level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool enabled(LogTopic topic, LogLevel level) const noexcept = 0;
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool enabled(LogTopic /*topic*/, LogLevel /*level*/) const noexcept override {
        return false;
    }
};

/// stderr, "12:00:01.042 WARN  client    client.hpp:268 message".
class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogThreshold threshold = LogThreshold{}, bool colors = true)
        : threshold_(threshold)
        , colors_(colors)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool enabled(LogTopic topic, LogLevel level) const noexcept override {
        return threshold_.allows(topic, level);
    }

    [[nodiscard]] const LogThreshold& threshold() const noexcept { return threshold_; }

private:
    LogThreshold threshold_;
    bool colors_;
};

// ─────────────────────────────────────────────────────────────────────────────
// TopicLog - front end bound to one topic
// ─────────────────────────────────────────────────────────────────────────────
// Formatting only happens for records the logger will keep.

class TopicLog {
public:
    TopicLog(ILogger& logger, LogTopic topic) noexcept
        : logger_(&logger)
        , topic_(topic)
    {}

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return logger_->enabled(topic_, level);
    }

    void write(LogLevel level, std::string_view message,
               std::source_location loc = std::source_location::current()) {
        if (enabled(level)) {
            logger_->log(LogRecord(topic_, level, std::string(message), loc));
        }
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        emit(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        emit(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        emit(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        emit(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    void emit(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(level)) {
            logger_->log(LogRecord(topic_, level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    ILogger* logger_;
    LogTopic topic_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global logger
// ─────────────────────────────────────────────────────────────────────────────

/// The process-wide logger. A NullLogger until set_logger() is called.
[[nodiscard]] ILogger& get_logger() noexcept;

/// Replaces the process-wide logger. Passing nullptr restores the NullLogger.
/// Not safe while another thread is logging.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

[[nodiscard]] inline TopicLog log_for(LogTopic topic) noexcept {
    return TopicLog(get_logger(), topic);
}

#define WCPP_LOG_AT(topic, level, msg) \
    do { auto wcpp_log_ = ::wcpp::log_for(::wcpp::LogTopic::topic); \
         if (wcpp_log_.enabled(level)) wcpp_log_.write(level, msg); } while (false)

#define WCPP_LOG_TRACE(topic, msg) WCPP_LOG_AT(topic, ::wcpp::LogLevel::Trace, msg)
#define WCPP_LOG_DEBUG(topic, msg) WCPP_LOG_AT(topic, ::wcpp::LogLevel::Debug, msg)
#define WCPP_LOG_INFO(topic, msg)  WCPP_LOG_AT(topic, ::wcpp::LogLevel::Info, msg)
#define WCPP_LOG_WARN(topic, msg)  WCPP_LOG_AT(topic, ::wcpp::LogLevel::Warn, msg)
#define WCPP_LOG_ERROR(topic, msg) WCPP_LOG_AT(topic, ::wcpp::LogLevel::Error, msg)

}  // namespace wcpp
