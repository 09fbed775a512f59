#include "wcpp/log/logger.hpp"

#include <array>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace wcpp {

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kDim   = "\033[2m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[1;35m";
        case LogLevel::Off:   return kReset;
    }
    return kReset;
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    std::string_view sv(path);
    const auto slash = sv.find_last_of("/\\");
    if (slash == std::string_view::npos) {
        return sv;
    }
    return sv.substr(slash + 1);
}

void write_timestamp(std::ostream& os, std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);
    os << std::put_time(&local, "%H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << millis << std::setfill(' ');
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    static constexpr std::array<std::pair<std::string_view, LogLevel>, 9> kNames{{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
        {"critical", LogLevel::Fatal},
        {"off", LogLevel::Off},
    }};
    for (const auto& [known, level] : kNames) {
        if (known == name) {
            return level;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (enabled(record.topic, record.level) == false) {
        return;
    }

    std::ostringstream line;
    write_timestamp(line, record.timestamp);
    line << ' ';
    if (colors_) {
        line << level_color(record.level);
    }
    line << std::left << std::setw(5) << to_string(record.level);
    if (colors_) {
        line << kReset;
    }
    line << ' ' << std::setw(9) << to_string(record.topic) << ' ';
    if (colors_) {
        line << kDim;
    }
    line << basename_of(record.location.file_name()) << ':' << record.location.line();
    if (colors_) {
        line << kReset;
    }
    line << ' ' << record.message << '\n';

    // One write per record keeps concurrent lines whole
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Thresholds from text
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<LogThreshold, std::string> parse_log_threshold(std::string_view text) {
    std::optional<LogLevel> fallback;
    std::array<std::optional<LogLevel>, kLogTopicCount> named{};

    while (text.empty() == false) {
        const auto comma = text.find(',');
        const auto item = text.substr(0, comma);
        text = (comma == std::string_view::npos) ? std::string_view{} : text.substr(comma + 1);
        if (item.empty()) {
            continue;
        }

        const auto equals = item.find('=');
        const auto level_name = (equals == std::string_view::npos) ? item : item.substr(equals + 1);
        const auto level = parse_log_level(level_name);
        if (level.has_value() == false) {
            return tl::unexpected("unknown log level '" + std::string(level_name) + "'");
        }

        if (equals == std::string_view::npos) {
            if (fallback.has_value()) {
                return tl::unexpected(std::string("more than one default level"));
            }
            fallback = level;
            continue;
        }

        const auto topic_name = item.substr(0, equals);
        const auto topic = parse_log_topic(topic_name);
        if (topic.has_value() == false) {
            return tl::unexpected("unknown log topic '" + std::string(topic_name) + "'");
        }
        named[static_cast<std::size_t>(*topic)] = level;
    }

    LogThreshold threshold(fallback.value_or(LogLevel::Info));
    for (std::size_t i = 0; i < kLogTopicCount; ++i) {
        if (named[i].has_value()) {
            threshold.set(static_cast<LogTopic>(i), *named[i]);
        }
    }
    return threshold;
}

std::optional<LogTopic> parse_log_topic(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kLogTopicCount; ++i) {
        const auto topic = static_cast<LogTopic>(i);
        if (to_string(topic) == name) {
            return topic;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::unique_ptr<ILogger>& logger_slot() {
    static std::unique_ptr<ILogger> slot = std::make_unique<NullLogger>();
    return slot;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_slot();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    logger_slot() = logger ? std::move(logger) : std::make_unique<NullLogger>();
}

}  // namespace wcpp
