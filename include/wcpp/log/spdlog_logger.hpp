#pragma once

#include "wcpp/log/logger.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace wcpp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// One spdlog::logger per topic, named "<base>.<topic>" and sharing the same
// sinks, so "%n" in a pattern prints e.g. "wcpp.stream". None of them is
// registered in spdlog's global registry.

class SpdlogLogger final : public ILogger {
public:
    /// Colored stdout sink.
    explicit SpdlogLogger(LogThreshold threshold = LogThreshold{});

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogThreshold threshold);

    /// Clones `base` once per topic; each clone starts at `base`'s level.
    /// Throws std::invalid_argument on nullptr.
    explicit SpdlogLogger(const std::shared_ptr<spdlog::logger>& base);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;
    [[nodiscard]] bool enabled(LogTopic topic, LogLevel level) const noexcept override;

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& underlying(LogTopic topic) const noexcept {
        return loggers_[static_cast<std::size_t>(topic)];
    }

    [[nodiscard]] const LogThreshold& threshold() const noexcept { return threshold_; }

    /// Not safe while another thread is logging through this instance.
    void set_threshold(LogThreshold threshold);

    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::array<std::shared_ptr<spdlog::logger>, kLogTopicCount> loggers_;
    LogThreshold threshold_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogThreshold threshold = LogThreshold{}
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogThreshold threshold = LogThreshold{}
);

/// Size-rotated log file: `max_size` bytes per file, `max_files` kept.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_rotating_logger(
    const std::string& filename,
    std::size_t max_size,
    std::size_t max_files,
    LogThreshold threshold = LogThreshold{}
);

}  // namespace wcpp
