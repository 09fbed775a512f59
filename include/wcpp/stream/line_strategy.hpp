#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Line strategies
// ─────────────────────────────────────────────────────────────────────────────
// A strategy turns logical lines into elements. It sees every line exactly
// once, in order, and may emit zero or one element per line. Returning an
// error ends the stream.

#include "wcpp/json/json_decoder.hpp"
#include "wcpp/stream/line_reassembler.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace wcpp {

template <typename T>
using LineOutcome = tl::expected<std::optional<T>, StreamDecodeError>;

template <typename T>
class ILineStrategy {
public:
    using Element = T;

    virtual ~ILineStrategy() = default;

    [[nodiscard]] virtual LineOutcome<T> on_line(std::string_view line) = 0;

    /// Called once after the last line. Strategies that buffer may emit here.
    [[nodiscard]] virtual LineOutcome<T> on_end() { return std::optional<T>{}; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Raw lines
// ─────────────────────────────────────────────────────────────────────────────

/// Returns false for lines that should be skipped.
using LineFilter = std::function<bool(std::string_view)>;

[[nodiscard]] inline bool is_blank_line(std::string_view line) noexcept {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

[[nodiscard]] inline LineFilter skip_blank_lines() {
    return [](std::string_view line) { return is_blank_line(line) == false; };
}

/// Skips blank lines and lines starting with `prefix` (e.g. "#").
[[nodiscard]] inline LineFilter skip_blank_and_comment_lines(std::string prefix) {
    return [prefix = std::move(prefix)](std::string_view line) {
        return is_blank_line(line) == false && line.starts_with(prefix) == false;
    };
}

class RawLineStrategy final : public ILineStrategy<std::string> {
public:
    RawLineStrategy() = default;
    explicit RawLineStrategy(LineFilter keep) : keep_(std::move(keep)) {}

    [[nodiscard]] LineOutcome<std::string> on_line(std::string_view line) override {
        if (keep_ && keep_(line) == false) {
            return std::optional<std::string>{};
        }
        return std::optional<std::string>{std::string(line)};
    }

private:
    LineFilter keep_;
};

// ─────────────────────────────────────────────────────────────────────────────
// One JSON record per line
// ─────────────────────────────────────────────────────────────────────────────

/// Decodes each line as a JSON document and converts it to T with nlohmann's
/// from_json. T = Json keeps the raw document.
template <typename T>
class RecordPerLineStrategy final : public ILineStrategy<T> {
public:
    explicit RecordPerLineStrategy(bool skip_blank = true) : skip_blank_(skip_blank) {}

    [[nodiscard]] LineOutcome<T> on_line(std::string_view line) override {
        if (skip_blank_ && is_blank_line(line)) {
            return std::optional<T>{};
        }

        auto document = decoder_.decode(line);
        if (!document) {
            return tl::unexpected(StreamDecodeError{"invalid record: " + document.error().message});
        }

        if constexpr (std::is_same_v<T, Json>) {
            return std::optional<T>{std::move(*document)};
        } else {
            try {
                return std::optional<T>{document->template get<T>()};
            } catch (const Json::exception& e) {
                return tl::unexpected(StreamDecodeError{std::string("record has wrong shape: ") + e.what()});
            }
        }
    }

private:
    JsonDecoder decoder_;
    bool skip_blank_;
};

}  // namespace wcpp
