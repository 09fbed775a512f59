#pragma once

#include <tl/expected.hpp>

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wcpp {

/// Terminal failure while turning bytes into elements.
struct StreamDecodeError {
    std::string message;
};

struct LineReassemblerOptions {
    /// A line longer than this without a terminator is a decode error.
    std::size_t max_line_bytes{std::numeric_limits<std::size_t>::max()};
};

/// Splits an incremental byte stream into logical lines.
///
/// LF ends a line. A CR directly in front of the LF is removed; any other CR
/// is ordinary line content. The lines produced do not depend on where the
/// input was split into chunks.
///
///   LineReassembler lines;
///   for (auto& chunk : body) {
///       for (auto& line : *lines.feed(chunk)) { ... }
///   }
///   if (auto rest = lines.finish()) { ... }
class LineReassembler {
public:
    LineReassembler() = default;
    explicit LineReassembler(LineReassemblerOptions options) : options_(options) {}

    [[nodiscard]] tl::expected<std::vector<std::string>, StreamDecodeError> feed(std::string_view chunk);

    /// Remaining unterminated bytes, at most once. nullopt if nothing is pending.
    [[nodiscard]] std::optional<std::string> finish();

    [[nodiscard]] std::size_t pending_bytes() const noexcept { return buffer_.size() - read_pos_; }

    void reset() noexcept;

private:
    void compact();

    LineReassemblerOptions options_;
    std::string buffer_;
    std::size_t read_pos_{0};
    bool finished_{false};
};

}  // namespace wcpp
