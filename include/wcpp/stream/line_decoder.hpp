#pragma once

#include "wcpp/stream/line_reassembler.hpp"
#include "wcpp/stream/line_strategy.hpp"

#include <memory>
#include <vector>

namespace wcpp {

/// LineReassembler feeding a strategy. Synchronous and I/O free: callers push
/// chunks in and take decoded elements out.
template <typename T>
class LineDecoder {
public:
    using Element = T;
    using Batch = tl::expected<std::vector<T>, StreamDecodeError>;

    explicit LineDecoder(
        std::unique_ptr<ILineStrategy<T>> strategy,
        LineReassemblerOptions options = {}
    )
        : lines_(options)
        , strategy_(std::move(strategy))
    {}

    [[nodiscard]] Batch feed(std::string_view chunk) {
        auto lines = lines_.feed(chunk);
        if (!lines) {
            return tl::unexpected(lines.error());
        }
        std::vector<T> out;
        for (const auto& line : *lines) {
            if (auto error = push_line(line, out)) {
                return tl::unexpected(std::move(*error));
            }
        }
        return out;
    }

    /// Flushes the unterminated remainder and lets the strategy emit its tail.
    [[nodiscard]] Batch finish() {
        std::vector<T> out;
        if (auto rest = lines_.finish()) {
            if (auto error = push_line(*rest, out)) {
                return tl::unexpected(std::move(*error));
            }
        }
        auto tail = strategy_->on_end();
        if (!tail) {
            return tl::unexpected(tail.error());
        }
        if (tail->has_value()) {
            out.push_back(std::move(**tail));
        }
        return out;
    }

private:
    std::optional<StreamDecodeError> push_line(std::string_view line, std::vector<T>& out) {
        auto element = strategy_->on_line(line);
        if (!element) {
            return std::move(element.error());
        }
        if (element->has_value()) {
            out.push_back(std::move(**element));
        }
        return std::nullopt;
    }

    LineReassembler lines_;
    std::unique_ptr<ILineStrategy<T>> strategy_;
};

}  // namespace wcpp
