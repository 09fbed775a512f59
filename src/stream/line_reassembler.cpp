#include "wcpp/stream/line_reassembler.hpp"

#include <format>

namespace wcpp {

namespace {

// Consumed bytes are only erased once this many have piled up
constexpr std::size_t kCompactThreshold = 4096;

[[nodiscard]] std::string_view strip_trailing_cr(std::string_view line) noexcept {
    if (line.empty() == false && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace

tl::expected<std::vector<std::string>, StreamDecodeError> LineReassembler::feed(std::string_view chunk) {
    std::vector<std::string> lines;
    if (finished_) {
        return lines;
    }

    // Only the new bytes can contain terminators we have not seen yet
    std::size_t search_from = buffer_.size();
    buffer_.append(chunk);

    std::size_t newline = 0;
    while ((newline = buffer_.find('\n', search_from)) != std::string::npos) {
        std::string_view line(buffer_.data() + read_pos_, newline - read_pos_);
        lines.emplace_back(strip_trailing_cr(line));
        read_pos_ = newline + 1;
        search_from = read_pos_;
    }

    compact();

    if (pending_bytes() > options_.max_line_bytes) {
        return tl::unexpected(StreamDecodeError{
            std::format("line exceeds {} bytes without a terminator", options_.max_line_bytes)});
    }
    return lines;
}

std::optional<std::string> LineReassembler::finish() {
    if (finished_) {
        return std::nullopt;
    }
    finished_ = true;

    if (pending_bytes() == 0) {
        buffer_.clear();
        read_pos_ = 0;
        return std::nullopt;
    }
    std::string rest = buffer_.substr(read_pos_);
    buffer_.clear();
    read_pos_ = 0;
    return rest;
}

void LineReassembler::reset() noexcept {
    buffer_.clear();
    read_pos_ = 0;
    finished_ = false;
}

void LineReassembler::compact() {
    if (read_pos_ == buffer_.size()) {
        buffer_.clear();
        read_pos_ = 0;
        return;
    }
    if (read_pos_ > kCompactThreshold) {
        buffer_.erase(0, read_pos_);
        read_pos_ = 0;
    }
}

}  // namespace wcpp
