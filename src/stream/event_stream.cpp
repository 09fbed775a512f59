#include "wcpp/stream/event_stream.hpp"

#include <charconv>
#include <format>

namespace wcpp {

namespace {

struct Field {
    std::string_view name;
    std::string_view value;
};

// "name: value" -> {name, value}; at most one space after the colon is part
// of the separator. A line without a colon is a field with an empty value.
[[nodiscard]] Field split_field(std::string_view line) noexcept {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return {line, {}};
    }
    std::string_view value = line.substr(colon + 1);
    if (value.empty() == false && value.front() == ' ') {
        value.remove_prefix(1);
    }
    return {line.substr(0, colon), value};
}

[[nodiscard]] std::optional<std::uint32_t> parse_retry(std::string_view value) noexcept {
    std::uint32_t millis = 0;
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, millis);
    const bool whole_value = (ec == std::errc{}) && (ptr == end) && (value.empty() == false);
    if (whole_value == false) {
        return std::nullopt;
    }
    return millis;
}

}  // namespace

LineOutcome<StreamEvent> EventStreamStrategy::on_line(std::string_view line) {
    if (line.empty()) {
        if (data_lines_.empty()) {
            event_type_.reset();
            retry_ms_.reset();
            return std::optional<StreamEvent>{};
        }
        return std::optional<StreamEvent>{dispatch()};
    }

    if (line.front() == ':') {
        return std::optional<StreamEvent>{};
    }

    const auto [name, value] = split_field(line);

    if (name == "event") {
        event_type_ = std::string(value);
    } else if (name == "data") {
        data_bytes_ += value.size() + 1;
        if (data_bytes_ > options_.max_event_bytes) {
            return tl::unexpected(StreamDecodeError{
                std::format("event data exceeds {} bytes", options_.max_event_bytes)});
        }
        data_lines_.emplace_back(value);
    } else if (name == "id") {
        last_id_ = std::string(value);
    } else if (name == "retry") {
        if (auto parsed = parse_retry(value)) {
            retry_ms_ = *parsed;
        }
    }

    return std::optional<StreamEvent>{};
}

void EventStreamStrategy::reset() {
    event_type_.reset();
    data_lines_.clear();
    data_bytes_ = 0;
    last_id_.reset();
    retry_ms_.reset();
}

StreamEvent EventStreamStrategy::dispatch() {
    StreamEvent event;
    event.event_type = std::move(event_type_);
    event.id = last_id_;
    event.retry_ms = retry_ms_;

    for (std::size_t i = 0; i < data_lines_.size(); ++i) {
        if (i > 0) {
            event.data.push_back('\n');
        }
        event.data.append(data_lines_[i]);
    }

    event_type_.reset();
    data_lines_.clear();
    data_bytes_ = 0;
    retry_ms_.reset();
    return event;
}

}  // namespace wcpp
