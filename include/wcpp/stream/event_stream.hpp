#pragma once

#include "wcpp/stream/line_strategy.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wcpp {

/// One dispatched text/event-stream event.
///
///   event: update        -> event_type = "update"
///   data: a              -> data = "a\nb"
///   data: b
///   id: 5                -> id = "5" (kept for later events until replaced)
///   retry: 3000          -> retry_ms = 3000
///   <blank line>         -> dispatch
struct StreamEvent {
    std::optional<std::string> event_type;
    std::string data;
    std::optional<std::string> id;
    std::optional<std::uint32_t> retry_ms;

    friend bool operator==(const StreamEvent&, const StreamEvent&) = default;
};

struct EventStreamOptions {
    /// Accumulated data above this size is a decode error.
    std::size_t max_event_bytes{512 * 1024};
};

/// Line-level text/event-stream parser.
///
/// Comments (":") and unknown fields are ignored. A blank line dispatches an
/// event only if at least one data line arrived since the previous dispatch;
/// event type, data and retry are cleared after every dispatch, while id
/// persists. An event still open when the stream ends is dropped.
class EventStreamStrategy final : public ILineStrategy<StreamEvent> {
public:
    EventStreamStrategy() = default;
    explicit EventStreamStrategy(EventStreamOptions options) : options_(options) {}

    [[nodiscard]] LineOutcome<StreamEvent> on_line(std::string_view line) override;

    /// Last id seen, for reconnecting with Last-Event-ID.
    [[nodiscard]] const std::optional<std::string>& last_event_id() const noexcept { return last_id_; }

    void reset();

private:
    [[nodiscard]] StreamEvent dispatch();

    EventStreamOptions options_;
    std::optional<std::string> event_type_;
    std::vector<std::string> data_lines_;
    std::size_t data_bytes_{0};
    std::optional<std::string> last_id_;
    std::optional<std::uint32_t> retry_ms_;
};

}  // namespace wcpp
