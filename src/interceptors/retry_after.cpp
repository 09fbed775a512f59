#include "wcpp/interceptors/retry_after.hpp"

#include "wcpp/async/cancellation.hpp"
#include "wcpp/log/logger.hpp"

#include <algorithm>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace wcpp {

namespace {

constexpr int kTooManyRequests = 429;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value) {
    std::tm tm{};
    std::istringstream in{std::string(value)};
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    if (in.fail()) {
        return std::nullopt;
    }
    const std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

}  // namespace

std::optional<std::chrono::milliseconds> parse_retry_after(
    std::string_view value,
    std::chrono::system_clock::time_point now
) {
    value = trim(value);
    if (value.empty()) {
        return std::nullopt;
    }

    std::int64_t seconds = 0;
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, seconds);
    if (ec == std::errc{} && ptr == end) {
        if (seconds < 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds{seconds * 1000};
    }

    const auto date = parse_http_date(value);
    if (date.has_value() == false) {
        return std::nullopt;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*date - now);
    return std::max(remaining, std::chrono::milliseconds{0});
}

RetryAfterInterceptor::RetryAfterInterceptor(RetryAfterOptions options, Clock clock, Sleeper sleeper)
    : options_(options)
    , clock_(std::move(clock))
    , sleeper_(std::move(sleeper))
{
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) -> asio::awaitable<void> {
            [[maybe_unused]] const bool finished = co_await sleep_for(delay);
        };
    }
}

std::chrono::milliseconds RetryAfterInterceptor::delay_for(const ResponseMetadata& meta) const {
    std::optional<std::chrono::milliseconds> requested;
    if (const auto header = meta.header("Retry-After")) {
        requested = parse_retry_after(*header, clock_());
    }
    return std::min(requested.value_or(options_.default_delay), options_.max_delay);
}

asio::awaitable<InterceptResult<HttpResponse>> RetryAfterInterceptor::intercept(
    HttpResponse response,
    const AttemptContext& context
) {
    if (response.meta.status_code != kTooManyRequests) {
        co_return response;
    }

    const auto delay = delay_for(response.meta);
    log_for(LogTopic::Client).info("{} {} rate limited; waiting {}ms before attempt {}",
                          to_string(context.method), context.path, delay.count(), context.attempt_number + 2);
    co_await sleeper_(delay);
    co_return tl::unexpected(InterceptorFault::retry_requested("Rate limited (429)"));
}

}  // namespace wcpp
