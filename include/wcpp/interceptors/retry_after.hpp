#pragma once

#include "wcpp/client/interceptor.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

namespace wcpp {

/// Delay requested by a Retry-After value: delta-seconds ("120") or an
/// IMF-fixdate ("Wed, 21 Oct 2015 07:28:00 GMT"). Dates in the past yield
/// zero. nullopt if the value is neither.
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_retry_after(
    std::string_view value,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

struct RetryAfterOptions {
    /// Used when a 429 has no usable Retry-After header.
    std::chrono::milliseconds default_delay{1'000};
    /// Upper bound on any wait.
    std::chrono::milliseconds max_delay{60'000};
};

/// On 429 Too Many Requests waits for min(Retry-After, max_delay), then asks
/// the client for another attempt. Every other response passes through.
class RetryAfterInterceptor final : public IResponseInterceptor {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using Sleeper = std::function<asio::awaitable<void>(std::chrono::milliseconds)>;

    explicit RetryAfterInterceptor(RetryAfterOptions options = {}, Clock clock = {}, Sleeper sleeper = {});

    [[nodiscard]] asio::awaitable<InterceptResult<HttpResponse>> intercept(
        HttpResponse response,
        const AttemptContext& context
    ) override;

    [[nodiscard]] std::chrono::milliseconds delay_for(const ResponseMetadata& meta) const;

private:
    RetryAfterOptions options_;
    Clock clock_;
    Sleeper sleeper_;
};

}  // namespace wcpp
