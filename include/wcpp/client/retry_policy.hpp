#ifndef WCPP_CLIENT_RETRY_POLICY_HPP
#define WCPP_CLIENT_RETRY_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace wcpp {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How many times an invocation is reattempted and how long to sleep between
// attempts. Which errors are worth retrying is decided by ClientError, not
// here.
//
//   delay(n) = exponential ? min(base * 2^min(n, 10), max) : base
//
// Usage:
//   auto policy = RetryPolicy{}
//       .with_max_retries(5)
//       .with_base_delay(std::chrono::milliseconds{250});

class RetryPolicy {
public:
    using Duration = std::chrono::milliseconds;

    static constexpr int kMaxExponent = 10;

    RetryPolicy() = default;

    RetryPolicy(int max_retries, Duration base_delay, Duration max_delay, bool exponential)
        : max_retries_(std::max(0, max_retries))
        , base_delay_(base_delay)
        , max_delay_(max_delay)
        , exponential_(exponential)
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Named policies
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static RetryPolicy exponential_backoff(int max_retries = 3) {
        return RetryPolicy{}.with_max_retries(max_retries);
    }

    /// Exactly one attempt.
    [[nodiscard]] static RetryPolicy none() {
        return RetryPolicy{}.with_max_retries(0);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Builder
    // ─────────────────────────────────────────────────────────────────────────

    RetryPolicy& with_max_retries(int retries) {
        max_retries_ = std::max(0, retries);
        return *this;
    }

    RetryPolicy& with_base_delay(Duration delay) {
        base_delay_ = delay;
        return *this;
    }

    RetryPolicy& with_max_delay(Duration delay) {
        max_delay_ = delay;
        return *this;
    }

    RetryPolicy& with_exponential_backoff(bool enabled) {
        exponential_ = enabled;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] int max_retries() const noexcept { return max_retries_; }
    [[nodiscard]] int max_attempts() const noexcept { return max_retries_ + 1; }
    [[nodiscard]] Duration base_delay() const noexcept { return base_delay_; }
    [[nodiscard]] Duration max_delay() const noexcept { return max_delay_; }
    [[nodiscard]] bool uses_exponential_backoff() const noexcept { return exponential_; }

    /// Sleep before the attempt that follows attempt `attempt` (0-based).
    [[nodiscard]] Duration delay(int attempt) const noexcept {
        if (exponential_ == false) {
            return base_delay_;
        }
        const int exponent = std::clamp(attempt, 0, kMaxExponent);
        const auto scaled = base_delay_ * (std::int64_t{1} << exponent);
        return std::min(Duration{scaled}, max_delay_);
    }

    friend bool operator==(const RetryPolicy&, const RetryPolicy&) = default;

private:
    int max_retries_{3};
    Duration base_delay_{1000};
    Duration max_delay_{30'000};
    bool exponential_{true};
};

}  // namespace wcpp

#endif  // WCPP_CLIENT_RETRY_POLICY_HPP
