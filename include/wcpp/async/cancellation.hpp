#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Cooperative cancellation
// ─────────────────────────────────────────────────────────────────────────────
// A CancellationSource flips a shared flag; every CancellationToken copied from
// it observes the flag. Code checks the token at its suspension points and can
// register a wake-up callback so a pending timer wait ends early.
//
// A default-constructed token is never cancelled.

#include <asio/awaitable.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace wcpp {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    bool cancelled{false};
    std::uint64_t next_id{0};
    std::map<std::uint64_t, std::function<void()>> callbacks;
};

}  // namespace detail

/// Unregisters its callback on destruction.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
        other.state_.reset();
    }

    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.state_.reset();
        }
        return *this;
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    ~CancellationRegistration() { reset(); }

    void reset() noexcept;

private:
    std::weak_ptr<detail::CancellationState> state_;
    std::uint64_t id_{0};
};

class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept;

    /// Runs `callback` once on cancellation, or immediately if already cancelled.
    /// The callback may run on the cancelling thread and must not block.
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> callback) const;

    [[nodiscard]] bool can_be_cancelled() const noexcept { return state_ != nullptr; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    /// Idempotent. Callbacks run on the calling thread after the lock is released.
    void cancel();

    [[nodiscard]] bool is_cancelled() const noexcept;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

/// Waits on a steady_timer of the current executor. Returns false if the wait
/// ended because `token` was cancelled (before, during, or right after it).
[[nodiscard]] asio::awaitable<bool> sleep_for(
    std::chrono::milliseconds duration,
    CancellationToken token = {}
);

}  // namespace wcpp
