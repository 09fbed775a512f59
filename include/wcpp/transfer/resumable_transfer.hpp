#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ResumableTransfer
// ═══════════════════════════════════════════════════════════════════════════
// Owns one download: its state, its progress feed, and its result. Transport
// callbacks (any thread) and the caller's pause()/cancel() all go through the
// same mutex; notifications go out after the lock is released.
//
//                 progress
//               ┌─────────┐
//               ▼         │
//        ┌─────────────┐──┘
//        │ Downloading │──── finished ────► Completed(location)
//        └─────────────┘──── failed ──────► Failed(error)
//           │       │
//     pause()       cancel()
//           │       │
//           ▼       ▼
//   Paused(token)  Cancelled      (pause without a token ends in Cancelled)
//
// Every state but Downloading is terminal: no callback or caller action
// changes it again.

#include "wcpp/client/client_error.hpp"
#include "wcpp/log/logger.hpp"
#include "wcpp/transfer/transfer_progress.hpp"
#include "wcpp/transport/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/redirect_error.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <variant>
#include <vector>

namespace wcpp {

// ─────────────────────────────────────────────────────────────────────────────
// State
// ─────────────────────────────────────────────────────────────────────────────

enum class TransferStatus { Downloading, Paused, Completed, Failed, Cancelled };

[[nodiscard]] constexpr std::string_view to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Downloading: return "Downloading";
        case TransferStatus::Paused:      return "Paused";
        case TransferStatus::Completed:   return "Completed";
        case TransferStatus::Failed:      return "Failed";
        case TransferStatus::Cancelled:   return "Cancelled";
    }
    return "Unknown";
}

namespace transfer_state {

struct Downloading {};

struct Paused {
    ResumeToken resume_token;
};

struct Completed {
    std::filesystem::path location;
};

template <typename Failure>
struct Failed {
    ClientError<Failure> error;
    /// Set when the transport could still describe how to continue.
    std::optional<ResumeToken> resume_token;
};

struct Cancelled {};

}  // namespace transfer_state

template <typename Failure = std::monostate>
using TransferState = std::variant<
    transfer_state::Downloading,
    transfer_state::Paused,
    transfer_state::Completed,
    transfer_state::Failed<Failure>,
    transfer_state::Cancelled
>;

template <typename Failure>
[[nodiscard]] TransferStatus status_of(const TransferState<Failure>& state) noexcept {
    return static_cast<TransferStatus>(state.index());
}

// ─────────────────────────────────────────────────────────────────────────────
// ProgressStream
// ─────────────────────────────────────────────────────────────────────────────

using ProgressChannel = asio::experimental::concurrent_channel<void(asio::error_code, TransferProgress)>;

/// Single-consumer feed of progress snapshots. next() yields nullopt once the
/// transfer has reached a terminal state.
class ProgressStream {
public:
    ProgressStream() = default;
    explicit ProgressStream(std::shared_ptr<ProgressChannel> channel) : channel_(std::move(channel)) {}

    [[nodiscard]] asio::awaitable<std::optional<TransferProgress>> next() {
        if (channel_ == nullptr) {
            co_return std::nullopt;
        }
        asio::error_code ec;
        auto progress = co_await channel_->async_receive(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            channel_.reset();
            co_return std::nullopt;
        }
        co_return progress;
    }

    [[nodiscard]] bool ended() const noexcept { return channel_ == nullptr; }

private:
    std::shared_ptr<ProgressChannel> channel_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ResumableTransfer
// ─────────────────────────────────────────────────────────────────────────────

template <typename Failure = std::monostate>
class ResumableTransfer final
    : public ITransferObserver
    , public std::enable_shared_from_this<ResumableTransfer<Failure>> {
public:
    using State = TransferState<Failure>;
    using Outcome = ClientResult<std::filesystem::path, Failure>;

    /// `destination` is where a finished download is moved to.
    ResumableTransfer(
        asio::any_io_executor executor,
        std::filesystem::path destination,
        std::size_t progress_buffer = 64
    )
        : executor_(std::move(executor))
        , destination_(std::move(destination))
        , progress_channel_(std::make_shared<ProgressChannel>(executor_, progress_buffer))
    {}

    ResumableTransfer(const ResumableTransfer&) = delete;
    ResumableTransfer& operator=(const ResumableTransfer&) = delete;

    /// Hands over the task the transfer controls. Called once, before start.
    void attach(std::shared_ptr<ITransferTask> task) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::holds_alternative<transfer_state::Downloading>(state_)) {
            task_ = std::move(task);
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] State state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    [[nodiscard]] TransferStatus status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_of<Failure>(state_);
    }

    [[nodiscard]] TransferProgress progress() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_;
    }

    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Caller operations
    // ─────────────────────────────────────────────────────────────────────────

    /// Stops the download keeping what was written. Returns the resume token,
    /// or nullopt if the transfer was not downloading or the transport could
    /// not produce one (the transfer is then Cancelled).
    [[nodiscard]] asio::awaitable<std::optional<ResumeToken>> pause() {
        std::shared_ptr<ITransferTask> task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const bool downloading = std::holds_alternative<transfer_state::Downloading>(state_);
            if (downloading == false || pausing_) {
                co_return std::nullopt;
            }
            pausing_ = true;
            task = task_;
        }

        std::optional<ResumeToken> token;
        if (task != nullptr) {
            auto executor = co_await asio::this_coro::executor;
            auto reply = std::make_shared<asio::experimental::concurrent_channel<
                void(asio::error_code, std::optional<ResumeToken>)>>(executor, 1);

            task->cancel(true, [reply](std::optional<ResumeToken> produced) {
                reply->try_send(asio::error_code{}, std::move(produced));
            });

            asio::error_code ec;
            token = co_await reply->async_receive(asio::redirect_error(asio::use_awaitable, ec));
            if (ec) {
                token.reset();
            }
        }

        Finish finish;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pausing_ = false;
            if (std::holds_alternative<transfer_state::Downloading>(state_) == false) {
                co_return std::nullopt;
            }
            if (token.has_value()) {
                state_ = transfer_state::Paused{*token};
            } else {
                state_ = transfer_state::Cancelled{};
            }
            finish = take_finish_locked();
        }
        complete(std::move(finish));
        co_return token;
    }

    /// Stops the download and discards it. No-op unless downloading.
    void cancel() {
        Finish finish;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::holds_alternative<transfer_state::Downloading>(state_) == false) {
                return;
            }
            state_ = transfer_state::Cancelled{};
            finish = take_finish_locked();
        }
        if (finish.task != nullptr) {
            finish.task->cancel(false, [](std::optional<ResumeToken>) {});
        }
        complete(std::move(finish));
    }

    /// Consume-once. Later calls, and calls after a terminal transition,
    /// return a stream that is already ended.
    [[nodiscard]] ProgressStream progress_updates() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (progress_taken_) {
            log_for(LogTopic::Transfer).warn("progress_updates() called more than once; returning an ended stream");
            return ProgressStream{};
        }
        progress_taken_ = true;
        if (std::holds_alternative<transfer_state::Downloading>(state_) == false) {
            return ProgressStream{};
        }
        return ProgressStream{progress_channel_};
    }

    /// Location of the finished file, or the error that ended the transfer.
    /// Paused and cancelled transfers yield a Cancelled error. Any number of
    /// callers may wait; each sees the same outcome.
    [[nodiscard]] asio::awaitable<Outcome> result() {
        auto executor = co_await asio::this_coro::executor;
        std::shared_ptr<Waiter> waiter;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::holds_alternative<transfer_state::Downloading>(state_) == false) {
                co_return outcome_locked();
            }
            waiter = std::make_shared<Waiter>(executor, 1);
            waiters_.push_back(waiter);
        }

        asio::error_code ec;
        co_await waiter->async_receive(asio::redirect_error(asio::use_awaitable, ec));

        std::lock_guard<std::mutex> lock(mutex_);
        co_return outcome_locked();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // ITransferObserver
    // ─────────────────────────────────────────────────────────────────────────

    void on_progress(std::int64_t bytes_written, std::int64_t total_expected) override {
        TransferProgress snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::holds_alternative<transfer_state::Downloading>(state_) == false) {
                return;
            }
            progress_.bytes_transferred = bytes_written;
            progress_.total_bytes = (total_expected > 0)
                ? std::optional<std::int64_t>{total_expected}
                : std::nullopt;
            snapshot = progress_;
        }
        // A full buffer drops the snapshot; progress() always has the latest
        progress_channel_->try_send(asio::error_code{}, snapshot);
    }

    void on_finished(const std::filesystem::path& location, const ResponseMetadata& meta) override {
        if (status() != TransferStatus::Downloading) {
            return;
        }

        State next = transfer_state::Completed{destination_};
        if (meta.is_success() == false) {
            next = transfer_state::Failed<Failure>{
                ClientError<Failure>::server_error(meta.status_code), std::nullopt};
        } else if (auto moved = move_into_place(location); moved.has_value() == false) {
            next = transfer_state::Failed<Failure>{
                ClientError<Failure>::network_error(moved.error()), std::nullopt};
        }

        transition(std::move(next));
    }

    void on_failed(const TransportFault& fault, std::optional<ResumeToken> resume_token) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::holds_alternative<transfer_state::Downloading>(state_) == false) {
                return;
            }
            // The pause in flight settles the state from its own reply
            if (pausing_ && fault.code == TransportFault::Code::Cancelled) {
                return;
            }
        }

        if (fault.code == TransportFault::Code::Cancelled) {
            transition(transfer_state::Cancelled{});
            return;
        }
        transition(transfer_state::Failed<Failure>{
            ClientError<Failure>::from_transport(fault), std::move(resume_token)});
    }

private:
    using Waiter = asio::experimental::concurrent_channel<void(asio::error_code)>;

    struct Finish {
        std::shared_ptr<ITransferTask> task;
        std::vector<std::shared_ptr<Waiter>> waiters;
        TransferStatus status{TransferStatus::Downloading};
    };

    Finish take_finish_locked() {
        Finish finish;
        finish.task = std::move(task_);
        finish.waiters = std::move(waiters_);
        waiters_.clear();
        finish.status = status_of<Failure>(state_);
        return finish;
    }

    void transition(State next) {
        Finish finish;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::holds_alternative<transfer_state::Downloading>(state_) == false) {
                return;
            }
            state_ = std::move(next);
            finish = take_finish_locked();
        }
        complete(std::move(finish));
    }

    void complete(Finish finish) {
        log_for(LogTopic::Transfer).debug("Download to {} is now {}", destination_.string(), to_string(finish.status));
        progress_channel_->close();
        for (auto& waiter : finish.waiters) {
            waiter->try_send(asio::error_code{});
        }
        finish.task.reset();
    }

    Outcome outcome_locked() const {
        if (const auto* completed = std::get_if<transfer_state::Completed>(&state_)) {
            return completed->location;
        }
        if (const auto* failed = std::get_if<transfer_state::Failed<Failure>>(&state_)) {
            return tl::unexpected(failed->error);
        }
        return tl::unexpected(ClientError<Failure>::cancelled());
    }

    tl::expected<void, std::string> move_into_place(const std::filesystem::path& location) const {
        namespace fs = std::filesystem;
        std::error_code ec;

        if (destination_.has_parent_path()) {
            fs::create_directories(destination_.parent_path(), ec);
            if (ec) {
                return tl::unexpected("cannot create " + destination_.parent_path().string() + ": " + ec.message());
            }
        }
        fs::remove(destination_, ec);

        fs::rename(location, destination_, ec);
        if (ec) {
            // Different filesystems: fall back to copy + remove
            ec.clear();
            fs::copy_file(location, destination_, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return tl::unexpected("cannot move download to " + destination_.string() + ": " + ec.message());
            }
            fs::remove(location, ec);
        }
        return {};
    }

    asio::any_io_executor executor_;
    const std::filesystem::path destination_;

    mutable std::mutex mutex_;
    State state_{transfer_state::Downloading{}};
    TransferProgress progress_;
    std::shared_ptr<ITransferTask> task_;
    std::vector<std::shared_ptr<Waiter>> waiters_;
    bool pausing_{false};
    bool progress_taken_{false};

    std::shared_ptr<ProgressChannel> progress_channel_;
};

}  // namespace wcpp
