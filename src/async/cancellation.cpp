#include "wcpp/async/cancellation.hpp"

#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <vector>

namespace wcpp {

void CancellationRegistration::reset() noexcept {
    auto state = state_.lock();
    state_.reset();
    if (state == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    state->callbacks.erase(id_);
}

bool CancellationToken::is_cancelled() const noexcept {
    if (state_ == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const {
    if (state_ == nullptr) {
        return {};
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled == false) {
            const auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }

    callback();
    return {};
}

void CancellationSource::cancel() {
    std::vector<std::function<void()>> to_run;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        for (auto& [id, callback] : state_->callbacks) {
            to_run.push_back(std::move(callback));
        }
        state_->callbacks.clear();
    }

    for (auto& callback : to_run) {
        callback();
    }
}

bool CancellationSource::is_cancelled() const noexcept {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

asio::awaitable<bool> sleep_for(std::chrono::milliseconds duration, CancellationToken token) {
    if (token.is_cancelled()) {
        co_return false;
    }

    auto executor = co_await asio::this_coro::executor;
    auto timer = std::make_shared<asio::steady_timer>(executor, duration);

    // The timer is shared with the callback because cancellation may be
    // posted from another thread after this frame has already resumed.
    auto registration = token.on_cancel([timer]() {
        asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
    });

    asio::error_code ec;
    co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));

    co_return token.is_cancelled() == false;
}

}  // namespace wcpp
