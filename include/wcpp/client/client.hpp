#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client
// ═══════════════════════════════════════════════════════════════════════════
// Runs endpoints against a transport. Each invoke() is one logical request:
//
//   for attempt in 0..max_retries:
//       cancelled?                     -> Cancelled
//       build request                  -> InvalidRequest on failure
//       request interceptors           -> abort / retry requested
//       transport                      -> fault table
//       response interceptors          -> abort / retry requested
//       status in success range?       -> decode success or DecodingError
//       otherwise                      -> ServerError (+ failure body if it decodes)
//       retryable and attempts left?   -> sleep delay(attempt), go again
//
// A Client holds no per-invocation state, so any number of invocations may
// run on it at once. The Client, the endpoint and the token must outlive the
// awaitables they are passed to.
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto user = co_await client.invoke(GetUser{42});
//       if (!user) { log(user.error().describe()); }
//   }, asio::detached);

#include "wcpp/async/cancellation.hpp"
#include "wcpp/client/client_config.hpp"
#include "wcpp/client/client_error.hpp"
#include "wcpp/client/endpoint.hpp"
#include "wcpp/client/interceptor.hpp"
#include "wcpp/client/request_builder.hpp"
#include "wcpp/log/logger.hpp"
#include "wcpp/stream/decoded_stream.hpp"
#include "wcpp/stream/event_stream.hpp"
#include "wcpp/stream/line_strategy.hpp"
#include "wcpp/transfer/resumable_transfer.hpp"
#include "wcpp/transport/transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/this_coro.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace wcpp {

/// Why one attempt produced no response.
struct ExchangeFailure {
    enum class Kind {
        RetryRequested,  ///< An interceptor asked for another attempt
        Cancelled,       ///< Token cancelled or an interceptor cancelled
        Interceptor,     ///< An interceptor failed; ends the invocation
        Transport        ///< The transport reported `fault`
    };

    Kind kind{Kind::Transport};
    std::string message;
    TransportFault fault{};
};

template <typename T>
using ExchangeResult = tl::expected<T, ExchangeFailure>;

class Client {
public:
    Client(ClientConfig config, std::shared_ptr<ITransport> transport);

    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<ITransport>& transport() const noexcept { return transport_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Request / response
    // ─────────────────────────────────────────────────────────────────────────

    template <typename E>
    [[nodiscard]] asio::awaitable<ClientResult<typename E::SuccessType, typename E::FailureType>>
    invoke(const E& endpoint, CancellationToken token = {}) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Streaming
    // ─────────────────────────────────────────────────────────────────────────
    // One attempt, no retries. The endpoint is copied into the stream; the
    // request is only sent by the first next().

    template <typename E, typename T>
    [[nodiscard]] DecodedStream<T, typename E::FailureType> stream(
        const E& endpoint,
        std::unique_ptr<ILineStrategy<T>> strategy,
        CancellationToken token = {},
        HeaderMap extra_headers = {}
    ) const;

    /// text/event-stream, sent with Accept and Cache-Control headers set for it.
    template <typename E>
    [[nodiscard]] DecodedStream<StreamEvent, typename E::FailureType> event_stream(
        const E& endpoint,
        CancellationToken token = {}
    ) const {
        HeaderMap headers{{"Accept", "text/event-stream"}, {"Cache-Control", "no-cache"}};
        return stream(endpoint, std::unique_ptr<ILineStrategy<StreamEvent>>(
            std::make_unique<EventStreamStrategy>()), std::move(token), std::move(headers));
    }

    template <typename E>
    [[nodiscard]] DecodedStream<std::string, typename E::FailureType> lines(
        const E& endpoint,
        LineFilter keep = {},
        CancellationToken token = {}
    ) const {
        return stream(endpoint, std::unique_ptr<ILineStrategy<std::string>>(
            std::make_unique<RawLineStrategy>(std::move(keep))), std::move(token));
    }

    /// One JSON document per line, converted to T.
    template <typename T, typename E>
    [[nodiscard]] DecodedStream<T, typename E::FailureType> records(
        const E& endpoint,
        CancellationToken token = {},
        bool skip_blank_lines = true
    ) const {
        return stream(endpoint, std::unique_ptr<ILineStrategy<T>>(
            std::make_unique<RecordPerLineStrategy<T>>(skip_blank_lines)), std::move(token));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Downloads
    // ─────────────────────────────────────────────────────────────────────────

    /// Starts downloading `endpoint` into `destination`. The transfer's
    /// notifications run on the calling coroutine's executor.
    template <typename E>
    [[nodiscard]] asio::awaitable<ClientResult<
        std::shared_ptr<ResumableTransfer<typename E::FailureType>>, typename E::FailureType>>
    download(const E& endpoint, std::filesystem::path destination) const;

    /// Continues a paused (or failed) download from its resume token.
    template <typename Failure = std::monostate>
    [[nodiscard]] asio::awaitable<ClientResult<std::shared_ptr<ResumableTransfer<Failure>>, Failure>>
    resume_download(ResumeToken token, std::filesystem::path destination) const;

private:
    [[nodiscard]] std::string next_correlation_id() const;

    [[nodiscard]] AttemptContext make_context(const RequestParts& parts, int attempt,
                                              const std::string& correlation_id) const;

    /// Builds the request and stamps the correlation id header.
    [[nodiscard]] tl::expected<HttpRequest, std::string> prepare(
        const RequestParts& parts,
        const std::string& correlation_id
    ) const;

    /// Request interceptors, transport, response interceptors.
    [[nodiscard]] asio::awaitable<ExchangeResult<HttpResponse>> exchange(
        HttpRequest request,
        AttemptContext context,
        CancellationToken token
    ) const;

    /// Request interceptors, then the streaming transport call.
    [[nodiscard]] asio::awaitable<ExchangeResult<StreamingResponse>> open_stream(
        HttpRequest request,
        AttemptContext context,
        CancellationToken token
    ) const;

    [[nodiscard]] asio::awaitable<ExchangeResult<HttpRequest>> intercept_request(
        HttpRequest request,
        const AttemptContext& context
    ) const;

    template <typename Failure>
    [[nodiscard]] static ClientError<Failure> terminal_error(const ExchangeFailure& failure);

    template <typename Failure>
    asio::awaitable<ClientResult<std::shared_ptr<ResumableTransfer<Failure>>, Failure>> start_transfer(
        std::filesystem::path destination,
        std::function<TransportResult<std::shared_ptr<ITransferTask>>(std::weak_ptr<ITransferObserver>)> make_task
    ) const;

    ClientConfig config_;
    std::shared_ptr<ITransport> transport_;
    InterceptorChain interceptors_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Template implementation
// ═══════════════════════════════════════════════════════════════════════════

template <typename Failure>
ClientError<Failure> Client::terminal_error(const ExchangeFailure& failure) {
    switch (failure.kind) {
        case ExchangeFailure::Kind::Cancelled:
            return ClientError<Failure>::cancelled();
        case ExchangeFailure::Kind::Transport:
            return ClientError<Failure>::from_transport(failure.fault);
        case ExchangeFailure::Kind::RetryRequested:
            return ClientError<Failure>::unexpected_response(failure.message);
        case ExchangeFailure::Kind::Interceptor:
            break;
    }
    return ClientError<Failure>::network_error(failure.message);
}

template <typename E>
asio::awaitable<ClientResult<typename E::SuccessType, typename E::FailureType>>
Client::invoke(const E& endpoint, CancellationToken token) const {
    using Failure = typename E::FailureType;
    using Error = ClientError<Failure>;

    const RetryPolicy policy = endpoint.retry_policy().value_or(config_.retry_policy);
    const RequestParts parts = request_parts(endpoint);
    const StatusRange success = endpoint.success_statuses();
    const std::string correlation_id = next_correlation_id();
    const int max_attempts = policy.max_attempts();

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        if (token.is_cancelled()) {
            co_return tl::unexpected(Error::cancelled());
        }

        auto request = prepare(parts, correlation_id);
        if (!request) {
            co_return tl::unexpected(Error::invalid_request(std::move(request.error())));
        }

        log_for(LogTopic::Client).debug("{} {} attempt {}/{} [{}]", to_string(parts.method), parts.path,
                               attempt + 1, max_attempts, correlation_id);

        auto exchanged = co_await exchange(std::move(*request), make_context(parts, attempt, correlation_id), token);
        const bool last_attempt = (attempt + 1 >= max_attempts);

        std::optional<Error> error;
        if (exchanged) {
            HttpResponse& response = *exchanged;
            if (success.contains(response.meta.status_code)) {
                auto decoded = endpoint.decode_success(response.body, response.meta);
                if (!decoded) {
                    co_return tl::unexpected(Error::decoding_error(std::move(decoded.error()), std::move(response.body)));
                }
                co_return std::move(*decoded);
            }

            auto failure = endpoint.decode_failure(response.body, response.meta);
            std::optional<Failure> typed;
            if (failure) {
                typed = std::move(*failure);
            }
            error = Error::server_error(response.meta.status_code, std::move(typed), std::move(response.body));
        } else if (exchanged.error().kind == ExchangeFailure::Kind::RetryRequested) {
            if (last_attempt) {
                log_for(LogTopic::Client).warn("{} {}: retry requested after the last attempt", to_string(parts.method), parts.path);
                co_return tl::unexpected(Error::unexpected_response("Retry requested after the last attempt"));
            }
            log_for(LogTopic::Client).debug("{} {}: interceptor requested a retry", to_string(parts.method), parts.path);
            continue;
        } else if (exchanged.error().kind == ExchangeFailure::Kind::Transport) {
            error = Error::from_transport(exchanged.error().fault);
        } else {
            co_return tl::unexpected(terminal_error<Failure>(exchanged.error()));
        }

        if (error->is_retryable() == false || last_attempt) {
            log_for(LogTopic::Client).warn("{} {} failed: {}", to_string(parts.method), parts.path, error->describe());
            co_return tl::unexpected(std::move(*error));
        }

        const auto delay = policy.delay(attempt);
        log_for(LogTopic::Client).info("Retrying {} {} in {}ms (attempt {}/{}): {}", to_string(parts.method), parts.path,
                              delay.count(), attempt + 2, max_attempts, error->describe());

        if (token.is_cancelled()) {
            co_return tl::unexpected(Error::cancelled());
        }
        const bool slept = co_await sleep_for(delay, token);
        if (slept == false || token.is_cancelled()) {
            co_return tl::unexpected(Error::cancelled());
        }
    }

    co_return tl::unexpected(Error::unexpected_response("No attempt was made"));
}

template <typename E, typename T>
DecodedStream<T, typename E::FailureType> Client::stream(
    const E& endpoint,
    std::unique_ptr<ILineStrategy<T>> strategy,
    CancellationToken token,
    HeaderMap extra_headers
) const {
    using Failure = typename E::FailureType;
    using Stream = DecodedStream<T, Failure>;

    auto described = std::make_shared<const E>(endpoint);
    RequestParts parts = request_parts(*described);
    for (auto& [name, value] : extra_headers) {
        set_header(parts.headers, name, std::move(value));
    }

    typename Stream::Opener open =
        [this, parts = std::move(parts), token]() -> asio::awaitable<ClientResult<StreamingResponse, Failure>> {
            const std::string correlation_id = next_correlation_id();
            auto request = prepare(parts, correlation_id);
            if (!request) {
                co_return tl::unexpected(ClientError<Failure>::invalid_request(std::move(request.error())));
            }
            // A stream may legitimately stay open far longer than one request.
            request->timeout = parts.timeout.value_or(config_.resource_timeout);
            auto opened = co_await open_stream(std::move(*request), make_context(parts, 0, correlation_id), token);
            if (!opened) {
                co_return tl::unexpected(terminal_error<Failure>(opened.error()));
            }
            co_return std::move(*opened);
        };

    typename Stream::FailureDecoder decode_failure =
        [described](std::string_view body, const ResponseMetadata& meta) -> std::optional<Failure> {
            auto failure = described->decode_failure(body, meta);
            if (!failure) {
                return std::nullopt;
            }
            return std::move(*failure);
        };

    DecodedStreamOptions options;
    options.success_statuses = described->success_statuses();
    options.failure_body_limit = config_.stream_failure_body_limit;

    return Stream(std::move(open), std::move(strategy), std::move(decode_failure), options, std::move(token));
}

template <typename Failure>
asio::awaitable<ClientResult<std::shared_ptr<ResumableTransfer<Failure>>, Failure>> Client::start_transfer(
    std::filesystem::path destination,
    std::function<TransportResult<std::shared_ptr<ITransferTask>>(std::weak_ptr<ITransferObserver>)> make_task
) const {
    auto executor = co_await asio::this_coro::executor;
    auto transfer = std::make_shared<ResumableTransfer<Failure>>(
        executor, std::move(destination), config_.progress_buffer_size);

    auto task = make_task(std::weak_ptr<ITransferObserver>(transfer));
    if (!task) {
        co_return tl::unexpected(ClientError<Failure>::from_transport(task.error()));
    }

    transfer->attach(*task);
    (*task)->start();
    co_return transfer;
}

template <typename E>
asio::awaitable<ClientResult<
    std::shared_ptr<ResumableTransfer<typename E::FailureType>>, typename E::FailureType>>
Client::download(const E& endpoint, std::filesystem::path destination) const {
    using Failure = typename E::FailureType;

    const RequestParts parts = request_parts(endpoint);
    const std::string correlation_id = next_correlation_id();
    auto request = prepare(parts, correlation_id);
    if (!request) {
        co_return tl::unexpected(ClientError<Failure>::invalid_request(std::move(request.error())));
    }
    request->timeout = parts.timeout.value_or(config_.resource_timeout);

    auto intercepted = co_await intercept_request(std::move(*request), make_context(parts, 0, correlation_id));
    if (!intercepted) {
        co_return tl::unexpected(terminal_error<Failure>(intercepted.error()));
    }

    log_for(LogTopic::Transfer).debug("Downloading {} to {}", intercepted->url, destination.string());
    auto transport = transport_;
    auto ready = std::make_shared<HttpRequest>(std::move(*intercepted));
    co_return co_await start_transfer<Failure>(std::move(destination),
        [transport, ready](std::weak_ptr<ITransferObserver> observer) {
            return transport->make_download(std::move(*ready), std::move(observer));
        });
}

template <typename Failure>
asio::awaitable<ClientResult<std::shared_ptr<ResumableTransfer<Failure>>, Failure>>
Client::resume_download(ResumeToken token, std::filesystem::path destination) const {
    log_for(LogTopic::Transfer).debug("Resuming download to {}", destination.string());
    auto transport = transport_;
    co_return co_await start_transfer<Failure>(std::move(destination),
        [transport, token = std::move(token)](std::weak_ptr<ITransferObserver> observer) {
            return transport->make_resumed_download(token, std::move(observer));
        });
}

}  // namespace wcpp
