#include "wcpp/client/client.hpp"

#include <exception>
#include <stdexcept>

namespace wcpp {

Client::Client(ClientConfig config, std::shared_ptr<ITransport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , interceptors_(config_.request_interceptors, config_.response_interceptors)
{
    if (transport_ == nullptr) {
        throw std::invalid_argument("Client: transport cannot be null");
    }
}

std::string Client::next_correlation_id() const {
    if (config_.request_id_generator) {
        return config_.request_id_generator();
    }
    return uuid_request_id();
}

AttemptContext Client::make_context(
    const RequestParts& parts,
    int attempt,
    const std::string& correlation_id
) const {
    AttemptContext context;
    context.path = parts.path;
    context.method = parts.method;
    context.attempt_number = attempt;
    context.correlation_id = correlation_id;
    return context;
}

tl::expected<HttpRequest, std::string> Client::prepare(
    const RequestParts& parts,
    const std::string& correlation_id
) const {
    auto request = build_request(parts, config_);
    if (request && config_.request_id_generator && config_.request_id_header.empty() == false) {
        set_header(request->headers, config_.request_id_header, correlation_id);
    }
    return request;
}

// ─────────────────────────────────────────────────────────────────────────────
// Interceptors and transport
// ─────────────────────────────────────────────────────────────────────────────

namespace {

ExchangeFailure from_interceptor(const InterceptorFault& fault) {
    switch (fault.kind) {
        case InterceptorFault::Kind::RetryRequested:
            return {ExchangeFailure::Kind::RetryRequested, fault.message, {}};
        case InterceptorFault::Kind::Cancelled:
            return {ExchangeFailure::Kind::Cancelled, fault.message, {}};
        case InterceptorFault::Kind::Failed:
            break;
    }
    return {ExchangeFailure::Kind::Interceptor, fault.message, {}};
}

ExchangeFailure cancelled_exchange() {
    return {ExchangeFailure::Kind::Cancelled, "Request was cancelled", {}};
}

ExchangeFailure transport_failure(TransportFault fault) {
    std::string message = fault.message;
    return {ExchangeFailure::Kind::Transport, std::move(message), std::move(fault)};
}

}  // namespace

asio::awaitable<ExchangeResult<HttpRequest>> Client::intercept_request(
    HttpRequest request,
    const AttemptContext& context
) const {
    InterceptResult<HttpRequest> intercepted = tl::unexpected(InterceptorFault::failed("not run"));
    try {
        intercepted = co_await interceptors_.run_request(std::move(request), context);
    } catch (const std::exception& e) {
        log_for(LogTopic::Client).warn("Request interceptor threw: {}", e.what());
        co_return tl::unexpected(ExchangeFailure{ExchangeFailure::Kind::Interceptor, e.what(), {}});
    }
    if (!intercepted) {
        co_return tl::unexpected(from_interceptor(intercepted.error()));
    }
    co_return std::move(*intercepted);
}

asio::awaitable<ExchangeResult<HttpResponse>> Client::exchange(
    HttpRequest request,
    AttemptContext context,
    CancellationToken token
) const {
    auto prepared = co_await intercept_request(std::move(request), context);
    if (!prepared) {
        co_return tl::unexpected(std::move(prepared.error()));
    }
    if (token.is_cancelled()) {
        co_return tl::unexpected(cancelled_exchange());
    }

    const auto started = std::chrono::steady_clock::now();
    auto sent = co_await transport_->send(std::move(*prepared));
    context.elapsed = std::chrono::steady_clock::now() - started;

    if (token.is_cancelled()) {
        co_return tl::unexpected(cancelled_exchange());
    }
    if (!sent) {
        co_return tl::unexpected(transport_failure(std::move(sent.error())));
    }

    InterceptResult<HttpResponse> intercepted = tl::unexpected(InterceptorFault::failed("not run"));
    try {
        intercepted = co_await interceptors_.run_response(std::move(*sent), context);
    } catch (const std::exception& e) {
        log_for(LogTopic::Client).warn("Response interceptor threw: {}", e.what());
        co_return tl::unexpected(ExchangeFailure{ExchangeFailure::Kind::Interceptor, e.what(), {}});
    }
    if (!intercepted) {
        co_return tl::unexpected(from_interceptor(intercepted.error()));
    }
    if (token.is_cancelled()) {
        co_return tl::unexpected(cancelled_exchange());
    }
    co_return std::move(*intercepted);
}

asio::awaitable<ExchangeResult<StreamingResponse>> Client::open_stream(
    HttpRequest request,
    AttemptContext context,
    CancellationToken token
) const {
    auto prepared = co_await intercept_request(std::move(request), context);
    if (!prepared) {
        co_return tl::unexpected(std::move(prepared.error()));
    }
    if (token.is_cancelled()) {
        co_return tl::unexpected(cancelled_exchange());
    }

    auto opened = co_await transport_->send_streaming(std::move(*prepared));
    if (!opened) {
        co_return tl::unexpected(transport_failure(std::move(opened.error())));
    }
    if (token.is_cancelled()) {
        opened->body->close();
        co_return tl::unexpected(cancelled_exchange());
    }
    co_return std::move(*opened);
}

}  // namespace wcpp
