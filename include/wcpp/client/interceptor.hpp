#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Interceptors
// ═══════════════════════════════════════════════════════════════════════════
// Per-attempt hooks around the transport. Request interceptors run in
// registration order before the request is sent, each receiving the previous
// one's output; response interceptors do the same with the response. Any of
// them may return a fault instead:
//
//   RetryRequested  start the next attempt (or give up if none remain)
//   Cancelled       end the invocation with a cancelled error
//   Failed          end the invocation with a network error
//
// Interceptors must not hold on to requests, responses or contexts after
// their call returns.

#include "wcpp/http/http_types.hpp"

#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wcpp {

/// Facts about one attempt. A fresh value is made for every attempt.
struct AttemptContext {
    std::string path;
    HttpMethod method{HttpMethod::Get};
    int attempt_number{0};       ///< 0 for the first attempt
    std::string correlation_id;  ///< Same for every attempt of one invocation

    /// Time spent in the transport. Only set for response interceptors.
    std::optional<std::chrono::nanoseconds> elapsed;
};

struct InterceptorFault {
    enum class Kind { RetryRequested, Cancelled, Failed };

    Kind kind{Kind::Failed};
    std::string message;

    [[nodiscard]] static InterceptorFault retry_requested(std::string reason = "Retry requested") {
        return {Kind::RetryRequested, std::move(reason)};
    }

    [[nodiscard]] static InterceptorFault cancelled(std::string reason = "Cancelled by interceptor") {
        return {Kind::Cancelled, std::move(reason)};
    }

    [[nodiscard]] static InterceptorFault failed(std::string reason) {
        return {Kind::Failed, std::move(reason)};
    }
};

template <typename T>
using InterceptResult = tl::expected<T, InterceptorFault>;

class IRequestInterceptor {
public:
    virtual ~IRequestInterceptor() = default;

    [[nodiscard]] virtual asio::awaitable<InterceptResult<HttpRequest>> intercept(
        HttpRequest request,
        const AttemptContext& context
    ) = 0;
};

class IResponseInterceptor {
public:
    virtual ~IResponseInterceptor() = default;

    [[nodiscard]] virtual asio::awaitable<InterceptResult<HttpResponse>> intercept(
        HttpResponse response,
        const AttemptContext& context
    ) = 0;
};

using RequestInterceptorList = std::vector<std::shared_ptr<IRequestInterceptor>>;
using ResponseInterceptorList = std::vector<std::shared_ptr<IResponseInterceptor>>;

// ─────────────────────────────────────────────────────────────────────────────
// Adapters for synchronous callables
// ─────────────────────────────────────────────────────────────────────────────

using RequestHook = std::function<InterceptResult<HttpRequest>(HttpRequest, const AttemptContext&)>;
using ResponseHook = std::function<InterceptResult<HttpResponse>(HttpResponse, const AttemptContext&)>;

[[nodiscard]] std::shared_ptr<IRequestInterceptor> make_request_interceptor(RequestHook hook);
[[nodiscard]] std::shared_ptr<IResponseInterceptor> make_response_interceptor(ResponseHook hook);

// ─────────────────────────────────────────────────────────────────────────────
// InterceptorChain
// ─────────────────────────────────────────────────────────────────────────────

class InterceptorChain {
public:
    InterceptorChain() = default;
    InterceptorChain(RequestInterceptorList request, ResponseInterceptorList response)
        : request_(std::move(request))
        , response_(std::move(response))
    {}

    /// Stops at the first fault.
    [[nodiscard]] asio::awaitable<InterceptResult<HttpRequest>> run_request(
        HttpRequest request,
        const AttemptContext& context
    ) const;

    [[nodiscard]] asio::awaitable<InterceptResult<HttpResponse>> run_response(
        HttpResponse response,
        const AttemptContext& context
    ) const;

    [[nodiscard]] bool empty() const noexcept { return request_.empty() && response_.empty(); }

private:
    RequestInterceptorList request_;
    ResponseInterceptorList response_;
};

}  // namespace wcpp
