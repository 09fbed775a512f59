#pragma once

#include "wcpp/client/interceptor.hpp"
#include "wcpp/client/retry_policy.hpp"
#include "wcpp/http/http_types.hpp"
#include "wcpp/json/json_decoder.hpp"
#include "wcpp/stream/decoded_stream.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace wcpp {

/// Random RFC 4122 version 4 identifier, e.g. "3f2b8c1e-9a4d-4c7e-b1f0-5d6e7a8b9c0d".
[[nodiscard]] std::string uuid_request_id();

// ─────────────────────────────────────────────────────────────────────────────
// ClientConfig
// ─────────────────────────────────────────────────────────────────────────────

struct ClientConfig {
    using RequestIdGenerator = std::function<std::string()>;

    /// Scheme, host and optional path prefix, e.g. "https://api.example.com/v2".
    std::string base_url;

    /// Budget for one attempt's request/response exchange.
    std::chrono::milliseconds request_timeout{30'000};

    /// Budget for a whole download.
    std::chrono::milliseconds resource_timeout{60'000};

    HeaderMap default_headers{{"Accept", "application/json"}};

    RetryPolicy retry_policy{};

    RequestInterceptorList request_interceptors;
    ResponseInterceptorList response_interceptors;

    /// When set, each invocation's id is also sent in `request_id_header`.
    RequestIdGenerator request_id_generator;
    std::string request_id_header{"X-Request-ID"};

    std::size_t stream_failure_body_limit{kDefaultFailureBodyLimit};

    /// Progress updates buffered per download before new ones are dropped.
    std::size_t progress_buffer_size{64};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder
    // ─────────────────────────────────────────────────────────────────────────
    //   auto config = ClientConfig{}
    //       .with_base_url("https://api.example.com")
    //       .with_bearer_token(token)
    //       .with_retry_policy(RetryPolicy::none());

    ClientConfig& with_base_url(std::string url);
    ClientConfig& with_header(const std::string& name, std::string value);
    ClientConfig& with_bearer_token(const std::string& token);
    ClientConfig& with_request_timeout(std::chrono::milliseconds timeout);
    ClientConfig& with_resource_timeout(std::chrono::milliseconds timeout);
    ClientConfig& with_retry_policy(RetryPolicy policy);
    ClientConfig& with_request_interceptor(std::shared_ptr<IRequestInterceptor> interceptor);
    ClientConfig& with_response_interceptor(std::shared_ptr<IResponseInterceptor> interceptor);
    ClientConfig& with_request_ids(RequestIdGenerator generator = uuid_request_id,
                                   std::string header = "X-Request-ID");

    /// Reads the scalar settings from a JSON document:
    ///
    ///   {
    ///     "base_url": "https://api.example.com",
    ///     "request_timeout_ms": 10000,
    ///     "resource_timeout_ms": 120000,
    ///     "headers": {"User-Agent": "demo/1.0"},
    ///     "retry": {"max_retries": 5, "base_delay_ms": 200,
    ///               "max_delay_ms": 10000, "exponential": true},
    ///     "request_id_header": "X-Correlation-ID",
    ///     "stream_failure_body_limit": 65536
    ///   }
    ///
    /// Unknown keys are ignored; keys of the wrong type are an error.
    [[nodiscard]] static tl::expected<ClientConfig, std::string> from_json(const Json& document);
};

}  // namespace wcpp
