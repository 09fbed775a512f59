#pragma once

#include "wcpp/client/client_config.hpp"
#include "wcpp/client/endpoint.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wcpp {

/// Everything about a request an endpoint decides, captured once per invocation.
struct RequestParts {
    HttpMethod method{HttpMethod::Get};
    std::string path;
    std::vector<QueryItem> query;
    HeaderMap headers;
    std::optional<Json> body;
    std::shared_ptr<const IBodyEncoder> encoder;
    std::optional<std::chrono::milliseconds> timeout;
};

template <typename E>
[[nodiscard]] RequestParts request_parts(const E& endpoint) {
    RequestParts parts;
    parts.method = endpoint.method();
    parts.path = endpoint.path();
    parts.query = endpoint.query();
    parts.headers = endpoint.headers();
    parts.body = endpoint.body();
    parts.encoder = endpoint.encoder();
    parts.timeout = endpoint.timeout();
    return parts;
}

/// Resolves the URL against `config.base_url` (or takes `parts.path` as an
/// absolute URL when there is no base), layers endpoint headers over the
/// default headers, and encodes the body. The error is a human readable reason.
[[nodiscard]] tl::expected<HttpRequest, std::string> build_request(
    const RequestParts& parts,
    const ClientConfig& config
);

}  // namespace wcpp
