#include "wcpp/client/request_builder.hpp"

#include <format>

namespace wcpp {

tl::expected<HttpRequest, std::string> build_request(
    const RequestParts& parts,
    const ClientConfig& config
) {
    const bool has_base = (config.base_url.empty() == false);
    const auto url = has_base
        ? resolve_url(config.base_url, parts.path, parts.query)
        : resolve_url(parts.path, "", parts.query);
    if (url.has_value() == false) {
        return tl::unexpected(std::format("cannot form a URL from base '{}' and path '{}'",
                                          config.base_url, parts.path));
    }

    HttpRequest request;
    request.method = parts.method;
    request.url = *url;
    request.timeout = parts.timeout.value_or(config.request_timeout);
    request.headers = config.default_headers;
    for (const auto& [name, value] : parts.headers) {
        set_header(request.headers, name, value);
    }

    if (parts.body.has_value()) {
        const auto encoder = parts.encoder ? parts.encoder : default_body_encoder();
        auto encoded = encoder->encode(*parts.body);
        if (!encoded) {
            return tl::unexpected(std::move(encoded.error()));
        }
        set_header_if_absent(request.headers, "Content-Type", std::move(encoded->content_type));
        request.body = std::move(encoded->bytes);
    }

    return request;
}

}  // namespace wcpp
