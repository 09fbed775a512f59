#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wcpp {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────
// Names keep the caller's casing; every lookup is case-insensitive (RFC 9110).

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& entry) {
        return header_name_equals(entry.first, name);
    });
}

[[nodiscard]] inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

/// Sets `name`, replacing any existing entry whatever its casing.
void set_header(HeaderMap& headers, std::string_view name, std::string value);

/// Sets `name` only when no entry exists under any casing. Returns true if set.
bool set_header_if_absent(HeaderMap& headers, std::string_view name, std::string value);

// ─────────────────────────────────────────────────────────────────────────────
// Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete,
    Head,
    Options
};

[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get:     return "GET";
        case HttpMethod::Post:    return "POST";
        case HttpMethod::Put:     return "PUT";
        case HttpMethod::Patch:   return "PATCH";
        case HttpMethod::Delete:  return "DELETE";
        case HttpMethod::Head:    return "HEAD";
        case HttpMethod::Options: return "OPTIONS";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Status ranges
// ─────────────────────────────────────────────────────────────────────────────

struct StatusRange {
    int first{200};
    int last{299};

    [[nodiscard]] constexpr bool contains(int status) const noexcept {
        return status >= first && status <= last;
    }

    [[nodiscard]] static constexpr StatusRange success() noexcept { return {200, 299}; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Request / response metadata
// ─────────────────────────────────────────────────────────────────────────────

struct QueryItem {
    std::string name;
    std::optional<std::string> value;
};

/// A fully resolved request, ready for a transport. Interceptors receive and
/// return values of this type.
struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    HeaderMap headers;
    std::optional<std::string> body;
    std::chrono::milliseconds timeout{30'000};

    HttpRequest& with_header(std::string_view name, std::string value) {
        set_header(headers, name, std::move(value));
        return *this;
    }

    HttpRequest& with_body(std::string content) {
        body = std::move(content);
        return *this;
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }
};

struct ResponseMetadata {
    int status_code{0};
    HeaderMap headers;
    std::string url;

    [[nodiscard]] bool is_success() const noexcept {
        return StatusRange::success().contains(status_code);
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }

    /// Declared length, if the server sent a parseable Content-Length.
    [[nodiscard]] std::optional<std::int64_t> content_length() const;
};

/// Body plus metadata for a completed, buffered exchange.
struct HttpResponse {
    std::string body;
    ResponseMetadata meta;
};

// ─────────────────────────────────────────────────────────────────────────────
// URLs (ada-url)
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;
    std::string host;
    std::uint16_t port{0};
    std::string path;
    std::string query;

    [[nodiscard]] bool is_secure() const { return scheme == "https"; }
};

/// WHATWG parse restricted to http/https. nullopt on anything else.
[[nodiscard]] std::optional<UrlComponents> parse_url(std::string_view url);

/// Appends `path` to the path of `base_url` and replaces the query with the
/// form-encoded `query`. nullopt if the base is not a valid http(s) URL.
[[nodiscard]] std::optional<std::string> resolve_url(
    std::string_view base_url,
    std::string_view path,
    const std::vector<QueryItem>& query = {}
);

}  // namespace wcpp
