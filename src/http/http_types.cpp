#include "wcpp/http/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace wcpp {

void set_header(HeaderMap& headers, std::string_view name, std::string value) {
    std::erase_if(headers, [&name](const auto& entry) {
        return header_name_equals(entry.first, name);
    });
    headers.emplace(std::string(name), std::move(value));
}

bool set_header_if_absent(HeaderMap& headers, std::string_view name, std::string value) {
    if (find_header(headers, name) != headers.end()) {
        return false;
    }
    headers.emplace(std::string(name), std::move(value));
    return true;
}

std::optional<std::int64_t> ResponseMetadata::content_length() const {
    const auto raw = header("Content-Length");
    if (raw.has_value() == false) {
        return std::nullopt;
    }
    std::int64_t length = 0;
    const auto* first = raw->data();
    const auto* last = raw->data() + raw->size();
    const auto [ptr, ec] = std::from_chars(first, last, length);
    const bool parsed = (ec == std::errc{}) && (ptr == last) && (length >= 0);
    if (parsed == false) {
        return std::nullopt;
    }
    return length;
}

// ─────────────────────────────────────────────────────────────────────────────
// URLs
// ─────────────────────────────────────────────────────────────────────────────

namespace {

[[nodiscard]] bool is_http_scheme(std::string_view protocol) {
    return protocol == "http:" || protocol == "https:";
}

}  // namespace

std::optional<UrlComponents> parse_url(std::string_view url) {
    auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return std::nullopt;
    }

    const auto protocol = parsed->get_protocol();
    if (is_http_scheme(protocol) == false) {
        return std::nullopt;
    }

    UrlComponents out;
    out.scheme = std::string(protocol.substr(0, protocol.size() - 1));
    out.host = std::string(parsed->get_hostname());
    if (out.host.empty()) {
        return std::nullopt;
    }

    const auto port = parsed->get_port();
    if (port.empty()) {
        out.port = out.is_secure() ? 443 : 80;
    } else {
        std::uint16_t value = 0;
        std::from_chars(port.data(), port.data() + port.size(), value);
        out.port = value;
    }

    out.path = std::string(parsed->get_pathname());
    if (out.path.empty()) {
        out.path = "/";
    }
    out.query = std::string(parsed->get_search());
    return out;
}

std::optional<std::string> resolve_url(
    std::string_view base_url,
    std::string_view path,
    const std::vector<QueryItem>& query
) {
    auto parsed = ada::parse<ada::url>(base_url);
    if (!parsed || is_http_scheme(parsed->get_protocol()) == false) {
        return std::nullopt;
    }

    std::string joined(parsed->get_pathname());
    while (joined.empty() == false && joined.back() == '/') {
        joined.pop_back();
    }
    if (path.empty() == false && path.front() != '/') {
        joined.push_back('/');
    }
    joined.append(path);
    if (joined.empty()) {
        joined = "/";
    }
    if (parsed->set_pathname(joined) == false) {
        return std::nullopt;
    }

    if (query.empty() == false) {
        ada::url_search_params params;
        for (const auto& item : query) {
            params.append(item.name, item.value.value_or(""));
        }
        parsed->set_search(params.to_string());
    }

    return std::string(parsed->get_href());
}

}  // namespace wcpp
