#include "wcpp/client/client_config.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <random>

namespace wcpp {

std::string uuid_request_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;

    std::array<std::uint8_t, 16> bytes{};
    const std::uint64_t hi = dist(rng);
    const std::uint64_t lo = dist(rng);
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
        bytes[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

ClientConfig& ClientConfig::with_base_url(std::string url) {
    base_url = std::move(url);
    return *this;
}

ClientConfig& ClientConfig::with_header(const std::string& name, std::string value) {
    set_header(default_headers, name, std::move(value));
    return *this;
}

ClientConfig& ClientConfig::with_bearer_token(const std::string& token) {
    return with_header("Authorization", "Bearer " + token);
}

ClientConfig& ClientConfig::with_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout = timeout;
    return *this;
}

ClientConfig& ClientConfig::with_resource_timeout(std::chrono::milliseconds timeout) {
    resource_timeout = timeout;
    return *this;
}

ClientConfig& ClientConfig::with_retry_policy(RetryPolicy policy) {
    retry_policy = policy;
    return *this;
}

ClientConfig& ClientConfig::with_request_interceptor(std::shared_ptr<IRequestInterceptor> interceptor) {
    request_interceptors.push_back(std::move(interceptor));
    return *this;
}

ClientConfig& ClientConfig::with_response_interceptor(std::shared_ptr<IResponseInterceptor> interceptor) {
    response_interceptors.push_back(std::move(interceptor));
    return *this;
}

ClientConfig& ClientConfig::with_request_ids(RequestIdGenerator generator, std::string header) {
    request_id_generator = std::move(generator);
    request_id_header = std::move(header);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON loading
// ─────────────────────────────────────────────────────────────────────────────

namespace {

using LoadResult = tl::expected<void, std::string>;

template <typename T, typename Apply>
LoadResult read_field(const Json& object, const char* key, Apply&& apply) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return {};
    }
    try {
        apply(it->template get<T>());
    } catch (const Json::exception&) {
        return tl::unexpected(std::format("config key '{}' has the wrong type", key));
    }
    return {};
}

LoadResult read_retry(const Json& retry, RetryPolicy& policy) {
    if (retry.is_object() == false) {
        return tl::unexpected(std::string("config key 'retry' must be an object"));
    }
    auto ok = read_field<int>(retry, "max_retries", [&](int v) { policy.with_max_retries(v); });
    if (!ok) return ok;
    ok = read_field<std::int64_t>(retry, "base_delay_ms",
        [&](std::int64_t v) { policy.with_base_delay(std::chrono::milliseconds{v}); });
    if (!ok) return ok;
    ok = read_field<std::int64_t>(retry, "max_delay_ms",
        [&](std::int64_t v) { policy.with_max_delay(std::chrono::milliseconds{v}); });
    if (!ok) return ok;
    return read_field<bool>(retry, "exponential", [&](bool v) { policy.with_exponential_backoff(v); });
}

}  // namespace

tl::expected<ClientConfig, std::string> ClientConfig::from_json(const Json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(std::string("config must be a JSON object"));
    }

    ClientConfig config;
    const std::array<LoadResult, 5> scalars{
        read_field<std::string>(document, "base_url",
            [&](std::string v) { config.base_url = std::move(v); }),
        read_field<std::int64_t>(document, "request_timeout_ms",
            [&](std::int64_t v) { config.request_timeout = std::chrono::milliseconds{v}; }),
        read_field<std::int64_t>(document, "resource_timeout_ms",
            [&](std::int64_t v) { config.resource_timeout = std::chrono::milliseconds{v}; }),
        read_field<std::string>(document, "request_id_header",
            [&](std::string v) { config.request_id_header = std::move(v); }),
        read_field<std::size_t>(document, "stream_failure_body_limit",
            [&](std::size_t v) { config.stream_failure_body_limit = v; }),
    };
    for (const auto& loaded : scalars) {
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
    }

    const auto headers = document.find("headers");
    if (headers != document.end()) {
        if (headers->is_object() == false) {
            return tl::unexpected(std::string("config key 'headers' must be an object"));
        }
        for (const auto& item : headers->items()) {
            if (item.value().is_string() == false) {
                return tl::unexpected(std::format("header '{}' must be a string", item.key()));
            }
            config.with_header(item.key(), item.value().get<std::string>());
        }
    }

    const auto retry = document.find("retry");
    if (retry != document.end()) {
        auto loaded = read_retry(*retry, config.retry_policy);
        if (!loaded) {
            return tl::unexpected(loaded.error());
        }
    }

    return config;
}

}  // namespace wcpp
