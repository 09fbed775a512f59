#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Endpoint
// ═══════════════════════════════════════════════════════════════════════════
// Describes one request shape and how its responses decode. Only path() is
// mandatory; everything else has a default.
//
//   struct GetUser : Endpoint<User, ApiError> {
//       int id;
//       std::string path() const override { return build_path({"users", id}); }
//   };
//
// Success and Failure decode by default as:
//   std::monostate -> body ignored
//   std::string    -> raw body
//   Json           -> parsed document
//   anything else  -> parsed document converted with nlohmann from_json

#include "wcpp/client/retry_policy.hpp"
#include "wcpp/http/body_encoder.hpp"
#include "wcpp/http/http_types.hpp"
#include "wcpp/http/path_component.hpp"
#include "wcpp/json/json_decoder.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace wcpp {

template <typename T>
using DecodeResult = tl::expected<T, std::string>;

template <typename T>
[[nodiscard]] DecodeResult<T> decode_body(std::string_view body) {
    if constexpr (std::is_same_v<T, std::monostate>) {
        return std::monostate{};
    } else if constexpr (std::is_same_v<T, std::string>) {
        return std::string(body);
    } else {
        auto document = decode_json(body);
        if (!document) {
            return tl::unexpected("invalid JSON: " + document.error().message);
        }
        if constexpr (std::is_same_v<T, Json>) {
            return std::move(*document);
        } else {
            try {
                return document->template get<T>();
            } catch (const Json::exception& e) {
                return tl::unexpected(std::string("unexpected JSON shape: ") + e.what());
            }
        }
    }
}

template <typename Success, typename Failure = std::monostate>
class Endpoint {
public:
    using SuccessType = Success;
    using FailureType = Failure;

    virtual ~Endpoint() = default;

    [[nodiscard]] virtual HttpMethod method() const { return HttpMethod::Get; }

    /// Path relative to the client's base URL, e.g. "/users/42".
    [[nodiscard]] virtual std::string path() const = 0;

    [[nodiscard]] virtual std::vector<QueryItem> query() const { return {}; }

    /// Merged over the client's default headers; these win on conflict.
    [[nodiscard]] virtual HeaderMap headers() const { return {}; }

    [[nodiscard]] virtual std::optional<Json> body() const { return std::nullopt; }

    [[nodiscard]] virtual std::shared_ptr<const IBodyEncoder> encoder() const {
        return default_body_encoder();
    }

    [[nodiscard]] virtual StatusRange success_statuses() const { return StatusRange::success(); }

    /// Overrides the client's retry policy for this endpoint.
    [[nodiscard]] virtual std::optional<RetryPolicy> retry_policy() const { return std::nullopt; }

    /// Overrides the client's request timeout for this endpoint.
    [[nodiscard]] virtual std::optional<std::chrono::milliseconds> timeout() const { return std::nullopt; }

    [[nodiscard]] virtual DecodeResult<Success> decode_success(
        std::string_view body,
        const ResponseMetadata& /*meta*/
    ) const {
        return decode_body<Success>(body);
    }

    [[nodiscard]] virtual DecodeResult<Failure> decode_failure(
        std::string_view body,
        const ResponseMetadata& /*meta*/
    ) const {
        return decode_body<Failure>(body);
    }
};

}  // namespace wcpp
