#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ClientError
// ═══════════════════════════════════════════════════════════════════════════
// The single error type every public entry point returns. It is generic over
// the endpoint's Failure type so a server error can carry the decoded error
// body; retry and offline classification only look at the code and status,
// never at the Failure payload.

#include "wcpp/transport/transport_error.hpp"

#include <tl/expected.hpp>

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wcpp {

enum class ClientErrorCode {
    NetworkError,        ///< Transport fault that is not otherwise classified
    InvalidRequest,      ///< Request could not be built; never retried
    Cancelled,           ///< Caller cancelled; never retried
    Timeout,             ///< Transport timed out
    ServerError,         ///< Status outside the endpoint's success range
    DecodingError,       ///< Success body could not be decoded
    UnexpectedResponse,  ///< Malformed exchange, or retry requests exhausted
    Offline              ///< No usable network path
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::NetworkError:       return "NetworkError";
        case ClientErrorCode::InvalidRequest:     return "InvalidRequest";
        case ClientErrorCode::Cancelled:          return "Cancelled";
        case ClientErrorCode::Timeout:            return "Timeout";
        case ClientErrorCode::ServerError:        return "ServerError";
        case ClientErrorCode::DecodingError:      return "DecodingError";
        case ClientErrorCode::UnexpectedResponse: return "UnexpectedResponse";
        case ClientErrorCode::Offline:            return "Offline";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] constexpr bool is_retryable(ClientErrorCode code, std::optional<int> status) noexcept {
    switch (code) {
        case ClientErrorCode::Timeout:
        case ClientErrorCode::NetworkError:
            return true;
        case ClientErrorCode::ServerError: {
            const int s = status.value_or(0);
            return s >= 500 || s == 429;
        }
        case ClientErrorCode::InvalidRequest:
        case ClientErrorCode::Cancelled:
        case ClientErrorCode::DecodingError:
        case ClientErrorCode::UnexpectedResponse:
        case ClientErrorCode::Offline:
            return false;
    }
    return false;
}

[[nodiscard]] constexpr bool is_offline(ClientErrorCode code) noexcept {
    return code == ClientErrorCode::Offline;
}

/// Fixed mapping from transport faults to client error codes.
[[nodiscard]] constexpr ClientErrorCode classify(TransportFault::Code fault) noexcept {
    switch (fault) {
        case TransportFault::Code::Cancelled:       return ClientErrorCode::Cancelled;
        case TransportFault::Code::TimedOut:        return ClientErrorCode::Timeout;
        case TransportFault::Code::NoConnection:
        case TransportFault::Code::ConnectionLost:
        case TransportFault::Code::HostUnreachable:
        case TransportFault::Code::DnsFailure:      return ClientErrorCode::Offline;
        case TransportFault::Code::Other:           return ClientErrorCode::NetworkError;
    }
    return ClientErrorCode::NetworkError;
}

// ─────────────────────────────────────────────────────────────────────────────
// ClientError<Failure>
// ─────────────────────────────────────────────────────────────────────────────

template <typename Failure = std::monostate>
class ClientError {
public:
    using FailureType = Failure;

    [[nodiscard]] static ClientError network_error(std::string cause) {
        return ClientError(ClientErrorCode::NetworkError, std::move(cause));
    }

    [[nodiscard]] static ClientError invalid_request(std::string reason) {
        return ClientError(ClientErrorCode::InvalidRequest, std::move(reason));
    }

    [[nodiscard]] static ClientError cancelled() {
        return ClientError(ClientErrorCode::Cancelled, "Request was cancelled");
    }

    [[nodiscard]] static ClientError timeout() {
        return ClientError(ClientErrorCode::Timeout, "Request timed out");
    }

    [[nodiscard]] static ClientError server_error(
        int status,
        std::optional<Failure> failure = std::nullopt,
        std::optional<std::string> raw_body = std::nullopt
    ) {
        ClientError e(ClientErrorCode::ServerError, std::format("Server returned status {}", status));
        e.status_code_ = status;
        e.failure_ = std::move(failure);
        e.raw_body_ = std::move(raw_body);
        return e;
    }

    [[nodiscard]] static ClientError decoding_error(
        std::string cause,
        std::optional<std::string> raw_body = std::nullopt
    ) {
        ClientError e(ClientErrorCode::DecodingError, std::move(cause));
        e.raw_body_ = std::move(raw_body);
        return e;
    }

    [[nodiscard]] static ClientError unexpected_response(std::string detail = "Unexpected response") {
        return ClientError(ClientErrorCode::UnexpectedResponse, std::move(detail));
    }

    [[nodiscard]] static ClientError offline(std::string detail = "Network is unavailable") {
        return ClientError(ClientErrorCode::Offline, std::move(detail));
    }

    [[nodiscard]] static ClientError from_transport(const TransportFault& fault) {
        switch (classify(fault.code)) {
            case ClientErrorCode::Cancelled: return cancelled();
            case ClientErrorCode::Timeout:   return timeout();
            case ClientErrorCode::Offline:   return offline(fault.message);
            default:                         return network_error(fault.message);
        }
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Accessors
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ClientErrorCode code() const noexcept { return code_; }

    /// Cause for network/decoding errors, reason for invalid requests.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] std::optional<int> status_code() const noexcept { return status_code_; }
    [[nodiscard]] const std::optional<Failure>& failure() const noexcept { return failure_; }
    [[nodiscard]] const std::optional<std::string>& raw_body() const noexcept { return raw_body_; }

    [[nodiscard]] bool is(ClientErrorCode code) const noexcept { return code_ == code; }
    [[nodiscard]] bool is_retryable() const noexcept { return wcpp::is_retryable(code_, status_code_); }
    [[nodiscard]] bool is_offline() const noexcept { return wcpp::is_offline(code_); }

    [[nodiscard]] std::string describe() const {
        return std::format("{}: {}", to_string(code_), message_);
    }

    /// Same error under another Failure type. The typed failure body is dropped.
    template <typename Other>
    [[nodiscard]] ClientError<Other> rebind() const {
        auto out = ClientError<Other>::restore(code_, message_, status_code_, raw_body_);
        return out;
    }

private:
    template <typename> friend class ClientError;

    ClientError(ClientErrorCode code, std::string message)
        : code_(code)
        , message_(std::move(message))
    {}

    [[nodiscard]] static ClientError restore(
        ClientErrorCode code,
        std::string message,
        std::optional<int> status,
        std::optional<std::string> raw_body
    ) {
        ClientError e(code, std::move(message));
        e.status_code_ = status;
        e.raw_body_ = std::move(raw_body);
        return e;
    }

    ClientErrorCode code_;
    std::string message_;
    std::optional<int> status_code_;
    std::optional<Failure> failure_;
    std::optional<std::string> raw_body_;
};

template <typename T, typename Failure = std::monostate>
using ClientResult = tl::expected<T, ClientError<Failure>>;

}  // namespace wcpp
