#pragma once

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace wcpp {

// ─────────────────────────────────────────────────────────────────────────────
// TransportFault
// ─────────────────────────────────────────────────────────────────────────────
// The closed set of failures a transport may report. Everything a concrete
// transport cannot classify lands in Other with the underlying message.

struct TransportFault {
    enum class Code {
        Cancelled,
        TimedOut,
        NoConnection,
        ConnectionLost,
        HostUnreachable,
        DnsFailure,
        Other
    };

    Code code{Code::Other};
    std::string message;

    [[nodiscard]] static TransportFault cancelled() {
        return {Code::Cancelled, "Transfer cancelled"};
    }

    [[nodiscard]] static TransportFault timed_out(std::string msg = "Request timed out") {
        return {Code::TimedOut, std::move(msg)};
    }

    [[nodiscard]] static TransportFault no_connection(std::string msg = "Not connected to the internet") {
        return {Code::NoConnection, std::move(msg)};
    }

    [[nodiscard]] static TransportFault connection_lost(std::string msg = "Network connection was lost") {
        return {Code::ConnectionLost, std::move(msg)};
    }

    [[nodiscard]] static TransportFault host_unreachable(std::string msg = "Cannot connect to host") {
        return {Code::HostUnreachable, std::move(msg)};
    }

    [[nodiscard]] static TransportFault dns_failure(std::string msg = "DNS lookup failed") {
        return {Code::DnsFailure, std::move(msg)};
    }

    [[nodiscard]] static TransportFault other(std::string msg) {
        return {Code::Other, std::move(msg)};
    }

    /// True for the faults that mean "there is no usable network path".
    [[nodiscard]] bool is_connectivity() const noexcept {
        switch (code) {
            case Code::NoConnection:
            case Code::ConnectionLost:
            case Code::HostUnreachable:
            case Code::DnsFailure:
                return true;
            case Code::Cancelled:
            case Code::TimedOut:
            case Code::Other:
                return false;
        }
        return false;
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportFault::Code code) noexcept {
    switch (code) {
        case TransportFault::Code::Cancelled:       return "Cancelled";
        case TransportFault::Code::TimedOut:        return "TimedOut";
        case TransportFault::Code::NoConnection:    return "NoConnection";
        case TransportFault::Code::ConnectionLost:  return "ConnectionLost";
        case TransportFault::Code::HostUnreachable: return "HostUnreachable";
        case TransportFault::Code::DnsFailure:      return "DnsFailure";
        case TransportFault::Code::Other:           return "Other";
    }
    return "Unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportFault>;

}  // namespace wcpp
