#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace wcpp {

/// Decimal (SI) byte count: "1 byte", "999 bytes", "1.5 KB", "12 MB".
[[nodiscard]] std::string format_byte_count(std::int64_t bytes);

struct TransferProgress {
    std::int64_t bytes_transferred{0};
    std::optional<std::int64_t> total_bytes;

    /// 0.0 to 1.0; nullopt unless the total is known and positive.
    [[nodiscard]] std::optional<double> fraction_completed() const noexcept {
        if (total_bytes.has_value() == false || *total_bytes <= 0) {
            return std::nullopt;
        }
        return static_cast<double>(bytes_transferred) / static_cast<double>(*total_bytes);
    }

    /// "45%", truncated toward zero; nullopt when the fraction is unknown.
    [[nodiscard]] std::optional<std::string> percentage_string() const;

    [[nodiscard]] std::string bytes_transferred_formatted() const {
        return format_byte_count(bytes_transferred);
    }

    [[nodiscard]] std::optional<std::string> total_bytes_formatted() const {
        if (total_bytes.has_value() == false) {
            return std::nullopt;
        }
        return format_byte_count(*total_bytes);
    }

    friend bool operator==(const TransferProgress&, const TransferProgress&) = default;
};

}  // namespace wcpp
