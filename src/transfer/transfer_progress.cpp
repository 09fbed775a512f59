#include "wcpp/transfer/transfer_progress.hpp"

#include <array>
#include <cmath>
#include <format>
#include <string_view>

namespace wcpp {

std::string format_byte_count(std::int64_t bytes) {
    if (bytes == 1) {
        return "1 byte";
    }
    if (bytes < 1000) {
        return std::format("{} bytes", bytes);
    }

    constexpr std::array<std::string_view, 5> units{"KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes) / 1000.0;
    std::size_t unit = 0;
    while (value >= 999.95 && unit + 1 < units.size()) {
        value /= 1000.0;
        ++unit;
    }

    // One decimal below 10 ("1.5 MB"), whole numbers above ("12 MB")
    if (value < 9.95 && std::fmod(std::round(value * 10.0), 10.0) != 0.0) {
        return std::format("{:.1f} {}", value, units[unit]);
    }
    return std::format("{:.0f} {}", value, units[unit]);
}

std::optional<std::string> TransferProgress::percentage_string() const {
    const auto fraction = fraction_completed();
    if (fraction.has_value() == false) {
        return std::nullopt;
    }
    return std::format("{}%", static_cast<std::int64_t>(*fraction * 100.0));
}

}  // namespace wcpp
