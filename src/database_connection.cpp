#include "database_connection.hpp"
#include <array>
#include <fmt/format.h>

std::uint64_t applyOverhead(std::uint64_t rawBytes, double multiplier) {
    return static_cast<std::uint64_t>(static_cast<double>(rawBytes) * multiplier);
}

std::string humanizeBytes(std::uint64_t bytes) {
    constexpr std::array<std::string_view, 5> units = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}
