#include <xfer/common/format.h>

#include <fmt/format.h>

#include <array>
#include <cmath>

namespace xfer::common {

std::string formatBytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 7> kUnits = {"B",   "KiB", "MiB", "GiB",
                                                          "TiB", "PiB", "EiB"};
    constexpr double kStep = 1024.0;

    if (bytes < 1024)
        return fmt::format("{} B", bytes);

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= kStep && unit + 1 < kUnits.size()) {
        value /= kStep;
        ++unit;
    }

    // Round to tenths; 1023.96 KiB rounds to 1024.0 and belongs to the next unit.
    double tenths = std::round(value * 10.0);
    if (tenths >= kStep * 10.0 && unit + 1 < kUnits.size()) {
        value /= kStep;
        ++unit;
        tenths = std::round(value * 10.0);
    }

    const auto whole = static_cast<std::uint64_t>(tenths) / 10;
    const auto fraction = static_cast<std::uint64_t>(tenths) % 10;
    if (fraction == 0)
        return fmt::format("{} {}", whole, kUnits[unit]);
    return fmt::format("{}.{} {}", whole, fraction, kUnits[unit]);
}

} // namespace xfer::common
