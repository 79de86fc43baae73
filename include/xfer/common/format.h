#pragma once

#include <cstdint>
#include <string>

namespace xfer::common {

/**
 * Human-readable byte count using binary units (B, KiB, MiB, ... EiB).
 *
 * At most one fractional digit, dropped when it is zero:
 *   1023 -> "1023 B", 1536 -> "1.5 KiB", 3072 -> "3 KiB"
 */
std::string formatBytes(std::uint64_t bytes);

} // namespace xfer::common
