#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace xfer::logging {

// "trace", "debug", "info", "warn", "error", "critical", "off" (case-insensitive).
std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

/**
 * Install a stderr color logger as the spdlog default and set its level.
 * Returns false (and leaves the level at warn) when the name is not a known level.
 */
bool configure(const std::string& level, const std::string& pattern = "[%H:%M:%S] [%l] %v");

} // namespace xfer::logging
