#pragma once

#include <xfer/resource/connectors.h>
#include <xfer/resource/resource.hpp>
#include <xfer/resource/transfer_progress.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace xfer::config {

enum class ProgressMode { Console, Log, None };

std::optional<ProgressMode> parseProgressMode(std::string_view s);
const char* progressModeName(ProgressMode mode);

/**
 * Effective configuration (defaults < config file < environment < command line).
 */
struct XferConfig {
    std::string logLevel{"warn"};
    ProgressMode progressMode{ProgressMode::Console};
    resource::ProgressCadence cadence{};
    std::optional<std::filesystem::path> traceFile;
    resource::HttpOptions http{};
};

// String trimming utilities
void trim(std::string& s);

// Quote handling
std::string unquote(std::string val);

// Tilde expansion
std::filesystem::path expand_tilde(const std::string& path);

/**
 * Parse the TOML subset used by config.toml into "section.key" -> value.
 * Keys outside of any section are stored without prefix. Missing file -> empty map.
 */
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

/**
 * Standard config path: $XFER_CONFIG, $XDG_CONFIG_HOME/xfer/config.toml or
 * ~/.config/xfer/config.toml. A non-empty override wins over all of them.
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Defaults overlaid with the file at config_path (if present) and XFER_LOG_LEVEL.
 */
resource::Expected<XferConfig> loadConfig(const std::filesystem::path& config_path);

} // namespace xfer::config
