#include <xfer/common/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>

namespace xfer::logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

bool configure(const std::string& level, const std::string& pattern) {
    auto logger = spdlog::get("xfer");
    if (!logger) {
        logger = spdlog::stderr_color_mt("xfer");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(pattern);

    auto lvl = parseLevel(level);
    spdlog::set_level(lvl.value_or(spdlog::level::warn));
    if (!lvl) {
        spdlog::warn("Unknown log level '{}', using warn", level);
        return false;
    }
    return true;
}

} // namespace xfer::logging
