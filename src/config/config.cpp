#include <xfer/config/config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace xfer::config {

using resource::Error;
using resource::ErrorCode;
using resource::Expected;

namespace {

// Position of a '#' that starts a comment (outside of quotes), npos if none.
std::size_t commentStart(std::string_view v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return i;
        }
    }
    return std::string_view::npos;
}

Expected<std::uint64_t> parseUnsigned(const std::string& key, const std::string& value) {
    std::uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid number for " + key + ": '" + value + "'"};
    }
    return out;
}

Expected<bool> parseBool(const std::string& key, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, "Invalid boolean for " + key + ": '" + value + "'"};
}

} // namespace

std::optional<ProgressMode> parseProgressMode(std::string_view s) {
    if (s == "console")
        return ProgressMode::Console;
    if (s == "log")
        return ProgressMode::Log;
    if (s == "none")
        return ProgressMode::None;
    return std::nullopt;
}

const char* progressModeName(ProgressMode mode) {
    switch (mode) {
        case ProgressMode::Console:
            return "console";
        case ProgressMode::Log:
            return "log";
        case ProgressMode::None:
            return "none";
    }
    return "console";
}

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);

        // Remove inline comments
        if (auto comment = commentStart(v); comment != std::string::npos) {
            v = v.substr(0, comment);
        }

        values[currentSection.empty() ? k : currentSection + "." + k] = unquote(v);
    }
    return values;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("XFER_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "xfer" / "config.toml";
    }

    return configHome / "xfer" / "config.toml";
}

Expected<XferConfig> loadConfig(const std::filesystem::path& config_path) {
    XferConfig cfg;
    const auto values = parse_config_file(config_path);
    if (!values.empty()) {
        spdlog::debug("Loaded {} settings from {}", values.size(), config_path.string());
    }

    for (const auto& [key, value] : values) {
        if (key == "logging.level") {
            cfg.logLevel = value;
        } else if (key == "progress.mode") {
            auto mode = parseProgressMode(value);
            if (!mode) {
                return Error{ErrorCode::InvalidArgument, "Unknown progress mode '" + value + "'"};
            }
            cfg.progressMode = *mode;
        } else if (key == "progress.granularity_bytes" || key == "progress.min_delta_bytes") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            if (n.value() == 0) {
                return Error{ErrorCode::InvalidArgument, key + " must be greater than zero"};
            }
            if (key == "progress.granularity_bytes")
                cfg.cadence.granularityBytes = n.value();
            else
                cfg.cadence.minimumDeltaBytes = n.value();
        } else if (key == "trace.file") {
            if (!value.empty())
                cfg.traceFile = expand_tilde(value);
        } else if (key == "http.timeout_ms" || key == "http.connect_timeout_ms") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            const std::chrono::milliseconds ms(static_cast<std::chrono::milliseconds::rep>(n.value()));
            if (key == "http.timeout_ms")
                cfg.http.timeout = ms;
            else
                cfg.http.connectTimeout = ms;
        } else if (key == "http.follow_redirects" || key == "http.insecure") {
            auto b = parseBool(key, value);
            if (!b.ok())
                return b.error();
            if (key == "http.follow_redirects")
                cfg.http.followRedirects = b.value();
            else
                cfg.http.tls.insecure = b.value();
        } else if (key == "http.ca_path") {
            cfg.http.tls.caPath = expand_tilde(value).string();
        } else if (key == "http.proxy") {
            if (!value.empty())
                cfg.http.proxy = value;
        } else if (key == "http.user_agent") {
            cfg.http.userAgent = value;
        } else {
            spdlog::debug("Ignoring unknown config key '{}'", key);
        }
    }

    if (const char* level = std::getenv("XFER_LOG_LEVEL"); level && *level) {
        cfg.logLevel = level;
    }
    return cfg;
}

} // namespace xfer::config
