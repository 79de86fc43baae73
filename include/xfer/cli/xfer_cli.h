#pragma once

#include <xfer/config/config.h>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace CLI {
class App;
}

namespace xfer::cli {

/**
 * Exit codes of the xfer executable.
 */
enum ExitCode : int { kSuccess = 0, kFailure = 1, kNotFound = 2 };

/**
 * The xfer command line: get, meta and put over an instrumented transport.
 *
 * Output streams are injected so the commands can run in-process (tests). Progress is
 * rendered on the error stream; `interactive` selects in-place redraw.
 */
class XferCli {
public:
    XferCli(std::ostream& out, std::ostream& err, bool interactive);
    ~XferCli();

    XferCli(const XferCli&) = delete;
    XferCli& operator=(const XferCli&) = delete;

    int run(int argc, char* argv[]);

private:
    struct GlobalOptions {
        std::string configPath;
        std::optional<std::string> logLevel;
        std::optional<std::string> progressMode;
        std::optional<std::string> traceFile;
    };

    struct GetOptions {
        std::string uri;
        std::string output;
        bool revalidate{false};
    };

    struct MetaOptions {
        std::string uri;
        bool revalidate{false};
        bool json{false};
    };

    struct PutOptions {
        std::string file;
        std::string uri;
    };

    resource::Expected<config::XferConfig> effectiveConfig() const;

    int runGet(const config::XferConfig& cfg);
    int runMeta(const config::XferConfig& cfg);
    int runPut(const config::XferConfig& cfg);

    std::ostream& out_;
    std::ostream& err_;
    bool interactive_;

    std::unique_ptr<CLI::App> app_;
    GlobalOptions global_;
    GetOptions get_;
    MetaOptions meta_;
    PutOptions put_;
};

} // namespace xfer::cli
