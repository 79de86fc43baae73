/*
 * xfer/src/cli/xfer_cli.cpp
 *
 * Command line front end.
 * - get:  read a resource through the instrumented accessor and write it out
 * - meta: read resource metadata (exit code 2 when absent)
 * - put:  upload a local file through the instrumented uploader
 *
 * Precedence for settings: defaults < config file < environment < flags.
 */

#include <xfer/cli/xfer_cli.h>
#include <xfer/common/format.h>
#include <xfer/common/logging.h>
#include <xfer/operations/json_trace_writer.h>
#include <xfer/operations/operation.h>
#include <xfer/progress/progress_logger.h>
#include <xfer/resource/connectors.h>
#include <xfer/resource/operation_types.h>
#include <xfer/resource/progress_logging.h>
#include <xfer/resource/resource_name.h>
#include <xfer/resource/streams.h>
#include <xfer/version.hpp>

#include <CLI/CLI.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <ostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace xfer::cli {

using resource::Error;
using resource::Expected;

namespace {

std::unique_ptr<progress::ProgressLoggerFactory>
makeProgressFactory(config::ProgressMode mode, std::ostream& err, bool interactive) {
    switch (mode) {
        case config::ProgressMode::Console:
            return std::make_unique<progress::ConsoleProgressLoggerFactory>(err, interactive);
        case config::ProgressMode::Log:
            return std::make_unique<progress::LoggingProgressLoggerFactory>();
        case config::ProgressMode::None:
            return std::make_unique<progress::NullProgressLoggerFactory>();
    }
    return std::make_unique<progress::NullProgressLoggerFactory>();
}

// Everything one command needs: a transport for the URI's scheme wrapped in the
// progress/operation decorator, plus the executor and its listeners.
struct TransferSession {
    std::unique_ptr<progress::ProgressLoggerFactory> progressFactory;
    operations::OperationExecutor executor;
    std::shared_ptr<operations::RecordingOperationListener> recorder;
    std::unique_ptr<resource::IResourceConnector> transport;
    std::unique_ptr<resource::ProgressLoggingResourceConnector> connector;

    static Expected<std::unique_ptr<TransferSession>> open(const config::XferConfig& cfg,
                                                           const resource::ResourceName& name,
                                                           std::ostream& err, bool interactive) {
        auto transport = resource::makeConnector(name.scheme(), cfg.http);
        if (!transport.ok())
            return transport.error();

        auto session = std::make_unique<TransferSession>();
        session->transport = std::move(transport).value();
        session->progressFactory = makeProgressFactory(cfg.progressMode, err, interactive);
        session->recorder = std::make_shared<operations::RecordingOperationListener>();
        session->executor.addListener(session->recorder);

        if (cfg.traceFile) {
            auto writer = operations::JsonTraceWriter::open(*cfg.traceFile);
            if (!writer.ok())
                return writer.error();
            session->executor.addListener(writer.value());
        }

        session->connector = std::make_unique<resource::ProgressLoggingResourceConnector>(
            *session->transport, *session->progressFactory, session->executor, cfg.cadence);
        return session;
    }

    [[nodiscard]] std::chrono::milliseconds lastDuration() const {
        auto records = recorder->records();
        return records.empty() ? std::chrono::milliseconds{0} : records.back().duration();
    }
};

void printError(std::ostream& err, const Error& e) {
    err << fmt::format("error: {} ({})\n", e.message, resource::errorCodeName(e.code));
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
}

json metadataToJson(const resource::ResourceMetadata& meta) {
    json j;
    j["location"] = meta.location;
    j["contentLength"] = meta.contentLength ? json(*meta.contentLength) : json(nullptr);
    j["lastModified"] =
        meta.lastModified ? json(formatTimestamp(*meta.lastModified)) : json(nullptr);
    j["etag"] = meta.etag ? json(*meta.etag) : json(nullptr);
    j["contentType"] = meta.contentType ? json(*meta.contentType) : json(nullptr);
    return j;
}

} // namespace

XferCli::XferCli(std::ostream& out, std::ostream& err, bool interactive)
    : out_(out), err_(err), interactive_(interactive) {
    app_ = std::make_unique<CLI::App>("Instrumented resource transfers", "xfer");
    app_->set_version_flag("--version", std::string(XFER_VERSION_LONG_STRING));
    app_->require_subcommand(1);
    app_->fallthrough();

    app_->add_option("--config", global_.configPath,
                     "Config file (default: $XFER_CONFIG or ~/.config/xfer/config.toml)");
    app_->add_option("--log-level", global_.logLevel,
                     "trace, debug, info, warn, error, critical or off");
    app_->add_option("--progress", global_.progressMode, "Progress display")
        ->check(CLI::IsMember({"console", "log", "none"}));
    app_->add_option("--trace", global_.traceFile, "Append finished operations as JSON lines");

    auto* get = app_->add_subcommand("get", "Download a resource");
    get->add_option("uri", get_.uri, "Resource URI")->required();
    get->add_option("-o,--output", get_.output, "Write to this file instead of stdout");
    get->add_flag("--revalidate", get_.revalidate, "Bypass caches along the way");

    auto* meta = app_->add_subcommand("meta", "Show resource metadata");
    meta->add_option("uri", meta_.uri, "Resource URI")->required();
    meta->add_flag("--revalidate", meta_.revalidate, "Bypass caches along the way");
    meta->add_flag("--json", meta_.json, "Print metadata as JSON");

    auto* put = app_->add_subcommand("put", "Upload a local file");
    put->add_option("file", put_.file, "Local file")->required()->check(CLI::ExistingFile);
    put->add_option("uri", put_.uri, "Destination URI")->required();
}

XferCli::~XferCli() = default;

Expected<config::XferConfig> XferCli::effectiveConfig() const {
    const auto path = config::get_config_path(global_.configPath);
    if (!global_.configPath.empty() && !fs::exists(path)) {
        return Error{resource::ErrorCode::InvalidArgument,
                     "Config file not found: " + path.string()};
    }
    auto loaded = config::loadConfig(path);
    if (!loaded.ok())
        return loaded.error();

    auto cfg = std::move(loaded).value();
    if (global_.logLevel)
        cfg.logLevel = *global_.logLevel;
    if (global_.progressMode) {
        if (auto mode = config::parseProgressMode(*global_.progressMode))
            cfg.progressMode = *mode;
    }
    if (global_.traceFile)
        cfg.traceFile = config::expand_tilde(*global_.traceFile);
    return cfg;
}

int XferCli::run(int argc, char* argv[]) {
    try {
        try {
            app_->parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_->exit(e, out_, err_);
        }

        auto cfg = effectiveConfig();
        if (!cfg.ok()) {
            printError(err_, cfg.error());
            return kFailure;
        }
        logging::configure(cfg.value().logLevel);
        spdlog::debug("xfer {} (progress: {})", XFER_VERSION_STRING,
                      config::progressModeName(cfg.value().progressMode));

        if (app_->got_subcommand("get"))
            return runGet(cfg.value());
        if (app_->got_subcommand("meta"))
            return runMeta(cfg.value());
        if (app_->got_subcommand("put"))
            return runPut(cfg.value());
        return kFailure;
    } catch (const std::exception& e) {
        err_ << "error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return kFailure;
    }
}

int XferCli::runGet(const config::XferConfig& cfg) {
    const resource::ResourceName name(get_.uri);
    auto session = TransferSession::open(cfg, name, err_, interactive_);
    if (!session.ok()) {
        printError(err_, session.error());
        return kFailure;
    }

    // The output file is only created once the resource turns out to exist.
    std::ofstream file;
    std::uint64_t copied = 0;
    auto r = session.value()->connector->withContent(
        name, get_.revalidate,
        [&](resource::InputStream& in, const resource::ResourceMetadata&) -> Expected<void> {
            std::ostream* sink = &out_;
            if (!get_.output.empty()) {
                file.open(get_.output, std::ios::binary | std::ios::trunc);
                if (!file) {
                    return Error{resource::ErrorCode::IoError,
                                 "Cannot open " + get_.output + " for write"};
                }
                sink = &file;
            }
            auto cr = resource::copyStream(in, *sink);
            if (!cr.ok())
                return cr.error();
            copied = cr.value();
            sink->flush();
            return Expected<void>{};
        });

    if (!r.ok()) {
        if (file.is_open()) {
            file.close();
            std::error_code ec;
            fs::remove(get_.output, ec);
        }
        printError(err_, r.error());
        return kFailure;
    }
    if (!r.value()) {
        err_ << "not found: " << name.displayName() << "\n";
        return kNotFound;
    }

    err_ << fmt::format("Downloaded {} from {} in {} ms\n", common::formatBytes(copied),
                        name.displayName(), session.value()->lastDuration().count());
    return kSuccess;
}

int XferCli::runMeta(const config::XferConfig& cfg) {
    const resource::ResourceName name(meta_.uri);
    auto session = TransferSession::open(cfg, name, err_, interactive_);
    if (!session.ok()) {
        printError(err_, session.error());
        return kFailure;
    }

    auto r = session.value()->connector->getMetaData(name, meta_.revalidate);
    if (!r.ok()) {
        printError(err_, r.error());
        return kFailure;
    }
    if (!r.value()) {
        if (meta_.json)
            out_ << json{{"location", name.toAsciiString()}, {"found", false}}.dump() << "\n";
        else
            out_ << "not found\n";
        return kNotFound;
    }

    const auto& meta = *r.value();
    if (meta_.json) {
        auto j = metadataToJson(meta);
        j["found"] = true;
        out_ << j.dump(2) << "\n";
        return kSuccess;
    }

    out_ << "location:       " << meta.location << "\n";
    if (meta.contentLength) {
        out_ << fmt::format("content-length: {} ({})\n", *meta.contentLength,
                            common::formatBytes(*meta.contentLength));
    } else {
        out_ << "content-length: unknown\n";
    }
    if (meta.lastModified)
        out_ << "last-modified:  " << formatTimestamp(*meta.lastModified) << "\n";
    if (meta.etag)
        out_ << "etag:           " << *meta.etag << "\n";
    if (meta.contentType)
        out_ << "content-type:   " << *meta.contentType << "\n";
    return kSuccess;
}

int XferCli::runPut(const config::XferConfig& cfg) {
    const resource::ResourceName name(put_.uri);
    auto content = resource::FileContent::forPath(put_.file);
    if (!content.ok()) {
        printError(err_, content.error());
        return kFailure;
    }

    auto session = TransferSession::open(cfg, name, err_, interactive_);
    if (!session.ok()) {
        printError(err_, session.error());
        return kFailure;
    }

    auto r = session.value()->connector->upload(content.value(), name);
    if (!r.ok()) {
        printError(err_, r.error());
        return kFailure;
    }

    std::uint64_t written = content.value().contentLength();
    auto records = session.value()->recorder->records();
    if (!records.empty()) {
        if (auto result = std::dynamic_pointer_cast<const resource::ResourceWriteResult>(
                records.back().result)) {
            written = result->bytesWritten;
        }
    }
    err_ << fmt::format("Uploaded {} to {} in {} ms\n", common::formatBytes(written),
                        name.displayName(), session.value()->lastDuration().count());
    return kSuccess;
}

} // namespace xfer::cli
