/*
 * xfer/src/resource/file_connector.cpp
 *
 * Local filesystem transport for file: URIs.
 *
 * - Missing files (and directories) are reported as absent, not as errors
 * - Uploads are staged next to the destination and renamed into place
 * - revalidate has no meaning for local files and is ignored
 */

#include <xfer/resource/connectors.h>
#include <xfer/resource/streams.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace xfer::resource {

namespace fs = std::filesystem;

namespace {

Expected<fs::path> localPath(const ResourceName& location) {
    if (location.scheme() != "file") {
        return Error{ErrorCode::InvalidArgument,
                     "Not a file URI: " + location.displayName()};
    }
    auto path = location.decodedPath();
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty path in URI: " + location.displayName()};
    }
    return fs::path(path);
}

// Absent for anything that is not a regular file.
Expected<std::optional<ResourceMetadata>> statFile(const ResourceName& location,
                                                   const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return std::optional<ResourceMetadata>{std::nullopt};
    }

    ResourceMetadata meta;
    meta.location = location.toAsciiString();
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot stat " + path.string() + ": " + ec.message()};
    }
    meta.contentLength = static_cast<std::uint64_t>(size);

    const auto mtime = fs::last_write_time(path, ec);
    if (!ec) {
        meta.lastModified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(mtime));
    }
    return std::optional<ResourceMetadata>{std::move(meta)};
}

} // namespace

class FileResourceConnector final : public IResourceConnector {
public:
    FileResourceConnector() = default;
    ~FileResourceConnector() override = default;

    Expected<bool> withContent(const ResourceName& location, [[maybe_unused]] bool revalidate,
                               const ContentAction& action) override {
        auto pr = localPath(location);
        if (!pr.ok())
            return pr.error();

        auto mr = statFile(location, pr.value());
        if (!mr.ok())
            return mr.error();
        if (!mr.value()) {
            spdlog::debug("File resource {} does not exist", pr.value().string());
            return false;
        }

        auto sr = FileInputStream::open(pr.value());
        if (!sr.ok())
            return sr.error();

        spdlog::debug("Reading {} ({} bytes)", pr.value().string(),
                      mr.value()->contentLength.value_or(0));
        auto ar = action(*sr.value(), *mr.value());
        if (!ar.ok())
            return ar.error();
        return true;
    }

    Expected<std::optional<ResourceMetadata>> getMetaData(const ResourceName& location,
                                                          [[maybe_unused]] bool revalidate) override {
        auto pr = localPath(location);
        if (!pr.ok())
            return pr.error();
        return statFile(location, pr.value());
    }

    Expected<void> upload(const ReadableContent& content, const ResourceName& destination) override {
        auto pr = localPath(destination);
        if (!pr.ok())
            return pr.error();
        const auto& target = pr.value();

        std::error_code ec;
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Cannot create directory " +
                                                     target.parent_path().string() + ": " +
                                                     ec.message()};
            }
        }

        auto sr = content.open();
        if (!sr.ok())
            return sr.error();

        fs::path staging = target;
        staging += ".part";
        {
            std::ofstream out(staging, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IoError, "Cannot open " + staging.string() + " for write"};
            }
            auto cr = copyStream(*sr.value(), out);
            if (!cr.ok()) {
                out.close();
                fs::remove(staging, ec);
                return cr.error();
            }
            spdlog::debug("Wrote {} bytes to {}", cr.value(), staging.string());
        }

        fs::rename(staging, target, ec);
        if (ec) {
            fs::remove(staging, ec);
            return Error{ErrorCode::IoError,
                         "Cannot move upload into place at " + target.string()};
        }
        return Expected<void>{};
    }
};

std::unique_ptr<IResourceConnector> makeFileConnector() {
    return std::make_unique<FileResourceConnector>();
}

Expected<std::unique_ptr<IResourceConnector>> makeConnector(std::string_view scheme,
                                                            const HttpOptions& options) {
    if (scheme == "file")
        return makeFileConnector();
    if (scheme == "http" || scheme == "https")
        return makeCurlConnector(options);
    return Error{ErrorCode::InvalidArgument,
                 "Unsupported URI scheme '" + std::string(scheme) + "'"};
}

} // namespace xfer::resource
