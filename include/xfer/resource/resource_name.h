#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace xfer::resource {

/**
 * Immutable name of a remote resource (an absolute URI).
 *
 * Only the pieces the transfer layer needs are split out: scheme, authority and
 * path. Full RFC 3986 validation is left to the transports.
 */
class ResourceName {
public:
    explicit ResourceName(std::string uri);

    static ResourceName fromPath(const std::filesystem::path& path);

    // The URI as given; used in operation names and progress descriptions.
    [[nodiscard]] const std::string& displayName() const noexcept { return uri_; }

    // Last non-empty path segment, or the whole URI when the path is empty.
    [[nodiscard]] std::string shortDisplayName() const;

    // Non-ASCII, control and space characters percent-encoded (upper-case hex).
    [[nodiscard]] std::string toAsciiString() const;

    [[nodiscard]] std::string_view scheme() const noexcept;
    [[nodiscard]] std::string_view authority() const noexcept;
    [[nodiscard]] std::string_view path() const noexcept;

    // Path with %XX escapes decoded, suitable for the local filesystem.
    [[nodiscard]] std::string decodedPath() const;

    bool operator==(const ResourceName& other) const noexcept { return uri_ == other.uri_; }

private:
    std::string uri_;
    std::size_t schemeEnd_{0};
    std::size_t authorityBegin_{0};
    std::size_t authorityEnd_{0};
    std::size_t pathEnd_{0};
};

} // namespace xfer::resource
