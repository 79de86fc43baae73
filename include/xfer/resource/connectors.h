#pragma once

#include <xfer/resource/resource.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xfer::resource {

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Options for the HTTP(S) transport.
 */
struct HttpOptions {
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds connectTimeout{30000};
    bool followRedirects{true};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent{"xfer"};
    std::vector<Header> headers;
};

// file: URIs on the local filesystem.
std::unique_ptr<IResourceConnector> makeFileConnector();

// http: and https: URIs through libcurl.
std::unique_ptr<IResourceConnector> makeCurlConnector(const HttpOptions& options);

/**
 * Transport for a URI scheme ("file", "http", "https"); InvalidArgument otherwise.
 */
Expected<std::unique_ptr<IResourceConnector>> makeConnector(std::string_view scheme,
                                                            const HttpOptions& options);

} // namespace xfer::resource
