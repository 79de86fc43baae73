/*
 * http_connector_curl.cpp
 *
 * Notes
 * - HTTP(S) transport built on the libcurl easy API.
 * - getMetaData() issues HEAD; withContent() issues GET and hands the body to the caller
 *   as a stream; upload() issues PUT and streams the request body from the content.
 * - 404 and 410 mean "resource absent"; any other status >= 400 is a ServerError.
 * - A final 3xx (redirects disabled, or nothing to follow) is a ServerError, never content.
 * - revalidate adds "Cache-Control: max-age=0" so intermediaries refetch.
 * - Honors timeout, TLS verify/CA, proxy, user agent, extra headers and redirects.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <xfer/resource/connectors.h>
#include <xfer/resource/streams.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace xfer::resource {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

// Local helper: lowercase copy
std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
        case CURLE_READ_ERROR:
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

bool isAbsentStatus(long status) {
    return status == 404 || status == 410;
}

Expected<void> checkFinalStatus(long status, std::string_view method, const std::string& url) {
    if (status >= 300 && status < 400) {
        return Error{ErrorCode::ServerError, "HTTP redirect " + std::to_string(status) + " for " +
                                                 std::string(method) + " " + url +
                                                 " was not followed"};
    }
    if (status >= 400) {
        return Error{ErrorCode::ServerError, "HTTP error " + std::to_string(status) + " for " +
                                                 std::string(method) + " " + url};
    }
    return Expected<void>{};
}

// Header parser context; reset on every status line so redirects keep the final response.
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> contentType;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    } else if (key == "etag") {
        // Strip surrounding quotes if present
        if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                                (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        ctx->etag = std::move(val);
    } else if (key == "last-modified") {
        ctx->lastModified = std::move(val);
    } else if (key == "content-type") {
        ctx->contentType = std::move(val);
    }

    return total;
}

size_t collect_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* body = static_cast<ByteVector*>(userdata);
    const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    body->insert(body->end(), bytes, bytes + total);
    return total;
}

size_t discard_cb(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

// Read context for PUT bodies
struct ReadContext {
    InputStream* stream{nullptr};
    std::optional<Error> error;
};

size_t read_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ReadContext*>(userdata);
    if (ctx == nullptr || ctx->stream == nullptr)
        return CURL_READFUNC_ABORT;

    std::span<std::byte> out{reinterpret_cast<std::byte*>(buffer), size * nitems};
    auto r = ctx->stream->read(out);
    if (!r.ok()) {
        ctx->error = r.error();
        return CURL_READFUNC_ABORT;
    }
    if (r.value() == kEndOfStream)
        return 0;
    return static_cast<size_t>(r.value());
}

HeaderList buildHeaderList(const HttpOptions& options, bool revalidate) {
    curl_slist* list = nullptr;
    for (const auto& h : options.headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    if (revalidate) {
        list = curl_slist_append(list, "Cache-Control: max-age=0");
    }
    return HeaderList{list, &curl_slist_free_all};
}

// Common CURL easy handle configuration
void configureCommon(CURL* curl, const HttpOptions& options) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min(options.connectTimeout, options.timeout).count()));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    // Proxy
    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    if (!options.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

ResourceMetadata toMetadata(const ResourceName& location, const HeaderParseContext& hctx) {
    ResourceMetadata meta;
    meta.location = location.toAsciiString();
    meta.contentLength = hctx.contentLength;
    meta.etag = hctx.etag;
    meta.contentType = hctx.contentType;
    if (hctx.lastModified) {
        const auto t = curl_getdate(hctx.lastModified->c_str(), nullptr);
        if (t >= 0) {
            meta.lastModified = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(t));
        }
    }
    return meta;
}

Expected<void> checkScheme(const ResourceName& location) {
    if (location.scheme() != "http" && location.scheme() != "https") {
        return Error{ErrorCode::InvalidArgument, "Not an HTTP(S) URI: " + location.displayName()};
    }
    return Expected<void>{};
}

} // namespace

class CurlResourceConnector final : public IResourceConnector {
public:
    explicit CurlResourceConnector(HttpOptions options) : options_(std::move(options)) {
        ensureCurlInitialized();
    }
    ~CurlResourceConnector() override = default;

    Expected<bool> withContent(const ResourceName& location, bool revalidate,
                               const ContentAction& action) override {
        if (auto sc = checkScheme(location); !sc.ok())
            return sc.error();

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string url = location.toAsciiString();
        auto headers = buildHeaderList(options_, revalidate);
        HeaderParseContext hctx{};
        ByteVector body;

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
        configureCommon(curl.get(), options_);

        spdlog::debug("GET {}{}", url, revalidate ? " (revalidate)" : "");
        const CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            spdlog::warn("GET {} failed: {}", url, curl_easy_strerror(rc));
            return makeCurlError(rc, "withContent(GET)");
        }

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
        if (isAbsentStatus(http_status)) {
            spdlog::debug("GET {} -> {} (absent)", url, http_status);
            return false;
        }
        if (auto st = checkFinalStatus(http_status, "GET", url); !st.ok()) {
            spdlog::debug("GET {} -> {}", url, http_status);
            return st.error();
        }

        if (hctx.etag) {
            spdlog::debug("HTTP fetch captured ETag: {}", *hctx.etag);
        }
        if (hctx.lastModified) {
            spdlog::debug("HTTP fetch captured Last-Modified: {}", *hctx.lastModified);
        }

        const auto meta = toMetadata(location, hctx);
        MemoryInputStream stream(std::move(body));
        auto ar = action(stream, meta);
        if (!ar.ok())
            return ar.error();
        return true;
    }

    Expected<std::optional<ResourceMetadata>> getMetaData(const ResourceName& location,
                                                          bool revalidate) override {
        if (auto sc = checkScheme(location); !sc.ok())
            return sc.error();

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string url = location.toAsciiString();
        auto headers = buildHeaderList(options_, revalidate);
        HeaderParseContext hctx{};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        configureCommon(curl.get(), options_);

        spdlog::debug("HEAD {}", url);
        const CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            spdlog::warn("HEAD {} failed: {}", url, curl_easy_strerror(rc));
            return makeCurlError(rc, "getMetaData(HEAD)");
        }

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
        if (isAbsentStatus(http_status)) {
            return std::optional<ResourceMetadata>{std::nullopt};
        }
        if (auto st = checkFinalStatus(http_status, "HEAD", url); !st.ok()) {
            spdlog::debug("HEAD {} -> {}", url, http_status);
            return st.error();
        }
        return std::optional<ResourceMetadata>{toMetadata(location, hctx)};
    }

    Expected<void> upload(const ReadableContent& content, const ResourceName& destination) override {
        if (auto sc = checkScheme(destination); !sc.ok())
            return sc.error();

        auto sr = content.open();
        if (!sr.ok())
            return sr.error();

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string url = destination.toAsciiString();
        auto headers = buildHeaderList(options_, false);
        ReadContext rctx{sr.value().get(), std::nullopt};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_cb);
        curl_easy_setopt(curl.get(), CURLOPT_READDATA, &rctx);
        curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE,
                         static_cast<curl_off_t>(content.contentLength()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_cb);
        configureCommon(curl.get(), options_);

        spdlog::debug("PUT {} ({} bytes)", url, content.contentLength());
        const CURLcode rc = curl_easy_perform(curl.get());
        if (rctx.error) {
            return *rctx.error;
        }
        if (rc != CURLE_OK) {
            spdlog::warn("PUT {} failed: {}", url, curl_easy_strerror(rc));
            return makeCurlError(rc, "upload(PUT)");
        }

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
        if (auto st = checkFinalStatus(http_status, "PUT", url); !st.ok()) {
            spdlog::debug("PUT {} -> {}", url, http_status);
            return st.error();
        }
        return Expected<void>{};
    }

private:
    HttpOptions options_;
};

std::unique_ptr<IResourceConnector> makeCurlConnector(const HttpOptions& options) {
    return std::make_unique<CurlResourceConnector>(options);
}

} // namespace xfer::resource
