#include <xfer/resource/resource_name.h>

namespace xfer::resource {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

ResourceName::ResourceName(std::string uri) : uri_(std::move(uri)) {
    // scheme ":" ["//" authority] path ["?" query] ["#" fragment]
    const auto colon = uri_.find(':');
    const auto firstDelim = uri_.find_first_of("/?#");
    if (colon != std::string::npos && colon > 0 &&
        (firstDelim == std::string::npos || colon < firstDelim)) {
        schemeEnd_ = colon;
    } else {
        schemeEnd_ = 0;
    }

    std::size_t cursor = schemeEnd_ == 0 ? 0 : schemeEnd_ + 1;
    if (uri_.compare(cursor, 2, "//") == 0) {
        authorityBegin_ = cursor + 2;
        auto end = uri_.find_first_of("/?#", authorityBegin_);
        authorityEnd_ = end == std::string::npos ? uri_.size() : end;
        cursor = authorityEnd_;
    } else {
        authorityBegin_ = authorityEnd_ = cursor;
    }

    auto end = uri_.find_first_of("?#", cursor);
    pathEnd_ = end == std::string::npos ? uri_.size() : end;
}

ResourceName ResourceName::fromPath(const std::filesystem::path& path) {
    auto absolute = std::filesystem::absolute(path).lexically_normal().generic_string();
    std::string uri{"file://"};
    if (absolute.empty() || absolute.front() != '/')
        uri.push_back('/');
    uri.append(absolute);
    return ResourceName{std::move(uri)};
}

std::string ResourceName::shortDisplayName() const {
    auto p = path();
    while (!p.empty() && p.back() == '/')
        p.remove_suffix(1);
    if (p.empty())
        return uri_;
    auto slash = p.rfind('/');
    return std::string{slash == std::string_view::npos ? p : p.substr(slash + 1)};
}

std::string ResourceName::toAsciiString() const {
    std::string out;
    out.reserve(uri_.size());
    for (unsigned char c : uri_) {
        if (c > 0x20 && c < 0x7F) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHexDigits[c >> 4]);
            out.push_back(kHexDigits[c & 0x0F]);
        }
    }
    return out;
}

std::string_view ResourceName::scheme() const noexcept {
    return std::string_view(uri_).substr(0, schemeEnd_);
}

std::string_view ResourceName::authority() const noexcept {
    return std::string_view(uri_).substr(authorityBegin_, authorityEnd_ - authorityBegin_);
}

std::string_view ResourceName::path() const noexcept {
    return std::string_view(uri_).substr(authorityEnd_, pathEnd_ - authorityEnd_);
}

std::string ResourceName::decodedPath() const {
    auto p = path();
    std::string out;
    out.reserve(p.size());
    for (std::size_t i = 0; i < p.size(); ++i) {
        if (p[i] == '%' && i + 2 < p.size()) {
            int hi = hexValue(p[i + 1]);
            int lo = hexValue(p[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(p[i]);
    }
    return out;
}

} // namespace xfer::resource
