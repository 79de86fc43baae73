#include <xfer/resource/streams.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <ostream>
#include <system_error>

namespace xfer::resource {

namespace {
constexpr std::size_t kCopyBufferSize = 64 * 1024;
}

// ---- MemoryInputStream ----

Expected<int> MemoryInputStream::read() {
    if (pos_ >= data_.size())
        return static_cast<int>(kEndOfStream);
    return static_cast<int>(std::to_integer<unsigned char>(data_[pos_++]));
}

Expected<std::int64_t> MemoryInputStream::read(std::span<std::byte> buffer) {
    if (buffer.empty())
        return std::int64_t{0};
    if (pos_ >= data_.size())
        return kEndOfStream;
    const auto n = std::min(buffer.size(), data_.size() - pos_);
    std::memcpy(buffer.data(), data_.data() + pos_, n);
    pos_ += n;
    return static_cast<std::int64_t>(n);
}

// ---- FileInputStream ----

Expected<std::unique_ptr<FileInputStream>> FileInputStream::open(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open file for read: " + path.string()};
    }
    return std::unique_ptr<FileInputStream>(new FileInputStream(path, std::move(in)));
}

Expected<int> FileInputStream::read() {
    const auto c = in_.get();
    if (c == std::ifstream::traits_type::eof()) {
        if (in_.bad())
            return Error{ErrorCode::IoError, "Read failed: " + path_.string()};
        return static_cast<int>(kEndOfStream);
    }
    return static_cast<int>(static_cast<unsigned char>(c));
}

Expected<std::int64_t> FileInputStream::read(std::span<std::byte> buffer) {
    if (buffer.empty())
        return std::int64_t{0};
    in_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (in_.bad())
        return Error{ErrorCode::IoError, "Read failed: " + path_.string()};
    const auto n = in_.gcount();
    if (n == 0)
        return kEndOfStream;
    return static_cast<std::int64_t>(n);
}

// ---- ReadableContent implementations ----

Expected<std::unique_ptr<InputStream>> MemoryContent::open() const {
    return std::unique_ptr<InputStream>(std::make_unique<MemoryInputStream>(data_));
}

Expected<FileContent> FileContent::forPath(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Cannot stat upload source " + path.string() + ": " + ec.message()};
    }
    return FileContent{path, static_cast<std::uint64_t>(size)};
}

Expected<std::unique_ptr<InputStream>> FileContent::open() const {
    auto r = FileInputStream::open(path_);
    if (!r.ok())
        return r.error();
    return std::unique_ptr<InputStream>(std::move(r).value());
}

// ---- Helpers ----

Expected<std::uint64_t> copyStream(InputStream& in, std::ostream& out) {
    std::array<std::byte, kCopyBufferSize> buffer{};
    std::uint64_t total = 0;
    for (;;) {
        auto r = in.read(std::span<std::byte>(buffer));
        if (!r.ok())
            return r.error();
        if (r.value() == kEndOfStream)
            break;
        out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(r.value()));
        if (!out)
            return Error{ErrorCode::IoError, "Failed to write output"};
        total += static_cast<std::uint64_t>(r.value());
    }
    return total;
}

Expected<ByteVector> readAll(InputStream& in) {
    ByteVector out;
    std::array<std::byte, kCopyBufferSize> buffer{};
    for (;;) {
        auto r = in.read(std::span<std::byte>(buffer));
        if (!r.ok())
            return r.error();
        if (r.value() == kEndOfStream)
            break;
        out.insert(out.end(), buffer.begin(), buffer.begin() + r.value());
    }
    return out;
}

} // namespace xfer::resource
