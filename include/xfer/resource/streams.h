#pragma once

#include <xfer/resource/resource.hpp>

#include <filesystem>
#include <fstream>
#include <iosfwd>

namespace xfer::resource {

/**
 * Stream over an owned byte buffer.
 */
class MemoryInputStream final : public InputStream {
public:
    explicit MemoryInputStream(ByteVector data) : data_(std::move(data)) {}

    using InputStream::read;
    Expected<int> read() override;
    Expected<std::int64_t> read(std::span<std::byte> buffer) override;

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    ByteVector data_;
    std::size_t pos_{0};
};

/**
 * Stream over a local file opened in binary mode.
 */
class FileInputStream final : public InputStream {
public:
    static Expected<std::unique_ptr<FileInputStream>> open(const std::filesystem::path& path);

    using InputStream::read;
    Expected<int> read() override;
    Expected<std::int64_t> read(std::span<std::byte> buffer) override;

private:
    FileInputStream(std::filesystem::path path, std::ifstream in)
        : path_(std::move(path)), in_(std::move(in)) {}

    std::filesystem::path path_;
    std::ifstream in_;
};

class MemoryContent final : public ReadableContent {
public:
    explicit MemoryContent(ByteVector data) : data_(std::move(data)) {}

    Expected<std::unique_ptr<InputStream>> open() const override;
    [[nodiscard]] std::uint64_t contentLength() const override { return data_.size(); }

private:
    ByteVector data_;
};

class FileContent final : public ReadableContent {
public:
    static Expected<FileContent> forPath(const std::filesystem::path& path);

    FileContent() = default;

    Expected<std::unique_ptr<InputStream>> open() const override;
    [[nodiscard]] std::uint64_t contentLength() const override { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileContent(std::filesystem::path path, std::uint64_t size)
        : path_(std::move(path)), size_(size) {}

    std::filesystem::path path_;
    std::uint64_t size_{0};
};

/**
 * Drain `in` into `out`. Returns the number of bytes copied.
 */
Expected<std::uint64_t> copyStream(InputStream& in, std::ostream& out);

/**
 * Drain `in` into memory.
 */
Expected<ByteVector> readAll(InputStream& in);

} // namespace xfer::resource
