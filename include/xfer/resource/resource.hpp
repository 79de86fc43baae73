#pragma once

/*
 * xfer Resource - Public Types and Transport Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces shared by the
 * transports (file, HTTP) and the instrumentation layer that decorates them. It
 * intentionally contains no implementation details.
 *
 * Design principles:
 * - A transport and its instrumented wrapper implement the same interface
 * - Absence of a resource is a normal outcome, never an error
 * - Bytes handed to the caller are never altered by the instrumentation
 *
 * Copyright (c) xfer Contributors
 */

#include <xfer/resource/resource_name.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xfer::resource {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Canonical error codes for transfer operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    IoError,
    PolicyViolation,
    Unknown
};

/**
 * Returned by stream reads once no more bytes are available.
 */
inline constexpr std::int64_t kEndOfStream = -1;

constexpr const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TlsVerificationFailed";
        case ErrorCode::ServerError:
            return "ServerError";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::PolicyViolation:
            return "PolicyViolation";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

// ===================
// Small data objects
// ===================

using ByteVector = std::vector<std::byte>;

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Metadata describing a remote resource as reported by a transport.
 * contentLength is std::nullopt when the transport cannot tell the size up front.
 */
struct ResourceMetadata {
    std::string location;
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::chrono::system_clock::time_point> lastModified{};
    std::optional<std::string> etag{};
    std::optional<std::string> contentType{};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===========
// Streams
// ===========

/**
 * Pull-based byte stream.
 *
 * Reads return the number of bytes delivered (possibly 0 for an empty buffer) or
 * kEndOfStream. The single-byte form returns the byte value (0-255) or kEndOfStream.
 */
class InputStream {
public:
    virtual ~InputStream() = default;

    virtual Expected<int> read() = 0;
    virtual Expected<std::int64_t> read(std::span<std::byte> buffer) = 0;

    /**
     * Read at most `length` bytes into buffer[offset, offset + length).
     */
    virtual Expected<std::int64_t> read(std::span<std::byte> buffer, std::size_t offset,
                                        std::size_t length) {
        if (offset > buffer.size() || length > buffer.size() - offset) {
            return Error{ErrorCode::InvalidArgument, "read: offset/length outside of buffer"};
        }
        return read(buffer.subspan(offset, length));
    }
};

/**
 * Content that can be opened (possibly several times) for upload.
 */
class ReadableContent {
public:
    virtual ~ReadableContent() = default;
    virtual Expected<std::unique_ptr<InputStream>> open() const = 0;
    [[nodiscard]] virtual std::uint64_t contentLength() const = 0;
};

// ===================
// Callback signatures
// ===================

/**
 * Caller action run against the content of a resource. The stream is only valid for
 * the duration of the call.
 */
using ContentAction = std::function<Expected<void>(InputStream&, const ResourceMetadata&)>;

/**
 * Typed variant of ContentAction, see withContent<T>() below.
 */
template <typename T>
using TypedContentAction = std::function<Expected<T>(InputStream&, const ResourceMetadata&)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Read access to resources. Transports and the instrumented accessor both implement it.
 */
class IResourceAccessor {
public:
    virtual ~IResourceAccessor() = default;

    /**
     * Run `action` against the content of `location`.
     * Returns false (and never invokes the action) when the resource does not exist.
     * An error returned by the action is returned unchanged.
     */
    virtual Expected<bool> withContent(const ResourceName& location, bool revalidate,
                                       const ContentAction& action) = 0;

    /**
     * Fetch metadata; std::nullopt when the resource does not exist.
     */
    virtual Expected<std::optional<ResourceMetadata>> getMetaData(const ResourceName& location,
                                                                  bool revalidate) = 0;
};

/**
 * Write access to resources.
 */
class IResourceUploader {
public:
    virtual ~IResourceUploader() = default;

    virtual Expected<void> upload(const ReadableContent& content,
                                  const ResourceName& destination) = 0;
};

/**
 * A transport: everything a scheme implementation provides.
 */
class IResourceConnector : public IResourceAccessor, public IResourceUploader {};

// ======================
// Helpers
// ======================

/**
 * Run a typed action against the content of `location` and hand back what it returned.
 * std::nullopt means the resource does not exist.
 */
template <typename T>
Expected<std::optional<T>> withContent(IResourceAccessor& accessor, const ResourceName& location,
                                       bool revalidate, const TypedContentAction<T>& action) {
    std::optional<T> produced;
    auto r = accessor.withContent(location, revalidate,
                                  [&](InputStream& in, const ResourceMetadata& meta) {
                                      auto ar = action(in, meta);
                                      if (!ar.ok())
                                          return Expected<void>{ar.error()};
                                      produced.emplace(std::move(ar).value());
                                      return Expected<void>{};
                                  });
    if (!r.ok())
        return r.error();
    if (!r.value())
        return std::optional<T>{std::nullopt};
    return std::optional<T>{std::move(produced)};
}

} // namespace xfer::resource
