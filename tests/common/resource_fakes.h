// In-memory transport and progress recorder shared by the resource tests.

#pragma once

#include <xfer/progress/progress_logger.h>
#include <xfer/resource/resource.hpp>
#include <xfer/resource/resource_name.h>
#include <xfer/resource/streams.h>

#include <algorithm>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace xfer::test {

inline resource::ByteVector make_bytes(std::size_t n) {
    resource::ByteVector out(n);
    for (std::size_t i = 0; i < n; ++i)
        out[i] = static_cast<std::byte>(i % 251);
    return out;
}

inline resource::ByteVector to_bytes(std::string_view s) {
    resource::ByteVector out(s.size());
    std::transform(s.begin(), s.end(), out.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return out;
}

inline std::string to_string(const resource::ByteVector& bytes) {
    std::string out(bytes.size(), '\0');
    std::transform(bytes.begin(), bytes.end(), out.begin(),
                   [](std::byte b) { return static_cast<char>(b); });
    return out;
}

/**
 * Serves a buffer while capping each read at the next scripted chunk size. Once the
 * script runs out, reads are only capped by the caller's buffer.
 */
class ChunkedInputStream final : public resource::InputStream {
public:
    ChunkedInputStream(const resource::ByteVector& data, std::vector<std::size_t> chunks)
        : data_(data), chunks_(std::move(chunks)) {}

    using InputStream::read;

    resource::Expected<int> read() override {
        if (pos_ >= data_.size())
            return static_cast<int>(resource::kEndOfStream);
        return static_cast<int>(std::to_integer<unsigned char>(data_[pos_++]));
    }

    resource::Expected<std::int64_t> read(std::span<std::byte> buffer) override {
        if (pos_ >= data_.size())
            return resource::kEndOfStream;
        std::size_t n = std::min(buffer.size(), data_.size() - pos_);
        if (next_ < chunks_.size())
            n = std::min(n, chunks_[next_++]);
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, buffer.begin());
        pos_ += n;
        return static_cast<std::int64_t>(n);
    }

private:
    const resource::ByteVector& data_;
    std::vector<std::size_t> chunks_;
    std::size_t pos_{0};
    std::size_t next_{0};
};

/**
 * Scripted transport for decorator tests.
 */
class FakeResourceConnector final : public resource::IResourceConnector {
public:
    struct Entry {
        resource::ByteVector data;
        bool lengthKnown{true};
        std::vector<std::size_t> chunks;
    };

    void put(const std::string& uri, resource::ByteVector data, bool lengthKnown = true,
             std::vector<std::size_t> chunks = {}) {
        entries[uri] = Entry{std::move(data), lengthKnown, std::move(chunks)};
    }

    resource::Expected<bool> withContent(const resource::ResourceName& location, bool revalidate,
                                         const resource::ContentAction& action) override {
        ++contentCalls;
        lastRevalidate = revalidate;
        if (failWith)
            return *failWith;
        if (throwMessage)
            throw std::runtime_error(*throwMessage);

        auto it = entries.find(location.displayName());
        if (it == entries.end())
            return false;

        ChunkedInputStream stream(it->second.data, it->second.chunks);
        auto ar = action(stream, metadataFor(location, it->second));
        if (!ar.ok())
            return ar.error();
        return true;
    }

    resource::Expected<std::optional<resource::ResourceMetadata>>
    getMetaData(const resource::ResourceName& location, bool revalidate) override {
        ++metadataCalls;
        lastRevalidate = revalidate;
        if (failWith)
            return *failWith;

        auto it = entries.find(location.displayName());
        if (it == entries.end())
            return std::optional<resource::ResourceMetadata>{};
        return std::optional<resource::ResourceMetadata>{metadataFor(location, it->second)};
    }

    // Pulls the content (at most uploadPullLimit bytes when set) and stores it.
    resource::Expected<void> upload(const resource::ReadableContent& content,
                                    const resource::ResourceName& destination) override {
        ++uploadCalls;
        if (failWith)
            return *failWith;

        for (int attempt = 0; attempt < uploadOpens; ++attempt) {
            auto sr = content.open();
            if (!sr.ok())
                return sr.error();

            resource::ByteVector received;
            std::vector<std::byte> buffer(1000);
            while (!uploadPullLimit || received.size() < *uploadPullLimit) {
                std::size_t want = buffer.size();
                if (uploadPullLimit)
                    want = std::min(want, *uploadPullLimit - received.size());
                auto r = sr.value()->read(std::span<std::byte>(buffer.data(), want));
                if (!r.ok())
                    return r.error();
                if (r.value() == resource::kEndOfStream)
                    break;
                received.insert(received.end(), buffer.begin(), buffer.begin() + r.value());
            }
            entries[destination.displayName()] = Entry{std::move(received), true, {}};
        }
        return resource::Expected<void>{};
    }

    std::map<std::string, Entry> entries;
    std::optional<resource::Error> failWith;
    std::optional<std::string> throwMessage;
    std::optional<std::size_t> uploadPullLimit;
    int uploadOpens{1};

    int contentCalls{0};
    int metadataCalls{0};
    int uploadCalls{0};
    bool lastRevalidate{false};

private:
    static resource::ResourceMetadata metadataFor(const resource::ResourceName& location,
                                                  const Entry& entry) {
        resource::ResourceMetadata meta;
        meta.location = location.toAsciiString();
        if (entry.lengthKnown)
            meta.contentLength = entry.data.size();
        meta.etag = "\"fake\"";
        return meta;
    }
};

/**
 * Records every call made on the progress sessions it hands out, including calls in
 * the wrong order.
 */
class RecordingProgressLoggerFactory final : public progress::ProgressLoggerFactory {
public:
    struct Session {
        std::string description;
        std::vector<std::string> events; // "started", "completed" or the progress status
        int started{0};
        int completed{0};

        [[nodiscard]] std::vector<std::string> progressMessages() const {
            std::vector<std::string> out;
            for (const auto& e : events) {
                if (e != "started" && e != "completed")
                    out.push_back(e);
            }
            return out;
        }
    };

    std::unique_ptr<progress::ProgressLogger> newOperation(std::string description) override {
        auto session = std::make_shared<Session>();
        session->description = description;
        sessions_.push_back(session);
        return std::make_unique<Logger>(std::move(session));
    }

    [[nodiscard]] std::size_t size() const { return sessions_.size(); }
    [[nodiscard]] const Session& session(std::size_t i) const { return *sessions_.at(i); }

private:
    class Logger final : public progress::ProgressLogger {
    public:
        explicit Logger(std::shared_ptr<Session> session) : session_(std::move(session)) {}

        const std::string& description() const override { return session_->description; }
        void started() override {
            ++session_->started;
            session_->events.emplace_back("started");
        }
        void progress(std::string_view status) override {
            session_->events.emplace_back(status);
        }
        void completed() override {
            ++session_->completed;
            session_->events.emplace_back("completed");
        }

    private:
        std::shared_ptr<Session> session_;
    };

    std::vector<std::shared_ptr<Session>> sessions_;
};

} // namespace xfer::test
