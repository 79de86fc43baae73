/*
 * xfer/src/resource/progress_logging_uploader.cpp
 *
 * Instrumented write path: "Upload <uri>" operations with upload progress.
 *
 * The delegate receives a ReadableContent whose streams count what the transport pulls.
 * Every open() starts a fresh count (a transport that retries re-reads from the start);
 * the recorded bytesWritten is the count of the most recently opened stream.
 */

#include <xfer/common/scope_guard.h>
#include <xfer/resource/counting_input_stream.h>
#include <xfer/resource/operation_types.h>
#include <xfer/resource/progress_logging.h>

#include <spdlog/spdlog.h>

namespace xfer::resource {

namespace {

class CountingContentStream final : public InputStream {
public:
    CountingContentStream(std::unique_ptr<InputStream> inner, progress::ProgressLogger& logger,
                          std::uint64_t totalBytes, ProgressCadence cadence,
                          std::shared_ptr<std::uint64_t> bytesSent)
        : inner_(std::move(inner)),
          progress_(logger, TransferDirection::Upload, totalBytes, cadence),
          counting_(*inner_, progress_), bytesSent_(std::move(bytesSent)) {
        *bytesSent_ = 0;
    }

    Expected<int> read() override { return track(counting_.read()); }

    Expected<std::int64_t> read(std::span<std::byte> buffer) override {
        return track(counting_.read(buffer));
    }

    Expected<std::int64_t> read(std::span<std::byte> buffer, std::size_t offset,
                                std::size_t length) override {
        return track(counting_.read(buffer, offset, length));
    }

private:
    template <typename T> Expected<T> track(Expected<T> r) {
        *bytesSent_ = counting_.bytesRead();
        return r;
    }

    std::unique_ptr<InputStream> inner_;
    TransferProgress progress_;
    CountingInputStream counting_;
    std::shared_ptr<std::uint64_t> bytesSent_;
};

class ProgressLoggingReadableContent final : public ReadableContent {
public:
    ProgressLoggingReadableContent(const ReadableContent& delegate,
                                   progress::ProgressLogger& logger, ProgressCadence cadence)
        : delegate_(delegate), logger_(logger), cadence_(cadence),
          bytesSent_(std::make_shared<std::uint64_t>(0)) {}

    Expected<std::unique_ptr<InputStream>> open() const override {
        auto r = delegate_.open();
        if (!r.ok())
            return r.error();
        return std::unique_ptr<InputStream>(std::make_unique<CountingContentStream>(
            std::move(r).value(), logger_, delegate_.contentLength(), cadence_, bytesSent_));
    }

    [[nodiscard]] std::uint64_t contentLength() const override {
        return delegate_.contentLength();
    }

    [[nodiscard]] std::uint64_t bytesSent() const { return *bytesSent_; }

private:
    const ReadableContent& delegate_;
    progress::ProgressLogger& logger_;
    ProgressCadence cadence_;
    std::shared_ptr<std::uint64_t> bytesSent_;
};

} // namespace

ProgressLoggingResourceUploader::ProgressLoggingResourceUploader(
    IResourceUploader& delegate, progress::ProgressLoggerFactory& progressLoggerFactory,
    operations::IOperationExecutor& executor, ProgressCadence cadence)
    : delegate_(delegate), progressLoggerFactory_(progressLoggerFactory), executor_(executor),
      cadence_(cadence) {}

Expected<void> ProgressLoggingResourceUploader::upload(const ReadableContent& content,
                                                       const ResourceName& destination) {
    const std::string displayName = "Upload " + destination.displayName();
    operations::OperationDescriptor descriptor{
        displayName, displayName, destination.shortDisplayName(),
        std::make_shared<const ResourceWriteDetails>(destination.toAsciiString())};

    return executor_.call<Expected<void>>(descriptor, [&](operations::OperationContext& context) {
        auto progressLogger = progressLoggerFactory_.newOperation(displayName);
        progressLogger->started();

        ProgressLoggingReadableContent counted(content, *progressLogger, cadence_);
        auto done = scope_exit([&] {
            progressLogger->completed();
            context.setResult(ResourceWriteResult{counted.bytesSent()});
        });

        auto r = delegate_.upload(counted, destination);
        if (!r.ok()) {
            spdlog::debug("{} failed: {}", displayName, r.error().message);
            context.failed(r.error());
        }
        return r;
    });
}

} // namespace xfer::resource
