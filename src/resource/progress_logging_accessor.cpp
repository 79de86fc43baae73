/*
 * xfer/src/resource/progress_logging_accessor.cpp
 *
 * Instrumented read path.
 *
 * withContent():
 * - One "Download <uri>" operation per call, submitted before the delegate runs
 * - Progress session opened right before the delegate call and completed on every
 *   exit path (scope guard), followed by the ResourceReadResult
 * - The raw stream is swapped for a CountingInputStream only for the duration of the
 *   caller's action; bytes and the caller-visible outcome are untouched
 *
 * getMetaData():
 * - One "Metadata of <uri>" operation per call, no progress session
 */

#include <xfer/common/scope_guard.h>
#include <xfer/resource/counting_input_stream.h>
#include <xfer/resource/operation_types.h>
#include <xfer/resource/progress_logging.h>

#include <spdlog/spdlog.h>

namespace xfer::resource {

using operations::OperationContext;
using operations::OperationDescriptor;

ProgressLoggingResourceAccessor::ProgressLoggingResourceAccessor(
    IResourceAccessor& delegate, progress::ProgressLoggerFactory& progressLoggerFactory,
    operations::IOperationExecutor& executor, ProgressCadence cadence)
    : delegate_(delegate), progressLoggerFactory_(progressLoggerFactory), executor_(executor),
      cadence_(cadence) {}

Expected<bool> ProgressLoggingResourceAccessor::withContent(const ResourceName& location,
                                                            bool revalidate,
                                                            const ContentAction& action) {
    const std::string displayName = "Download " + location.displayName();
    OperationDescriptor descriptor{displayName, displayName, location.shortDisplayName(),
                                   std::make_shared<const ResourceReadDetails>(
                                       location.toAsciiString())};

    return executor_.call<Expected<bool>>(descriptor, [&](OperationContext& context) {
        auto progressLogger = progressLoggerFactory_.newOperation(displayName);
        progressLogger->started();

        std::uint64_t bytesRead = 0;
        auto done = scope_exit([&] {
            progressLogger->completed();
            context.setResult(ResourceReadResult{bytesRead});
        });

        auto r = delegate_.withContent(
            location, revalidate,
            [&](InputStream& raw, const ResourceMetadata& metadata) -> Expected<void> {
                TransferProgress transferProgress(*progressLogger, TransferDirection::Download,
                                                  metadata.contentLength, cadence_);
                CountingInputStream counting(raw, transferProgress);
                auto capture = scope_exit([&] { bytesRead = counting.bytesRead(); });
                return action(counting, metadata);
            });

        if (!r.ok()) {
            spdlog::debug("{} failed: {}", displayName, r.error().message);
            context.failed(r.error());
        } else if (!r.value()) {
            spdlog::debug("{}: resource does not exist", displayName);
        }
        return r;
    });
}

Expected<std::optional<ResourceMetadata>>
ProgressLoggingResourceAccessor::getMetaData(const ResourceName& location, bool revalidate) {
    const std::string displayName = "Metadata of " + location.displayName();
    OperationDescriptor descriptor{displayName, displayName, std::nullopt,
                                   std::make_shared<const ResourceMetadataDetails>(
                                       location.toAsciiString())};

    using MetadataOutcome = Expected<std::optional<ResourceMetadata>>;
    return executor_.call<MetadataOutcome>(descriptor, [&](OperationContext& context) {
        auto r = delegate_.getMetaData(location, revalidate);
        if (r.ok()) {
            context.setResult(ResourceMetadataResult{});
        } else {
            spdlog::debug("{} failed: {}", displayName, r.error().message);
            context.failed(r.error());
        }
        return r;
    });
}

} // namespace xfer::resource
