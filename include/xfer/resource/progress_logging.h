#pragma once

#include <xfer/operations/operation.h>
#include <xfer/progress/progress_logger.h>
#include <xfer/resource/resource.hpp>
#include <xfer/resource/transfer_progress.h>

namespace xfer::resource {

/**
 * Accessor decorator: records every read as an operation and reports download progress
 * while the caller consumes the content. Results and bytes pass through untouched.
 *
 * Content reads are recorded as "Download <location>" with ResourceReadDetails and a
 * ResourceReadResult carrying the bytes the caller actually read. Metadata reads are
 * recorded as "Metadata of <location>" and never open a progress session.
 *
 * Holds references only; one instance may serve concurrent calls as long as the
 * collaborators do.
 */
class ProgressLoggingResourceAccessor final : public IResourceAccessor {
public:
    ProgressLoggingResourceAccessor(IResourceAccessor& delegate,
                                    progress::ProgressLoggerFactory& progressLoggerFactory,
                                    operations::IOperationExecutor& executor,
                                    ProgressCadence cadence = {});

    Expected<bool> withContent(const ResourceName& location, bool revalidate,
                               const ContentAction& action) override;

    Expected<std::optional<ResourceMetadata>> getMetaData(const ResourceName& location,
                                                          bool revalidate) override;

private:
    IResourceAccessor& delegate_;
    progress::ProgressLoggerFactory& progressLoggerFactory_;
    operations::IOperationExecutor& executor_;
    ProgressCadence cadence_;
};

/**
 * Uploader decorator: records "Upload <destination>" operations and reports upload
 * progress as the delegate pulls bytes from the content.
 */
class ProgressLoggingResourceUploader final : public IResourceUploader {
public:
    ProgressLoggingResourceUploader(IResourceUploader& delegate,
                                    progress::ProgressLoggerFactory& progressLoggerFactory,
                                    operations::IOperationExecutor& executor,
                                    ProgressCadence cadence = {});

    Expected<void> upload(const ReadableContent& content, const ResourceName& destination) override;

private:
    IResourceUploader& delegate_;
    progress::ProgressLoggerFactory& progressLoggerFactory_;
    operations::IOperationExecutor& executor_;
    ProgressCadence cadence_;
};

/**
 * Connector decorator combining both of the above over one transport.
 */
class ProgressLoggingResourceConnector final : public IResourceConnector {
public:
    ProgressLoggingResourceConnector(IResourceConnector& delegate,
                                     progress::ProgressLoggerFactory& progressLoggerFactory,
                                     operations::IOperationExecutor& executor,
                                     ProgressCadence cadence = {})
        : accessor_(delegate, progressLoggerFactory, executor, cadence),
          uploader_(delegate, progressLoggerFactory, executor, cadence) {}

    Expected<bool> withContent(const ResourceName& location, bool revalidate,
                               const ContentAction& action) override {
        return accessor_.withContent(location, revalidate, action);
    }

    Expected<std::optional<ResourceMetadata>> getMetaData(const ResourceName& location,
                                                          bool revalidate) override {
        return accessor_.getMetaData(location, revalidate);
    }

    Expected<void> upload(const ReadableContent& content, const ResourceName& destination) override {
        return uploader_.upload(content, destination);
    }

private:
    ProgressLoggingResourceAccessor accessor_;
    ProgressLoggingResourceUploader uploader_;
};

} // namespace xfer::resource
