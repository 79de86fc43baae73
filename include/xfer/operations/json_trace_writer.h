#pragma once

#include <xfer/operations/operation.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

namespace xfer::operations {

/**
 * Appends one JSON object per finished operation (JSON Lines) to a trace file.
 */
class JsonTraceWriter final : public OperationListener {
public:
    static resource::Expected<std::shared_ptr<JsonTraceWriter>>
    open(const std::filesystem::path& path);

    void started(OperationId, std::optional<OperationId>, const OperationDescriptor&) override {}
    void finished(const OperationRecord& record) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    JsonTraceWriter(std::filesystem::path path, std::ofstream out)
        : path_(std::move(path)), out_(std::move(out)) {}

    std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream out_;
};

} // namespace xfer::operations
