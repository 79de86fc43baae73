#include <xfer/operations/json_trace_writer.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace xfer::operations {

resource::Expected<std::shared_ptr<JsonTraceWriter>>
JsonTraceWriter::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::app);
    if (!out) {
        return resource::Error{resource::ErrorCode::IoError,
                               "Failed to open trace file: " + path.string()};
    }
    spdlog::debug("Writing operation trace to {}", path.string());
    return std::shared_ptr<JsonTraceWriter>(new JsonTraceWriter(path, std::move(out)));
}

void JsonTraceWriter::finished(const OperationRecord& record) {
    const auto line = toJson(record).dump();
    std::lock_guard lk(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        spdlog::warn("Failed to append operation #{} to trace {}", record.id, path_.string());
    }
}

} // namespace xfer::operations
