#include <xfer/resource/operation_types.h>

#include <nlohmann/json.hpp>

namespace xfer::resource {

nlohmann::json ResourceReadDetails::toJson() const {
    return {{"location", location}};
}

nlohmann::json ResourceReadResult::toJson() const {
    return {{"bytesRead", bytesRead}};
}

nlohmann::json ResourceMetadataDetails::toJson() const {
    return {{"location", location}};
}

nlohmann::json ResourceMetadataResult::toJson() const {
    return nlohmann::json::object();
}

nlohmann::json ResourceWriteDetails::toJson() const {
    return {{"location", location}};
}

nlohmann::json ResourceWriteResult::toJson() const {
    return {{"bytesWritten", bytesWritten}};
}

} // namespace xfer::resource
