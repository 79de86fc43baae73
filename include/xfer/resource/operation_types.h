#pragma once

#include <xfer/operations/operation.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace xfer::resource {

// Details/results recorded for the transfer operations.

struct ResourceReadDetails final : operations::OperationPayload {
    explicit ResourceReadDetails(std::string loc) : location(std::move(loc)) {}

    std::string location;

    [[nodiscard]] std::string_view typeName() const override { return "ResourceRead.Details"; }
    [[nodiscard]] nlohmann::json toJson() const override;
};

struct ResourceReadResult final : operations::OperationPayload {
    explicit ResourceReadResult(std::uint64_t n) : bytesRead(n) {}

    std::uint64_t bytesRead{0};

    [[nodiscard]] std::string_view typeName() const override { return "ResourceRead.Result"; }
    [[nodiscard]] nlohmann::json toJson() const override;
};

struct ResourceMetadataDetails final : operations::OperationPayload {
    explicit ResourceMetadataDetails(std::string loc) : location(std::move(loc)) {}

    std::string location;

    [[nodiscard]] std::string_view typeName() const override {
        return "ResourceReadMetadata.Details";
    }
    [[nodiscard]] nlohmann::json toJson() const override;
};

// Completion marker; carries no data.
struct ResourceMetadataResult final : operations::OperationPayload {
    [[nodiscard]] std::string_view typeName() const override {
        return "ResourceReadMetadata.Result";
    }
    [[nodiscard]] nlohmann::json toJson() const override;
};

struct ResourceWriteDetails final : operations::OperationPayload {
    explicit ResourceWriteDetails(std::string loc) : location(std::move(loc)) {}

    std::string location;

    [[nodiscard]] std::string_view typeName() const override { return "ResourceWrite.Details"; }
    [[nodiscard]] nlohmann::json toJson() const override;
};

struct ResourceWriteResult final : operations::OperationPayload {
    explicit ResourceWriteResult(std::uint64_t n) : bytesWritten(n) {}

    std::uint64_t bytesWritten{0};

    [[nodiscard]] std::string_view typeName() const override { return "ResourceWrite.Result"; }
    [[nodiscard]] nlohmann::json toJson() const override;
};

} // namespace xfer::resource
