#pragma once

#include <xfer/resource/resource.hpp>
#include <xfer/resource/transfer_progress.h>

#include <cstdint>

namespace xfer::resource {

/**
 * Pass-through stream that counts the bytes handed to its reader and reports each new
 * cumulative count to a TransferProgress. Does not own either collaborator.
 */
class CountingInputStream final : public InputStream {
public:
    CountingInputStream(InputStream& inner, TransferProgress& progress)
        : inner_(inner), progress_(progress) {}

    Expected<int> read() override;
    Expected<std::int64_t> read(std::span<std::byte> buffer) override;
    Expected<std::int64_t> read(std::span<std::byte> buffer, std::size_t offset,
                                std::size_t length) override;

    [[nodiscard]] std::uint64_t bytesRead() const noexcept { return count_; }

private:
    void advance(std::uint64_t n);

    InputStream& inner_;
    TransferProgress& progress_;
    std::uint64_t count_{0};
};

} // namespace xfer::resource
