#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace xfer::progress {
class ProgressLogger;
}

namespace xfer::resource {

enum class TransferDirection { Download, Upload };

/**
 * Reporting cadence. A new cumulative count is announced once it is at least
 * minimumDeltaBytes past the last announced value; announced values are rounded
 * down to a multiple of granularityBytes.
 */
struct ProgressCadence {
    std::uint64_t granularityBytes{512};
    std::uint64_t minimumDeltaBytes{1024};
};

/**
 * "<done>/<total> downloaded" or "<done> downloaded" (uploaded for uploads).
 */
std::string formatTransferStatus(std::uint64_t displayBytes, std::optional<std::uint64_t> totalBytes,
                                 TransferDirection direction);

/**
 * Per-transfer throttler: decides which cumulative counts are worth announcing and
 * forwards the formatted status to a progress session. One instance per transfer;
 * not thread-safe.
 */
class TransferProgress {
public:
    TransferProgress(progress::ProgressLogger& logger, TransferDirection direction,
                     std::optional<std::uint64_t> totalBytes, ProgressCadence cadence = {});

    /**
     * Report the new cumulative byte count. Emits at most one announcement.
     * Returns true when an announcement was made.
     */
    bool onCumulativeBytes(std::uint64_t cumulative);

    [[nodiscard]] std::uint64_t lastAnnounced() const noexcept { return lastAnnounced_; }
    [[nodiscard]] const std::optional<std::uint64_t>& totalBytes() const noexcept {
        return totalBytes_;
    }

private:
    progress::ProgressLogger& logger_;
    TransferDirection direction_;
    std::optional<std::uint64_t> totalBytes_;
    ProgressCadence cadence_;
    std::uint64_t lastAnnounced_{0};
};

} // namespace xfer::resource
