#include <xfer/common/format.h>
#include <xfer/progress/progress_logger.h>
#include <xfer/resource/transfer_progress.h>

#include <algorithm>

namespace xfer::resource {

std::string formatTransferStatus(std::uint64_t displayBytes, std::optional<std::uint64_t> totalBytes,
                                 TransferDirection direction) {
    std::string status = common::formatBytes(displayBytes);
    if (totalBytes) {
        status.push_back('/');
        status.append(common::formatBytes(*totalBytes));
    }
    status.append(direction == TransferDirection::Download ? " downloaded" : " uploaded");
    return status;
}

TransferProgress::TransferProgress(progress::ProgressLogger& logger, TransferDirection direction,
                                   std::optional<std::uint64_t> totalBytes, ProgressCadence cadence)
    : logger_(logger), direction_(direction), totalBytes_(totalBytes), cadence_(cadence) {
    cadence_.granularityBytes = std::max<std::uint64_t>(1, cadence_.granularityBytes);
}

bool TransferProgress::onCumulativeBytes(std::uint64_t cumulative) {
    if (cumulative < lastAnnounced_ || cumulative - lastAnnounced_ < cadence_.minimumDeltaBytes)
        return false;

    const auto display = cumulative / cadence_.granularityBytes * cadence_.granularityBytes;
    logger_.progress(formatTransferStatus(display, totalBytes_, direction_));
    lastAnnounced_ = display;
    return true;
}

} // namespace xfer::resource
