#include <xfer/resource/counting_input_stream.h>

namespace xfer::resource {

Expected<int> CountingInputStream::read() {
    auto r = inner_.read();
    if (r.ok() && r.value() >= 0)
        advance(1);
    return r;
}

Expected<std::int64_t> CountingInputStream::read(std::span<std::byte> buffer) {
    auto r = inner_.read(buffer);
    if (r.ok() && r.value() >= 0)
        advance(static_cast<std::uint64_t>(r.value()));
    return r;
}

Expected<std::int64_t> CountingInputStream::read(std::span<std::byte> buffer, std::size_t offset,
                                                 std::size_t length) {
    auto r = inner_.read(buffer, offset, length);
    if (r.ok() && r.value() >= 0)
        advance(static_cast<std::uint64_t>(r.value()));
    return r;
}

void CountingInputStream::advance(std::uint64_t n) {
    count_ += n;
    progress_.onCumulativeBytes(count_);
}

} // namespace xfer::resource
