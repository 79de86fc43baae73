#include <catch2/catch_test_macros.hpp>

#include <xfer/common/format.h>

using xfer::common::formatBytes;

TEST_CASE("formatBytes prints plain bytes below 1 KiB", "[unit][common][format]") {
    CHECK(formatBytes(0) == "0 B");
    CHECK(formatBytes(1) == "1 B");
    CHECK(formatBytes(1023) == "1023 B");
}

TEST_CASE("formatBytes scales by 1024 with one fractional digit", "[unit][common][format]") {
    CHECK(formatBytes(1024) == "1 KiB");
    CHECK(formatBytes(1536) == "1.5 KiB");
    CHECK(formatBytes(3072) == "3 KiB");
    CHECK(formatBytes(4096) == "4 KiB");
    CHECK(formatBytes(1126) == "1.1 KiB");
    CHECK(formatBytes(1024 * 1024) == "1 MiB");
    CHECK(formatBytes(5ull * 1024 * 1024 * 1024 / 2) == "2.5 GiB");
}

TEST_CASE("formatBytes rolls over to the next unit when rounding reaches 1024",
          "[unit][common][format]") {
    // 1048575 B is 1023.999 KiB
    CHECK(formatBytes(1024 * 1024 - 1) == "1 MiB");
    CHECK(formatBytes(1024 * 1024 - 60) == "1023.9 KiB");
}
