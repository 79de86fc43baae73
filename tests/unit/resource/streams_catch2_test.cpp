#include <catch2/catch_test_macros.hpp>

#include <xfer/resource/streams.h>

#include "../../common/resource_fakes.h"
#include "../../common/test_helpers_catch2.h"

#include <sstream>

using namespace xfer::resource;

TEST_CASE("Memory stream delivers its buffer then end of stream", "[unit][resource][streams]") {
    MemoryInputStream in(xfer::test::to_bytes("abc"));
    std::vector<std::byte> buffer(2);

    auto n = in.read(std::span<std::byte>(buffer));
    REQUIRE(n.ok());
    CHECK(n.value() == 2);
    CHECK(in.remaining() == 1);

    auto empty = in.read(std::span<std::byte>());
    REQUIRE(empty.ok());
    CHECK(empty.value() == 0);

    auto c = in.read();
    REQUIRE(c.ok());
    CHECK(c.value() == 'c');

    auto eof = in.read(std::span<std::byte>(buffer));
    REQUIRE(eof.ok());
    CHECK(eof.value() == kEndOfStream);
}

TEST_CASE("copyStream and readAll drain a stream", "[unit][resource][streams]") {
    const auto data = xfer::test::make_bytes(200000);

    SECTION("copy") {
        MemoryInputStream in(data);
        std::ostringstream out;
        auto n = copyStream(in, out);
        REQUIRE(n.ok());
        CHECK(n.value() == data.size());
        CHECK(out.str() == xfer::test::to_string(data));
    }

    SECTION("read all") {
        MemoryInputStream in(data);
        auto all = readAll(in);
        REQUIRE(all.ok());
        CHECK(all.value() == data);
    }
}

TEST_CASE("File content opens fresh streams", "[unit][resource][streams]") {
    const auto dir = xfer::test::make_temp_dir();
    const auto file = xfer::test::write_file(dir / "payload.txt", "hello world");

    auto content = FileContent::forPath(file);
    REQUIRE(content.ok());
    CHECK(content.value().contentLength() == 11);

    for (int i = 0; i < 2; ++i) {
        auto stream = content.value().open();
        REQUIRE(stream.ok());
        auto all = readAll(*stream.value());
        REQUIRE(all.ok());
        CHECK(xfer::test::to_string(all.value()) == "hello world");
    }

    auto missing = FileContent::forPath(dir / "missing.txt");
    REQUIRE_FALSE(missing.ok());
    CHECK(missing.error().code == ErrorCode::IoError);

    auto unopenable = FileInputStream::open(dir / "missing.txt");
    CHECK_FALSE(unopenable.ok());

    std::filesystem::remove_all(dir);
}
