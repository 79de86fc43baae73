#include <catch2/catch_test_macros.hpp>

#include <xfer/operations/json_trace_writer.h>
#include <xfer/resource/operation_types.h>

#include "../../common/test_helpers_catch2.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>
#include <vector>

using namespace xfer::operations;

namespace {

std::vector<nlohmann::json> readLines(const std::filesystem::path& path) {
    std::vector<nlohmann::json> out;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty())
            out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

} // namespace

TEST_CASE("Trace writer appends one JSON line per operation", "[unit][operations][trace]") {
    const auto dir = xfer::test::make_temp_dir("xfer_trace_");
    const auto path = dir / "sub" / "trace.jsonl";

    {
        auto writer = JsonTraceWriter::open(path);
        REQUIRE(writer.ok());
        CHECK(writer.value()->path() == path);

        OperationExecutor executor;
        executor.addListener(writer.value());
        executor.run(OperationDescriptor{"Download a", "Download a", std::string("a"),
                                         std::make_shared<const xfer::resource::ResourceReadDetails>(
                                             "https://h/a")},
                     [](OperationContext& context) {
                         context.setResult(xfer::resource::ResourceReadResult{1234});
                     });
        executor.run(OperationDescriptor{"Metadata of a", "Metadata of a", std::nullopt,
                                         std::make_shared<const xfer::resource::ResourceMetadataDetails>(
                                             "https://h/a")},
                     [](OperationContext& context) {
                         context.failed({xfer::resource::ErrorCode::Timeout, "slow"});
                     });
    }

    auto lines = readLines(path);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["name"] == "Download a");
    CHECK(lines[0]["details"]["type"] == "ResourceRead.Details");
    CHECK(lines[0]["details"]["location"] == "https://h/a");
    CHECK(lines[0]["result"]["type"] == "ResourceRead.Result");
    CHECK(lines[0]["result"]["bytesRead"] == 1234);
    CHECK_FALSE(lines[0].contains("failure"));
    CHECK(lines[1]["failure"]["code"] == "Timeout");
    CHECK_FALSE(lines[1].contains("result"));

    SECTION("reopening appends") {
        auto again = JsonTraceWriter::open(path);
        REQUIRE(again.ok());
        OperationExecutor executor;
        executor.addListener(again.value());
        executor.run(OperationDescriptor{"third", "third", std::nullopt, nullptr},
                     [](OperationContext&) {});
        CHECK(readLines(path).size() == 3);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Trace writer reports unwritable paths", "[unit][operations][trace]") {
    const auto dir = xfer::test::make_temp_dir("xfer_trace_");
    // A directory cannot be opened as the trace file.
    auto writer = JsonTraceWriter::open(dir);
    REQUIRE_FALSE(writer.ok());
    CHECK(writer.error().code == xfer::resource::ErrorCode::IoError);
    std::filesystem::remove_all(dir);
}
