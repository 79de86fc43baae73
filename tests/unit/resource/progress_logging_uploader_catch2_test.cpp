#include <catch2/catch_test_macros.hpp>

#include <xfer/operations/operation.h>
#include <xfer/resource/operation_types.h>
#include <xfer/resource/progress_logging.h>
#include <xfer/resource/resource_name.h>
#include <xfer/resource/streams.h>

#include "../../common/resource_fakes.h"

#include <memory>
#include <stdexcept>

using namespace xfer::resource;
using xfer::operations::OperationExecutor;
using xfer::operations::RecordingOperationListener;
using xfer::test::FakeResourceConnector;
using xfer::test::RecordingProgressLoggerFactory;

namespace {

const std::string kDestination = "https://repo.example.com/releases/lib-1.0.jar";

struct UploaderFixture {
    UploaderFixture() : uploader(transport, progress, executor) { executor.addListener(recorder); }

    [[nodiscard]] std::uint64_t recordedBytesWritten() const {
        auto records = recorder->records();
        REQUIRE(records.size() == 1);
        auto result = std::dynamic_pointer_cast<const ResourceWriteResult>(records[0].result);
        REQUIRE(result);
        return result->bytesWritten;
    }

    FakeResourceConnector transport;
    RecordingProgressLoggerFactory progress;
    OperationExecutor executor;
    std::shared_ptr<RecordingOperationListener> recorder =
        std::make_shared<RecordingOperationListener>();
    ProgressLoggingResourceUploader uploader;
};

// Content whose streams fail on open.
class UnreadableContent final : public ReadableContent {
public:
    Expected<std::unique_ptr<InputStream>> open() const override {
        return Error{ErrorCode::IoError, "source vanished"};
    }
    [[nodiscard]] std::uint64_t contentLength() const override { return 10; }
};

} // namespace

TEST_CASE("Instrumented upload records the operation and forwards the bytes",
          "[unit][resource][upload]") {
    UploaderFixture f;
    MemoryContent content(xfer::test::make_bytes(4096));

    auto r = f.uploader.upload(content, ResourceName(kDestination));

    REQUIRE(r.ok());
    CHECK(f.transport.uploadCalls == 1);
    REQUIRE(f.transport.entries.count(kDestination) == 1);
    CHECK(f.transport.entries[kDestination].data == xfer::test::make_bytes(4096));
    CHECK(f.recordedBytesWritten() == 4096);

    const auto record = f.recorder->records().front();
    CHECK(record.descriptor.name == "Upload " + kDestination);
    CHECK(record.descriptor.displayName == "Upload " + kDestination);
    REQUIRE(record.descriptor.progressDisplayName);
    CHECK(*record.descriptor.progressDisplayName == "lib-1.0.jar");
    auto details = std::dynamic_pointer_cast<const ResourceWriteDetails>(record.descriptor.details);
    REQUIRE(details);
    CHECK(details->location == kDestination);
    CHECK_FALSE(record.failure);

    REQUIRE(f.progress.size() == 1);
    const auto& session = f.progress.session(0);
    CHECK(session.description == "Upload " + kDestination);
    CHECK(session.started == 1);
    CHECK(session.completed == 1);
    // The fake transport pulls 1000 bytes per read.
    CHECK(session.progressMessages() ==
          std::vector<std::string>{"1.5 KiB/4 KiB uploaded", "2.5 KiB/4 KiB uploaded",
                                   "3.5 KiB/4 KiB uploaded"});
}

TEST_CASE("Instrumented upload reports what the transport actually pulled",
          "[unit][resource][upload]") {
    UploaderFixture f;
    f.transport.uploadPullLimit = 1600;
    MemoryContent content(xfer::test::make_bytes(4096));

    auto r = f.uploader.upload(content, ResourceName(kDestination));

    REQUIRE(r.ok());
    CHECK(f.recordedBytesWritten() == 1600);
    CHECK(f.progress.session(0).progressMessages() ==
          std::vector<std::string>{"1.5 KiB/4 KiB uploaded"});
}

TEST_CASE("Instrumented upload restarts the count when the content is reopened",
          "[unit][resource][upload]") {
    UploaderFixture f;
    f.transport.uploadOpens = 2;
    MemoryContent content(xfer::test::make_bytes(2500));

    auto r = f.uploader.upload(content, ResourceName(kDestination));

    REQUIRE(r.ok());
    CHECK(f.recordedBytesWritten() == 2500);
    CHECK(f.progress.size() == 1);
    CHECK(f.progress.session(0).completed == 1);
}

TEST_CASE("Instrumented upload propagates failures", "[unit][resource][upload]") {
    UploaderFixture f;

    SECTION("transport error") {
        f.transport.failWith = Error{ErrorCode::ServerError, "HTTP 500"};
        MemoryContent content(xfer::test::make_bytes(10));
        auto r = f.uploader.upload(content, ResourceName(kDestination));
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ServerError);
        CHECK(f.recordedBytesWritten() == 0);
    }

    SECTION("content cannot be opened") {
        UnreadableContent content;
        auto r = f.uploader.upload(content, ResourceName(kDestination));
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().message == "source vanished");
    }

    auto records = f.recorder->records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].failure);
    CHECK(f.progress.session(0).completed == 1);
}
