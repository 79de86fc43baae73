#include <catch2/catch_test_macros.hpp>

#include <xfer/operations/operation.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace xfer::operations;
using xfer::resource::Error;
using xfer::resource::ErrorCode;

namespace {

struct CountPayload final : OperationPayload {
    explicit CountPayload(int v) : value(v) {}
    std::string_view typeName() const override { return "Test.Count"; }
    nlohmann::json toJson() const override { return {{"value", value}}; }
    int value;
};

OperationDescriptor describe(std::string name) {
    return OperationDescriptor{name, name, std::nullopt, nullptr};
}

// Records start notifications alongside the finished records.
class StartRecorder final : public OperationListener {
public:
    void started(OperationId id, std::optional<OperationId> parentId,
                 const OperationDescriptor& descriptor) override {
        starts.push_back({id, parentId, descriptor.name});
    }
    void finished(const OperationRecord& record) override { finishedIds.push_back(record.id); }

    struct Start {
        OperationId id;
        std::optional<OperationId> parentId;
        std::string name;
    };
    std::vector<Start> starts;
    std::vector<OperationId> finishedIds;
};

} // namespace

TEST_CASE("Executor records results and timing", "[unit][operations]") {
    OperationExecutor executor;
    auto recorder = std::make_shared<RecordingOperationListener>();
    executor.addListener(recorder);

    const int out = executor.call<int>(describe("compute"), [](OperationContext& context) {
        context.setResult(CountPayload{7});
        return 42;
    });

    CHECK(out == 42);
    auto records = recorder->records();
    REQUIRE(records.size() == 1);
    CHECK(records[0].descriptor.name == "compute");
    CHECK_FALSE(records[0].parentId);
    CHECK_FALSE(records[0].failure);
    CHECK(records[0].endTime >= records[0].startTime);
    auto result = std::dynamic_pointer_cast<const CountPayload>(records[0].result);
    REQUIRE(result);
    CHECK(result->value == 7);
}

TEST_CASE("Executor keeps the first result only", "[unit][operations]") {
    OperationExecutor executor;
    auto recorder = std::make_shared<RecordingOperationListener>();
    executor.addListener(recorder);

    executor.run(describe("twice"), [](OperationContext& context) {
        context.setResult(CountPayload{1});
        context.setResult(CountPayload{2});
    });

    auto result = std::dynamic_pointer_cast<const CountPayload>(recorder->records()[0].result);
    REQUIRE(result);
    CHECK(result->value == 1);
}

TEST_CASE("Executor parents nested operations", "[unit][operations]") {
    OperationExecutor executor;
    auto starts = std::make_shared<StartRecorder>();
    executor.addListener(starts);

    CHECK_FALSE(OperationExecutor::currentOperation());
    executor.run(describe("outer"), [&](OperationContext&) {
        const auto outerId = OperationExecutor::currentOperation();
        REQUIRE(outerId);
        executor.run(describe("inner"), [&](OperationContext&) {
            CHECK(OperationExecutor::currentOperation() != outerId);
        });
        CHECK(OperationExecutor::currentOperation() == outerId);
    });
    CHECK_FALSE(OperationExecutor::currentOperation());

    REQUIRE(starts->starts.size() == 2);
    CHECK(starts->starts[0].name == "outer");
    CHECK_FALSE(starts->starts[0].parentId);
    CHECK(starts->starts[1].name == "inner");
    CHECK(starts->starts[1].parentId == starts->starts[0].id);
    CHECK(starts->starts[1].id > starts->starts[0].id);
    // Inner finishes first.
    CHECK(starts->finishedIds == std::vector<OperationId>{starts->starts[1].id,
                                                          starts->starts[0].id});
}

TEST_CASE("Executor records failures", "[unit][operations]") {
    OperationExecutor executor;
    auto recorder = std::make_shared<RecordingOperationListener>();
    executor.addListener(recorder);

    SECTION("reported through the context") {
        executor.run(describe("soft"), [](OperationContext& context) {
            context.failed(Error{ErrorCode::NetworkError, "unreachable"});
        });
        auto records = recorder->records();
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].failure);
        CHECK(records[0].failure->code == ErrorCode::NetworkError);
    }

    SECTION("thrown by the body") {
        CHECK_THROWS_AS(executor.run(describe("hard"),
                                     [](OperationContext& context) {
                                         context.setResult(CountPayload{3});
                                         throw std::logic_error("boom");
                                     }),
                        std::logic_error);
        auto records = recorder->records();
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].failure);
        CHECK(records[0].failure->code == ErrorCode::Unknown);
        CHECK(records[0].failure->message == "boom");
        CHECK(records[0].result);
        CHECK_FALSE(OperationExecutor::currentOperation());
    }
}

TEST_CASE("Executor threads have independent parents", "[unit][operations]") {
    OperationExecutor executor;
    auto recorder = std::make_shared<RecordingOperationListener>();
    executor.addListener(recorder);

    executor.run(describe("main"), [&](OperationContext&) {
        std::thread worker([&] { executor.run(describe("worker"), [](OperationContext&) {}); });
        worker.join();
    });

    auto records = recorder->records();
    REQUIRE(records.size() == 2);
    CHECK(records[0].descriptor.name == "worker");
    CHECK_FALSE(records[0].parentId);
}

TEST_CASE("Removed listeners are no longer notified", "[unit][operations]") {
    OperationExecutor executor;
    auto recorder = std::make_shared<RecordingOperationListener>();
    executor.addListener(recorder);
    executor.run(describe("one"), [](OperationContext&) {});
    executor.removeListener(recorder);
    executor.run(describe("two"), [](OperationContext&) {});

    CHECK(recorder->records().size() == 1);
    recorder->clear();
    CHECK(recorder->records().empty());
}

TEST_CASE("Operation records serialize to JSON", "[unit][operations]") {
    OperationRecord record;
    record.id = 5;
    record.parentId = 2;
    record.descriptor = OperationDescriptor{"Download x", "Download x", std::string("x"),
                                            std::make_shared<const CountPayload>(1)};
    record.result = std::make_shared<const CountPayload>(9);
    record.failure = Error{ErrorCode::Timeout, "slow"};
    record.startTime = std::chrono::steady_clock::time_point{};
    record.endTime = record.startTime + std::chrono::milliseconds(15);

    const auto j = toJson(record);
    CHECK(j["id"] == 5);
    CHECK(j["parentId"] == 2);
    CHECK(j["name"] == "Download x");
    CHECK(j["progressDisplayName"] == "x");
    CHECK(j["details"]["type"] == "Test.Count");
    CHECK(j["details"]["value"] == 1);
    CHECK(j["result"]["value"] == 9);
    CHECK(j["failure"]["code"] == "Timeout");
    CHECK(j["failure"]["message"] == "slow");
    CHECK(j["durationMs"] == 15);

    record.parentId.reset();
    CHECK(toJson(record)["parentId"].is_null());
}
