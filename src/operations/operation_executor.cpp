/*
 * xfer/src/operations/operation_executor.cpp
 *
 * In-process operation executor.
 *
 * - Ids are process-wide and strictly increasing
 * - The parent of an operation is the innermost operation running on the same thread
 * - Failures are recorded from OperationContext::failed() and from exceptions thrown by
 *   the body; exceptions are rethrown unchanged after listeners were notified
 */

#include <xfer/operations/operation.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace xfer::operations {

namespace {

thread_local std::vector<OperationId> tlsOperationStack;

class ExecutorContext final : public OperationContext {
public:
    explicit ExecutorContext(const OperationDescriptor& descriptor) : descriptor_(descriptor) {}

    using OperationContext::setResult;

    void setResult(PayloadPtr result) override {
        if (result_) {
            spdlog::warn("Operation '{}' already has a result; ignoring second result ({})",
                         descriptor_.displayName, result ? result->typeName() : "null");
            return;
        }
        result_ = std::move(result);
    }

    void failed(const Error& failure) override { failure_ = failure; }

    PayloadPtr takeResult() { return std::move(result_); }
    std::optional<Error> takeFailure() { return std::move(failure_); }

private:
    const OperationDescriptor& descriptor_;
    PayloadPtr result_;
    std::optional<Error> failure_;
};

} // namespace

void OperationExecutor::addListener(std::shared_ptr<OperationListener> listener) {
    if (!listener)
        return;
    std::lock_guard lk(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

void OperationExecutor::removeListener(const std::shared_ptr<OperationListener>& listener) {
    std::lock_guard lk(listenersMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

std::vector<std::shared_ptr<OperationListener>> OperationExecutor::snapshotListeners() const {
    std::lock_guard lk(listenersMutex_);
    return listeners_;
}

std::optional<OperationId> OperationExecutor::currentOperation() {
    if (tlsOperationStack.empty())
        return std::nullopt;
    return tlsOperationStack.back();
}

void OperationExecutor::run(const OperationDescriptor& descriptor,
                            const std::function<void(OperationContext&)>& body) {
    OperationRecord record;
    record.id = nextId_.fetch_add(1, std::memory_order_relaxed);
    record.parentId = currentOperation();
    record.descriptor = descriptor;

    const auto listeners = snapshotListeners();
    spdlog::trace("Operation #{} '{}' started", record.id, descriptor.displayName);
    record.startTime = std::chrono::steady_clock::now();
    for (const auto& l : listeners) {
        l->started(record.id, record.parentId, record.descriptor);
    }

    ExecutorContext context(record.descriptor);
    auto finish = [&](std::optional<Error> thrown) {
        record.endTime = std::chrono::steady_clock::now();
        record.result = context.takeResult();
        record.failure = thrown ? std::move(thrown) : context.takeFailure();
        if (record.failure) {
            spdlog::debug("Operation #{} '{}' failed after {}ms: {}", record.id,
                          descriptor.displayName, record.duration().count(),
                          record.failure->message);
        } else {
            spdlog::debug("Operation #{} '{}' finished in {}ms", record.id,
                          descriptor.displayName, record.duration().count());
        }
        for (const auto& l : listeners) {
            l->finished(record);
        }
    };

    tlsOperationStack.push_back(record.id);
    try {
        body(context);
    } catch (const std::exception& e) {
        tlsOperationStack.pop_back();
        finish(Error{resource::ErrorCode::Unknown, e.what()});
        throw;
    } catch (...) {
        tlsOperationStack.pop_back();
        finish(Error{resource::ErrorCode::Unknown, "unknown exception"});
        throw;
    }
    tlsOperationStack.pop_back();
    finish(std::nullopt);
}

// ---- RecordingOperationListener ----

void RecordingOperationListener::finished(const OperationRecord& record) {
    std::lock_guard lk(mutex_);
    records_.push_back(record);
}

std::vector<OperationRecord> RecordingOperationListener::records() const {
    std::lock_guard lk(mutex_);
    return records_;
}

void RecordingOperationListener::clear() {
    std::lock_guard lk(mutex_);
    records_.clear();
}

// ---- JSON ----

nlohmann::json toJson(const OperationRecord& record) {
    nlohmann::json j;
    j["id"] = record.id;
    j["parentId"] = record.parentId ? nlohmann::json(*record.parentId) : nlohmann::json(nullptr);
    j["name"] = record.descriptor.name;
    j["displayName"] = record.descriptor.displayName;
    if (record.descriptor.progressDisplayName)
        j["progressDisplayName"] = *record.descriptor.progressDisplayName;
    if (record.descriptor.details) {
        j["details"] = record.descriptor.details->toJson();
        j["details"]["type"] = std::string(record.descriptor.details->typeName());
    }
    if (record.result) {
        j["result"] = record.result->toJson();
        j["result"]["type"] = std::string(record.result->typeName());
    }
    if (record.failure) {
        j["failure"] = {{"code", resource::errorCodeName(record.failure->code)},
                        {"message", record.failure->message}};
    }
    j["durationMs"] = record.duration().count();
    return j;
}

} // namespace xfer::operations
