#pragma once

/*
 * xfer Operations - named, timed units of work with typed details and results.
 *
 * An operation is opened with a descriptor, runs a body that receives an
 * OperationContext, and is closed on every exit path. Listeners observe start and
 * finish; the executor owns ids, parenting and timing.
 */

#include <xfer/resource/resource.hpp>

#include <nlohmann/json_fwd.hpp>

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xfer::operations {

using resource::Error;

/**
 * Typed details/result attached to an operation.
 */
class OperationPayload {
public:
    virtual ~OperationPayload() = default;
    [[nodiscard]] virtual std::string_view typeName() const = 0;
    [[nodiscard]] virtual nlohmann::json toJson() const = 0;
};

using PayloadPtr = std::shared_ptr<const OperationPayload>;

struct OperationDescriptor {
    std::string name;
    std::string displayName;
    std::optional<std::string> progressDisplayName;
    PayloadPtr details;
};

using OperationId = std::uint64_t;

/**
 * Everything known about an operation once it has finished.
 */
struct OperationRecord {
    OperationId id{0};
    std::optional<OperationId> parentId;
    OperationDescriptor descriptor;
    std::chrono::steady_clock::time_point startTime{};
    std::chrono::steady_clock::time_point endTime{};
    PayloadPtr result;
    std::optional<Error> failure;

    [[nodiscard]] std::chrono::milliseconds duration() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);
    }
};

/**
 * Handed to the operation body. A result is set at most once.
 */
class OperationContext {
public:
    virtual ~OperationContext() = default;

    virtual void setResult(PayloadPtr result) = 0;
    virtual void failed(const Error& failure) = 0;

    template <typename R>
        requires std::derived_from<R, OperationPayload>
    void setResult(R result) {
        setResult(PayloadPtr(std::make_shared<const R>(std::move(result))));
    }
};

class OperationListener {
public:
    virtual ~OperationListener() = default;

    virtual void started(OperationId id, std::optional<OperationId> parentId,
                         const OperationDescriptor& descriptor) = 0;
    virtual void finished(const OperationRecord& record) = 0;
};

/**
 * Operation sink. run() returns after the body returns or rethrows what it threw.
 */
class IOperationExecutor {
public:
    virtual ~IOperationExecutor() = default;

    virtual void run(const OperationDescriptor& descriptor,
                     const std::function<void(OperationContext&)>& body) = 0;

    template <typename T>
    T call(const OperationDescriptor& descriptor,
           const std::function<T(OperationContext&)>& body) {
        std::optional<T> out;
        run(descriptor, [&](OperationContext& context) { out.emplace(body(context)); });
        return std::move(*out);
    }
};

/**
 * In-process executor: sequential ids, per-thread parent tracking, listener fan-out.
 * Safe to use from several threads; each thread has its own operation stack.
 */
class OperationExecutor final : public IOperationExecutor {
public:
    OperationExecutor() = default;

    void addListener(std::shared_ptr<OperationListener> listener);
    void removeListener(const std::shared_ptr<OperationListener>& listener);

    void run(const OperationDescriptor& descriptor,
             const std::function<void(OperationContext&)>& body) override;

    // Id of the innermost operation running on the calling thread.
    [[nodiscard]] static std::optional<OperationId> currentOperation();

private:
    std::vector<std::shared_ptr<OperationListener>> snapshotListeners() const;

    std::atomic<OperationId> nextId_{1};
    mutable std::mutex listenersMutex_;
    std::vector<std::shared_ptr<OperationListener>> listeners_;
};

/**
 * Keeps finished operations in memory, in finish order.
 */
class RecordingOperationListener final : public OperationListener {
public:
    void started(OperationId, std::optional<OperationId>, const OperationDescriptor&) override {}
    void finished(const OperationRecord& record) override;

    [[nodiscard]] std::vector<OperationRecord> records() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<OperationRecord> records_;
};

/**
 * JSON representation used by trace files and the CLI.
 */
nlohmann::json toJson(const OperationRecord& record);

} // namespace xfer::operations
