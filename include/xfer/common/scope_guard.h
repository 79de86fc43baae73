#pragma once

#include <utility>

namespace xfer {

/**
 * Runs a callable when the enclosing scope unwinds, normally or by exception.
 *
 * The instrumented accessor and uploader use it so that a progress session is
 * completed and the operation result is recorded exactly once, whichever way the
 * delegate call or the caller's action leaves:
 * @code
 * logger->started();
 * auto done = scope_exit([&] {
 *     logger->completed();
 *     context.setResult(ResourceReadResult{bytesRead});
 * });
 * return delegate.withContent(location, revalidate, adapter);
 * @endcode
 *
 * The callable must not throw; it runs from a destructor.
 */
template <typename Func> class ScopeExit {
public:
    explicit ScopeExit(Func func) : func_(std::move(func)) {}
    ~ScopeExit() { func_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;
    ScopeExit(ScopeExit&&) = delete;
    ScopeExit& operator=(ScopeExit&&) = delete;

private:
    Func func_;
};

template <typename Func> [[nodiscard]] ScopeExit<Func> scope_exit(Func func) {
    return ScopeExit<Func>(std::move(func));
}

} // namespace xfer
