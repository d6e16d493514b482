// Single gate through which every network operation passes, so the protocol
// client is never driven by two operations at once. Waiters are served in
// arrival order (ticket lock).
#pragma once
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>

namespace smblite {

class OperationLock {
public:
    // Called with the operation name right after acquiring (true) and right
    // before releasing (false) the gate.
    using TraceHook = std::function<void(const char* /*operation*/, bool /*acquired*/)>;

    OperationLock() = default;
    OperationLock(const OperationLock&) = delete;
    OperationLock& operator=(const OperationLock&) = delete;

    void setTraceHook(TraceHook hook);

    // Blocks until the gate is free, runs fn, releases the gate on every exit
    // path (including exceptions thrown by fn), then returns fn's result.
    template <class F>
    auto withExclusiveAccess(const char* operation, F&& fn) -> decltype(fn()) {
        Holder holder(*this, operation);
        return std::forward<F>(fn)();
    }

    bool busy() const;

private:
    class Holder {
    public:
        Holder(OperationLock& lock, const char* operation)
            : lock_(lock), operation_(operation) { lock_.acquire(operation_); }
        ~Holder() { lock_.release(operation_); }
        Holder(const Holder&) = delete;
        Holder& operator=(const Holder&) = delete;
    private:
        OperationLock& lock_;
        const char* operation_;
    };

    void acquire(const char* operation);
    void release(const char* operation);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::uint64_t nextTicket_ = 0;
    std::uint64_t serving_ = 0;
    bool held_ = false;
    TraceHook trace_;
};

} // namespace smblite
