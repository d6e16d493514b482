#include "smblite/OperationLock.hpp"
#include "smblite/Log.hpp"

namespace smblite {

void OperationLock::setTraceHook(TraceHook hook) {
    std::lock_guard<std::mutex> lk(mtx_);
    trace_ = std::move(hook);
}

bool OperationLock::busy() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return held_;
}

void OperationLock::acquire(const char* operation) {
    TraceHook trace;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        const std::uint64_t ticket = nextTicket_++;
        if (ticket != serving_) LOGD("%s waiting for the operation lock", operation);
        cv_.wait(lk, [this, ticket] { return ticket == serving_ && !held_; });
        held_ = true;
        trace = trace_;
    }
    if (trace) trace(operation, true);
}

void OperationLock::release(const char* operation) {
    TraceHook trace;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        trace = trace_;
    }
    if (trace) trace(operation, false);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        held_ = false;
        ++serving_;
    }
    cv_.notify_all();
}

} // namespace smblite
