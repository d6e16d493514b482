// Cooperative cancellation flag, one per logical operation. Set once, never reset.
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace smblite {

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool isCancelled() const { return cancelled_.load(); }

    // Sleeps up to d; returns true early if cancelled meanwhile.
    template <class Rep, class Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& d) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, d, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
};

} // namespace smblite
