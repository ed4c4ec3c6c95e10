#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Token bucket shared by every worker of a window.
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double per_minute, double burst);

    // Non-blocking; `now` is injectable for tests.
    bool try_acquire(Clock::time_point now);
    Clock::duration wait_time(Clock::time_point now);

    // Blocks until a token is available. Returns false once `cancelled` is set.
    bool acquire(const std::atomic<bool>& cancelled);
    void wake_all();

private:
    void refill(Clock::time_point now);

    double rate_per_sec_;
    double capacity_;
    double tokens_;
    Clock::time_point last_;
    std::mutex mtx_;
    std::condition_variable cv_;
};
