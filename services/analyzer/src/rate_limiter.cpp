#include "../include/rate_limiter.hpp"
#include <algorithm>

TokenBucket::TokenBucket(double per_minute, double burst)
    : rate_per_sec_(per_minute / 60.0),
      capacity_(burst > 0 ? burst : per_minute),
      tokens_(burst > 0 ? burst : per_minute),
      last_(Clock::now()) {}

void TokenBucket::refill(Clock::time_point now) {
    if (now <= last_) return;
    double secs = std::chrono::duration<double>(now - last_).count();
    tokens_ = std::min(capacity_, tokens_ + secs * rate_per_sec_);
    last_ = now;
}

bool TokenBucket::try_acquire(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mtx_);
    refill(now);
    if (tokens_ < 1.0) return false;
    tokens_ -= 1.0;
    return true;
}

TokenBucket::Clock::duration TokenBucket::wait_time(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mtx_);
    refill(now);
    if (tokens_ >= 1.0) return Clock::duration::zero();
    double secs = (1.0 - tokens_) / rate_per_sec_;
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(secs));
}

bool TokenBucket::acquire(const std::atomic<bool>& cancelled) {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!cancelled.load()) {
        auto now = Clock::now();
        refill(now);
        if (tokens_ >= 1.0) {
            tokens_ -= 1.0;
            return true;
        }
        double secs = (1.0 - tokens_) / rate_per_sec_;
        auto wait = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(secs));
        // wake periodically so an abort is noticed promptly
        cv_.wait_for(lk, std::min<Clock::duration>(wait, std::chrono::milliseconds(250)));
    }
    return false;
}

void TokenBucket::wake_all() {
    cv_.notify_all();
}
