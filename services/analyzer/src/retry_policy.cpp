#include "../include/retry_policy.hpp"
#include <algorithm>
#include <random>
#include <thread>

RetryPolicy::RetryPolicy(const RetryConfig& cfg) : cfg_(cfg) {}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt, double unit) const {
    if (cfg_.base_delay_ms <= 0) return std::chrono::milliseconds(0);
    double d = (double)cfg_.base_delay_ms;
    for (int i = 1; i < attempt && d < (double)cfg_.max_delay_ms; ++i) d *= 2.0;
    d = std::min(d, (double)cfg_.max_delay_ms);
    double factor = 1.0 + cfg_.jitter * (2.0 * unit - 1.0);
    return std::chrono::milliseconds((long long)std::max(0.0, d * factor));
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return delay_for(attempt, dist(rng));
}

void RetryPolicy::wait(int attempt) const {
    auto d = delay_for(attempt);
    if (d.count() > 0) std::this_thread::sleep_for(d);
}
