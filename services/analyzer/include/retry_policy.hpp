#pragma once
#include "config.hpp"
#include <chrono>

// Exponential backoff with jitter: base * 2^(n-1), capped at max, then
// scaled by a factor in [1 - jitter, 1 + jitter].
class RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& cfg);

    int max_attempts() const { return cfg_.max_attempts; }
    int structural_attempts() const { return cfg_.structural_attempts; }

    // Delay before the attempt following failed attempt `attempt` (1-based).
    // `unit` is a sample in [0, 1).
    std::chrono::milliseconds delay_for(int attempt, double unit) const;
    std::chrono::milliseconds delay_for(int attempt) const;

    void wait(int attempt) const;

private:
    RetryConfig cfg_;
};
