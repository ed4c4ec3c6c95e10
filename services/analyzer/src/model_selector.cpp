#include "../include/model_selector.hpp"
#include <stdexcept>

ModelChoice select_model(const AnalyzerConfig& cfg, int tier, std::size_t backlog_size,
                         long remaining_requests) {
    if (!valid_tier(tier)) throw std::invalid_argument("tier out of range: " + std::to_string(tier));
    const TierModelConfig& t = cfg.tiers[tier - 1];

    ModelChoice c{t.model, t.max_output_tokens, false};
    if (t.conserve_model.empty() || cfg.daily_request_quota <= 0) return c;

    double ratio = remaining_requests <= 0 ? 0.0 : (double)remaining_requests / (double)cfg.daily_request_quota;
    if (ratio < cfg.conserve_below || (long)backlog_size > remaining_requests) {
        c.model = t.conserve_model;
        c.conserving = true;
    }
    return c;
}
