#pragma once
#include "config.hpp"
#include <string>

struct ModelChoice {
    std::string model;
    int max_output_tokens{0};
    bool conserving{false};
};

// Pure: same inputs, same choice. Switches to the tier's conserve model when
// the remaining daily quota drops below cfg.conserve_below of the total, or
// cannot cover the backlog.
ModelChoice select_model(const AnalyzerConfig& cfg, int tier, std::size_t backlog_size,
                         long remaining_requests);
