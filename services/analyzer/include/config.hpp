#pragma once
#include "job.hpp"
#include "../../../shared/cpp/llm_sdk/include/llm_client.hpp"
#include "../../../shared/cpp/security/include/input_sanitizer.hpp"
#include <array>
#include <string>

struct TierModelConfig {
    std::string model;
    int max_output_tokens{2048};
    std::string fallback_model;  // one extra attempt after transient exhaustion
    std::string conserve_model;  // used when quota runs low
};

struct RetryConfig {
    int max_attempts{3};
    int structural_attempts{2};
    long base_delay_ms{1000};
    long max_delay_ms{60000};
    double jitter{0.1};
};

struct AnalyzerConfig {
    std::string db_path{"./data/jobguard.db"};
    std::string prompt_dir;                 // empty: built-in templates held in memory
    std::string incident_log{"./data/security_incidents.jsonl"};
    OllamaConfig ollama;

    int workers{4};
    double requests_per_minute{15};
    double burst{0};                        // 0: same as requests_per_minute
    long daily_request_quota{1500};
    double conserve_below{0.1};             // remaining quota ratio
    long window_timeout_seconds{3600};

    std::array<TierModelConfig, kTierCount> tiers;
    RetryConfig retry;
    UnpunctuatedConfig unpunctuated;

    std::size_t max_string_length{10000};
    std::size_t max_description_bytes{2000};
    int suppress_source_after{0};           // 0: never suppress
    int alert_threshold{5};                 // tamper + token detections per window
    int trigger_port{8090};
};

AnalyzerConfig default_config();

// Defaults, then the JSON file (if any), then environment overrides.
AnalyzerConfig load_config(const std::string& path);
void apply_env(AnalyzerConfig& cfg);
void validate_config(const AnalyzerConfig& cfg);
