#pragma once
#include <array>
#include <cstdint>
#include <string>

constexpr int kTierCount = 3;

struct Job {
    std::string id;          // unique id
    std::string title;
    std::string company;
    std::string source;      // scrape source, used for escalation
    std::string description; // raw scraped text, untrusted
};

enum class Outcome { Pending, Success, Failed, Fallback, Skipped, Suppressed };

const char* to_string(Outcome o);

// One LLM call attempt for one job and tier.
struct AnalysisSession {
    std::string job_id;
    int tier{0};
    std::string token_prefix; // full token never leaves memory
    std::string model;
    std::string template_version;
    int attempt{0};
    int64_t created_at{0};
    int64_t completed_at{0};
    Outcome outcome{Outcome::Pending};
    std::string error;
};

struct TierFlags {
    std::array<bool, kTierCount> done{};
    std::array<bool, kTierCount> failed{};
    std::array<int64_t, kTierCount> done_at{};
    long prompt_tokens{0};
    long completion_tokens{0};
};

inline bool valid_tier(int tier) { return tier >= 1 && tier <= kTierCount; }
