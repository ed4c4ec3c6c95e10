#pragma once
#include "job.hpp"
#include "../../../shared/cpp/security/include/structure_validator.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

struct SkillRequirement {
    std::string name;
    int importance{0}; // 1-100
};

struct Tier1Analysis {
    std::string job_id;
    bool authentic{false};
    int credibility_score{0}; // 1-10
    std::string industry;
    std::string sub_industry;
    std::string job_function;
    std::string seniority_level;
    std::string job_title;
    std::string company_name;
    std::vector<SkillRequirement> skills;
    std::string application_link;
};

struct Tier2Analysis {
    std::string job_id;
    int stress_level{0}; // 1-10
    std::vector<std::string> stress_indicators;
    bool unrealistic_expectations{false};
    bool scam_indicators{false};
    std::vector<std::string> unstated_skills;
    std::string career_trajectory;
};

struct Tier3Analysis {
    std::string job_id;
    int prestige_factor{0}; // 1-10
    std::string pain_point;
    std::string solution_angle;
};

using TierAnalysis = std::variant<Tier1Analysis, Tier2Analysis, Tier3Analysis>;

// Expected response shape for one tier. Unknown top-level keys are rejected.
const FieldSpec& tier_schema(int tier);

// `doc` must already have passed tier_schema(tier).
TierAnalysis to_analysis(int tier, const nlohmann::json& doc);

// Summary of earlier tiers handed to the next tier's prompt.
std::string prior_context(const std::vector<TierAnalysis>& earlier);
