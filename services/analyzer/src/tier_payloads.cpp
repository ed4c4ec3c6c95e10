#include "../include/tier_payloads.hpp"
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
FieldSpec root(std::vector<FieldSpec> fields) {
    FieldSpec r = object_field("", std::move(fields));
    r.allow_extra = false;
    return r;
}

FieldSpec build_tier1() {
    return root({
        string_field("security_token"),
        string_field("job_id"),
        object_field("authenticity_check", {
            bool_field("title_matches_role"),
            bool_field("is_authentic"),
            integer_field("credibility_score", 1, 10),
            string_field("mismatch_explanation", false),
            string_field("reasoning", false),
        }),
        object_field("classification", {
            string_field("industry"),
            string_field("sub_industry", false),
            string_field("job_function"),
            enum_field("seniority_level", {"intern", "entry-level", "junior", "mid-level", "senior",
                                           "lead", "principal", "manager", "director", "executive"}),
            number_field("confidence", 0, 100, false),
        }),
        object_field("structured_data", {
            string_field("job_title"),
            string_field("company_name"),
            string_field("company_website", false),
            string_field("department", false),
            string_field("job_type", false),
            string_field("hiring_manager", false),
            string_field("reporting_to", false),
            object_field("skill_requirements", {
                array_field("skills", object_field("skill", {
                    string_field("skill_name"),
                    integer_field("importance_rating", 1, 100),
                    string_field("reasoning", false),
                })),
                string_array("certifications", false),
            }),
            object_field("work_arrangement", {}, false),
            object_field("compensation", {}, false),
            object_field("application_details", {
                string_field("application_link", false),
                string_field("application_email", false),
                string_field("application_method", false),
                string_field("posted_date", false),
                string_field("application_deadline", false),
                string_field("special_instructions", false),
                string_array("required_documents", false),
            }, false),
            object_field("ats_optimization", {
                string_array("primary_keywords", false),
                string_array("industry_keywords", false),
                string_array("must_have_phrases", false),
            }, false),
        }),
    });
}

FieldSpec build_tier2() {
    auto flag = [](const char* name) {
        return object_field(name, {bool_field("detected"), string_field("details", false)});
    };
    return root({
        string_field("security_token"),
        string_field("job_id"),
        object_field("stress_level_analysis", {
            integer_field("estimated_stress_level", 1, 10),
            string_array("stress_indicators"),
            string_field("reasoning", false),
        }),
        object_field("red_flags", {
            flag("unrealistic_expectations"),
            flag("potential_scam_indicators"),
            string_field("overall_red_flag_reasoning", false),
        }),
        object_field("implicit_requirements", {
            string_array("unstated_skills"),
            string_array("cultural_expectations", false),
            string_field("career_trajectory", false),
            string_field("integration_with_skills", false),
        }),
    });
}

FieldSpec build_tier3() {
    return root({
        string_field("security_token"),
        string_field("job_id"),
        object_field("prestige_analysis", {
            integer_field("prestige_factor", 1, 10),
            string_field("prestige_reasoning", false),
        }),
        object_field("cover_letter_insight", {
            object_field("employer_pain_point", {
                string_field("pain_point"),
                string_field("evidence", false),
                string_field("solution_angle"),
            }),
        }),
    });
}

std::string str(const json& obj, const char* key) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

std::vector<std::string> strings(const json& obj, const char* key) {
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

const json& member(const json& obj, const char* key) {
    static const json empty = json::object();
    auto it = obj.find(key);
    return (it != obj.end() && it->is_object()) ? *it : empty;
}

std::string join(const std::vector<std::string>& items, std::size_t limit) {
    std::string out;
    for (std::size_t i = 0; i < items.size() && i < limit; ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out.empty() ? "Unknown" : out;
}

struct ContextWriter {
    std::ostringstream& os;
    void operator()(const Tier1Analysis& a) const {
        std::vector<std::string> skills;
        for (const auto& s : a.skills) skills.push_back(s.name);
        os << "Industry: " << (a.industry.empty() ? "Unknown" : a.industry) << "\n"
           << "Seniority: " << (a.seniority_level.empty() ? "Unknown" : a.seniority_level) << "\n"
           << "Top Skills: " << join(skills, 5) << "\n"
           << "Authenticity Score: " << a.credibility_score << "/10\n";
    }
    void operator()(const Tier2Analysis& a) const {
        os << "Stress Level: " << a.stress_level << "/10\n"
           << "Red Flags Detected: " << ((a.unrealistic_expectations || a.scam_indicators) ? "Yes" : "No") << "\n"
           << "Key Implicit Requirements: " << join(a.unstated_skills, 3) << "\n";
    }
    void operator()(const Tier3Analysis& a) const {
        os << "Prestige Factor: " << a.prestige_factor << "/10\n";
    }
};
}

const FieldSpec& tier_schema(int tier) {
    static const FieldSpec t1 = build_tier1();
    static const FieldSpec t2 = build_tier2();
    static const FieldSpec t3 = build_tier3();
    switch (tier) {
        case 1: return t1;
        case 2: return t2;
        case 3: return t3;
        default: throw std::invalid_argument("tier out of range: " + std::to_string(tier));
    }
}

TierAnalysis to_analysis(int tier, const json& doc) {
    if (tier == 1) {
        Tier1Analysis a;
        a.job_id = str(doc, "job_id");
        const json& auth = member(doc, "authenticity_check");
        a.authentic = auth.value("is_authentic", false);
        a.credibility_score = auth.value("credibility_score", 0);
        const json& cls = member(doc, "classification");
        a.industry = str(cls, "industry");
        a.sub_industry = str(cls, "sub_industry");
        a.job_function = str(cls, "job_function");
        a.seniority_level = str(cls, "seniority_level");
        const json& sd = member(doc, "structured_data");
        a.job_title = str(sd, "job_title");
        a.company_name = str(sd, "company_name");
        const json& skills = member(sd, "skill_requirements");
        auto it = skills.find("skills");
        if (it != skills.end() && it->is_array()) {
            for (const auto& s : *it) {
                if (!s.is_object()) continue;
                a.skills.push_back({str(s, "skill_name"), s.value("importance_rating", 0)});
            }
        }
        a.application_link = str(member(sd, "application_details"), "application_link");
        return a;
    }
    if (tier == 2) {
        Tier2Analysis a;
        a.job_id = str(doc, "job_id");
        const json& stress = member(doc, "stress_level_analysis");
        a.stress_level = stress.value("estimated_stress_level", 0);
        a.stress_indicators = strings(stress, "stress_indicators");
        const json& flags = member(doc, "red_flags");
        a.unrealistic_expectations = member(flags, "unrealistic_expectations").value("detected", false);
        a.scam_indicators = member(flags, "potential_scam_indicators").value("detected", false);
        const json& implicit = member(doc, "implicit_requirements");
        a.unstated_skills = strings(implicit, "unstated_skills");
        a.career_trajectory = str(implicit, "career_trajectory");
        return a;
    }
    if (tier == 3) {
        Tier3Analysis a;
        a.job_id = str(doc, "job_id");
        a.prestige_factor = member(doc, "prestige_analysis").value("prestige_factor", 0);
        const json& pain = member(member(doc, "cover_letter_insight"), "employer_pain_point");
        a.pain_point = str(pain, "pain_point");
        a.solution_angle = str(pain, "solution_angle");
        return a;
    }
    throw std::invalid_argument("tier out of range: " + std::to_string(tier));
}

std::string prior_context(const std::vector<TierAnalysis>& earlier) {
    std::ostringstream os;
    for (const auto& a : earlier) std::visit(ContextWriter{os}, a);
    return os.str();
}
