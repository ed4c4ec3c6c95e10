#include "../services/analyzer/include/tier_payloads.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using testsupport::valid_doc;
using json = nlohmann::json;

TEST(TierPayloads, CannedResponsesMatchSchemas) {
    for (int tier = 1; tier <= kTierCount; ++tier) {
        ValidationReport r = validate_structure(valid_doc(tier, "tok", "job-1"), tier_schema(tier));
        EXPECT_TRUE(r.ok) << "tier " << tier << ": " << (r.errors.empty() ? "" : r.errors[0]);
    }
}

TEST(TierPayloads, UnknownTopLevelFieldIsRejected) {
    json doc = valid_doc(1, "tok", "job-1");
    doc["note"] = "extra";
    EXPECT_FALSE(validate_structure(doc, tier_schema(1)).ok);
}

TEST(TierPayloads, SeniorityOutsideTheScaleIsRejected) {
    json doc = valid_doc(1, "tok", "job-1");
    doc["classification"]["seniority_level"] = "galactic overlord";
    EXPECT_FALSE(validate_structure(doc, tier_schema(1)).ok);
}

TEST(TierPayloads, ScoresAreRangeChecked) {
    json doc = valid_doc(2, "tok", "job-1");
    doc["stress_level_analysis"]["estimated_stress_level"] = 11;
    EXPECT_FALSE(validate_structure(doc, tier_schema(2)).ok);

    doc = valid_doc(3, "tok", "job-1");
    doc["prestige_analysis"]["prestige_factor"] = 0;
    EXPECT_FALSE(validate_structure(doc, tier_schema(3)).ok);
}

TEST(TierPayloads, ConvertsTierOne) {
    TierAnalysis a = to_analysis(1, valid_doc(1, "tok", "job-1"));
    ASSERT_TRUE(std::holds_alternative<Tier1Analysis>(a));
    const auto& t1 = std::get<Tier1Analysis>(a);
    EXPECT_EQ(t1.job_id, "job-1");
    EXPECT_TRUE(t1.authentic);
    EXPECT_EQ(t1.credibility_score, 8);
    EXPECT_EQ(t1.industry, "Software");
    EXPECT_EQ(t1.seniority_level, "Senior");
    ASSERT_EQ(t1.skills.size(), 2u);
    EXPECT_EQ(t1.skills[0].name, "C++");
    EXPECT_EQ(t1.skills[0].importance, 90);
    EXPECT_EQ(t1.application_link, "https://careers.acme.com/apply");
}

TEST(TierPayloads, ConvertsLaterTiers) {
    auto t2 = std::get<Tier2Analysis>(to_analysis(2, valid_doc(2, "tok", "job-1")));
    EXPECT_EQ(t2.stress_level, 6);
    EXPECT_FALSE(t2.unrealistic_expectations);
    EXPECT_EQ(t2.unstated_skills.size(), 2u);

    auto t3 = std::get<Tier3Analysis>(to_analysis(3, valid_doc(3, "tok", "job-1")));
    EXPECT_EQ(t3.prestige_factor, 7);
    EXPECT_EQ(t3.pain_point, "scaling the platform");
}

TEST(TierPayloads, PriorContextSummarizesEarlierTiers) {
    std::vector<TierAnalysis> earlier{to_analysis(1, valid_doc(1, "tok", "job-1")),
                                      to_analysis(2, valid_doc(2, "tok", "job-1"))};
    std::string ctx = prior_context(earlier);
    EXPECT_NE(ctx.find("Industry: Software"), std::string::npos);
    EXPECT_NE(ctx.find("Seniority: Senior"), std::string::npos);
    EXPECT_NE(ctx.find("Top Skills: C++, SQL"), std::string::npos);
    EXPECT_NE(ctx.find("Authenticity Score: 8/10"), std::string::npos);
    EXPECT_NE(ctx.find("Stress Level: 6/10"), std::string::npos);
    EXPECT_NE(ctx.find("Red Flags Detected: No"), std::string::npos);
    EXPECT_NE(ctx.find("Key Implicit Requirements: on call rotation, mentoring"), std::string::npos);
    EXPECT_TRUE(prior_context({}).empty());
}

TEST(TierPayloads, BadTierThrows) {
    EXPECT_THROW(tier_schema(0), std::invalid_argument);
    EXPECT_THROW(to_analysis(4, json::object()), std::invalid_argument);
}
