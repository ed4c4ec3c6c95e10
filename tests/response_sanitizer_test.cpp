#include "../shared/cpp/security/include/response_sanitizer.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using json = nlohmann::json;

namespace {
std::size_t count_pattern(const SanitizeResult& r, const std::string& id) {
    return (std::size_t)std::count_if(r.detections.begin(), r.detections.end(),
                                      [&](const SecurityDetection& d) { return d.pattern_id == id; });
}
}

TEST(ResponseSanitizer, StripsSqlAndCommandFragments) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"structured_data", {{"skill_requirements", {{"skills", json::array({
        {{"skill_name", "Python'; DROP TABLE jobs; --"}, {"importance_rating", 80}}})}}}}}};

    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    const json& skill = r.value["structured_data"]["skill_requirements"]["skills"][0];
    EXPECT_EQ(skill["skill_name"], "Python'[REMOVED] [REMOVED] jobs[REMOVED] [REMOVED]");
    EXPECT_EQ(skill["importance_rating"], 80);

    EXPECT_EQ(r.detections.size(), 4u);
    EXPECT_EQ(count_pattern(r, "sql.drop_table"), 1u);
    EXPECT_EQ(count_pattern(r, "sql.line_comment"), 1u);
    EXPECT_EQ(count_pattern(r, "cmd.semicolon"), 2u);
    for (const auto& d : r.detections) {
        EXPECT_EQ(d.field, "structured_data.skill_requirements.skills[0].skill_name");
        EXPECT_EQ(d.job_id, "job-1");
        EXPECT_EQ(d.tier, 1);
    }
}

TEST(ResponseSanitizer, RemovesSuspiciousHostFromAllowedField) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"application_details", {{"application_link", "https://192.168.1.1/apply"}}}};

    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value["application_details"]["application_link"], "[SUSPICIOUS_URL_REMOVED]/apply");
    ASSERT_EQ(r.detections.size(), 1u);
    EXPECT_EQ(r.detections[0].category, DetectionCategory::Url);
    EXPECT_EQ(r.detections[0].pattern_id, "exfil.private_ip");
    EXPECT_EQ(r.detections[0].severity, Severity::High);
}

TEST(ResponseSanitizer, KeepsOrdinaryUrlInAllowedField) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"application_link", "https://careers.acme.com/apply?id=7"}};
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value, doc);
    EXPECT_TRUE(r.detections.empty());
}

TEST(ResponseSanitizer, RemovesAnyUrlFromProhibitedField) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"job_title", "Engineer https://careers.acme.com/x"}};
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value["job_title"], "Engineer [URL_REMOVED]");
    ASSERT_EQ(r.detections.size(), 1u);
    EXPECT_EQ(r.detections[0].pattern_id, "url.prohibited_field");
}

TEST(ResponseSanitizer, UrlsInOtherFieldsAreLeftAlone) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"reasoning", "see https://127.0.0.1/x"}};
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value, doc);
}

TEST(ResponseSanitizer, CleanDocumentIsUnchanged) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {
        {"job_id", "job-1"},
        {"classification", {{"industry", "Sales & Marketing"}, {"seniority_level", "senior"}, {"confidence", 92.5}}},
        {"structured_data", {{"department", "R&D"}, {"company_website", "https://acme.com"}}},
        {"authenticity_check", {{"is_authentic", true}, {"credibility_score", 8}}},
        {"tags", json::array({"C++", "distributed systems", "team lead"})}
    };
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value, doc);
    EXPECT_TRUE(r.detections.empty());
    EXPECT_TRUE(r.warnings.empty());
}

TEST(ResponseSanitizer, EscapesMarkupOnXss) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"reasoning", "<script>alert(1)</script>"}};
    SanitizeResult r = s.sanitize(doc, "job-1", 2);
    EXPECT_EQ(r.value["reasoning"], "&lt;script&gt;alert(1)&lt;/script&gt;");
    EXPECT_EQ(count_pattern(r, "xss.script_tag"), 2u);
}

TEST(ResponseSanitizer, StripsTraversalUntilStable) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"reasoning", "..././etc/passwd"}};
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value["reasoning"], "etc/passwd");
    EXPECT_GE(r.detections.size(), 2u);
    for (const auto& d : r.detections) EXPECT_EQ(d.category, DetectionCategory::PathTraversal);
}

TEST(ResponseSanitizer, TraversalCannotRebuildSql) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"skill_name", "Python DROP ../TABLE jobs"}, {"reasoning", "x UNION ..\\SELECT password"}};
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value["skill_name"], "Python [REMOVED] jobs");
    EXPECT_EQ(r.value["reasoning"], "x [REMOVED] password");
    EXPECT_EQ(count_pattern(r, "sql.drop_table"), 1u);
    EXPECT_EQ(count_pattern(r, "sql.union_select"), 1u);
    EXPECT_EQ(count_pattern(r, "path.dotdot_slash"), 1u);
    EXPECT_EQ(count_pattern(r, "path.dotdot_backslash"), 1u);
}

TEST(ResponseSanitizer, RedactsInlineLineComment) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"reasoning", "admin'-- and the rest"}, {"role", "Java -- Spring"}};
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value["reasoning"], "admin'[REMOVED] and the rest");
    EXPECT_EQ(r.value["role"], "Java [REMOVED] Spring");
    EXPECT_EQ(count_pattern(r, "sql.line_comment"), 2u);
}

TEST(ResponseSanitizer, RedirectOnlyCountsWhenItTargetsAPath) {
    PatternLibrary lib;
    ResponseSanitizer s(lib);
    json doc = {{"salary_note", "Base > 100k for seniors"}, {"reasoning", "cat key > /tmp/out"}};
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value["salary_note"], "Base > 100k for seniors");
    EXPECT_EQ(r.value["reasoning"], "cat key [REMOVED]tmp/out");
    EXPECT_EQ(count_pattern(r, "cmd.redirect"), 1u);
}

TEST(ResponseSanitizer, TruncatesAndStripsControlsWithWarningsOnly) {
    PatternLibrary lib;
    SanitizerPolicy policy;
    policy.max_string_length = 10;
    ResponseSanitizer s(lib, policy);

    json doc = {{"a", "abcdefghijklmnop"}, {"b", std::string("ab\x01" "c\xE2\x80\x8B" "d")}};
    SanitizeResult r = s.sanitize(doc, "job-1", 1);
    EXPECT_EQ(r.value["a"], "abcdefghij");
    EXPECT_EQ(r.value["b"], "abcd");
    EXPECT_EQ(r.warnings.size(), 2u);
    EXPECT_TRUE(r.detections.empty());
}

TEST(ResponseSanitizer, HtmlEscape) {
    EXPECT_EQ(ResponseSanitizer::html_escape("<a href='x'>&\"</a>"),
              "&lt;a href=&#x27;x&#x27;&gt;&amp;&quot;&lt;/a&gt;");
}
