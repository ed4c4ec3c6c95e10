#include "../services/analyzer/include/analysis_store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sqlite3.h>

using testsupport::TempDir;

namespace {
Job job(const std::string& id, const std::string& source = "board") {
    return {id, "Engineer " + id, "Acme", source, "Build things."};
}

class StoreTest : public ::testing::Test {
protected:
    AnalysisStore store{":memory:"};
};
}

TEST_F(StoreTest, AddAndFetchJob) {
    EXPECT_TRUE(store.add_job(job("a")));
    auto j = store.job("a");
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ(j->title, "Engineer a");
    EXPECT_FALSE(store.job("missing").has_value());
    EXPECT_EQ(store.status().jobs, 1u);
}

TEST_F(StoreTest, IngestedJobIsImmutable) {
    Job original = job("a");
    original.description = "original text";
    ASSERT_TRUE(store.add_job(original));
    ASSERT_TRUE(store.commit_tier("a", 1, "{}", "m", 0, 0));

    Job replaced = original;
    replaced.title = "Staff Engineer";
    replaced.description = "REPLACED text";
    replaced.source = "elsewhere";
    EXPECT_FALSE(store.add_job(replaced));

    auto j = store.job("a");
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ(j->title, "Engineer a");
    EXPECT_EQ(j->description, "original text");
    EXPECT_EQ(j->source, "board");
    EXPECT_TRUE(store.flags("a").done[0]);
    EXPECT_EQ(store.status().jobs, 1u);
}

TEST_F(StoreTest, BacklogFollowsTierOrder) {
    store.add_job(job("a"));
    store.add_job(job("b"));
    EXPECT_EQ(store.backlog(1, 10), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(store.backlog(2, 10).empty());
    EXPECT_EQ(store.backlog(1, 1).size(), 1u);

    ASSERT_TRUE(store.commit_tier("a", 1, "{}", "m", 10, 5));
    EXPECT_EQ(store.backlog(1, 10), (std::vector<std::string>{"b"}));
    EXPECT_EQ(store.backlog(2, 10), (std::vector<std::string>{"a"}));
    EXPECT_EQ(store.backlog_size(2), 1u);
}

TEST_F(StoreTest, CommitIsForwardOnly) {
    store.add_job(job("a"));
    EXPECT_THROW(store.commit_tier("a", 2, "{}", "m", 0, 0), StoreError);
    EXPECT_THROW(store.commit_tier("a", 3, "{}", "m", 0, 0), StoreError);
    EXPECT_FALSE(store.payload("a", 2).has_value());
    EXPECT_FALSE(store.flags("a").done[1]);
}

TEST_F(StoreTest, CommitIsIdempotent) {
    store.add_job(job("a"));
    EXPECT_TRUE(store.commit_tier("a", 1, R"({"v":1})", "m", 10, 5));
    EXPECT_FALSE(store.commit_tier("a", 1, R"({"v":2})", "m", 10, 5));
    EXPECT_EQ(*store.payload("a", 1), R"({"v":1})");

    TierFlags f = store.flags("a");
    EXPECT_TRUE(f.done[0]);
    EXPECT_GT(f.done_at[0], 0);
    EXPECT_EQ(f.prompt_tokens, 10);
    EXPECT_EQ(f.completion_tokens, 5);
}

TEST_F(StoreTest, FailedJobsWaitForRequeue) {
    store.add_job(job("a"));
    store.add_job(job("b"));
    store.mark_failed("a", 1);
    store.mark_failed("b", 1);
    EXPECT_TRUE(store.backlog(1, 10).empty());
    EXPECT_TRUE(store.flags("a").failed[0]);

    EXPECT_EQ(store.requeue(1, "a"), 1u);
    EXPECT_EQ(store.backlog(1, 10), (std::vector<std::string>{"a"}));
    EXPECT_EQ(store.requeue(1), 1u);
    EXPECT_EQ(store.backlog(1, 10).size(), 2u);
    EXPECT_EQ(store.requeue(1), 0u);
}

TEST_F(StoreTest, FailingADoneTierHasNoEffect) {
    store.add_job(job("a"));
    store.commit_tier("a", 1, "{}", "m", 0, 0);
    store.mark_failed("a", 1);
    EXPECT_FALSE(store.flags("a").failed[0]);
}

TEST_F(StoreTest, SessionsAndUsage) {
    AnalysisSession s;
    s.job_id = "a";
    s.tier = 1;
    s.token_prefix = "SEC_TOKEN_abcdef";
    s.attempt = 1;
    s.outcome = Outcome::Failed;
    store.record_session(s);
    s.attempt = 2;
    s.outcome = Outcome::Success;
    store.record_session(s);
    EXPECT_EQ(store.session_count("a", 1), 2u);
    EXPECT_EQ(store.session_count("a", 2), 0u);

    EXPECT_EQ(store.requests_today(), 0);
    store.record_usage(1, 100, 50);
    store.record_usage(2, 100, 50);
    EXPECT_EQ(store.requests_today(), 3);
}

TEST_F(StoreTest, SourceFlagsAccumulate) {
    EXPECT_EQ(store.source_flags("spam"), 0);
    EXPECT_EQ(store.flag_source("spam"), 1);
    EXPECT_EQ(store.flag_source("spam"), 2);
    EXPECT_EQ(store.source_flags("spam"), 2);
    EXPECT_EQ(store.source_flags("other"), 0);
}

TEST_F(StoreTest, DetectionsRoundTripWithBoundedSample) {
    SecurityDetection d;
    d.job_id = "a";
    d.tier = 2;
    d.field = "red_flags.details";
    d.category = DetectionCategory::Xss;
    d.severity = Severity::High;
    d.pattern_id = "xss.script_tag";
    d.sample = std::string(1000, 'x');
    d.detected_at = 42;
    store.append_detection(d);

    auto rows = store.detections("a");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].category, DetectionCategory::Xss);
    EXPECT_EQ(rows[0].severity, Severity::High);
    EXPECT_EQ(rows[0].field, "red_flags.details");
    EXPECT_EQ(rows[0].sample.size(), kMaxSampleBytes);
    EXPECT_EQ(rows[0].detected_at, 42);
    EXPECT_EQ(store.status().detections, 1u);
}

TEST_F(StoreTest, StatusCountsPerTier) {
    store.add_job(job("a"));
    store.add_job(job("b"));
    store.add_job(job("c"));
    store.commit_tier("a", 1, "{}", "m", 0, 0);
    store.mark_failed("b", 1);

    StoreStatus st = store.status();
    EXPECT_EQ(st.jobs, 3u);
    EXPECT_EQ(st.done[0], 1u);
    EXPECT_EQ(st.failed[0], 1u);
    EXPECT_EQ(st.pending[0], 1u);
    EXPECT_EQ(st.pending[1], 1u);
    EXPECT_EQ(st.pending[2], 0u);
}

TEST(AnalysisStoreFile, DetectionsAreAppendOnly) {
    TempDir dir;
    std::string path = dir.file("jobguard.db");
    {
        AnalysisStore store(path);
        store.append_detection(make_detection("a", 1, "f", DetectionCategory::Sql, Severity::High, "sql.x", "s"));
    }

    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    EXPECT_NE(sqlite3_exec(db, "UPDATE security_detections SET sample = 'edited';", nullptr, nullptr, nullptr),
              SQLITE_OK);
    EXPECT_NE(sqlite3_exec(db, "DELETE FROM security_detections;", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    AnalysisStore reopened(path);
    auto rows = reopened.detections("a");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].sample, "s");
}

TEST(AnalysisStoreFile, SurvivesReopen) {
    TempDir dir;
    std::string path = dir.file("jobguard.db");
    {
        AnalysisStore store(path);
        store.add_job(job("a"));
        store.commit_tier("a", 1, "{}", "m", 1, 1);
    }
    AnalysisStore store(path);
    EXPECT_TRUE(store.flags("a").done[0]);
    EXPECT_EQ(store.backlog(2, 10), (std::vector<std::string>{"a"}));
}
