#include "../shared/cpp/security/include/incident_logger.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <fstream>

using testsupport::TempDir;

namespace {
class CollectingStore : public DetectionStore {
public:
    void append_detection(const SecurityDetection& d) override { rows.push_back(d); }
    std::vector<SecurityDetection> rows;
};

class BrokenStore : public DetectionStore {
public:
    void append_detection(const SecurityDetection&) override { throw std::runtime_error("disk full"); }
};

SecurityDetection sample(const std::string& pattern) {
    return make_detection("job-1", 1, "field", DetectionCategory::Sql, Severity::Medium, pattern, "x");
}

std::vector<std::string> lines_of(const std::string& path) {
    std::vector<std::string> out;
    std::ifstream f(path);
    std::string line;
    while (std::getline(f, line)) out.push_back(line);
    return out;
}
}

TEST(IncidentLogger, RecordsIntoStore) {
    CollectingStore store;
    IncidentLogger log(&store, "");
    log.record_all({sample("sql.a"), sample("sql.b")});
    EXPECT_EQ(store.rows.size(), 2u);
    EXPECT_EQ(log.recorded(), 2u);
    EXPECT_EQ(log.write_failures(), 0u);
}

TEST(IncidentLogger, StoreFailureIsCountedNotThrown) {
    BrokenStore store;
    IncidentLogger log(&store, "");
    EXPECT_NO_THROW(log.record(sample("sql.a")));
    EXPECT_EQ(log.recorded(), 0u);
    EXPECT_EQ(log.write_failures(), 1u);
}

TEST(IncidentLogger, SummaryLineForEveryJobAndTier) {
    TempDir dir;
    std::string path = dir.file("incidents.jsonl");
    IncidentLogger log(nullptr, path);

    log.summarize({"job-1", 1, "success", 1, {}});

    std::vector<SecurityDetection> many;
    for (int i = 0; i < 7; ++i) many.push_back(sample("sql.p" + std::to_string(i)));
    log.summarize({"job-2", 2, "failed", 3, many});

    auto lines = lines_of(path);
    ASSERT_EQ(lines.size(), 2u);
    auto clean = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(clean["job_id"], "job-1");
    EXPECT_EQ(clean["tier"], 1);
    EXPECT_EQ(clean["outcome"], "success");
    EXPECT_EQ(clean["detections"], 0);
    EXPECT_TRUE(clean["patterns"].empty());

    auto j = nlohmann::json::parse(lines[1]);
    EXPECT_EQ(j["job_id"], "job-2");
    EXPECT_EQ(j["tier"], 2);
    EXPECT_EQ(j["outcome"], "failed");
    EXPECT_EQ(j["attempts"], 3);
    EXPECT_EQ(j["detections"], 7);
    EXPECT_EQ(j["patterns"].size(), IncidentLogger::kMaxSummaryPatterns);
}

TEST(IncidentLogger, UnwritableSummaryIsCounted) {
    TempDir dir;
    IncidentLogger log(nullptr, dir.file("missing/dir/incidents.jsonl"));
    EXPECT_NO_THROW(log.summarize({"job-1", 1, "success", 1, {sample("sql.a")}}));
    EXPECT_EQ(log.write_failures(), 1u);
}
