#pragma once
#include "job.hpp"
#include "../../../shared/cpp/security/include/incident_logger.hpp"
#include <array>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StoreStatus {
    std::size_t jobs{0};
    std::array<std::size_t, kTierCount> pending{};
    std::array<std::size_t, kTierCount> done{};
    std::array<std::size_t, kTierCount> failed{};
    std::size_t detections{0};
    long requests_today{0};
};

// One SQLite connection shared by all workers, serialized by a mutex.
// Accepts ":memory:" for tests.
class AnalysisStore final : public DetectionStore {
public:
    explicit AnalysisStore(const std::string& db_path);
    ~AnalysisStore() override;

    AnalysisStore(const AnalysisStore&) = delete;
    AnalysisStore& operator=(const AnalysisStore&) = delete;

    // Jobs are immutable once ingested: returns false and changes nothing
    // when the id is already stored.
    bool add_job(const Job& job);
    std::optional<Job> job(const std::string& id);

    // Jobs eligible for `tier`, oldest first.
    std::vector<std::string> backlog(int tier, std::size_t limit);
    std::size_t backlog_size(int tier);

    TierFlags flags(const std::string& job_id);

    // Persists the payload and flips the tier flag in one transaction.
    // Returns false when the tier was already done. Throws StoreError if the
    // previous tier is not done.
    bool commit_tier(const std::string& job_id, int tier, const std::string& payload_json,
                     const std::string& model, long prompt_tokens, long completion_tokens);
    void mark_failed(const std::string& job_id, int tier);
    // Clears failed flags so jobs become eligible again. Empty id: every job.
    std::size_t requeue(int tier, const std::string& job_id = {});

    std::optional<std::string> payload(const std::string& job_id, int tier);

    void record_session(const AnalysisSession& s);
    std::size_t session_count(const std::string& job_id, int tier);

    void append_detection(const SecurityDetection& d) override;
    std::vector<SecurityDetection> detections(const std::string& job_id);

    long requests_today();
    void record_usage(long requests, long prompt_tokens, long completion_tokens);

    // Returns the source's flag count after incrementing it.
    int flag_source(const std::string& source);
    int source_flags(const std::string& source);

    StoreStatus status();

private:
    void init();
    void exec(const std::string& sql);
    void ensure_result_row(const std::string& job_id);

    struct sqlite3* db_ {nullptr};
    std::mutex mtx_;
};
