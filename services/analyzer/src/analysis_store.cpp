#include "../include/analysis_store.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>

namespace {
void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

std::string col_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

struct Stmt {
    sqlite3* db{nullptr};
    sqlite3_stmt* st{nullptr};
    Stmt(sqlite3* d, const std::string& sql) : db(d) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Stmt() { if (st) sqlite3_finalize(st); }
    bool row() {
        int rc = sqlite3_step(st);
        if (rc == SQLITE_ROW) return true;
        if (rc != SQLITE_DONE) throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db));
        return false;
    }
    void done() {
        if (sqlite3_step(st) != SQLITE_DONE) throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db));
    }
};

// Rolls back unless commit() was reached.
struct Txn {
    sqlite3* db;
    bool committed{false};
    explicit Txn(sqlite3* d) : db(d) {
        char* err = nullptr;
        if (sqlite3_exec(db, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown";
            sqlite3_free(err);
            throw StoreError("begin failed: " + msg);
        }
    }
    void commit() {
        char* err = nullptr;
        if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown";
            sqlite3_free(err);
            throw StoreError("commit failed: " + msg);
        }
        committed = true;
    }
    ~Txn() {
        if (!committed) sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
};

std::string col(int tier, const char* suffix) {
    if (!valid_tier(tier)) throw StoreError("tier out of range: " + std::to_string(tier));
    return "tier" + std::to_string(tier) + "_" + suffix;
}
}

AnalysisStore::AnalysisStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open SQLite DB: " + db_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    init();
}

AnalysisStore::~AnalysisStore() {
    if (db_) sqlite3_close(db_);
}

void AnalysisStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS jobs (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  title TEXT,\n"
         "  company TEXT,\n"
         "  source TEXT,\n"
         "  description TEXT,\n"
         "  ingested_at INTEGER\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS tier_results (\n"
         "  job_id TEXT PRIMARY KEY REFERENCES jobs(id),\n"
         "  tier1_done INTEGER NOT NULL DEFAULT 0, tier1_at INTEGER, tier1_failed INTEGER NOT NULL DEFAULT 0,\n"
         "  tier2_done INTEGER NOT NULL DEFAULT 0, tier2_at INTEGER, tier2_failed INTEGER NOT NULL DEFAULT 0,\n"
         "  tier3_done INTEGER NOT NULL DEFAULT 0, tier3_at INTEGER, tier3_failed INTEGER NOT NULL DEFAULT 0,\n"
         "  prompt_tokens INTEGER NOT NULL DEFAULT 0,\n"
         "  completion_tokens INTEGER NOT NULL DEFAULT 0\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS analysis_payloads (\n"
         "  job_id TEXT NOT NULL,\n"
         "  tier INTEGER NOT NULL,\n"
         "  payload TEXT NOT NULL,\n"
         "  model TEXT,\n"
         "  created_at INTEGER,\n"
         "  PRIMARY KEY (job_id, tier)\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS analysis_sessions (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  job_id TEXT, tier INTEGER, token_prefix TEXT, model TEXT, template_version TEXT,\n"
         "  attempt INTEGER, created_at INTEGER, completed_at INTEGER, outcome TEXT, error TEXT\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS security_detections (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  job_id TEXT, tier INTEGER, field TEXT, category TEXT, severity TEXT,\n"
         "  pattern_id TEXT, sample TEXT, detected_at INTEGER\n"
         ");");
    exec("CREATE TRIGGER IF NOT EXISTS security_detections_no_update BEFORE UPDATE ON security_detections\n"
         "BEGIN SELECT RAISE(ABORT, 'security_detections is append-only'); END;");
    exec("CREATE TRIGGER IF NOT EXISTS security_detections_no_delete BEFORE DELETE ON security_detections\n"
         "BEGIN SELECT RAISE(ABORT, 'security_detections is append-only'); END;");
    exec("CREATE TABLE IF NOT EXISTS usage (\n"
         "  day TEXT PRIMARY KEY,\n"
         "  requests INTEGER NOT NULL DEFAULT 0,\n"
         "  prompt_tokens INTEGER NOT NULL DEFAULT 0,\n"
         "  completion_tokens INTEGER NOT NULL DEFAULT 0\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS source_detections (\n"
         "  source TEXT PRIMARY KEY,\n"
         "  flagged INTEGER NOT NULL DEFAULT 0,\n"
         "  updated_at INTEGER\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_detections_job ON security_detections(job_id);");
    exec("CREATE INDEX IF NOT EXISTS idx_sessions_job ON analysis_sessions(job_id, tier);");
}

void AnalysisStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error: " + msg);
    }
}

void AnalysisStore::ensure_result_row(const std::string& job_id) {
    Stmt s(db_, "INSERT OR IGNORE INTO tier_results (job_id) VALUES (?);");
    bind_text(s.st, 1, job_id);
    s.done();
}

bool AnalysisStore::add_job(const Job& job) {
    std::lock_guard<std::mutex> lk(mtx_);
    Txn txn(db_);
    Stmt s(db_, "INSERT INTO jobs (id, title, company, source, description, ingested_at)\n"
                "VALUES (?, ?, ?, ?, ?, ?)\n"
                "ON CONFLICT(id) DO NOTHING;");
    bind_text(s.st, 1, job.id);
    bind_text(s.st, 2, job.title);
    bind_text(s.st, 3, job.company);
    bind_text(s.st, 4, job.source);
    bind_text(s.st, 5, job.description);
    sqlite3_bind_int64(s.st, 6, epoch_micros());
    s.done();
    if (sqlite3_changes(db_) == 0) return false;
    ensure_result_row(job.id);
    txn.commit();
    return true;
}

std::optional<Job> AnalysisStore::job(const std::string& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "SELECT id, title, company, source, description FROM jobs WHERE id = ?;");
    bind_text(s.st, 1, id);
    if (!s.row()) return std::nullopt;
    Job j;
    j.id = col_text(s.st, 0);
    j.title = col_text(s.st, 1);
    j.company = col_text(s.st, 2);
    j.source = col_text(s.st, 3);
    j.description = col_text(s.st, 4);
    return j;
}

namespace {
std::string eligible_where(int tier) {
    std::string w = "COALESCE(t." + col(tier, "done") + ", 0) = 0 AND COALESCE(t." + col(tier, "failed") + ", 0) = 0";
    if (tier > 1) w += " AND t." + col(tier - 1, "done") + " = 1";
    return w;
}
}

std::vector<std::string> AnalysisStore::backlog(int tier, std::size_t limit) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "SELECT j.id FROM jobs j LEFT JOIN tier_results t ON t.job_id = j.id\n"
                "WHERE " + eligible_where(tier) + "\n"
                "ORDER BY j.ingested_at, j.id LIMIT ?;");
    sqlite3_bind_int64(s.st, 1, (sqlite3_int64)limit);
    std::vector<std::string> out;
    while (s.row()) out.push_back(col_text(s.st, 0));
    return out;
}

std::size_t AnalysisStore::backlog_size(int tier) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "SELECT COUNT(*) FROM jobs j LEFT JOIN tier_results t ON t.job_id = j.id WHERE " +
                eligible_where(tier) + ";");
    return s.row() ? (std::size_t)sqlite3_column_int64(s.st, 0) : 0;
}

TierFlags AnalysisStore::flags(const std::string& job_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "SELECT tier1_done, tier1_failed, tier1_at, tier2_done, tier2_failed, tier2_at,\n"
                "  tier3_done, tier3_failed, tier3_at, prompt_tokens, completion_tokens\n"
                "FROM tier_results WHERE job_id = ?;");
    bind_text(s.st, 1, job_id);
    TierFlags f;
    if (!s.row()) return f;
    for (int i = 0; i < kTierCount; ++i) {
        f.done[i] = sqlite3_column_int(s.st, i * 3) != 0;
        f.failed[i] = sqlite3_column_int(s.st, i * 3 + 1) != 0;
        f.done_at[i] = sqlite3_column_int64(s.st, i * 3 + 2);
    }
    f.prompt_tokens = (long)sqlite3_column_int64(s.st, 9);
    f.completion_tokens = (long)sqlite3_column_int64(s.st, 10);
    return f;
}

bool AnalysisStore::commit_tier(const std::string& job_id, int tier, const std::string& payload_json,
                                const std::string& model, long prompt_tokens, long completion_tokens) {
    std::lock_guard<std::mutex> lk(mtx_);
    Txn txn(db_);
    ensure_result_row(job_id);

    {
        std::string prev = tier > 1 ? col(tier - 1, "done") : std::string("1");
        Stmt q(db_, "SELECT " + col(tier, "done") + ", " + prev + " FROM tier_results WHERE job_id = ?;");
        bind_text(q.st, 1, job_id);
        if (!q.row()) throw StoreError("no result row for job " + job_id);
        if (sqlite3_column_int(q.st, 0) != 0) return false;
        if (sqlite3_column_int(q.st, 1) == 0) {
            throw StoreError("tier " + std::to_string(tier) + " committed before tier " +
                             std::to_string(tier - 1) + " for job " + job_id);
        }
    }

    int64_t now = epoch_micros();
    {
        Stmt s(db_, "INSERT OR REPLACE INTO analysis_payloads (job_id, tier, payload, model, created_at)\n"
                    "VALUES (?, ?, ?, ?, ?);");
        bind_text(s.st, 1, job_id);
        sqlite3_bind_int(s.st, 2, tier);
        bind_text(s.st, 3, payload_json);
        bind_text(s.st, 4, model);
        sqlite3_bind_int64(s.st, 5, now);
        s.done();
    }
    {
        Stmt s(db_, "UPDATE tier_results SET " + col(tier, "done") + " = 1, " + col(tier, "at") + " = ?, " +
                    col(tier, "failed") + " = 0,\n"
                    "  prompt_tokens = prompt_tokens + ?, completion_tokens = completion_tokens + ?\n"
                    "WHERE job_id = ?;");
        sqlite3_bind_int64(s.st, 1, now);
        sqlite3_bind_int64(s.st, 2, prompt_tokens);
        sqlite3_bind_int64(s.st, 3, completion_tokens);
        bind_text(s.st, 4, job_id);
        s.done();
    }
    txn.commit();
    return true;
}

void AnalysisStore::mark_failed(const std::string& job_id, int tier) {
    std::lock_guard<std::mutex> lk(mtx_);
    Txn txn(db_);
    ensure_result_row(job_id);
    Stmt s(db_, "UPDATE tier_results SET " + col(tier, "failed") + " = 1 WHERE job_id = ? AND " +
                col(tier, "done") + " = 0;");
    bind_text(s.st, 1, job_id);
    s.done();
    txn.commit();
}

std::size_t AnalysisStore::requeue(int tier, const std::string& job_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::string sql = "UPDATE tier_results SET " + col(tier, "failed") + " = 0 WHERE " + col(tier, "failed") + " = 1";
    if (!job_id.empty()) sql += " AND job_id = ?";
    Stmt s(db_, sql + ";");
    if (!job_id.empty()) bind_text(s.st, 1, job_id);
    s.done();
    return (std::size_t)sqlite3_changes(db_);
}

std::optional<std::string> AnalysisStore::payload(const std::string& job_id, int tier) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "SELECT payload FROM analysis_payloads WHERE job_id = ? AND tier = ?;");
    bind_text(s.st, 1, job_id);
    sqlite3_bind_int(s.st, 2, tier);
    if (!s.row()) return std::nullopt;
    return col_text(s.st, 0);
}

void AnalysisStore::record_session(const AnalysisSession& a) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "INSERT INTO analysis_sessions\n"
                "(job_id, tier, token_prefix, model, template_version, attempt, created_at, completed_at, outcome, error)\n"
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bind_text(s.st, 1, a.job_id);
    sqlite3_bind_int(s.st, 2, a.tier);
    bind_text(s.st, 3, a.token_prefix);
    bind_text(s.st, 4, a.model);
    bind_text(s.st, 5, a.template_version);
    sqlite3_bind_int(s.st, 6, a.attempt);
    sqlite3_bind_int64(s.st, 7, a.created_at);
    sqlite3_bind_int64(s.st, 8, a.completed_at);
    bind_text(s.st, 9, to_string(a.outcome));
    bind_text(s.st, 10, a.error);
    s.done();
}

std::size_t AnalysisStore::session_count(const std::string& job_id, int tier) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "SELECT COUNT(*) FROM analysis_sessions WHERE job_id = ? AND tier = ?;");
    bind_text(s.st, 1, job_id);
    sqlite3_bind_int(s.st, 2, tier);
    return s.row() ? (std::size_t)sqlite3_column_int64(s.st, 0) : 0;
}

void AnalysisStore::append_detection(const SecurityDetection& d) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "INSERT INTO security_detections\n"
                "(job_id, tier, field, category, severity, pattern_id, sample, detected_at)\n"
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    bind_text(s.st, 1, d.job_id);
    sqlite3_bind_int(s.st, 2, d.tier);
    bind_text(s.st, 3, d.field);
    bind_text(s.st, 4, to_string(d.category));
    bind_text(s.st, 5, to_string(d.severity));
    bind_text(s.st, 6, d.pattern_id);
    bind_text(s.st, 7, bounded_sample(d.sample));
    sqlite3_bind_int64(s.st, 8, d.detected_at);
    s.done();
}

std::vector<SecurityDetection> AnalysisStore::detections(const std::string& job_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "SELECT job_id, tier, field, category, severity, pattern_id, sample, detected_at\n"
                "FROM security_detections WHERE job_id = ? ORDER BY id;");
    bind_text(s.st, 1, job_id);
    std::vector<SecurityDetection> out;
    while (s.row()) {
        SecurityDetection d;
        d.job_id = col_text(s.st, 0);
        d.tier = sqlite3_column_int(s.st, 1);
        d.field = col_text(s.st, 2);
        parse_category(col_text(s.st, 3), d.category);
        parse_severity(col_text(s.st, 4), d.severity);
        d.pattern_id = col_text(s.st, 5);
        d.sample = col_text(s.st, 6);
        d.detected_at = sqlite3_column_int64(s.st, 7);
        out.push_back(std::move(d));
    }
    return out;
}

long AnalysisStore::requests_today() {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "SELECT requests FROM usage WHERE day = ?;");
    bind_text(s.st, 1, utc_day());
    return s.row() ? (long)sqlite3_column_int64(s.st, 0) : 0;
}

void AnalysisStore::record_usage(long requests, long prompt_tokens, long completion_tokens) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt s(db_, "INSERT INTO usage (day, requests, prompt_tokens, completion_tokens) VALUES (?, ?, ?, ?)\n"
                "ON CONFLICT(day) DO UPDATE SET requests = requests + excluded.requests,\n"
                "  prompt_tokens = prompt_tokens + excluded.prompt_tokens,\n"
                "  completion_tokens = completion_tokens + excluded.completion_tokens;");
    bind_text(s.st, 1, utc_day());
    sqlite3_bind_int64(s.st, 2, requests);
    sqlite3_bind_int64(s.st, 3, prompt_tokens);
    sqlite3_bind_int64(s.st, 4, completion_tokens);
    s.done();
}

int AnalysisStore::flag_source(const std::string& source) {
    std::lock_guard<std::mutex> lk(mtx_);
    {
        Stmt s(db_, "INSERT INTO source_detections (source, flagged, updated_at) VALUES (?, 1, ?)\n"
                    "ON CONFLICT(source) DO UPDATE SET flagged = flagged + 1, updated_at = excluded.updated_at;");
        bind_text(s.st, 1, source);
        sqlite3_bind_int64(s.st, 2, epoch_micros());
        s.done();
    }
    Stmt q(db_, "SELECT flagged FROM source_detections WHERE source = ?;");
    bind_text(q.st, 1, source);
    return q.row() ? sqlite3_column_int(q.st, 0) : 0;
}

int AnalysisStore::source_flags(const std::string& source) {
    std::lock_guard<std::mutex> lk(mtx_);
    Stmt q(db_, "SELECT flagged FROM source_detections WHERE source = ?;");
    bind_text(q.st, 1, source);
    return q.row() ? sqlite3_column_int(q.st, 0) : 0;
}

StoreStatus AnalysisStore::status() {
    StoreStatus st;
    for (int tier = 1; tier <= kTierCount; ++tier) {
        st.pending[tier - 1] = backlog_size(tier);
    }
    st.requests_today = requests_today();

    std::lock_guard<std::mutex> lk(mtx_);
    {
        Stmt s(db_, "SELECT COUNT(*) FROM jobs;");
        if (s.row()) st.jobs = (std::size_t)sqlite3_column_int64(s.st, 0);
    }
    {
        Stmt s(db_, "SELECT SUM(tier1_done), SUM(tier1_failed), SUM(tier2_done), SUM(tier2_failed),\n"
                    "  SUM(tier3_done), SUM(tier3_failed) FROM tier_results;");
        if (s.row()) {
            for (int i = 0; i < kTierCount; ++i) {
                st.done[i] = (std::size_t)sqlite3_column_int64(s.st, i * 2);
                st.failed[i] = (std::size_t)sqlite3_column_int64(s.st, i * 2 + 1);
            }
        }
    }
    {
        Stmt s(db_, "SELECT COUNT(*) FROM security_detections;");
        if (s.row()) st.detections = (std::size_t)sqlite3_column_int64(s.st, 0);
    }
    return st;
}
