#pragma once
#include "detection.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Durable sink for detections, implemented by the analysis store.
class DetectionStore {
public:
    virtual ~DetectionStore() = default;
    virtual void append_detection(const SecurityDetection& d) = 0;
};

struct IncidentSummary {
    std::string job_id;
    int tier{0};
    std::string outcome;
    int attempts{0};
    std::vector<SecurityDetection> detections;
};

// Never throws: a failed write is counted and reported, and processing goes on.
class IncidentLogger {
public:
    static constexpr std::size_t kMaxSummaryPatterns = 5;

    // `store` may be null; an empty `jsonl_path` disables the summary file.
    IncidentLogger(DetectionStore* store, std::string jsonl_path);

    void record(const SecurityDetection& d);
    void record_all(const std::vector<SecurityDetection>& ds);
    // One line per job and tier, clean runs included.
    void summarize(const IncidentSummary& s);

    uint64_t recorded() const { return recorded_.load(); }
    uint64_t write_failures() const { return failures_.load(); }

private:
    void note_failure(const std::string& what);

    DetectionStore* store_;
    std::string jsonl_path_;
    std::mutex file_mtx_;
    std::atomic<uint64_t> recorded_{0};
    std::atomic<uint64_t> failures_{0};
};
