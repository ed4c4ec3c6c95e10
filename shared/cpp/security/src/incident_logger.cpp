#include "../include/incident_logger.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

IncidentLogger::IncidentLogger(DetectionStore* store, std::string jsonl_path)
    : store_(store), jsonl_path_(std::move(jsonl_path)) {}

void IncidentLogger::note_failure(const std::string& what) {
    ++failures_;
    log_error("security", "incident log write failed: " + what);
}

void IncidentLogger::record(const SecurityDetection& d) {
    if (d.severity == Severity::High || d.severity == Severity::Critical) {
        log_error("security", std::string(to_string(d.category)) + "/" + d.pattern_id + " severity=" +
                                  to_string(d.severity) + " job=" + d.job_id + " tier=" + std::to_string(d.tier) +
                                  " field=" + d.field);
    }
    if (!store_) {
        ++recorded_;
        return;
    }
    try {
        store_->append_detection(d);
        ++recorded_;
    } catch (const std::exception& e) {
        note_failure(e.what());
    }
}

void IncidentLogger::record_all(const std::vector<SecurityDetection>& ds) {
    for (const auto& d : ds) record(d);
}

void IncidentLogger::summarize(const IncidentSummary& s) {
    if (jsonl_path_.empty()) return;

    json patterns = json::array();
    for (const auto& d : s.detections) {
        if (patterns.size() >= kMaxSummaryPatterns) break;
        patterns.push_back(d.pattern_id);
    }
    json line = {
        {"at", epoch_micros()},
        {"job_id", s.job_id},
        {"tier", s.tier},
        {"outcome", s.outcome},
        {"attempts", s.attempts},
        {"detections", s.detections.size()},
        {"patterns", patterns}
    };

    try {
        std::string text = line.dump(-1, ' ', false, json::error_handler_t::replace);
        std::lock_guard<std::mutex> lk(file_mtx_);
        std::ofstream f(jsonl_path_, std::ios::app);
        if (!f) return note_failure("cannot open " + jsonl_path_);
        f << text << '\n';
        if (!f) note_failure("short write to " + jsonl_path_);
    } catch (const std::exception& e) {
        note_failure(e.what());
    }
}
