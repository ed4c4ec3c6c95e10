#include "../include/detection.hpp"
#include <chrono>

const char* to_string(Severity s) {
    switch (s) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

const char* to_string(DetectionCategory c) {
    switch (c) {
        case DetectionCategory::Sql: return "sql";
        case DetectionCategory::Command: return "command";
        case DetectionCategory::Xss: return "xss";
        case DetectionCategory::PathTraversal: return "path-traversal";
        case DetectionCategory::Url: return "url";
        case DetectionCategory::Tamper: return "tamper";
        case DetectionCategory::TokenMismatch: return "token-mismatch";
        case DetectionCategory::UnpunctuatedStream: return "unpunctuated-stream";
        case DetectionCategory::PromptInjection: return "prompt-injection";
    }
    return "unknown";
}

bool parse_severity(const std::string& s, Severity& out) {
    if (s == "low") { out = Severity::Low; return true; }
    if (s == "medium") { out = Severity::Medium; return true; }
    if (s == "high") { out = Severity::High; return true; }
    if (s == "critical") { out = Severity::Critical; return true; }
    return false;
}

bool parse_category(const std::string& s, DetectionCategory& out) {
    static const DetectionCategory all[] = {
        DetectionCategory::Sql, DetectionCategory::Command, DetectionCategory::Xss,
        DetectionCategory::PathTraversal, DetectionCategory::Url, DetectionCategory::Tamper,
        DetectionCategory::TokenMismatch, DetectionCategory::UnpunctuatedStream,
        DetectionCategory::PromptInjection};
    for (auto c : all) {
        if (s == to_string(c)) { out = c; return true; }
    }
    return false;
}

std::string utf8_truncate(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    std::size_t end = max_bytes;
    // back off continuation bytes so a code point is never split
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) --end;
    return text.substr(0, end);
}

std::string bounded_sample(const std::string& text, std::size_t max_bytes) {
    return utf8_truncate(text, max_bytes);
}

int64_t epoch_micros() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

SecurityDetection make_detection(const std::string& job_id, int tier, const std::string& field,
                                 DetectionCategory category, Severity severity,
                                 const std::string& pattern_id, const std::string& sample) {
    SecurityDetection d;
    d.job_id = job_id;
    d.tier = tier;
    d.field = field;
    d.category = category;
    d.severity = severity;
    d.pattern_id = pattern_id;
    d.sample = bounded_sample(sample);
    d.detected_at = epoch_micros();
    return d;
}
