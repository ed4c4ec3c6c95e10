#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

enum class Severity { Low, Medium, High, Critical };

enum class DetectionCategory {
    Sql,
    Command,
    Xss,
    PathTraversal,
    Url,
    Tamper,
    TokenMismatch,
    UnpunctuatedStream,
    PromptInjection
};

// Write-once audit record. `sample` is always bounded, never the whole payload.
struct SecurityDetection {
    std::string job_id;
    int tier{0};
    std::string field;
    DetectionCategory category{DetectionCategory::Sql};
    Severity severity{Severity::Low};
    std::string pattern_id;
    std::string sample;
    int64_t detected_at{0}; // epoch microseconds
};

// Raised when the template store, registry or database cannot be used at all.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* to_string(Severity s);
const char* to_string(DetectionCategory c);
bool parse_severity(const std::string& s, Severity& out);
bool parse_category(const std::string& s, DetectionCategory& out);

constexpr std::size_t kMaxSampleBytes = 200;

// Truncates on a UTF-8 boundary.
std::string bounded_sample(const std::string& text, std::size_t max_bytes = kMaxSampleBytes);
std::string utf8_truncate(const std::string& text, std::size_t max_bytes);

int64_t epoch_micros();

SecurityDetection make_detection(const std::string& job_id, int tier, const std::string& field,
                                 DetectionCategory category, Severity severity,
                                 const std::string& pattern_id, const std::string& sample);
