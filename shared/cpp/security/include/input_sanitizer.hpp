#pragma once
#include "detection.hpp"
#include "pattern_library.hpp"
#include <string>
#include <vector>

struct UnpunctuatedConfig {
    std::size_t min_length{200};        // characters
    double max_punctuation_ratio{0.02};
    std::string severity{"auto"};       // "auto" or a fixed level
};

struct InputScanResult {
    std::vector<SecurityDetection> detections;
    bool unpunctuated{false};
    bool injection_phrases{false};
};

// Advisory scan of job text before it reaches a prompt. Never modifies or
// rejects the text.
class InputSanitizer {
public:
    InputSanitizer(const PatternLibrary& lib, UnpunctuatedConfig cfg);

    InputScanResult scan(const std::string& job_id, const std::string& text) const;

    Severity classify(std::size_t length, double ratio) const;

    // Characters and punctuation marks in `seq`, counted in code points.
    static void count(const std::string& seq, std::size_t& chars, std::size_t& punct);

private:
    const PatternLibrary& lib_;
    UnpunctuatedConfig cfg_;
};
