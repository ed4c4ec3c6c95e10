#include "../include/input_sanitizer.hpp"
#include <sstream>

namespace {
std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Decodes one code point starting at s[i] and advances i. Malformed bytes count as one.
uint32_t next_code_point(const std::string& s, std::size_t& i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    int extra = 0;
    uint32_t cp = c;
    if (c >= 0xF0) { extra = 3; cp = c & 0x07; }
    else if (c >= 0xE0) { extra = 2; cp = c & 0x0F; }
    else if (c >= 0xC0) { extra = 1; cp = c & 0x1F; }
    ++i;
    for (int k = 0; k < extra && i < s.size(); ++k) {
        unsigned char cc = static_cast<unsigned char>(s[i]);
        if ((cc & 0xC0) != 0x80) break;
        cp = (cp << 6) | (cc & 0x3F);
        ++i;
    }
    return cp;
}

bool is_punct(uint32_t cp) {
    switch (cp) {
        case '.': case ',': case ';': case ':': case '!': case '?': case '-':
        case '(': case ')': case '[': case ']': case '{': case '}':
        case '\'': case '"':
        case 0x2013: case 0x2014: // en dash, em dash
            return true;
        default:
            return false;
    }
}
}

InputSanitizer::InputSanitizer(const PatternLibrary& lib, UnpunctuatedConfig cfg)
    : lib_(lib), cfg_(std::move(cfg)) {}

void InputSanitizer::count(const std::string& seq, std::size_t& chars, std::size_t& punct) {
    chars = 0;
    punct = 0;
    std::size_t i = 0;
    while (i < seq.size()) {
        if (is_punct(next_code_point(seq, i))) ++punct;
        ++chars;
    }
}

Severity InputSanitizer::classify(std::size_t length, double ratio) const {
    if (cfg_.severity != "auto") {
        Severity fixed;
        if (parse_severity(cfg_.severity, fixed)) return fixed;
    }
    if ((ratio == 0.0 && length >= 500) || (ratio < 0.005 && length >= 800)) return Severity::Critical;
    if (ratio < 0.01 || length >= 600) return Severity::High;
    if (cfg_.max_punctuation_ratio - ratio >= 0.015) return Severity::Medium;
    return Severity::Low;
}

InputScanResult InputSanitizer::scan(const std::string& job_id, const std::string& text) const {
    InputScanResult res;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string seq = trim(line);
        if (seq.empty()) continue;
        std::size_t chars = 0, punct = 0;
        count(seq, chars, punct);
        if (chars < cfg_.min_length) continue;
        double ratio = static_cast<double>(punct) / static_cast<double>(chars);
        if (ratio >= cfg_.max_punctuation_ratio) continue;

        res.unpunctuated = true;
        auto d = make_detection(job_id, 1, "description", DetectionCategory::UnpunctuatedStream,
                                classify(chars, ratio), "input.unpunctuated", seq);
        res.detections.push_back(std::move(d));
    }

    for (const PatternRule* rule : lib_.rules_for(DetectionCategory::PromptInjection)) {
        for (const auto& m : rule->matches(text)) {
            res.injection_phrases = true;
            res.detections.push_back(make_detection(job_id, 1, "description", rule->category,
                                                    rule->severity, rule->id, text.substr(m.pos, m.len)));
        }
    }
    return res;
}
