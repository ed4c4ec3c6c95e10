#pragma once
#include "detection.hpp"
#include <regex>
#include <string>
#include <vector>

struct PatternMatch {
    std::size_t pos{0};
    std::size_t len{0};
};

struct PatternRule {
    std::string id;
    DetectionCategory category{DetectionCategory::Sql};
    Severity severity{Severity::Low};
    std::regex re;

    std::vector<PatternMatch> matches(const std::string& text) const;
    bool search(const std::string& text) const;
};

// A URL located inside free text. `authority_end` is the offset just past
// scheme://authority, relative to `pos`.
struct UrlSpan {
    std::size_t pos{0};
    std::size_t len{0};
    std::size_t authority_end{0};
    std::string host; // lowercased, userinfo and port removed
};

// Read-only after construction; safe to share between worker threads.
class PatternLibrary {
public:
    PatternLibrary();

    void add_rule(const std::string& id, DetectionCategory category, Severity severity,
                  const std::string& pattern);

    std::vector<const PatternRule*> rules_for(DetectionCategory category) const;
    std::vector<UrlSpan> find_urls(const std::string& text) const;

    // Returns the matching host rule id, or an empty string for an ordinary host.
    std::string suspicious_host(const std::string& host) const;

private:
    std::vector<PatternRule> rules_;
    std::vector<PatternRule> host_rules_;
    std::regex url_re_;
};

// Replaces every match of `rule` with `replacement`. The matched text of each
// occurrence is appended to `samples`.
std::string redact_matches(const PatternRule& rule, const std::string& text,
                           const std::string& replacement, std::vector<std::string>& samples);
