#pragma once
#include "detection.hpp"
#include "pattern_library.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

struct SanitizerPolicy {
    std::size_t max_string_length{10000}; // bytes
    // Any URL in these fields is removed outright.
    std::set<std::string> url_prohibited_fields{
        "skill_name", "industry", "sub_industry", "job_title", "company_name",
        "department", "seniority_level", "job_function"};
    // URLs are expected here; only suspicious hosts are removed.
    std::set<std::string> url_allowed_fields{
        "application_link", "application_email", "company_website"};
    std::string redaction_marker{"[REMOVED]"};
    std::string url_marker{"[URL_REMOVED]"};
    std::string suspicious_url_marker{"[SUSPICIOUS_URL_REMOVED]"};
};

struct SanitizeResult {
    nlohmann::json value;
    std::vector<SecurityDetection> detections;
    std::vector<std::string> warnings; // truncation and control characters
};

// Walks every string leaf of a parsed response. Structure and non-string
// values pass through untouched; a clean input comes back unchanged.
class ResponseSanitizer {
public:
    explicit ResponseSanitizer(const PatternLibrary& lib, SanitizerPolicy policy = {});

    SanitizeResult sanitize(const nlohmann::json& doc, const std::string& job_id, int tier) const;

    // `key` is the nearest object key, `path` the full location used in detections.
    std::string sanitize_string(const std::string& key, const std::string& path, const std::string& value,
                                const std::string& job_id, int tier, SanitizeResult& res) const;

    const SanitizerPolicy& policy() const { return policy_; }

    static std::string html_escape(const std::string& s);
    static std::string strip_control(const std::string& s, std::size_t& removed);

private:
    void walk(nlohmann::json& node, const std::string& key, const std::string& path,
              const std::string& job_id, int tier, SanitizeResult& res) const;

    const PatternLibrary& lib_;
    SanitizerPolicy policy_;
};
