#include "../include/response_sanitizer.hpp"

using json = nlohmann::json;

namespace {
constexpr int kMaxTraversalPasses = 8;

bool dropped_code_point(uint32_t cp) {
    if (cp == '\t' || cp == '\n' || cp == '\r') return false;
    if (cp < 0x20 || cp == 0x7F) return true;           // C0, DEL
    if (cp >= 0x80 && cp <= 0x9F) return true;          // C1
    if (cp >= 0x200B && cp <= 0x200F) return true;      // zero-width, LRM/RLM
    if (cp >= 0x202A && cp <= 0x202E) return true;      // bidi embeddings/overrides
    if (cp >= 0x2060 && cp <= 0x2064) return true;      // word joiner, invisible operators
    if (cp >= 0x2066 && cp <= 0x2069) return true;      // bidi isolates
    if (cp == 0xFEFF) return true;                      // BOM / zero-width no-break space
    return false;
}
}

ResponseSanitizer::ResponseSanitizer(const PatternLibrary& lib, SanitizerPolicy policy)
    : lib_(lib), policy_(std::move(policy)) {}

std::string ResponseSanitizer::html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string ResponseSanitizer::strip_control(const std::string& s, std::size_t& removed) {
    std::string out;
    out.reserve(s.size());
    removed = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        int len = 1;
        uint32_t cp = c;
        if (c >= 0xF0 && c <= 0xF4) { len = 4; cp = c & 0x07; }
        else if (c >= 0xE0) { len = c <= 0xEF ? 3 : 0; cp = c & 0x0F; }
        else if (c >= 0xC2) { len = 2; cp = c & 0x1F; }
        else if (c >= 0x80) { len = 0; }

        bool valid = len > 0 && i + len <= s.size();
        for (int k = 1; valid && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) valid = false;
            else cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            ++removed;
            ++i;
            continue;
        }
        if (dropped_code_point(cp)) ++removed;
        else out.append(s, i, len);
        i += len;
    }
    return out;
}

std::string ResponseSanitizer::sanitize_string(const std::string& key, const std::string& path,
                                               const std::string& value, const std::string& job_id,
                                               int tier, SanitizeResult& res) const {
    std::string s = value;

    if (s.size() > policy_.max_string_length) {
        res.warnings.push_back(path + ": truncated from " + std::to_string(s.size()) + " bytes");
        s = utf8_truncate(s, policy_.max_string_length);
    }

    std::size_t removed = 0;
    s = strip_control(s, removed);
    if (removed) {
        res.warnings.push_back(path + ": removed " + std::to_string(removed) + " control characters");
    }

    auto redact_category = [&](DetectionCategory cat, const std::string& replacement) {
        for (const PatternRule* rule : lib_.rules_for(cat)) {
            std::vector<std::string> samples;
            s = redact_matches(*rule, s, replacement, samples);
            for (const auto& m : samples) {
                res.detections.push_back(make_detection(job_id, tier, path, cat, rule->severity, rule->id, m));
            }
        }
    };

    // Traversal runs before the SQL and command rules: "DROP ../TABLE" only
    // becomes a statement once stripped. Stripping can also splice a new
    // sequence together ("..././"), so repeat.
    for (int pass = 0; pass < kMaxTraversalPasses; ++pass) {
        std::size_t before = res.detections.size();
        redact_category(DetectionCategory::PathTraversal, "");
        if (res.detections.size() == before) break;
    }

    redact_category(DetectionCategory::Sql, policy_.redaction_marker);
    redact_category(DetectionCategory::Command, policy_.redaction_marker);

    bool xss = false;
    for (const PatternRule* rule : lib_.rules_for(DetectionCategory::Xss)) {
        for (const auto& m : rule->matches(s)) {
            xss = true;
            res.detections.push_back(make_detection(job_id, tier, path, DetectionCategory::Xss,
                                                    rule->severity, rule->id, s.substr(m.pos, m.len)));
        }
    }
    if (xss) s = html_escape(s);

    bool prohibited = policy_.url_prohibited_fields.count(key) > 0;
    bool allowed = policy_.url_allowed_fields.count(key) > 0;
    if (prohibited || allowed) {
        auto urls = lib_.find_urls(s);
        for (auto it = urls.rbegin(); it != urls.rend(); ++it) {
            std::string url = s.substr(it->pos, it->len);
            if (prohibited) {
                s.replace(it->pos, it->len, policy_.url_marker);
                res.detections.push_back(make_detection(job_id, tier, path, DetectionCategory::Url,
                                                        Severity::Medium, "url.prohibited_field", url));
                continue;
            }
            std::string rule_id = lib_.suspicious_host(it->host);
            if (rule_id.empty()) continue;
            s.replace(it->pos, it->authority_end, policy_.suspicious_url_marker);
            res.detections.push_back(make_detection(job_id, tier, path, DetectionCategory::Url,
                                                    Severity::High, rule_id, url));
        }
    }
    return s;
}

void ResponseSanitizer::walk(json& node, const std::string& key, const std::string& path,
                             const std::string& job_id, int tier, SanitizeResult& res) const {
    if (node.is_string()) {
        node = sanitize_string(key, path, node.get<std::string>(), job_id, tier, res);
    } else if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            walk(it.value(), it.key(), path.empty() ? it.key() : path + "." + it.key(), job_id, tier, res);
        }
    } else if (node.is_array()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            walk(node[i], key, path + "[" + std::to_string(i) + "]", job_id, tier, res);
        }
    }
}

SanitizeResult ResponseSanitizer::sanitize(const json& doc, const std::string& job_id, int tier) const {
    SanitizeResult res;
    res.value = doc;
    walk(res.value, "", "", job_id, tier, res);
    return res;
}
