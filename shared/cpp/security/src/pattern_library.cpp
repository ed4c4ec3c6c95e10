#include "../include/pattern_library.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace {
constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

// "user:pw@Host:8080" -> "host", "[::1]:80" -> "[::1]"
std::string host_of(const std::string& authority) {
    std::string a = authority;
    auto at = a.rfind('@');
    if (at != std::string::npos) a = a.substr(at + 1);
    if (!a.empty() && a[0] == '[') {
        auto close = a.find(']');
        return lower(close == std::string::npos ? a : a.substr(0, close + 1));
    }
    auto colon = a.find(':');
    if (colon != std::string::npos) a = a.substr(0, colon);
    while (!a.empty() && a.back() == '.') a.pop_back();
    return lower(a);
}

bool parse_ipv4(const std::string& host, int octets[4]) {
    int n = 0;
    std::size_t i = 0;
    while (n < 4) {
        std::size_t start = i;
        while (i < host.size() && std::isdigit((unsigned char)host[i])) ++i;
        if (i == start || i - start > 3) return false;
        int v = std::atoi(host.substr(start, i - start).c_str());
        if (v > 255) return false;
        octets[n++] = v;
        if (n < 4) {
            if (i >= host.size() || host[i] != '.') return false;
            ++i;
        }
    }
    return i == host.size();
}
}

std::vector<PatternMatch> PatternRule::matches(const std::string& text) const {
    std::vector<PatternMatch> out;
    auto begin = std::sregex_iterator(text.begin(), text.end(), re);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        if (it->length(0) == 0) continue;
        out.push_back({static_cast<std::size_t>(it->position(0)), static_cast<std::size_t>(it->length(0))});
    }
    return out;
}

bool PatternRule::search(const std::string& text) const {
    return std::regex_search(text, re);
}

PatternLibrary::PatternLibrary()
    : url_re_(R"([a-z][a-z0-9+.\-]*://[^\s"'<>]+)", kFlags) {
    using C = DetectionCategory;
    using S = Severity;

    add_rule("sql.union_select", C::Sql, S::High, R"(union\s+(all\s+)?select)");
    add_rule("sql.drop_table", C::Sql, S::High, R"(drop\s+table)");
    add_rule("sql.delete_from", C::Sql, S::High, R"(delete\s+from)");
    add_rule("sql.insert_into", C::Sql, S::High, R"(insert\s+into)");
    add_rule("sql.update_set", C::Sql, S::High, R"(update\s+\w+\s+set\b)");
    add_rule("sql.exec_call", C::Sql, S::High, R"(\bexec\s*\()");
    add_rule("sql.execute_immediate", C::Sql, S::High, R"(execute\s+immediate)");
    add_rule("sql.xp_cmdshell", C::Sql, S::Critical, R"(xp_cmdshell)");
    add_rule("sql.tautology", C::Sql, S::High, R"('\s*or\s+'?1'?\s*=\s*'?1)");
    add_rule("sql.line_comment", C::Sql, S::Medium, R"(--(?=\s|$))");
    add_rule("sql.block_comment", C::Sql, S::Medium, R"(/\*[\s\S]*?\*/)");

    add_rule("cmd.semicolon", C::Command, S::Medium, R"(;)");
    add_rule("cmd.pipe", C::Command, S::Medium, R"(\|)");
    add_rule("cmd.backtick", C::Command, S::High, R"(`)");
    add_rule("cmd.subshell", C::Command, S::High, R"(\$\()");
    add_rule("cmd.var_expansion", C::Command, S::Medium, R"(\$\{)");
    add_rule("cmd.and_chain", C::Command, S::High, R"(&&)");
    add_rule("cmd.redirect", C::Command, S::High, R"(>\s*/)");

    add_rule("xss.script_tag", C::Xss, S::High, R"(<\s*/?\s*script)");
    add_rule("xss.javascript_uri", C::Xss, S::High, R"(javascript\s*:)");
    add_rule("xss.vbscript_uri", C::Xss, S::High, R"(vbscript\s*:)");
    add_rule("xss.data_html", C::Xss, S::High, R"(data\s*:\s*text/html)");
    add_rule("xss.event_handler", C::Xss, S::Medium, R"(\bon[a-z]+\s*=)");
    add_rule("xss.iframe", C::Xss, S::High, R"(<\s*iframe)");
    add_rule("xss.object", C::Xss, S::Medium, R"(<\s*object)");
    add_rule("xss.embed", C::Xss, S::Medium, R"(<\s*embed)");

    add_rule("path.dotdot_slash", C::PathTraversal, S::Medium, R"(\.\./)");
    add_rule("path.dotdot_backslash", C::PathTraversal, S::Medium, R"(\.\.\\)");
    add_rule("path.encoded_dotdot", C::PathTraversal, S::Medium, R"(%2e%2e(%2f|%5c|/|\\)?)");
    add_rule("path.half_encoded", C::PathTraversal, S::Medium, R"(\.\.(%2f|%5c))");

    add_rule("inject.ignore_instructions", C::PromptInjection, S::Medium, R"(ignore.{0,20}(all\s+)?instructions)");
    add_rule("inject.forget_previous", C::PromptInjection, S::Medium, R"(forget.{0,20}(the\s+)?previous)");
    add_rule("inject.new_instructions", C::PromptInjection, S::Medium, R"(new.{0,20}instructions)");
    add_rule("inject.system_prompt", C::PromptInjection, S::Medium, R"(system.{0,20}prompt)");
    add_rule("inject.act_as_if", C::PromptInjection, S::Low, R"(act.{0,20}as.{0,20}if)");
    add_rule("inject.show_prompt", C::PromptInjection, S::Medium, R"(show\s+me\s+your\s+prompt)");
    add_rule("inject.reveal_system", C::PromptInjection, S::Medium, R"(reveal\s+your\s+system)");
    add_rule("inject.bypass_safety", C::PromptInjection, S::High, R"(bypass.{0,20}safety)");
    add_rule("inject.jailbreak", C::PromptInjection, S::High, R"(jailbreak)");
    add_rule("inject.developer_mode", C::PromptInjection, S::Medium, R"(developer\s+mode)");

    auto host_rule = [this](const std::string& id, const std::string& pattern) {
        host_rules_.push_back({id, DetectionCategory::Url, Severity::High, std::regex(pattern, kFlags)});
    };
    host_rule("exfil.ipv6_literal", R"(^\[[0-9a-f:.%]+\]$)");
    host_rule("exfil.numeric_host", R"(^(0x[0-9a-f]+|\d+)$)");
    host_rule("exfil.localhost", R"((^|\.)localhost$)");
    host_rule("exfil.tunnel", R"((^|\.)(ngrok\.io|ngrok\.app|ngrok-free\.app|localtunnel\.me|loca\.lt|serveo\.net|trycloudflare\.com)$)");
    host_rule("exfil.dynamic_dns", R"((^|\.)(duckdns\.org|no-ip\.org|no-ip\.com|noip\.com|ddns\.net|dyndns\.org|dyndns\.com|hopto\.org)$)");
}

void PatternLibrary::add_rule(const std::string& id, DetectionCategory category, Severity severity,
                              const std::string& pattern) {
    rules_.push_back({id, category, severity, std::regex(pattern, kFlags)});
}

std::vector<const PatternRule*> PatternLibrary::rules_for(DetectionCategory category) const {
    std::vector<const PatternRule*> out;
    for (const auto& r : rules_) {
        if (r.category == category) out.push_back(&r);
    }
    return out;
}

std::vector<UrlSpan> PatternLibrary::find_urls(const std::string& text) const {
    std::vector<UrlSpan> out;
    auto begin = std::sregex_iterator(text.begin(), text.end(), url_re_);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        UrlSpan u;
        u.pos = static_cast<std::size_t>(it->position(0));
        std::string m = it->str(0);
        while (!m.empty() && std::string(".,!?").find(m.back()) != std::string::npos) m.pop_back();
        u.len = m.size();

        std::size_t auth_start = m.find("://") + 3;
        std::size_t auth_stop = m.find_first_of("/?#", auth_start);
        if (auth_stop == std::string::npos) auth_stop = m.size();
        u.authority_end = auth_stop;
        u.host = host_of(m.substr(auth_start, auth_stop - auth_start));
        out.push_back(std::move(u));
    }
    return out;
}

std::string PatternLibrary::suspicious_host(const std::string& host) const {
    int o[4];
    if (parse_ipv4(host, o)) {
        if (o[0] == 127) return "exfil.loopback";
        if (o[0] == 10 || (o[0] == 172 && o[1] >= 16 && o[1] <= 31) || (o[0] == 192 && o[1] == 168)) {
            return "exfil.private_ip";
        }
        if (o[0] == 169 && o[1] == 254) return "exfil.link_local";
        return "exfil.ip_literal";
    }
    for (const auto& r : host_rules_) {
        if (r.search(host)) return r.id;
    }
    return {};
}

std::string redact_matches(const PatternRule& rule, const std::string& text,
                           const std::string& replacement, std::vector<std::string>& samples) {
    auto found = rule.matches(text);
    if (found.empty()) return text;
    std::string out;
    out.reserve(text.size());
    std::size_t cursor = 0;
    for (const auto& m : found) {
        out.append(text, cursor, m.pos - cursor);
        out += replacement;
        samples.push_back(text.substr(m.pos, m.len));
        cursor = m.pos + m.len;
    }
    out.append(text, cursor, std::string::npos);
    return out;
}
