#include "../include/prompt_security.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
std::string read_file(const fs::path& p, bool& ok) {
    std::ifstream f(p, std::ios::binary);
    ok = static_cast<bool>(f);
    if (!ok) return {};
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_file_atomic(const fs::path& p, const std::string& data) {
    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw ConfigError("cannot write " + tmp.string());
        f << data;
        if (!f) throw ConfigError("short write to " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, p, ec);
    if (ec) throw ConfigError("cannot replace " + p.string() + ": " + ec.message());
}

std::string file_name_for(int tier) {
    return "tier" + std::to_string(tier) + ".txt";
}

bool is_placeholder_name(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!(std::isupper((unsigned char)c) || c == '_')) return false;
    }
    return true;
}

std::string substitute(const std::string& text, const std::map<std::string, std::string>& values,
                       const char* section) {
    std::string out;
    out.reserve(text.size() + 256);
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '{') {
            auto close = text.find('}', i + 1);
            if (close != std::string::npos) {
                std::string name = text.substr(i + 1, close - i - 1);
                if (is_placeholder_name(name)) {
                    auto it = values.find(name);
                    if (it == values.end()) {
                        throw ConfigError(std::string("placeholder {") + name + "} not allowed in template " + section);
                    }
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += text[i++];
    }
    return out;
}
}

std::string sha256_hex(const std::string& data) {
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data.data(), data.size());
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256_Final(md, &ctx);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

// Exact bytes: a whitespace edit can move the body marker, so it counts.
std::string template_hash(const std::string& text) {
    return sha256_hex(text);
}

std::string generate_security_token() {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    constexpr unsigned kAlphabet = sizeof(alphabet) - 1; // 62
    constexpr unsigned kLimit = 256 - (256 % kAlphabet); // reject to avoid modulo bias

    std::string token = "SEC_TOKEN_";
    unsigned char buf[64];
    while (token.size() < 10 + 32) {
        if (RAND_bytes(buf, sizeof(buf)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        for (unsigned char b : buf) {
            if (b >= kLimit) continue;
            token += alphabet[b % kAlphabet];
            if (token.size() == 10 + 32) break;
        }
    }
    return token;
}

std::string token_prefix(const std::string& token) {
    return token.substr(0, 16);
}

// ---------- FileTemplateStore ----------

FileTemplateStore::FileTemplateStore(std::string dir) : dir_(std::move(dir)) {
    bool ok = false;
    std::string raw = read_file(fs::path(dir_) / kRegistryFile, ok);
    if (!ok) throw ConfigError("prompt registry not found in " + dir_);
    json reg;
    try {
        reg = json::parse(raw);
        for (const auto& e : reg.at("templates")) {
            TemplateRecord r;
            r.tier = e.at("tier").get<int>();
            r.version = e.value("version", std::string("unknown"));
            r.sha256 = e.at("sha256").get<std::string>();
            r.file = e.value("file", file_name_for(r.tier));
            r.snapshot = e.value("snapshot", std::string());
            records_[r.tier] = std::move(r);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed prompt registry: ") + e.what());
    }
}

PromptTemplate FileTemplateStore::load(int tier) {
    TemplateRecord r = record(tier);
    bool ok = false;
    PromptTemplate t;
    t.tier = tier;
    t.version = r.version;
    t.text = read_file(fs::path(dir_) / r.file, ok);
    // a missing file reads as empty and fails the hash check like any edit
    return t;
}

TemplateRecord FileTemplateStore::record(int tier) {
    auto it = records_.find(tier);
    if (it == records_.end()) {
        throw ConfigError("no registry entry for tier " + std::to_string(tier));
    }
    return it->second;
}

void FileTemplateStore::reset(int tier, const PromptTemplate& known_good) {
    TemplateRecord r = record(tier);
    write_file_atomic(fs::path(dir_) / r.file, known_good.text);
}

void FileTemplateStore::deploy(const std::string& dir, const std::vector<PromptTemplate>& templates) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw ConfigError("cannot create " + dir + ": " + ec.message());

    json reg;
    reg["templates"] = json::array();
    for (const auto& t : templates) {
        std::string file = file_name_for(t.tier);
        write_file_atomic(fs::path(dir) / file, t.text);
        reg["templates"].push_back({
            {"tier", t.tier},
            {"version", t.version},
            {"sha256", template_hash(t.text)},
            {"file", file},
            {"snapshot", t.text}
        });
    }
    write_file_atomic(fs::path(dir) / kRegistryFile, reg.dump(2));
}

// ---------- MemoryTemplateStore ----------

MemoryTemplateStore::MemoryTemplateStore(const std::vector<PromptTemplate>& templates) {
    for (const auto& t : templates) {
        current_[t.tier] = t;
        records_[t.tier] = {t.tier, t.version, template_hash(t.text), file_name_for(t.tier), t.text};
    }
}

PromptTemplate MemoryTemplateStore::load(int tier) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = current_.find(tier);
    if (it == current_.end()) throw ConfigError("no template for tier " + std::to_string(tier));
    return it->second;
}

TemplateRecord MemoryTemplateStore::record(int tier) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(tier);
    if (it == records_.end()) throw ConfigError("no registry entry for tier " + std::to_string(tier));
    return it->second;
}

void MemoryTemplateStore::reset(int tier, const PromptTemplate& known_good) {
    std::lock_guard<std::mutex> lk(mtx_);
    current_[tier] = known_good;
}

void MemoryTemplateStore::overwrite(int tier, const std::string& text) {
    std::lock_guard<std::mutex> lk(mtx_);
    current_[tier].tier = tier;
    current_[tier].text = text;
}

// ---------- PromptSecurityManager ----------

PromptSecurityManager::PromptSecurityManager(TemplateStore& store, CanonicalFn canonical,
                                             std::size_t max_description_bytes)
    : store_(store), canonical_(std::move(canonical)), max_description_bytes_(max_description_bytes) {}

void PromptSecurityManager::check_available(int tier) {
    std::lock_guard<std::mutex> lk(mtx_);
    store_.record(tier);
    store_.load(tier);
}

PromptTemplate PromptSecurityManager::verified_template(int tier, const std::string& job_id,
                                                        std::vector<SecurityDetection>& detections) {
    std::lock_guard<std::mutex> lk(mtx_);
    TemplateRecord rec = store_.record(tier);
    PromptTemplate current = store_.load(tier);
    std::string found = template_hash(current.text);
    if (found == rec.sha256) return current;

    detections.push_back(make_detection(
        job_id, tier, "template.tier" + std::to_string(tier), DetectionCategory::Tamper,
        Severity::Critical, "tamper.template_hash",
        "expected " + rec.sha256.substr(0, 16) + " found " + found.substr(0, 16)));
    log_error("security", "template for tier " + std::to_string(tier) + " failed integrity check, restoring");

    std::vector<PromptTemplate> candidates;
    if (!rec.snapshot.empty()) candidates.push_back({tier, rec.version, rec.snapshot});
    if (canonical_) candidates.push_back(canonical_(tier));

    for (const auto& c : candidates) {
        if (template_hash(c.text) != rec.sha256) continue;
        try {
            store_.reset(tier, c);
        } catch (const ConfigError& e) {
            // the known-good copy is still used for this call
            log_error("security", std::string("template restore failed: ") + e.what());
        }
        return c;
    }
    throw ConfigError("no known-good template for tier " + std::to_string(tier));
}

std::string PromptSecurityManager::render(const std::string& template_text,
                                          const std::map<std::string, std::string>& header_values,
                                          const std::map<std::string, std::string>& body_values) {
    std::size_t marker = std::string::npos;
    std::size_t from = 0;
    while ((from = template_text.find(kBodyMarker, from)) != std::string::npos) {
        if (from == 0 || template_text[from - 1] == '\n') { marker = from; break; }
        ++from;
    }
    if (marker == std::string::npos) throw ConfigError("template has no body marker");

    std::string header = template_text.substr(0, marker);
    std::size_t body_start = template_text.find('\n', marker);
    std::string body = body_start == std::string::npos ? std::string() : template_text.substr(body_start + 1);

    if (header.find("{SECURITY_TOKEN}") == std::string::npos) {
        throw ConfigError("template header does not embed the security token");
    }
    while (!header.empty() && (header.back() == '\n' || header.back() == '\r')) header.pop_back();

    return substitute(header, header_values, "header") + "\n\n" + substitute(body, body_values, "body");
}

PreparedPrompt PromptSecurityManager::prepare(int tier, const PromptInputs& in,
                                              std::vector<SecurityDetection>& detections) {
    PromptTemplate t = verified_template(tier, in.job_id, detections);

    PreparedPrompt out;
    out.token = generate_security_token();
    out.template_version = t.version;

    std::string description = in.job_description;
    if (description.size() > max_description_bytes_) {
        description = utf8_truncate(description, max_description_bytes_) + "...";
    }

    std::map<std::string, std::string> header{{"SECURITY_TOKEN", out.token}};
    std::map<std::string, std::string> body{
        {"SECURITY_TOKEN", out.token},
        {"JOB_ID", in.job_id},
        {"JOB_TITLE", in.job_title},
        {"JOB_DESCRIPTION", description},
        {"PRIOR_CONTEXT", in.prior_context.empty() ? std::string("None") : in.prior_context}
    };
    out.text = render(t.text, header, body);
    return out;
}
