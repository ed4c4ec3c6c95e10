#pragma once
#include "detection.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Template layout: a header holding the security instructions, then a line
// reading "### BODY", then the job section. The header only accepts
// {SECURITY_TOKEN}; the body accepts every placeholder below.
constexpr const char* kBodyMarker = "### BODY";

struct PromptTemplate {
    int tier{0};
    std::string version;
    std::string text;
};

struct TemplateRecord {
    int tier{0};
    std::string version;
    std::string sha256;   // of the exact template bytes
    std::string file;
    std::string snapshot; // known-good copy of the text
};

std::string sha256_hex(const std::string& data);

std::string template_hash(const std::string& text);

// "SEC_TOKEN_" followed by 32 alphanumerics from OpenSSL's CSPRNG.
std::string generate_security_token();
std::string token_prefix(const std::string& token);

class TemplateStore {
public:
    virtual ~TemplateStore() = default;
    // Current template as deployed; may have been modified by someone.
    virtual PromptTemplate load(int tier) = 0;
    virtual TemplateRecord record(int tier) = 0;
    // Overwrites the deployed template with a known-good copy.
    virtual void reset(int tier, const PromptTemplate& known_good) = 0;
};

// Templates on disk as tier<N>.txt plus prompt_registry.json.
class FileTemplateStore final : public TemplateStore {
public:
    explicit FileTemplateStore(std::string dir);

    PromptTemplate load(int tier) override;
    TemplateRecord record(int tier) override;
    void reset(int tier, const PromptTemplate& known_good) override;

    // Writes every template file and a fresh registry with hashes and snapshots.
    static void deploy(const std::string& dir, const std::vector<PromptTemplate>& templates);

    static constexpr const char* kRegistryFile = "prompt_registry.json";

private:
    std::string dir_;
    std::map<int, TemplateRecord> records_;
};

// Keeps templates in memory; used when no prompt directory is configured.
class MemoryTemplateStore final : public TemplateStore {
public:
    explicit MemoryTemplateStore(const std::vector<PromptTemplate>& templates);

    PromptTemplate load(int tier) override;
    TemplateRecord record(int tier) override;
    void reset(int tier, const PromptTemplate& known_good) override;

    // Replaces the deployed text without touching the registry.
    void overwrite(int tier, const std::string& text);

private:
    std::mutex mtx_;
    std::map<int, PromptTemplate> current_;
    std::map<int, TemplateRecord> records_;
};

struct PromptInputs {
    std::string job_id;
    std::string job_title;
    std::string job_description;
    std::string prior_context;
};

struct PreparedPrompt {
    std::string text;
    std::string token;
    std::string template_version;
};

class PromptSecurityManager {
public:
    using CanonicalFn = std::function<PromptTemplate(int)>;

    PromptSecurityManager(TemplateStore& store, CanonicalFn canonical, std::size_t max_description_bytes);

    // Verifies the template, embeds a fresh token and renders the prompt.
    // Throws ConfigError when no known-good template exists for the tier.
    PreparedPrompt prepare(int tier, const PromptInputs& in, std::vector<SecurityDetection>& detections);

    // Returns a template whose hash matches the registry, restoring the
    // deployed copy on mismatch.
    PromptTemplate verified_template(int tier, const std::string& job_id,
                                     std::vector<SecurityDetection>& detections);

    // Checks that the store and registry are usable for `tier`.
    void check_available(int tier);

    // Single pass: inserted values are never rescanned for placeholders.
    static std::string render(const std::string& template_text,
                              const std::map<std::string, std::string>& header_values,
                              const std::map<std::string, std::string>& body_values);

private:
    TemplateStore& store_;
    CanonicalFn canonical_;
    std::size_t max_description_bytes_;
    std::mutex mtx_;
};
