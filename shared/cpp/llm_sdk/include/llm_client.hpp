#pragma once
#include <stdexcept>
#include <string>

struct LlmRequest {
    std::string prompt;
    std::string model;
    int max_output_tokens{2048};
};

struct LlmResponse {
    std::string text; // raw model output, expected to be JSON
    long prompt_tokens{0};
    long completion_tokens{0};
};

// Raised for anything that prevented a usable response body from arriving.
class LlmTransportError : public std::runtime_error {
public:
    LlmTransportError(const std::string& what, bool transient)
        : std::runtime_error(what), transient_(transient) {}
    bool transient() const { return transient_; }

private:
    bool transient_;
};

// The LLM is an untrusted black box: implementations return whatever text came back.
class LlmClient {
public:
    virtual ~LlmClient() = default;
    virtual LlmResponse generate(const LlmRequest& req) = 0;
};

struct OllamaConfig {
    std::string url{"http://localhost:11434"};
    long timeout_ms{240000};
    double temperature{0.0};
};

class OllamaClient final : public LlmClient {
public:
    explicit OllamaClient(OllamaConfig cfg);
    LlmResponse generate(const LlmRequest& req) override;

private:
    OllamaConfig cfg_;
};
