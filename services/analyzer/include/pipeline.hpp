#pragma once
#include "job.hpp"
#include "tier_payloads.hpp"
#include "../../../shared/cpp/llm_sdk/include/llm_client.hpp"
#include "../../../shared/cpp/security/include/incident_logger.hpp"
#include "../../../shared/cpp/security/include/prompt_security.hpp"
#include "../../../shared/cpp/security/include/response_sanitizer.hpp"
#include "../../../shared/cpp/security/include/token_validator.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class FailureKind { None, Transient, Permanent, Structural, TokenMismatch };

const char* to_string(FailureKind k);

struct PipelineResult {
    bool ok{false};
    FailureKind failure{FailureKind::None};
    std::string error;
    nlohmann::json payload;             // sanitized, without the token; set when ok
    std::optional<TierAnalysis> analysis;
    std::vector<SecurityDetection> detections;
    std::vector<std::string> warnings;
    long prompt_tokens{0};
    long completion_tokens{0};
    AnalysisSession session;
};

// One job, one tier, one LLM call: prompt -> call -> parse -> token check ->
// schema check -> sanitize. Persistence and retries belong to the caller.
class AnalysisPipeline {
public:
    AnalysisPipeline(LlmClient& llm, PromptSecurityManager& prompts,
                     const ResponseSanitizer& sanitizer, IncidentLogger& incidents);

    // Throws ConfigError when no trustworthy template exists.
    PipelineResult run(const Job& job, int tier, const std::string& prior_context,
                       const std::string& model, int max_output_tokens, int attempt);

    // Substring from the first '{' to the last '}'.
    static std::optional<std::string> extract_json(const std::string& text);

private:
    LlmClient& llm_;
    PromptSecurityManager& prompts_;
    const ResponseSanitizer& sanitizer_;
    IncidentLogger& incidents_;
    RoundTripTokenValidator tokens_;
};
