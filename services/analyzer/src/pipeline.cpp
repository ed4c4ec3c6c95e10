#include "../include/pipeline.hpp"

using json = nlohmann::json;

const char* to_string(FailureKind k) {
    switch (k) {
        case FailureKind::None: return "none";
        case FailureKind::Transient: return "transient";
        case FailureKind::Permanent: return "permanent";
        case FailureKind::Structural: return "structural";
        case FailureKind::TokenMismatch: return "token-mismatch";
    }
    return "none";
}

AnalysisPipeline::AnalysisPipeline(LlmClient& llm, PromptSecurityManager& prompts,
                                   const ResponseSanitizer& sanitizer, IncidentLogger& incidents)
    : llm_(llm), prompts_(prompts), sanitizer_(sanitizer), incidents_(incidents) {}

std::optional<std::string> AnalysisPipeline::extract_json(const std::string& text) {
    auto first = text.find('{');
    auto last = text.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) return std::nullopt;
    return text.substr(first, last - first + 1);
}

PipelineResult AnalysisPipeline::run(const Job& job, int tier, const std::string& prior_context,
                                     const std::string& model, int max_output_tokens, int attempt) {
    PipelineResult res;
    res.session.job_id = job.id;
    res.session.tier = tier;
    res.session.model = model;
    res.session.attempt = attempt;
    res.session.created_at = epoch_micros();

    auto finish = [&](FailureKind kind, const std::string& error) -> PipelineResult& {
        res.ok = kind == FailureKind::None;
        res.failure = kind;
        res.error = error;
        res.session.outcome = res.ok ? Outcome::Success : Outcome::Failed;
        res.session.error = error;
        res.session.completed_at = epoch_micros();
        incidents_.record_all(res.detections);
        return res;
    };

    PromptInputs in{job.id, job.title, job.description, prior_context};
    PreparedPrompt prompt;
    try {
        prompt = prompts_.prepare(tier, in, res.detections);
    } catch (const ConfigError&) {
        incidents_.record_all(res.detections);
        throw;
    }
    res.session.token_prefix = token_prefix(prompt.token);
    res.session.template_version = prompt.template_version;

    LlmResponse reply;
    try {
        reply = llm_.generate({prompt.text, model, max_output_tokens});
    } catch (const LlmTransportError& e) {
        return finish(e.transient() ? FailureKind::Transient : FailureKind::Permanent, e.what());
    }
    res.prompt_tokens = reply.prompt_tokens;
    res.completion_tokens = reply.completion_tokens;

    auto body = extract_json(reply.text);
    if (!body) return finish(FailureKind::Structural, "no JSON object in response");
    json doc = json::parse(*body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return finish(FailureKind::Structural, "response is not a JSON object");
    }

    if (!tokens_.validate(doc, prompt.token, job.id, tier, res.detections)) {
        return finish(FailureKind::TokenMismatch, "security token missing or mismatched");
    }

    ValidationReport report = validate_structure(doc, tier_schema(tier));
    if (!report.ok) {
        std::string msg = "schema: " + report.errors.front();
        if (report.errors.size() > 1) msg += " (+" + std::to_string(report.errors.size() - 1) + " more)";
        return finish(FailureKind::Structural, msg);
    }
    if (doc.at("job_id").get<std::string>() != job.id) {
        return finish(FailureKind::Structural, "response is for job " + doc.at("job_id").get<std::string>());
    }

    SanitizeResult clean = sanitizer_.sanitize(doc, job.id, tier);
    for (auto& d : clean.detections) res.detections.push_back(std::move(d));
    res.warnings = std::move(clean.warnings);
    clean.value.erase(RoundTripTokenValidator::kTokenField);
    res.payload = std::move(clean.value);
    res.analysis = to_analysis(tier, res.payload);
    return finish(FailureKind::None, "");
}
