#include "../include/llm_client.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

OllamaClient::OllamaClient(OllamaConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.url.empty() && cfg_.url.back() == '/') cfg_.url.pop_back();
}

LlmResponse OllamaClient::generate(const LlmRequest& req) {
    json body = {
        {"model", req.model},
        {"prompt", req.prompt},
        {"stream", false},
        {"format", "json"},
        {"options", {
            {"temperature", cfg_.temperature},
            {"num_predict", req.max_output_tokens}
        }}
    };

    HttpResponse r;
    try {
        r = http_post_json(cfg_.url + "/api/generate", body.dump(), cfg_.timeout_ms);
    } catch (const std::runtime_error& e) {
        throw LlmTransportError(e.what(), true);
    }

    if (r.status == 429 || r.status >= 500) {
        throw LlmTransportError("generate failed: status " + std::to_string(r.status), true);
    }
    if (r.status < 200 || r.status >= 300) {
        throw LlmTransportError("generate failed: status " + std::to_string(r.status), false);
    }

    json data;
    try {
        data = json::parse(r.body);
    } catch (const json::parse_error& e) {
        // Ollama's own envelope, not model output.
        throw LlmTransportError(std::string("unreadable generate envelope: ") + e.what(), true);
    }

    LlmResponse out;
    if (data.contains("response") && data["response"].is_string()) {
        out.text = data["response"].get<std::string>();
    }
    out.prompt_tokens = data.value("prompt_eval_count", 0L);
    out.completion_tokens = data.value("eval_count", 0L);
    return out;
}
