#include "../include/config.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

AnalyzerConfig default_config() {
    AnalyzerConfig cfg;
    cfg.tiers[0] = {"llama3.2:3b", 2048, "mistral", ""};
    cfg.tiers[1] = {"llama3.1:8b", 1536, "mistral", "llama3.2:3b"};
    cfg.tiers[2] = {"qwen2.5:14b", 2048, "mistral", "llama3.1:8b"};
    return cfg;
}

namespace {
void read_tiers(const json& arr, AnalyzerConfig& cfg) {
    for (const auto& t : arr) {
        int tier = t.at("tier").get<int>();
        if (!valid_tier(tier)) throw ConfigError("config: tier out of range: " + std::to_string(tier));
        auto& m = cfg.tiers[tier - 1];
        m.model = t.value("model", m.model);
        m.max_output_tokens = t.value("max_output_tokens", m.max_output_tokens);
        m.fallback_model = t.value("fallback_model", m.fallback_model);
        m.conserve_model = t.value("conserve_model", m.conserve_model);
    }
}
}

AnalyzerConfig load_config(const std::string& path) {
    AnalyzerConfig cfg = default_config();
    if (!path.empty()) {
        json j;
        try {
            j = json::parse(read_text_file(path));
        } catch (const json::parse_error& e) {
            throw ConfigError("config: " + path + ": " + e.what());
        } catch (const std::runtime_error& e) {
            throw ConfigError(std::string("config: ") + e.what());
        }

        try {
            cfg.db_path = j.value("db_path", cfg.db_path);
            cfg.prompt_dir = j.value("prompt_dir", cfg.prompt_dir);
            cfg.incident_log = j.value("incident_log", cfg.incident_log);
            if (j.contains("ollama")) {
                const auto& o = j["ollama"];
                cfg.ollama.url = o.value("url", cfg.ollama.url);
                cfg.ollama.timeout_ms = o.value("timeout_ms", cfg.ollama.timeout_ms);
                cfg.ollama.temperature = o.value("temperature", cfg.ollama.temperature);
            }
            cfg.workers = j.value("workers", cfg.workers);
            cfg.requests_per_minute = j.value("requests_per_minute", cfg.requests_per_minute);
            cfg.burst = j.value("burst", cfg.burst);
            cfg.daily_request_quota = j.value("daily_request_quota", cfg.daily_request_quota);
            cfg.conserve_below = j.value("conserve_below", cfg.conserve_below);
            cfg.window_timeout_seconds = j.value("window_timeout_seconds", cfg.window_timeout_seconds);
            if (j.contains("tiers")) read_tiers(j["tiers"], cfg);
            if (j.contains("retry")) {
                const auto& r = j["retry"];
                cfg.retry.max_attempts = r.value("max_attempts", cfg.retry.max_attempts);
                cfg.retry.structural_attempts = r.value("structural_attempts", cfg.retry.structural_attempts);
                cfg.retry.base_delay_ms = r.value("base_delay_ms", cfg.retry.base_delay_ms);
                cfg.retry.max_delay_ms = r.value("max_delay_ms", cfg.retry.max_delay_ms);
                cfg.retry.jitter = r.value("jitter", cfg.retry.jitter);
            }
            if (j.contains("unpunctuated")) {
                const auto& u = j["unpunctuated"];
                cfg.unpunctuated.min_length = u.value("min_length", cfg.unpunctuated.min_length);
                cfg.unpunctuated.max_punctuation_ratio =
                    u.value("max_punctuation_ratio", cfg.unpunctuated.max_punctuation_ratio);
                cfg.unpunctuated.severity = u.value("severity", cfg.unpunctuated.severity);
            }
            cfg.max_string_length = j.value("max_string_length", cfg.max_string_length);
            cfg.max_description_bytes = j.value("max_description_bytes", cfg.max_description_bytes);
            cfg.suppress_source_after = j.value("suppress_source_after", cfg.suppress_source_after);
            cfg.alert_threshold = j.value("alert_threshold", cfg.alert_threshold);
            cfg.trigger_port = j.value("trigger_port", cfg.trigger_port);
        } catch (const json::type_error& e) {
            throw ConfigError("config: " + path + ": " + e.what());
        } catch (const json::out_of_range& e) {
            throw ConfigError("config: " + path + ": " + e.what());
        }
    }
    apply_env(cfg);
    validate_config(cfg);
    return cfg;
}

void apply_env(AnalyzerConfig& cfg) {
    cfg.ollama.url = getenv_or("OLLAMA_URL", cfg.ollama.url);
    cfg.db_path = getenv_or("JOBGUARD_DB_PATH", cfg.db_path);
    cfg.prompt_dir = getenv_or("JOBGUARD_PROMPT_DIR", cfg.prompt_dir);
    cfg.incident_log = getenv_or("JOBGUARD_INCIDENT_LOG", cfg.incident_log);
    std::string port = getenv_or("TRIGGER_PORT", "");
    if (!port.empty()) {
        try {
            cfg.trigger_port = std::stoi(port);
        } catch (const std::exception&) {
            throw ConfigError("TRIGGER_PORT is not a number: " + port);
        }
    }
}

void validate_config(const AnalyzerConfig& cfg) {
    if (cfg.workers < 1) throw ConfigError("config: workers must be at least 1");
    if (cfg.requests_per_minute <= 0) throw ConfigError("config: requests_per_minute must be positive");
    if (cfg.daily_request_quota < 1) throw ConfigError("config: daily_request_quota must be positive");
    if (cfg.retry.max_attempts < 1) throw ConfigError("config: retry.max_attempts must be at least 1");
    if (cfg.retry.structural_attempts < 1) throw ConfigError("config: retry.structural_attempts must be at least 1");
    if (cfg.max_string_length == 0) throw ConfigError("config: max_string_length must be positive");
    for (int t = 1; t <= kTierCount; ++t) {
        if (cfg.tiers[t - 1].model.empty()) {
            throw ConfigError("config: no model for tier " + std::to_string(t));
        }
    }
    Severity s;
    if (cfg.unpunctuated.severity != "auto" && !parse_severity(cfg.unpunctuated.severity, s)) {
        throw ConfigError("config: unknown unpunctuated.severity " + cfg.unpunctuated.severity);
    }
}
