#pragma once
#include "../services/analyzer/include/config.hpp"
#include "../shared/cpp/llm_sdk/include/llm_client.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <regex>
#include <string>
#include <vector>

namespace testsupport {

using json = nlohmann::json;

struct TempDir {
    std::filesystem::path path;

    TempDir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("jobguard_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    std::string file(const std::string& name) const { return (path / name).string(); }
};

inline AnalyzerConfig test_config(const TempDir& dir) {
    AnalyzerConfig cfg = default_config();
    cfg.db_path = dir.file("jobguard.db");
    cfg.incident_log = dir.file("incidents.jsonl");
    cfg.workers = 1;
    cfg.requests_per_minute = 6000;
    cfg.retry.base_delay_ms = 0;
    return cfg;
}

inline std::string token_in(const std::string& prompt) {
    static const std::regex re("SEC_TOKEN_[A-Za-z0-9]{32}");
    std::smatch m;
    return std::regex_search(prompt, m, re) ? m.str(0) : std::string();
}

inline std::string job_id_in(const std::string& prompt) {
    static const std::regex re("\nID: ([^\n]*)");
    std::smatch m;
    return std::regex_search(prompt, m, re) ? m.str(1) : std::string();
}

inline int tier_in(const std::string& prompt) {
    static const std::regex re("# Tier ([1-3]) ");
    std::smatch m;
    return std::regex_search(prompt, m, re) ? std::stoi(m.str(1)) : 0;
}

// A response that passes the tier's schema.
inline json valid_doc(int tier, const std::string& token, const std::string& job_id) {
    if (tier == 1) {
        return {
            {"security_token", token},
            {"job_id", job_id},
            {"authenticity_check", {{"title_matches_role", true}, {"is_authentic", true}, {"credibility_score", 8}}},
            {"classification", {{"industry", "Software"}, {"sub_industry", "Backend"},
                                {"job_function", "Engineering"}, {"seniority_level", "Senior"}}},
            {"structured_data", {
                {"job_title", "Backend Engineer"},
                {"company_name", "Acme"},
                {"skill_requirements", {{"skills", json::array({
                    {{"skill_name", "C++"}, {"importance_rating", 90}},
                    {{"skill_name", "SQL"}, {"importance_rating", 70}}})}}},
                {"application_details", {{"application_link", "https://careers.acme.com/apply"}}}
            }}
        };
    }
    if (tier == 2) {
        return {
            {"security_token", token},
            {"job_id", job_id},
            {"stress_level_analysis", {{"estimated_stress_level", 6}, {"stress_indicators", json::array({"tight deadlines"})}}},
            {"red_flags", {{"unrealistic_expectations", {{"detected", false}}},
                           {"potential_scam_indicators", {{"detected", false}}}}},
            {"implicit_requirements", {{"unstated_skills", json::array({"on call rotation", "mentoring"})}}}
        };
    }
    return {
        {"security_token", token},
        {"job_id", job_id},
        {"prestige_analysis", {{"prestige_factor", 7}}},
        {"cover_letter_insight", {{"employer_pain_point", {{"pain_point", "scaling the platform"},
                                                           {"solution_angle", "lead with migration work"}}}}}
    };
}

// Fake model. Replays queued steps, then answers every prompt correctly.
class ScriptedLlm final : public LlmClient {
public:
    using Step = std::function<LlmResponse(const LlmRequest&)>;

    static LlmResponse valid(const LlmRequest& req) {
        json doc = valid_doc(tier_in(req.prompt), token_in(req.prompt), job_id_in(req.prompt));
        return {doc.dump(), 100, 50};
    }

    static Step edit(std::function<void(json&)> fn) {
        return [fn](const LlmRequest& req) {
            json doc = valid_doc(tier_in(req.prompt), token_in(req.prompt), job_id_in(req.prompt));
            fn(doc);
            return LlmResponse{doc.dump(), 100, 50};
        };
    }

    static Step text(const std::string& body) {
        return [body](const LlmRequest&) { return LlmResponse{body, 10, 5}; };
    }

    static Step transient() {
        return [](const LlmRequest&) -> LlmResponse { throw LlmTransportError("status 503", true); };
    }

    static Step permanent() {
        return [](const LlmRequest&) -> LlmResponse { throw LlmTransportError("status 404", false); };
    }

    void push(Step s, int times = 1) {
        std::lock_guard<std::mutex> lk(mtx_);
        for (int i = 0; i < times; ++i) steps_.push_back(s);
    }

    LlmResponse generate(const LlmRequest& req) override {
        Step s;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            prompts_.push_back(req.prompt);
            models_.push_back(req.model);
            call_times_.push_back(std::chrono::steady_clock::now());
            if (!steps_.empty()) {
                s = steps_.front();
                steps_.pop_front();
            }
        }
        return s ? s(req) : valid(req);
    }

    std::size_t calls() {
        std::lock_guard<std::mutex> lk(mtx_);
        return prompts_.size();
    }
    std::vector<std::string> prompts() {
        std::lock_guard<std::mutex> lk(mtx_);
        return prompts_;
    }
    std::vector<std::string> models() {
        std::lock_guard<std::mutex> lk(mtx_);
        return models_;
    }

    std::vector<std::chrono::steady_clock::time_point> call_times() {
        std::lock_guard<std::mutex> lk(mtx_);
        return call_times_;
    }

private:
    std::mutex mtx_;
    std::deque<Step> steps_;
    std::vector<std::chrono::steady_clock::time_point> call_times_;
    std::vector<std::string> prompts_;
    std::vector<std::string> models_;
};

}
