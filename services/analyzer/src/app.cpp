#include "../include/app.hpp"
#include "../include/prompt_templates.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {
void ensure_parent(const std::string& path) {
    if (path.empty() || path == ":memory:") return;
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) throw ConfigError("cannot create " + parent.string() + ": " + ec.message());
}
}

std::unique_ptr<AnalyzerApp> make_app(const AnalyzerConfig& cfg) {
    auto app = std::make_unique<AnalyzerApp>();
    app->cfg = cfg;
    ensure_parent(cfg.db_path);
    ensure_parent(cfg.incident_log);
    app->store = std::make_unique<AnalysisStore>(cfg.db_path);
    app->llm = std::make_unique<OllamaClient>(cfg.ollama);
    if (cfg.prompt_dir.empty()) {
        app->templates = std::make_unique<MemoryTemplateStore>(builtin_templates());
    } else {
        app->templates = std::make_unique<FileTemplateStore>(cfg.prompt_dir);
    }
    app->orchestrator = std::make_unique<Orchestrator>(app->cfg, *app->store, *app->llm, *app->templates);
    return app;
}

std::size_t import_jobs_jsonl(AnalysisStore& store, const std::string& path, std::vector<std::string>& errors) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot read " + path);

    std::size_t imported = 0;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            errors.push_back("line " + std::to_string(lineno) + ": not a JSON object");
            continue;
        }
        Job job;
        try {
            job.id = j.value("id", std::string());
            job.title = j.value("title", std::string());
            job.company = j.value("company", std::string());
            job.source = j.value("source", std::string());
            job.description = j.value("description", std::string());
        } catch (const json::type_error& e) {
            errors.push_back("line " + std::to_string(lineno) + ": " + e.what());
            continue;
        }
        if (job.id.empty()) {
            errors.push_back("line " + std::to_string(lineno) + ": missing id");
            continue;
        }
        if (!store.add_job(job)) {
            errors.push_back("line " + std::to_string(lineno) + ": job " + job.id + " already ingested, kept stored copy");
            continue;
        }
        ++imported;
    }
    return imported;
}
