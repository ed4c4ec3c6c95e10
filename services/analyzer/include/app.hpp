#pragma once
#include "analysis_store.hpp"
#include "config.hpp"
#include "orchestrator.hpp"
#include <memory>
#include <string>
#include <vector>

// Everything a front end (CLI or trigger daemon) needs, wired from one config.
struct AnalyzerApp {
    AnalyzerConfig cfg;
    std::unique_ptr<AnalysisStore> store;
    std::unique_ptr<LlmClient> llm;
    std::unique_ptr<TemplateStore> templates;
    std::unique_ptr<Orchestrator> orchestrator;
};

std::unique_ptr<AnalyzerApp> make_app(const AnalyzerConfig& cfg);

// One JSON object per line: id (required), title, company, source, description.
// Bad lines and ids already stored are reported in `errors` and skipped.
std::size_t import_jobs_jsonl(AnalysisStore& store, const std::string& path, std::vector<std::string>& errors);
