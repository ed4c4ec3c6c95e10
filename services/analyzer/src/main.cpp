#include "../include/app.hpp"
#include "../include/prompt_templates.hpp"
#include "../include/util.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void usage() {
    std::cerr << "jobguard usage:\n"
              << "  run --tier N [--batch M]\n"
              << "  run-all [--batch M]\n"
              << "  status\n"
              << "  requeue --tier N [--job ID]\n"
              << "  import --file jobs.jsonl\n"
              << "  deploy-templates [--dir DIR]\n"
              << "  detections --job ID\n"
              << "common options: [--config FILE] [--db FILE] [--prompt-dir DIR] [--ollama URL]\n";
}

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];

    try {
        std::string config_path = getenv_or("JOBGUARD_CONFIG", "");
        std::string db, prompt_dir, ollama, job_id, file, dir;
        int tier = 0;
        std::size_t batch = 25;
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config" && i + 1 < argc) config_path = argv[++i];
            else if (a == "--db" && i + 1 < argc) db = argv[++i];
            else if (a == "--prompt-dir" && i + 1 < argc) prompt_dir = argv[++i];
            else if (a == "--ollama" && i + 1 < argc) ollama = argv[++i];
            else if (a == "--tier" && i + 1 < argc) tier = std::atoi(argv[++i]);
            else if (a == "--batch" && i + 1 < argc) batch = (std::size_t)std::stoul(argv[++i]);
            else if (a == "--job" && i + 1 < argc) job_id = argv[++i];
            else if (a == "--file" && i + 1 < argc) file = argv[++i];
            else if (a == "--dir" && i + 1 < argc) dir = argv[++i];
            else { usage(); return 2; }
        }

        AnalyzerConfig cfg = load_config(config_path);
        if (!db.empty()) cfg.db_path = db;
        if (!prompt_dir.empty()) cfg.prompt_dir = prompt_dir;
        if (!ollama.empty()) cfg.ollama.url = ollama;

        if (cmd == "deploy-templates") {
            std::string target = dir.empty() ? cfg.prompt_dir : dir;
            if (target.empty()) { usage(); return 2; }
            FileTemplateStore::deploy(target, builtin_templates());
            std::cout << "[OK] Deployed " << kTierCount << " templates (version " << kTemplateVersion
                      << ") to " << target << "\n";
            return 0;
        }

        CurlGlobal curl;
        auto app = make_app(cfg);

        if (cmd == "run") {
            if (!valid_tier(tier)) { usage(); return 2; }
            BatchSummary s = app->orchestrator->run_tier(tier, batch);
            std::cout << s.to_json().dump(2) << "\n";
            return s.aborted ? 3 : 0;
        } else if (cmd == "run-all") {
            nlohmann::json out = nlohmann::json::array();
            bool aborted = false;
            for (const auto& s : app->orchestrator->run_all(batch)) {
                out.push_back(s.to_json());
                aborted = aborted || s.aborted;
            }
            std::cout << out.dump(2) << "\n";
            return aborted ? 3 : 0;
        } else if (cmd == "status") {
            std::cout << app->orchestrator->status().to_json().dump(2) << "\n";
            return 0;
        } else if (cmd == "requeue") {
            if (!valid_tier(tier)) { usage(); return 2; }
            std::size_t n = app->orchestrator->requeue(tier, job_id);
            std::cout << "[OK] Requeued: " << n << "\n";
            return 0;
        } else if (cmd == "import") {
            if (file.empty()) { usage(); return 2; }
            std::vector<std::string> errors;
            std::size_t n = import_jobs_jsonl(*app->store, file, errors);
            for (const auto& e : errors) std::cerr << "[import] " << e << "\n";
            std::cout << "[OK] Imported jobs: " << n << "\n";
            return errors.empty() ? 0 : 4;
        } else if (cmd == "detections") {
            if (job_id.empty()) { usage(); return 2; }
            for (const auto& d : app->store->detections(job_id)) {
                std::cout << "tier " << d.tier << "  " << to_string(d.severity) << "  "
                          << to_string(d.category) << "/" << d.pattern_id << "  " << d.field
                          << "  " << d.sample << "\n";
            }
            return 0;
        } else {
            usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
