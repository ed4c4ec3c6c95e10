#pragma once
#include "analysis_store.hpp"
#include "config.hpp"
#include "model_selector.hpp"
#include "pipeline.hpp"
#include "rate_limiter.hpp"
#include "retry_policy.hpp"
#include "window_queue.hpp"
#include "../../../shared/cpp/security/include/input_sanitizer.hpp"
#include "../../../shared/cpp/security/include/pattern_library.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

struct BatchSummary {
    int tier{0};
    std::size_t selected{0};
    std::size_t success{0};
    std::size_t fallback{0};
    std::size_t failed{0};
    std::size_t skipped{0};
    std::size_t suppressed{0};
    std::size_t pending{0};       // selected but not reached before an abort
    std::size_t tamper{0};
    std::size_t token_mismatch{0};
    std::size_t detections{0};
    long prompt_tokens{0};
    long completion_tokens{0};
    bool aborted{false};
    std::string abort_reason;
    int64_t started_at{0};
    int64_t finished_at{0};

    nlohmann::json to_json() const;
};

struct PipelineStatus {
    StoreStatus store;
    std::size_t fully_analyzed{0};
    bool running{false};
    WindowSnapshot window;

    nlohmann::json to_json() const;
};

// Thrown by run_tier when another window holds the orchestrator.
class WindowBusyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Orchestrator {
public:
    Orchestrator(const AnalyzerConfig& cfg, AnalysisStore& store, LlmClient& llm, TemplateStore& templates);

    // Processes up to `batch_size` jobs eligible for `tier`. Only one window
    // runs at a time; a second caller gets WindowBusyError. Throws
    // ConfigError/StoreError on fatal setup errors.
    BatchSummary run_tier(int tier, std::size_t batch_size);
    // Tiers 1, 2, 3 in order; stops after an aborted window.
    std::vector<BatchSummary> run_all(std::size_t batch_size);

    // Stops dispatching; in-flight jobs finish, the rest stay pending.
    void abort(const std::string& reason);
    bool running() const { return running_.load(); }

    PipelineStatus status();
    std::size_t requeue(int tier, const std::string& job_id = {});

    const IncidentLogger& incidents() const { return incidents_; }

private:
    struct Window;

    void worker_loop(Window& w);
    void process_job(Window& w, const std::string& job_id);
    Outcome analyze(Window& w, const Job& job, const std::string& context, int& attempts,
                    std::vector<SecurityDetection>& detections);
    bool suppressed_source(Window& w, const Job& job, std::vector<SecurityDetection>& detections);
    std::string context_for(const std::string& job_id, int tier);
    void count_call(Window& w, const PipelineResult& r);

    AnalyzerConfig cfg_;
    AnalysisStore& store_;
    LlmClient& llm_;

    PatternLibrary patterns_;
    InputSanitizer input_;
    ResponseSanitizer sanitizer_;
    IncidentLogger incidents_;
    PromptSecurityManager prompts_;
    AnalysisPipeline pipeline_;
    RetryPolicy retry_;
    TokenBucket bucket_;

    std::mutex run_mtx_;
    std::atomic<bool> running_{false};
    std::atomic<bool> abort_{false};
    std::mutex abort_mtx_;
    std::string abort_reason_;
    std::shared_ptr<WindowQueue> queue_;
    std::mutex queue_mtx_;
};
