#include "../include/orchestrator.hpp"
#include "../include/prompt_templates.hpp"
#include "../../../shared/cpp/security/include/log.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace {
SanitizerPolicy policy_from(const AnalyzerConfig& cfg) {
    SanitizerPolicy p;
    p.max_string_length = cfg.max_string_length;
    return p;
}

struct RunningFlag {
    std::atomic<bool>& flag;
    explicit RunningFlag(std::atomic<bool>& f) : flag(f) { flag = true; }
    ~RunningFlag() { flag = false; }
};
}

json BatchSummary::to_json() const {
    return {
        {"tier", tier},
        {"selected", selected},
        {"success", success},
        {"fallback", fallback},
        {"failed", failed},
        {"skipped", skipped},
        {"suppressed", suppressed},
        {"pending", pending},
        {"tamper", tamper},
        {"token_mismatch", token_mismatch},
        {"detections", detections},
        {"prompt_tokens", prompt_tokens},
        {"completion_tokens", completion_tokens},
        {"aborted", aborted},
        {"abort_reason", abort_reason},
        {"started_at", started_at},
        {"finished_at", finished_at}
    };
}

json PipelineStatus::to_json() const {
    json tiers = json::array();
    for (int t = 1; t <= kTierCount; ++t) {
        tiers.push_back({
            {"tier", t},
            {"pending", store.pending[t - 1]},
            {"done", store.done[t - 1]},
            {"failed", store.failed[t - 1]}
        });
    }
    auto items = [](const std::vector<WindowItem>& v) {
        json a = json::array();
        for (const auto& i : v) a.push_back({{"job_id", i.job_id}, {"tier", i.tier}});
        return a;
    };
    return {
        {"jobs", store.jobs},
        {"fully_analyzed", fully_analyzed},
        {"tiers", tiers},
        {"detections", store.detections},
        {"requests_today", store.requests_today},
        {"running", running},
        {"window", {{"queued", items(window.queued)}, {"inflight", items(window.inflight)}}}
    };
}

struct Orchestrator::Window {
    int tier{0};
    ModelChoice model;
    std::string fallback_model;
    std::shared_ptr<WindowQueue> queue;
    std::chrono::steady_clock::time_point deadline;

    std::mutex mtx;
    BatchSummary summary;
    std::exception_ptr fatal;
};

Orchestrator::Orchestrator(const AnalyzerConfig& cfg, AnalysisStore& store, LlmClient& llm,
                           TemplateStore& templates)
    : cfg_(cfg),
      store_(store),
      llm_(llm),
      input_(patterns_, cfg_.unpunctuated),
      sanitizer_(patterns_, policy_from(cfg_)),
      incidents_(&store_, cfg_.incident_log),
      prompts_(templates, builtin_template, cfg_.max_description_bytes),
      pipeline_(llm_, prompts_, sanitizer_, incidents_),
      retry_(cfg_.retry),
      bucket_(cfg_.requests_per_minute, cfg_.burst) {}

void Orchestrator::abort(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lk(abort_mtx_);
        if (!abort_.load()) abort_reason_ = reason;
        abort_ = true;
    }
    bucket_.wake_all();
    log_info("analyzer", "abort requested: " + reason);
}

std::size_t Orchestrator::requeue(int tier, const std::string& job_id) {
    if (!valid_tier(tier)) throw std::invalid_argument("tier out of range: " + std::to_string(tier));
    std::size_t n = store_.requeue(tier, job_id);
    log_info("analyzer", "requeued " + std::to_string(n) + " job(s) for tier " + std::to_string(tier));
    return n;
}

PipelineStatus Orchestrator::status() {
    PipelineStatus s;
    s.store = store_.status();
    s.fully_analyzed = s.store.done[kTierCount - 1];
    s.running = running_.load();
    std::lock_guard<std::mutex> lk(queue_mtx_);
    if (queue_) s.window = queue_->snapshot();
    return s;
}

std::string Orchestrator::context_for(const std::string& job_id, int tier) {
    std::vector<TierAnalysis> earlier;
    for (int t = 1; t < tier; ++t) {
        auto raw = store_.payload(job_id, t);
        if (!raw) throw StoreError("missing tier " + std::to_string(t) + " payload for job " + job_id);
        json doc = json::parse(*raw, nullptr, false);
        if (doc.is_discarded()) throw StoreError("corrupt tier " + std::to_string(t) + " payload for job " + job_id);
        earlier.push_back(to_analysis(t, doc));
    }
    return prior_context(earlier);
}

void Orchestrator::count_call(Window& w, const PipelineResult& r) {
    store_.record_session(r.session);
    store_.record_usage(1, r.prompt_tokens, r.completion_tokens);

    std::lock_guard<std::mutex> lk(w.mtx);
    w.summary.prompt_tokens += r.prompt_tokens;
    w.summary.completion_tokens += r.completion_tokens;
    w.summary.detections += r.detections.size();
    for (const auto& d : r.detections) {
        if (d.category == DetectionCategory::Tamper) ++w.summary.tamper;
        if (d.category == DetectionCategory::TokenMismatch) ++w.summary.token_mismatch;
    }
}

bool Orchestrator::suppressed_source(Window& w, const Job& job, std::vector<SecurityDetection>& detections) {
    InputScanResult scan = input_.scan(job.id, job.title + "\n" + job.description);
    incidents_.record_all(scan.detections);
    {
        std::lock_guard<std::mutex> lk(w.mtx);
        w.summary.detections += scan.detections.size();
    }
    detections.insert(detections.end(), scan.detections.begin(), scan.detections.end());

    if (!scan.unpunctuated || job.source.empty()) return false;
    int flagged = store_.flag_source(job.source);
    if (cfg_.suppress_source_after <= 0 || flagged < cfg_.suppress_source_after) return false;

    log_error("security", "suppressing job " + job.id + ": source " + job.source + " flagged " +
                              std::to_string(flagged) + " times");
    return true;
}

Outcome Orchestrator::analyze(Window& w, const Job& job, const std::string& context, int& attempts,
                              std::vector<SecurityDetection>& detections) {
    auto acquire = [&]() {
        if (abort_.load()) return false;
        if (store_.requests_today() >= cfg_.daily_request_quota) {
            abort("daily request quota reached");
            return false;
        }
        return bucket_.acquire(abort_);
    };
    auto commit = [&](const PipelineResult& r, const std::string& model) {
        std::string payload = r.payload.dump(-1, ' ', false, json::error_handler_t::replace);
        return store_.commit_tier(job.id, w.tier, payload, model, r.prompt_tokens, r.completion_tokens);
    };
    auto call = [&](const std::string& model) {
        ++attempts;
        PipelineResult r = pipeline_.run(job, w.tier, context, model, w.model.max_output_tokens, attempts);
        count_call(w, r);
        detections.insert(detections.end(), r.detections.begin(), r.detections.end());
        if (!r.ok) {
            log_error("analyzer", "job " + job.id + " tier " + std::to_string(w.tier) + " attempt " +
                                      std::to_string(attempts) + " " + to_string(r.failure) + ": " + r.error);
        }
        return r;
    };

    FailureKind last = FailureKind::None;
    int structural = 0;
    for (int n = 1; n <= retry_.max_attempts(); ++n) {
        if (!acquire()) return Outcome::Pending;
        PipelineResult r = call(w.model.model);
        if (r.ok) return commit(r, w.model.model) ? Outcome::Success : Outcome::Skipped;

        last = r.failure;
        if (last == FailureKind::Permanent) break;
        if (last == FailureKind::Structural && ++structural >= retry_.structural_attempts()) break;
        if (n < retry_.max_attempts()) retry_.wait(n);
    }

    if (last == FailureKind::Transient && !w.fallback_model.empty() && w.fallback_model != w.model.model) {
        if (!acquire()) return Outcome::Pending;
        PipelineResult r = call(w.fallback_model);
        if (r.ok) return commit(r, w.fallback_model) ? Outcome::Fallback : Outcome::Skipped;
    }

    store_.mark_failed(job.id, w.tier);
    return Outcome::Failed;
}

void Orchestrator::process_job(Window& w, const std::string& job_id) {
    auto job = store_.job(job_id);
    TierFlags f = store_.flags(job_id);
    int t = w.tier;
    // re-checked at dispatch: another window may have moved the job on
    bool eligible = job && !f.done[t - 1] && !f.failed[t - 1] && (t == 1 || f.done[t - 2]);
    if (!eligible) {
        std::lock_guard<std::mutex> lk(w.mtx);
        ++w.summary.skipped;
        return;
    }

    std::vector<SecurityDetection> detections;
    int attempts = 0;
    Outcome outcome;
    if (t == 1 && suppressed_source(w, *job, detections)) {
        store_.mark_failed(job_id, t);
        outcome = Outcome::Suppressed;
    } else {
        std::string context = t > 1 ? context_for(job_id, t) : std::string();
        outcome = analyze(w, *job, context, attempts, detections);
    }

    {
        std::lock_guard<std::mutex> lk(w.mtx);
        switch (outcome) {
            case Outcome::Success: ++w.summary.success; break;
            case Outcome::Fallback: ++w.summary.fallback; break;
            case Outcome::Failed: ++w.summary.failed; break;
            case Outcome::Skipped: ++w.summary.skipped; break;
            case Outcome::Suppressed: ++w.summary.suppressed; break;
            case Outcome::Pending: ++w.summary.pending; break;
        }
    }
    incidents_.summarize({job_id, t, to_string(outcome), attempts, detections});
}

void Orchestrator::worker_loop(Window& w) {
    while (!abort_.load()) {
        if (std::chrono::steady_clock::now() > w.deadline) {
            abort("window timeout");
            break;
        }
        auto item = w.queue->dequeue();
        if (!item) break;
        try {
            process_job(w, item->job_id);
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lk(w.mtx);
                if (!w.fatal) w.fatal = std::current_exception();
            }
            w.queue->complete(item->job_id);
            abort(std::string("fatal: ") + e.what());
            break;
        }
        w.queue->complete(item->job_id);
    }
}

BatchSummary Orchestrator::run_tier(int tier, std::size_t batch_size) {
    if (!valid_tier(tier)) throw std::invalid_argument("tier out of range: " + std::to_string(tier));
    std::unique_lock<std::mutex> lk(run_mtx_, std::try_to_lock);
    if (!lk.owns_lock()) throw WindowBusyError("a processing window is already running");

    {
        std::lock_guard<std::mutex> alk(abort_mtx_);
        abort_ = false;
        abort_reason_.clear();
    }
    RunningFlag flag(running_);

    Window w;
    w.tier = tier;
    w.summary.tier = tier;
    w.summary.started_at = epoch_micros();

    prompts_.check_available(tier);

    std::vector<std::string> ids = store_.backlog(tier, batch_size);
    w.summary.selected = ids.size();
    long remaining = cfg_.daily_request_quota - store_.requests_today();
    w.model = select_model(cfg_, tier, store_.backlog_size(tier), remaining);
    w.fallback_model = cfg_.tiers[tier - 1].fallback_model;
    w.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(cfg_.window_timeout_seconds);

    w.queue = std::make_shared<WindowQueue>();
    for (const auto& id : ids) w.queue->enqueue({id, tier});
    {
        std::lock_guard<std::mutex> qlk(queue_mtx_);
        queue_ = w.queue;
    }

    log_info("analyzer", "tier " + std::to_string(tier) + " window: " + std::to_string(ids.size()) +
                             " job(s), model " + w.model.model + (w.model.conserving ? " (conserving quota)" : ""));

    std::size_t n = std::min<std::size_t>((std::size_t)cfg_.workers, ids.size());
    std::vector<std::thread> workers;
    workers.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        workers.emplace_back([this, &w] { worker_loop(w); });
    }
    for (auto& th : workers) th.join();

    {
        std::lock_guard<std::mutex> qlk(queue_mtx_);
        queue_.reset();
    }
    w.summary.pending += w.queue->cancel_queued();
    w.summary.finished_at = epoch_micros();
    {
        std::lock_guard<std::mutex> alk(abort_mtx_);
        w.summary.aborted = abort_.load();
        w.summary.abort_reason = abort_reason_;
    }

    if (w.fatal) std::rethrow_exception(w.fatal);

    const BatchSummary& s = w.summary;
    log_info("analyzer", "tier " + std::to_string(tier) + " done: success=" + std::to_string(s.success) +
                             " fallback=" + std::to_string(s.fallback) + " failed=" + std::to_string(s.failed) +
                             " skipped=" + std::to_string(s.skipped) + " suppressed=" + std::to_string(s.suppressed) +
                             " pending=" + std::to_string(s.pending) + " detections=" + std::to_string(s.detections));
    if (cfg_.alert_threshold > 0 && s.tamper + s.token_mismatch >= (std::size_t)cfg_.alert_threshold) {
        log_error("security", "ALERT: " + std::to_string(s.tamper) + " tamper and " +
                                  std::to_string(s.token_mismatch) + " token-mismatch detections in tier " +
                                  std::to_string(tier) + " window");
    }
    return w.summary;
}

std::vector<BatchSummary> Orchestrator::run_all(std::size_t batch_size) {
    std::vector<BatchSummary> out;
    for (int tier = 1; tier <= kTierCount; ++tier) {
        out.push_back(run_tier(tier, batch_size));
        if (out.back().aborted) break;
    }
    return out;
}
