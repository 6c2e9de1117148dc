// ==============================================================================
// orchestrator.cpp - Single / batch циклы, продвижение версий, dry run
// ==============================================================================
//
// Продвижение версии:
// 1. PatchGate применяет кандидатов к RuleStore (upsert)
// 2. VersionManager тегирует получившийся набор
// 3. SafetyGateRunner проверяет кандидата
// 4. all_passed -> replace_all(кандидат), иначе возврат снимка до цикла
//
// PersistenceError на любом шаге останавливает цикл и пробрасывается.
//
// ==============================================================================

#include <lexrefine/executor.hpp>
#include <lexrefine/orchestrator.hpp>
#include <lexrefine/output.hpp>

#include <algorithm>
#include <cstdio>
#include <set>
#include <stdexcept>

namespace lexrefine::orchestrator {

namespace {

std::string format_ratio(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += sep;
        }
        out += item;
    }
    return out;
}

void merge_usage(std::map<std::string, std::uint64_t>& total,
                 const std::map<std::string, std::uint64_t>& delta) {
    for (const auto& [rule_id, count] : delta) {
        total[rule_id] += count;
    }
}

}  // namespace

Orchestrator::Orchestrator(Services services, Options options)
    : services_(std::move(services)),
      options_(std::move(options)),
      telemetry_(services_.telemetry ? *services_.telemetry : null_telemetry_),
      log_(services_.log),
      rollback_monitor_(options_.rollback, services_.log) {
    if (!services_.evaluator) {
        throw std::invalid_argument("orchestrator requires an evaluator");
    }
}

std::size_t Orchestrator::consecutive_passes() const {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    return consecutive_passes_;
}

std::optional<BatchCycleReport> Orchestrator::last_cycle() const {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    return last_cycle_;
}

void Orchestrator::alert(const std::string& rule_name, const std::string& severity,
                         const std::string& message) {
    telemetry_.record_alert(rule_name, severity, message);
    if (log_) {
        log_->warn("[" + rule_name + "] " + message);
    }
}

// ----------------------------------------------------------------------------
// Per-case processing
// ----------------------------------------------------------------------------

std::shared_ptr<const engine::Program> Orchestrator::pin_program() const {
    auto snapshot = services_.store.snapshot();
    return services_.engine.prepare(snapshot->rules, std::nullopt, snapshot->version);
}

CaseOutcome Orchestrator::process_case(const corpus::DocumentCase& c,
                                       const engine::Program& program) {
    CaseOutcome out;
    out.case_id = c.case_id;
    auto start = std::chrono::steady_clock::now();

    try {
        auto result = services_.engine.apply(c.content, program);
        out.output = std::move(result.text);
        out.stats = std::move(result.stats);
        out.evaluation = evaluator::evaluate_with_timeout(
            services_.evaluator, c.content, out.output, c.to_metadata(), options_.evaluator_timeout);
        out.success = out.evaluation.ok;
        if (!out.success) {
            out.error = out.evaluation.errors.empty() ? "evaluator failure"
                                                      : out.evaluation.errors.front();
        }
    } catch (const std::exception& e) {
        out.evaluation = evaluator::Evaluation::fallback(e.what());
        out.success = false;
        out.error = e.what();
    }

    out.elapsed_ms = std::chrono::duration<double, std::milli>(
                         std::chrono::steady_clock::now() - start)
                         .count();
    telemetry_.record_case_processed(out.elapsed_ms, out.success);
    if (!out.success && log_) {
        log_->debug("case " + out.case_id + " failed: " + out.error);
    }
    return out;
}

std::vector<CaseOutcome> Orchestrator::process_cases(
    const std::vector<corpus::DocumentCase>& cases, const engine::Program& program,
    std::size_t max_concurrent) {
    std::vector<CaseOutcome> outcomes(cases.size());
    if (cases.empty()) {
        return outcomes;
    }
    for (std::size_t i = 0; i < cases.size(); ++i) {
        outcomes[i].case_id = cases[i].case_id;
        outcomes[i].error = "case task did not complete";
    }

    BoundedExecutor executor(std::min(std::max<std::size_t>(max_concurrent, 1), cases.size()));
    for (std::size_t i = 0; i < cases.size(); ++i) {
        // Каждая задача пишет только свой слот
        executor.submit([this, &cases, &program, &outcomes, i] {
            outcomes[i] = process_case(cases[i], program);
        });
    }
    for (const auto& error : executor.wait_idle()) {
        if (log_) {
            log_->warn("case task failed: " + error);
        }
    }
    return outcomes;
}

// ----------------------------------------------------------------------------
// Patches and promotion
// ----------------------------------------------------------------------------

void Orchestrator::ensure_registered() {
    auto snapshot = services_.store.snapshot();
    if (services_.versions.find(snapshot->version)) {
        services_.versions.restore(snapshot->version);
    } else {
        services_.versions.adopt(snapshot->version, snapshot->rules, "loaded from store");
    }
}

void Orchestrator::restore_version(const std::shared_ptr<const store::RuleSet>& target) {
    if (!services_.versions.restore(target->version)) {
        services_.versions.adopt(target->version, target->rules, "restored");
    }
    try {
        services_.store.replace_all(target->rules, target->version);
    } catch (const store::PersistenceError& e) {
        services_.store.reset_in_memory(target);
        alert("orchestrator", "critical",
              "could not persist rollback to " + target->version + ": " + e.what());
        throw;
    }
}

patch::ApplyReport Orchestrator::apply_suggestions(
    const std::vector<evaluator::RawSuggestion>& raw, patch::SynthesisReport* synthesis) {
    patch::SynthesisReport report = services_.synthesizer.synthesize(raw);
    if (log_) {
        log_->debug("synthesis: " + std::to_string(report.candidates.size()) + " candidates, " +
                    std::to_string(report.below_threshold) + " below threshold, " +
                    std::to_string(report.duplicates) + " duplicates, " +
                    std::to_string(report.malformed) + " malformed");
    }
    auto applied = services_.patch_gate.auto_apply(report.candidates, options_.auto_apply_threshold);
    if (synthesis) {
        *synthesis = std::move(report);
    }
    return applied;
}

PromotionOutcome Orchestrator::promote(const std::shared_ptr<const store::RuleSet>& before,
                                       version::Bump bump, const std::string& description) {
    PromotionOutcome outcome;
    outcome.attempted = true;

    auto current = services_.store.snapshot();
    auto record = services_.versions.tag(current->rules, description, bump);
    outcome.version = record.version;

    store::RuleSet candidate{record.version, current->rules};
    safety::GateReport report = services_.gates.run_all(candidate);

    try {
        if (report.all_passed) {
            services_.store.replace_all(current->rules, record.version);
            outcome.promoted = true;
            if (log_) {
                log_->info("promoted rules " + before->version + " -> " + record.version);
            }
        } else {
            restore_version(before);
            std::string failed_gate =
                report.results.empty() ? "unknown" : safety::to_string(report.results.back().gate_type);
            alert("safety_gates", "warning",
                  "version " + record.version + " failed " + failed_gate + " gate, " +
                      before->version + " stays active");
        }
    } catch (const store::PersistenceError&) {
        services_.store.reset_in_memory(before);
        services_.versions.restore(before->version);
        throw;
    }

    outcome.gates = std::move(report);
    return outcome;
}

// ----------------------------------------------------------------------------
// Single case
// ----------------------------------------------------------------------------

SingleCaseResult Orchestrator::run_single(const corpus::DocumentCase& c) {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    ensure_registered();

    auto program = pin_program();
    CaseOutcome outcome = process_case(c, *program);

    auto usage = outcome.stats.usage();
    if (!usage.empty()) {
        services_.store.record_usage(usage);
    }
    auto before = services_.store.snapshot();

    SingleCaseResult result;
    result.case_id = c.case_id;
    result.diff_summary = diff_summary(c.content, outcome.output);
    result.token_reduction_pct = token_reduction_pct(c.content, outcome.output);

    const auto& metrics = outcome.evaluation.metrics;
    result.passed = outcome.success && metrics.parsing_errors == 0 &&
                    services_.gates.thresholds().quality_ok(metrics);

    if (result.passed) {
        ++consecutive_passes_;
        if (log_) {
            log_->info("case " + c.case_id + " passed, consecutive passes: " +
                       std::to_string(consecutive_passes_));
        }
    } else {
        consecutive_passes_ = 0;
        if (log_) {
            log_->warn("case " + c.case_id + " failed quality check (quality " +
                       format_ratio(metrics.quality_score()) + ")");
        }
        if (!outcome.evaluation.suggestions.empty()) {
            result.patches = apply_suggestions(outcome.evaluation.suggestions);
            if (result.patches.persistence_failed) {
                restore_version(before);
                throw store::PersistenceError("rule persistence failed while patching case " +
                                              c.case_id);
            }
            if (result.patches.changed_count() > 0) {
                result.promotion =
                    promote(before, version::Bump::Patch, "auto patch: case " + c.case_id);
            }
        }
    }

    result.consecutive_passes = consecutive_passes_;
    result.ready_for_batch = consecutive_passes_ >= options_.consecutive_passes_for_batch;
    if (result.ready_for_batch && log_) {
        log_->info(std::to_string(consecutive_passes_) +
                   " consecutive passes, ready for batch scale");
    }

    result.output = std::move(outcome.output);
    result.stats = std::move(outcome.stats);
    result.evaluation = std::move(outcome.evaluation);
    return result;
}

// ----------------------------------------------------------------------------
// Batch cycle
// ----------------------------------------------------------------------------

BatchCycleReport Orchestrator::run_batch_cycle(std::size_t sample_size) {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    ensure_registered();

    if (sample_size == 0) {
        sample_size = options_.initial_batch_size;
    }
    sample_size = std::min(sample_size, options_.max_batch_size);

    BatchCycleReport report;
    report.cycle = ++cycle_count_;

    // 1. Выборка
    auto cases = services_.corpus.stratified_sample(sample_size, options_.strata);
    report.sample_size = cases.size();
    report.diversity = corpus::diversity_score(cases);

    // 2-3. Преобразование и оценка с закреплённой версией
    auto pinned = services_.store.snapshot();
    report.version_before = pinned->version;
    auto program = services_.engine.prepare(pinned->rules, std::nullopt, pinned->version);
    auto outcomes = process_cases(cases, *program, options_.max_concurrent_batch);
    report.initial = aggregate(outcomes);

    std::map<std::string, std::uint64_t> usage;
    for (const auto& o : outcomes) {
        merge_usage(usage, o.stats.usage());
    }
    if (!usage.empty()) {
        services_.store.record_usage(usage);
    }
    auto before = services_.store.snapshot();

    // 4. Кластеры ошибок; предложения берутся из случаев верхних кластеров
    report.clusters = cluster_failures(outcomes);
    std::set<std::string> focus;
    for (std::size_t i = 0; i < report.clusters.size() && i < options_.top_clusters; ++i) {
        focus.insert(report.clusters[i].error_pattern);
    }
    std::vector<evaluator::RawSuggestion> raw;
    for (const auto& o : outcomes) {
        bool in_focus = std::any_of(o.evaluation.errors.begin(), o.evaluation.errors.end(),
                                    [&focus](const std::string& e) { return focus.count(e) > 0; });
        if (in_focus) {
            raw.insert(raw.end(), o.evaluation.suggestions.begin(), o.evaluation.suggestions.end());
        }
    }

    // 5-6. Патчи, тег версии, гейты
    if (!raw.empty()) {
        report.patches = apply_suggestions(raw, &report.synthesis);
        if (report.patches.persistence_failed) {
            restore_version(before);
            throw store::PersistenceError("rule persistence failed in batch cycle " +
                                          std::to_string(report.cycle));
        }
        if (report.patches.changed_count() > 0) {
            report.promotion =
                promote(before, version::Bump::Minor,
                        "batch cycle " + std::to_string(report.cycle) + ": " +
                            std::to_string(report.patches.changed_count()) + " patches");
        }
    }

    // 7. Повторная проверка той же выборки новой версией
    if (report.promotion.promoted) {
        auto revalidation = process_cases(cases, *pin_program(), options_.max_concurrent_batch);
        report.revalidated = aggregate(revalidation);

        report.rollback = rollback_monitor_.should_rollback(report.revalidated->to_metric_map(),
                                                            report.initial.to_metric_map());
        if (report.rollback) {
            restore_version(before);
            report.rolled_back = true;
            alert("auto_rollback", "critical",
                  "version " + report.promotion.version + " rolled back to " + before->version +
                      ": " + join(report.rollback.reasons, "; "));
        } else {
            report.quality_improvement =
                report.revalidated->average.quality_score() - report.initial.average.quality_score();
            report.error_reduction = report.initial.error_rate - report.revalidated->error_rate;
        }
    }

    // Решение о масштабе
    report.significant = report.promotion.promoted && !report.rolled_back &&
                         (report.quality_improvement >= options_.min_quality_improvement ||
                          report.error_reduction >= options_.min_error_reduction);
    if (report.significant) {
        no_improvement_count_ = 0;
        report.next_action = NextAction::ScaleUp;
        report.next_sample_size = std::min(sample_size * 2, options_.max_batch_size);
    } else {
        ++no_improvement_count_;
        report.next_sample_size = sample_size;
        report.next_action = no_improvement_count_ >= options_.stabilize_after
                                 ? NextAction::Stabilized
                                 : NextAction::RetrySameScale;
    }
    report.no_improvement_count = no_improvement_count_;
    report.version_after = services_.store.version();

    const BatchMetrics& final_metrics = report.final_metrics();
    if (final_metrics.cases > 0 && services_.gates.thresholds().quality_ok(final_metrics.average)) {
        services_.versions.mark_stable(report.version_after, final_metrics.to_metric_map());
    }

    if (log_) {
        log_->info("batch cycle " + std::to_string(report.cycle) + ": " +
                   std::to_string(report.sample_size) + " cases, quality " +
                   format_ratio(final_metrics.average.quality_score()) + ", version " +
                   report.version_after + ", next " + to_string(report.next_action));
    }

    last_cycle_ = report;
    return report;
}

// ----------------------------------------------------------------------------
// Readiness and dry run
// ----------------------------------------------------------------------------

Readiness Orchestrator::check_readiness() const {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    Readiness r;

    if (!last_cycle_) {
        r.reasons.emplace_back("no recent batch results");
    } else {
        const BatchMetrics& m = last_cycle_->final_metrics();
        if (m.cases == 0 || !services_.gates.thresholds().quality_ok(m.average)) {
            r.reasons.emplace_back("quality thresholds not met in latest batch");
        }
        bool regression = last_cycle_->rolled_back;
        if (const auto& gates = last_cycle_->promotion.gates) {
            const auto* reg = gates->find(safety::GateType::Regression);
            regression = regression || (reg && !reg->passed);
        }
        if (regression) {
            r.reasons.emplace_back("regression detected in latest batch");
        }
    }

    bool stable = no_improvement_count_ >= options_.stabilize_after ||
                  services_.versions.latest_stable().has_value();
    if (!stable) {
        r.reasons.emplace_back("rule set not stable");
    }

    r.ready = r.reasons.empty();
    return r;
}

DryRunStats Orchestrator::run_dry_run() {
    const DryRunCriteria& criteria = options_.dry_run;

    DryRunStats stats;
    stats.corpus_size = services_.corpus.count();
    stats.estimated_cost_usd = estimate_cost(stats.corpus_size, criteria);
    if (stats.corpus_size == 0) {
        return stats;
    }
    stats.target_size = std::max<std::size_t>(
        1, static_cast<std::size_t>(static_cast<double>(stats.corpus_size) * criteria.sample_fraction));

    auto sample = services_.corpus.stratified_sample(stats.target_size, options_.strata);
    stats.sample_size = sample.size();
    if (sample.empty() ||
        static_cast<double>(sample.size()) <
            static_cast<double>(stats.target_size) * criteria.min_sample_ratio) {
        return stats;
    }

    auto program = pin_program();
    std::size_t batch_size = std::max<std::size_t>(1, criteria.batch_size);
    double total_seconds = 0.0;
    for (std::size_t offset = 0; offset < sample.size(); offset += batch_size) {
        std::size_t end = std::min(sample.size(), offset + batch_size);
        std::vector<corpus::DocumentCase> batch(
            sample.begin() + static_cast<std::ptrdiff_t>(offset),
            sample.begin() + static_cast<std::ptrdiff_t>(end));

        auto start = std::chrono::steady_clock::now();
        auto outcomes = process_cases(batch, *program, options_.max_concurrent_full);
        total_seconds +=
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        for (const auto& o : outcomes) {
            ++(o.success ? stats.processed : stats.failed);
        }
    }

    auto n = static_cast<double>(sample.size());
    stats.failure_rate = static_cast<double>(stats.failed) / n;
    stats.avg_case_seconds = total_seconds / n;

    if (log_) {
        log_->info("dry run: " + std::to_string(stats.processed) + "/" +
                   std::to_string(stats.sample_size) + " processed, failure rate " +
                   format_ratio(stats.failure_rate));
    }
    return stats;
}

}  // namespace lexrefine::orchestrator
