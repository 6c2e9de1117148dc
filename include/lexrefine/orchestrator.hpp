// ==============================================================================
// lexrefine/orchestrator.hpp - Цикл улучшения правил на трёх масштабах
// ==============================================================================
//
// Назначение:
// - Single: один документ, счётчик подряд пройденных проверок
// - Batch: стратифицированная выборка, кластеры ошибок, патчи, гейты,
//   продвижение версии, откат при деградации, решение о масштабе
// - Full: проверка готовности, 1% dry run, offset-батчи с checkpoint
// - Управление заданиями: start / stop / pause / resume / status / wait
//
// Цикл: sample -> transform -> evaluate -> synthesize -> gate -> promote
//       -> re-validate
//
// Batch всегда работает с Program, закреплённой в начале batch. Набор
// правил меняется только между batch и только одним писателем
// (cycle_mutex_). Stop и pause проверяются на границе batch.
//
// ==============================================================================

#ifndef LEXREFINE_ORCHESTRATOR_HPP
#define LEXREFINE_ORCHESTRATOR_HPP

#include <lexrefine/corpus.hpp>
#include <lexrefine/engine.hpp>
#include <lexrefine/evaluator.hpp>
#include <lexrefine/job.hpp>
#include <lexrefine/patch.hpp>
#include <lexrefine/safety.hpp>
#include <lexrefine/store.hpp>
#include <lexrefine/version.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lexrefine::output {
class Writer;
}

namespace lexrefine::orchestrator {

// ============================================================================
// Options
// ============================================================================

/// Критерии 1% dry run перед полным прогоном
struct DryRunCriteria {
    double sample_fraction = 0.01;
    std::size_t batch_size = 100;
    double min_sample_ratio = 0.9;  // доля выборки, которую нужно получить
    double max_failure_rate = 0.05;
    double max_avg_case_seconds = 10.0;
    double budget_usd = 5000.0;
    double tokens_per_case = 2000.0;
    double usd_per_1k_tokens = 0.01;
};

struct Options {
    std::size_t consecutive_passes_for_batch = 20;
    std::size_t initial_batch_size = 50;
    std::size_t max_batch_size = 5000;
    std::size_t max_concurrent_batch = 5;
    std::size_t max_concurrent_full = 10;
    std::size_t full_batch_size = 1000;
    std::chrono::milliseconds evaluator_timeout{30000};
    std::size_t stabilize_after = 3;
    double min_quality_improvement = 0.03;
    double min_error_reduction = 0.05;
    double auto_apply_threshold = 0.8;
    std::size_t top_clusters = 3;
    DryRunCriteria dry_run;
    safety::RollbackOptions rollback;
    corpus::Strata strata = corpus::Strata::defaults();
    std::filesystem::path checkpoint_path;  // пусто - без checkpoint
};

/// Внешние компоненты. Все ссылки должны пережить Orchestrator.
struct Services {
    store::RuleStore& store;
    version::VersionManager& versions;
    const engine::RuleEngine& engine;
    patch::PatchSynthesizer& synthesizer;
    patch::PatchGate& patch_gate;
    const safety::SafetyGateRunner& gates;
    std::shared_ptr<evaluator::Evaluator> evaluator;
    const corpus::CaseSource& corpus;
    Telemetry* telemetry = nullptr;  // nullptr -> NullTelemetry
    output::Writer* log = nullptr;
};

// ============================================================================
// Per-case results and aggregation
// ============================================================================

struct CaseOutcome {
    std::string case_id;
    std::string output;
    engine::Stats stats;
    evaluator::Evaluation evaluation;
    double elapsed_ms = 0.0;
    bool success = false;  // оценщик вернул результат
    std::string error;
};

/// Агрегат batch (только суммы и счётчики, порядок не важен)
struct BatchMetrics {
    evaluator::QualityMetrics average;
    std::size_t cases = 0;
    std::size_t failed = 0;        // сбой оценщика
    std::size_t with_errors = 0;   // оценщик сообщил об ошибках
    double error_rate = 0.0;       // with_errors / cases
    double avg_case_ms = 0.0;

    /// nrr, fpr, ss, token_reduction, error_rate
    safety::MetricMap to_metric_map() const;
};

BatchMetrics aggregate(const std::vector<CaseOutcome>& outcomes);

/// Кластер ошибок оценщика с одинаковым текстом
struct FailureCluster {
    std::string pattern_type;  // page_number, separator, header_footer, ...
    std::string error_pattern;
    std::size_t failure_count = 0;
    std::vector<std::string> sample_cases;
};

/// page_number | separator | header_footer | reference | whitespace | unknown
std::string classify_failure(const std::string& error_message);

/// Кластеры по убыванию failure_count (при равенстве - по тексту ошибки)
std::vector<FailureCluster> cluster_failures(const std::vector<CaseOutcome>& outcomes);

/// "Lines: a → b (+d), Characters: a → b (+d)"
std::string diff_summary(const std::string& before, const std::string& after);

/// (до - после) / до * 100 по оценке токенов, два знака после запятой
double token_reduction_pct(const std::string& before, const std::string& after);

// ============================================================================
// Cycle reports
// ============================================================================

/// Итог попытки продвинуть патчи в новую версию
struct PromotionOutcome {
    bool attempted = false;  // были реальные изменения правил
    bool promoted = false;
    std::string version;     // тегированная версия кандидата
    std::optional<safety::GateReport> gates;
};

struct SingleCaseResult {
    std::string case_id;
    std::string output;
    engine::Stats stats;
    evaluator::Evaluation evaluation;
    bool passed = false;
    std::size_t consecutive_passes = 0;
    bool ready_for_batch = false;
    std::string diff_summary;
    double token_reduction_pct = 0.0;
    patch::ApplyReport patches;
    PromotionOutcome promotion;
};

enum class NextAction { ScaleUp, RetrySameScale, Stabilized };

std::string to_string(NextAction a);

struct BatchCycleReport {
    std::size_t cycle = 0;
    std::size_t sample_size = 0;
    double diversity = 0.0;
    std::string version_before;
    std::string version_after;

    BatchMetrics initial;
    std::optional<BatchMetrics> revalidated;
    std::vector<FailureCluster> clusters;

    patch::SynthesisReport synthesis;
    patch::ApplyReport patches;
    PromotionOutcome promotion;
    safety::RollbackDecision rollback;
    bool rolled_back = false;

    double quality_improvement = 0.0;
    double error_reduction = 0.0;
    bool significant = false;

    NextAction next_action = NextAction::RetrySameScale;
    std::size_t next_sample_size = 0;
    std::size_t no_improvement_count = 0;

    /// Метрики, с которыми версия осталась после цикла
    const BatchMetrics& final_metrics() const {
        return revalidated && !rolled_back ? *revalidated : initial;
    }
};

struct Readiness {
    bool ready = false;
    std::vector<std::string> reasons;

    explicit operator bool() const { return ready; }
};

struct DryRunStats {
    std::size_t corpus_size = 0;
    std::size_t target_size = 0;
    std::size_t sample_size = 0;
    std::size_t processed = 0;
    std::size_t failed = 0;
    double failure_rate = 0.0;
    double avg_case_seconds = 0.0;
    double estimated_cost_usd = 0.0;
};

struct DryRunDecision {
    bool ready = false;
    std::vector<std::string> reasons;

    /// Причины через "; "
    std::string reason() const;

    explicit operator bool() const { return ready; }
};

/// Оценка стоимости полного прогона
double estimate_cost(std::size_t corpus_size, const DryRunCriteria& criteria);

/// Решение по статистике dry run
DryRunDecision evaluate_dry_run(const DryRunStats& stats, const DryRunCriteria& criteria);

// ============================================================================
// Result sink
// ============================================================================

/// Получатель результатов полного прогона. Вызывается из потока задания
/// после каждого batch.
class CaseSink {
public:
    virtual ~CaseSink() = default;
    virtual void record(const CaseOutcome& outcome, const std::string& version) = 0;
};

/// JSONL: {"case_id", "version", "success", "output", "metrics", "errors"}
class JsonlCaseSink : public CaseSink {
public:
    /// Дописывает в файл. Бросает std::runtime_error если файл не открыт.
    explicit JsonlCaseSink(const std::filesystem::path& path);

    void record(const CaseOutcome& outcome, const std::string& version) override;

    std::size_t written() const;

private:
    mutable std::mutex mutex_;
    std::ofstream file_;
    std::size_t written_ = 0;
};

// ============================================================================
// Orchestrator
// ============================================================================

struct StartOptions {
    std::size_t sample_size = 0;  // batch: начальный размер (0 - из Options)
    std::size_t max_cycles = 10;  // batch
    std::size_t max_cases = 0;    // single: 0 - весь корпус
    bool require_readiness = true;  // full
    bool resume_from_checkpoint = false;  // full
    CaseSink* sink = nullptr;  // full
};

class Orchestrator {
public:
    Orchestrator(Services services, Options options = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // --- Синхронные операции ------------------------------------------------

    /// Обработать один документ; при провале - патчи и продвижение версии
    SingleCaseResult run_single(const corpus::DocumentCase& c);

    /// Один цикл улучшения на стратифицированной выборке.
    /// Бросает store::PersistenceError.
    BatchCycleReport run_batch_cycle(std::size_t sample_size);

    /// Условия перехода к полному прогону
    Readiness check_readiness() const;

    /// 1% прогон без изменения правил
    DryRunStats run_dry_run();

    // --- Управление заданиями -----------------------------------------------

    /// Запустить задание в фоновом потоке. Бросает std::logic_error если
    /// другое задание ещё не завершено.
    std::string start(Scale scale, const StartOptions& options = {});

    /// Запрос остановки; вступает в силу на границе batch
    bool stop(const std::string& job_id);

    bool pause(const std::string& job_id);

    bool resume(const std::string& job_id);

    std::optional<JobSnapshot> status(const std::string& job_id) const;

    /// Дождаться завершения фонового потока
    std::optional<JobSnapshot> wait(const std::string& job_id);

    std::vector<JobSnapshot> jobs() const;

    // --- Состояние -------------------------------------------------------------

    std::size_t consecutive_passes() const;

    std::optional<BatchCycleReport> last_cycle() const;

    const Options& options() const { return options_; }

private:
    struct JobControl;

    /// Обработать документы с закреплённой Program, max_concurrent потоков
    std::vector<CaseOutcome> process_cases(const std::vector<corpus::DocumentCase>& cases,
                                           const engine::Program& program,
                                           std::size_t max_concurrent);

    CaseOutcome process_case(const corpus::DocumentCase& c, const engine::Program& program);

    /// Предложения -> кандидаты -> PatchGate. Бросает store::PersistenceError.
    patch::ApplyReport apply_suggestions(const std::vector<evaluator::RawSuggestion>& raw,
                                         patch::SynthesisReport* synthesis = nullptr);

    /// Тегировать текущий набор, прогнать гейты, продвинуть или вернуть
    /// снимок before. Вызывается под cycle_mutex_.
    PromotionOutcome promote(const std::shared_ptr<const store::RuleSet>& before,
                             version::Bump bump, const std::string& description);

    /// Вернуть store и VersionManager к снимку target. Если сохранение
    /// отката не удалось, снимок всё равно восстанавливается в памяти,
    /// затем PersistenceError пробрасывается.
    void restore_version(const std::shared_ptr<const store::RuleSet>& target);

    /// Зарегистрировать текущую версию store в VersionManager
    void ensure_registered();

    std::shared_ptr<const engine::Program> pin_program() const;

    // --- Фоновые задания ----------------------------------------------------

    void run_job(const std::shared_ptr<JobControl>& control, const StartOptions& options);
    void run_single_job(JobControl& control, const StartOptions& options);
    void run_batch_job(JobControl& control, const StartOptions& options);
    void run_full_job(JobControl& control, const StartOptions& options);

    /// Граница batch: false если задание остановлено (статус уже cancelled)
    bool batch_boundary(JobControl& control);

    template <typename Fn>
    void update_job(JobControl& control, Fn&& fn);

    void finish_job(JobControl& control, JobStatus status, std::string message);

    void alert(const std::string& rule_name, const std::string& severity,
               const std::string& message);

    std::string next_job_id(Scale scale);

    Services services_;
    Options options_;
    NullTelemetry null_telemetry_;
    Telemetry& telemetry_;
    output::Writer* log_;
    safety::AutoRollbackMonitor rollback_monitor_;

    mutable std::mutex cycle_mutex_;  // единственный писатель правил
    std::size_t consecutive_passes_ = 0;
    std::size_t no_improvement_count_ = 0;
    std::size_t cycle_count_ = 0;
    std::optional<BatchCycleReport> last_cycle_;

    mutable std::mutex jobs_mutex_;
    std::condition_variable jobs_cv_;
    std::map<std::string, std::shared_ptr<JobControl>> jobs_;
    std::uint64_t job_counter_ = 0;
};

}  // namespace lexrefine::orchestrator

#endif  // LEXREFINE_ORCHESTRATOR_HPP
