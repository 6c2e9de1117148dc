// ==============================================================================
// lexrefine/safety.hpp - Цепочка защитных гейтов для версии правил
// ==============================================================================
//
// Назначение:
// - Гейты unit -> regression -> holdout -> performance над кандидатом RuleSet
// - Первый проваленный гейт останавливает цепочку
// - Исключение внутри гейта = провал гейта с details["error"]
// - AutoRollbackMonitor: решение об откате по деградации метрик
//
// Активный набор правил гейты не трогают: кандидат компилируется отдельно.
//
// ==============================================================================

#ifndef LEXREFINE_SAFETY_HPP
#define LEXREFINE_SAFETY_HPP

#include <lexrefine/corpus.hpp>
#include <lexrefine/engine.hpp>
#include <lexrefine/evaluator.hpp>
#include <lexrefine/output.hpp>
#include <lexrefine/store.hpp>
#include <lexrefine/value.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexrefine::safety {

// ============================================================================
// Results
// ============================================================================

enum class GateType { Unit, Regression, Holdout, Performance };

/// "unit" | "regression" | "holdout" | "performance"
std::string to_string(GateType g);

struct GateResult {
    GateType gate_type = GateType::Unit;
    bool passed = false;
    double score = 0.0;
    Value details = Value::make_object();
    std::optional<std::string> error;
};

/// Результаты одного прогона. Содержит только выполненные гейты.
struct GateReport {
    std::string version;
    std::vector<GateResult> results;
    bool all_passed = false;

    const GateResult* find(GateType g) const;

    /// Gate | Result | Score | Notes
    output::Table to_table() const;
};

// ============================================================================
// Fixtures
// ============================================================================

struct UnitFixture {
    std::string case_id;
    std::string description;
    std::string input;
    std::string expected_output;
};

/// Номер страницы, разделитель, повторные пробелы
std::vector<UnitFixture> default_unit_fixtures();

/// Ранее найденный сбой, который не должен повториться
struct RegressionCase {
    std::string case_id;
    std::string description;
    std::string input;
    std::vector<std::string> forbidden;  // regex, не должны совпасть с результатом
    std::vector<std::string> required;   // подстроки, должны остаться в результате
};

struct RegressionLoadResult {
    bool ok = false;
    std::vector<RegressionCase> cases;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// JSONL: {"case_id", "description", "input", "forbidden": [...], "required": [...]}
RegressionLoadResult load_regression_cases(const std::filesystem::path& path);

// ============================================================================
// Thresholds
// ============================================================================

struct GateThresholds {
    double unit_pass_ratio = 0.9;
    double min_nrr = 0.92;
    double min_fpr = 0.985;
    double min_ss = 0.90;
    double min_token_reduction = 20.0;  // проценты
    double max_processing_time_ms = 5000.0;
    double max_memory_mb = 1000.0;
    std::size_t performance_repeat = 1000;
    std::chrono::milliseconds evaluator_timeout{30000};

    /// Метрики holdout проходят все минимумы
    bool quality_ok(const evaluator::QualityMetrics& m) const;
};

// ============================================================================
// Output comparison
// ============================================================================

/// Схлопнуть пробельные последовательности, обрезать края
std::string normalize_whitespace(std::string_view text);

/// Jaccard по словам (1 для двух пустых строк)
double word_jaccard(std::string_view a, std::string_view b);

/// Точное совпадение, совпадение после нормализации пробелов
/// или Jaccard по словам >= 0.95
bool outputs_match(std::string_view expected, std::string_view actual);

// ============================================================================
// SafetyGateRunner
// ============================================================================

class SafetyGateRunner {
public:
    SafetyGateRunner(const engine::RuleEngine& engine,
                     std::shared_ptr<evaluator::Evaluator> evaluator,
                     GateThresholds thresholds = {}, output::Writer* log = nullptr);

    void set_unit_fixtures(std::vector<UnitFixture> fixtures);
    void set_regression_cases(std::vector<RegressionCase> cases);
    void set_holdout_cases(std::vector<corpus::DocumentCase> cases);

    /// Прогнать цепочку гейтов над кандидатом
    GateReport run_all(const store::RuleSet& candidate) const;

    GateResult run_unit(const engine::Program& program) const;
    GateResult run_regression(const engine::Program& program) const;
    GateResult run_holdout(const engine::Program& program) const;
    GateResult run_performance(const engine::Program& program) const;

    const GateThresholds& thresholds() const { return thresholds_; }

private:
    /// Выполнить гейт; std::exception -> passed=false, details["error"]
    GateResult guarded(GateType type,
                       const std::function<GateResult(const engine::Program&)>& gate,
                       const engine::Program& program) const;

    const engine::RuleEngine& engine_;
    std::shared_ptr<evaluator::Evaluator> evaluator_;
    GateThresholds thresholds_;
    output::Writer* log_;

    std::vector<UnitFixture> unit_fixtures_;
    std::vector<RegressionCase> regression_cases_;
    std::vector<corpus::DocumentCase> holdout_cases_;
};

// ============================================================================
// AutoRollbackMonitor
// ============================================================================

struct RollbackOptions {
    double degradation_ratio = 0.95;
    double error_rate_ratio = 1.5;
};

struct RollbackDecision {
    bool rollback = false;
    std::vector<std::string> reasons;

    explicit operator bool() const { return rollback; }
};

/// Метрики версии: nrr, fpr, ss, error_rate
using MetricMap = std::map<std::string, double>;

class AutoRollbackMonitor {
public:
    explicit AutoRollbackMonitor(RollbackOptions options = {}, output::Writer* log = nullptr);

    /// Откат если nrr/fpr/ss упали ниже degradation_ratio * предыдущих
    /// или error_rate вырос больше чем в error_rate_ratio раз
    RollbackDecision should_rollback(const MetricMap& current, const MetricMap& previous) const;

    const RollbackOptions& options() const { return options_; }

private:
    RollbackOptions options_;
    output::Writer* log_;
};

}  // namespace lexrefine::safety

#endif  // LEXREFINE_SAFETY_HPP
