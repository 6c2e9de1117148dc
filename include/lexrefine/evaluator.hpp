// ==============================================================================
// lexrefine/evaluator.hpp - Контракт внешнего оценщика качества
// ==============================================================================
//
// Назначение:
// - QualityMetrics (NRR, FPR/ICR, SS, token reduction, parsing errors)
// - Интерфейс Evaluator: evaluate(before, after, metadata)
// - Разбор ответа оценщика (JSON, в т.ч. внутри ```json блока)
// - Вызов с таймаутом: таймаут/исключение/мусор -> нулевые метрики + ошибка
// - ReplayEvaluator: записанные ответы по case_id (CLI, тесты)
//
// Внутренности оценщика (prompting, модель) сюда не входят.
//
// ==============================================================================

#ifndef LEXREFINE_EVALUATOR_HPP
#define LEXREFINE_EVALUATOR_HPP

#include <lexrefine/value.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lexrefine::evaluator {

// ============================================================================
// Data model
// ============================================================================

struct QualityMetrics {
    double nrr = 0.0;              // Noise Reduction Rate
    double fpr = 0.0;              // False Positive Rate / Important-Content Retention
    double ss = 0.0;               // Semantic Similarity
    double token_reduction = 0.0;  // проценты
    int parsing_errors = 0;

    /// Средний показатель качества (nrr, fpr, ss)
    double quality_score() const { return (nrr + fpr + ss) / 3.0; }

    std::map<std::string, double> to_map() const;
};

/// Сырое предложение оценщика (до синтеза)
struct RawSuggestion {
    std::string description;
    double confidence_score = 0.0;
    std::string rule_type;       // может быть псевдонимом (regex_improvement, ...)
    std::string pattern_before;  // regex для поиска
    std::string pattern_after;   // замена (обычно пустая)
    double estimated_improvement = 0.0;
    std::vector<std::string> applicable_cases;
};

struct Evaluation {
    QualityMetrics metrics;
    std::vector<std::string> errors;
    std::vector<RawSuggestion> suggestions;
    bool ok = true;  // false: использован fallback

    /// Нулевые метрики + одно описание ошибки
    static Evaluation fallback(std::string message);
};

/// Сбой оценщика (таймаут, плохой ответ, нет записи)
class EvaluatorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Evaluator interface
// ============================================================================

class Evaluator {
public:
    virtual ~Evaluator() = default;

    /// Может бросать исключения; вызывающие используют evaluate_with_timeout
    virtual Evaluation evaluate(const std::string& before, const std::string& after,
                                const Value& metadata) = 0;
};

/// Предел вызовов, которые превысили таймаут и ещё выполняются в фоне
constexpr std::size_t MAX_STRANDED_EVALUATIONS = 32;

/// Вызов с таймаутом в отдельном потоке. Никогда не бросает:
/// таймаут, исключение оценщика -> Evaluation::fallback.
/// После таймаута вызов продолжается в фоне, результат отбрасывается.
/// Пока в фоне висят MAX_STRANDED_EVALUATIONS вызовов, новые не
/// запускаются и сразу возвращают fallback.
Evaluation evaluate_with_timeout(const std::shared_ptr<Evaluator>& evaluator,
                                 const std::string& before, const std::string& after,
                                 const Value& metadata, std::chrono::milliseconds timeout);

/// Число вызовов, превысивших таймаут и ещё не завершившихся
std::size_t stranded_evaluations();

// ============================================================================
// Response parsing
// ============================================================================

/// Выделить JSON: содержимое ```json ... ``` или от первой '{' до последней '}'
std::string extract_json(std::string_view text);

/// Разобрать ответ оценщика. Никогда не бросает: некорректный ответ ->
/// fallback с ошибкой "parse error: ...".
Evaluation parse_evaluation_response(std::string_view text);

/// Разобрать уже распарсенный JSON объект
Evaluation evaluation_from_json(const rapidjson::Value& root);

// ============================================================================
// Helpers
// ============================================================================

/// Среднее метрик; parsing_errors суммируются
QualityMetrics average(const std::vector<QualityMetrics>& metrics);

/// Оценка числа токенов: слова * 1.3
double estimate_tokens(std::string_view text);

// ============================================================================
// ReplayEvaluator
// ============================================================================

/// Записанные ответы оценщика по case_id (metadata["case_id"]).
/// Запись "*" используется для неизвестных case_id.
class ReplayEvaluator : public Evaluator {
public:
    struct LoadResult {
        bool ok = false;
        std::size_t count = 0;
        std::string error;

        explicit operator bool() const { return ok; }
    };

    ReplayEvaluator() = default;

    /// JSONL: {"case_id": "...", "response": {...} | "..."}
    LoadResult load(const std::filesystem::path& path);

    void add(const std::string& case_id, std::string response);

    Evaluation evaluate(const std::string& before, const std::string& after,
                        const Value& metadata) override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> responses_;
};

}  // namespace lexrefine::evaluator

#endif  // LEXREFINE_EVALUATOR_HPP
