// ==============================================================================
// lexrefine/job.hpp - Задания обработки, телеметрия, checkpoint
// ==============================================================================
//
// Назначение:
// - Scale, JobStatus и ProcessingJob (прогресс, ETA, последние ошибки)
// - Telemetry: хуки record_case_processed / record_alert
// - Checkpoint полного прогона (RapidJSON файл) для продолжения с offset
//
// Переходы статуса:
//   pending -> sampling -> processing -> analyzing -> completed
//   paused  <-> любой нетерминальный (только на границе batch)
//   cancelled / failed из любого нетерминального
//
// ==============================================================================

#ifndef LEXREFINE_JOB_HPP
#define LEXREFINE_JOB_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lexrefine::orchestrator {

using TimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Scale / JobStatus
// ============================================================================

enum class Scale { Single, Batch, Full };

std::string to_string(Scale s);

/// "single" | "batch" | "full". Бросает std::invalid_argument.
Scale parse_scale(std::string_view s);

enum class JobStatus {
    Pending,
    Sampling,
    Processing,
    Analyzing,
    Paused,
    Completed,
    Failed,
    Cancelled,
};

std::string to_string(JobStatus s);

/// Бросает std::invalid_argument
JobStatus parse_job_status(std::string_view s);

/// completed | failed | cancelled
bool is_terminal(JobStatus s);

// ============================================================================
// ProcessingJob
// ============================================================================

struct ProcessingJob {
    static constexpr std::size_t MAX_RECENT_ERRORS = 20;

    std::string job_id;
    Scale scale = Scale::Single;
    JobStatus status = JobStatus::Pending;
    std::string version;  // версия правил, закреплённая за текущим batch

    std::size_t total_cases = 0;
    std::size_t processed_cases = 0;
    std::size_t failed_cases = 0;
    std::size_t current_batch = 0;
    std::size_t total_batches = 0;

    TimePoint start_time{};
    std::optional<TimePoint> end_time;
    std::string message;  // итог или причина отказа
    std::deque<std::string> recent_errors;

    /// Доля успешных среди обработанных (0..1)
    double success_rate() const;

    /// (processed + failed) / total * 100, не больше 100
    double progress_pct() const;

    /// Оценка завершения по средней скорости; nullopt пока нет данных
    std::optional<TimePoint> estimated_completion(TimePoint now) const;

    /// Добавить ошибку, старые вытесняются
    void record_error(std::string error);
};

/// Снимок состояния задания для status()
using JobSnapshot = ProcessingJob;

// ============================================================================
// Telemetry
// ============================================================================

class Telemetry {
public:
    virtual ~Telemetry() = default;

    virtual void record_case_processed(double time_ms, bool success) = 0;

    virtual void record_alert(const std::string& rule_name, const std::string& severity,
                              const std::string& message) = 0;
};

class NullTelemetry : public Telemetry {
public:
    void record_case_processed(double, bool) override {}
    void record_alert(const std::string&, const std::string&, const std::string&) override {}
};

// ============================================================================
// Checkpoint
// ============================================================================

struct Checkpoint {
    std::string job_id;
    std::string version;
    std::size_t next_offset = 0;
    std::size_t processed_cases = 0;
    std::size_t failed_cases = 0;
    std::size_t total_cases = 0;
    JobStatus status = JobStatus::Processing;
    TimePoint updated_at{};
};

struct CheckpointResult {
    bool ok = false;
    Checkpoint checkpoint;
    std::string error;

    explicit operator bool() const { return ok; }
};

std::string serialize_checkpoint(const Checkpoint& cp);

/// Бросает std::runtime_error при ошибке записи
void save_checkpoint(const std::filesystem::path& path, const Checkpoint& cp);

CheckpointResult load_checkpoint(const std::filesystem::path& path);

}  // namespace lexrefine::orchestrator

#endif  // LEXREFINE_JOB_HPP
