// ==============================================================================
// jobs.cpp - Фоновые задания: single / batch / full, stop / pause / resume
// ==============================================================================
//
// Каждое задание выполняется в своём потоке. Флаги stop и pause
// проверяются только на границе batch (batch_boundary), поэтому текущий
// batch всегда дорабатывается. Полный прогон после каждого batch пишет
// checkpoint; новое задание с resume_from_checkpoint продолжает с его offset.
//
// ==============================================================================

#include <lexrefine/orchestrator.hpp>
#include <lexrefine/output.hpp>
#include <lexrefine/platform.hpp>

#include <algorithm>
#include <stdexcept>

namespace lexrefine::orchestrator {

struct Orchestrator::JobControl {
    ProcessingJob job;
    JobStatus resume_status = JobStatus::Processing;
    bool stop_requested = false;   // под jobs_mutex_
    bool pause_requested = false;  // под jobs_mutex_
    std::mutex join_mutex;
    std::thread thread;
};

Orchestrator::~Orchestrator() {
    std::vector<std::shared_ptr<JobControl>> controls;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (auto& [id, control] : jobs_) {
            control->stop_requested = true;
            control->pause_requested = false;
            controls.push_back(control);
        }
    }
    jobs_cv_.notify_all();
    for (auto& control : controls) {
        std::lock_guard<std::mutex> join_lock(control->join_mutex);
        if (control->thread.joinable()) {
            control->thread.join();
        }
    }
}

std::string Orchestrator::next_job_id(Scale scale) {
    return to_string(scale) + "_" +
           platform::format_utc(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S") + "_" +
           std::to_string(++job_counter_);
}

template <typename Fn>
void Orchestrator::update_job(JobControl& control, Fn&& fn) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    fn(control.job);
}

void Orchestrator::finish_job(JobControl& control, JobStatus status, std::string message) {
    std::string job_id;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        control.job.status = status;
        control.job.end_time = std::chrono::system_clock::now();
        control.job.message = message;
        if (status == JobStatus::Failed) {
            control.job.record_error(message);
        }
        job_id = control.job.job_id;
    }
    jobs_cv_.notify_all();

    if (status == JobStatus::Failed) {
        alert("orchestrator", "error", "job " + job_id + " failed: " + message);
    } else if (log_) {
        log_->info("job " + job_id + " " + to_string(status) + ": " + message);
    }
}

bool Orchestrator::batch_boundary(JobControl& control) {
    std::unique_lock<std::mutex> lock(jobs_mutex_);
    if (control.pause_requested && !control.stop_requested) {
        control.resume_status = control.job.status;
        control.job.status = JobStatus::Paused;
        if (log_) {
            log_->info("job " + control.job.job_id + " paused");
        }
        jobs_cv_.wait(lock, [&control] {
            return !control.pause_requested || control.stop_requested;
        });
        if (!control.stop_requested) {
            control.job.status = control.resume_status;
            if (log_) {
                log_->info("job " + control.job.job_id + " resumed");
            }
        }
    }
    if (control.stop_requested) {
        lock.unlock();
        finish_job(control, JobStatus::Cancelled, "stopped at batch boundary");
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Control surface
// ----------------------------------------------------------------------------

std::string Orchestrator::start(Scale scale, const StartOptions& options) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    for (const auto& [id, control] : jobs_) {
        if (!is_terminal(control->job.status)) {
            throw std::logic_error("job " + id + " is still running");
        }
    }

    auto control = std::make_shared<JobControl>();
    control->job.job_id = next_job_id(scale);
    control->job.scale = scale;
    control->job.status = JobStatus::Pending;
    control->job.start_time = std::chrono::system_clock::now();
    control->job.version = services_.store.version();
    jobs_[control->job.job_id] = control;

    control->thread = std::thread([this, control, options] { run_job(control, options); });
    if (log_) {
        log_->info("started " + to_string(scale) + " job " + control->job.job_id);
    }
    return control->job.job_id;
}

bool Orchestrator::stop(const std::string& job_id) {
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end() || is_terminal(it->second->job.status)) {
            return false;
        }
        it->second->stop_requested = true;
    }
    jobs_cv_.notify_all();
    return true;
}

bool Orchestrator::pause(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end() || is_terminal(it->second->job.status) ||
        it->second->pause_requested) {
        return false;
    }
    it->second->pause_requested = true;
    return true;
}

bool Orchestrator::resume(const std::string& job_id) {
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end() || !it->second->pause_requested ||
            is_terminal(it->second->job.status)) {
            return false;
        }
        it->second->pause_requested = false;
    }
    jobs_cv_.notify_all();
    return true;
}

std::optional<JobSnapshot> Orchestrator::status(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second->job;
}

std::optional<JobSnapshot> Orchestrator::wait(const std::string& job_id) {
    std::shared_ptr<JobControl> control;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return std::nullopt;
        }
        control = it->second;
    }
    {
        std::lock_guard<std::mutex> join_lock(control->join_mutex);
        if (control->thread.joinable()) {
            control->thread.join();
        }
    }
    return status(job_id);
}

std::vector<JobSnapshot> Orchestrator::jobs() const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    std::vector<JobSnapshot> out;
    out.reserve(jobs_.size());
    for (const auto& [id, control] : jobs_) {
        out.push_back(control->job);
    }
    return out;
}

// ----------------------------------------------------------------------------
// Job bodies
// ----------------------------------------------------------------------------

void Orchestrator::run_job(const std::shared_ptr<JobControl>& control,
                           const StartOptions& options) {
    try {
        switch (control->job.scale) {
        case Scale::Single:
            run_single_job(*control, options);
            break;
        case Scale::Batch:
            run_batch_job(*control, options);
            break;
        case Scale::Full:
            run_full_job(*control, options);
            break;
        }
    } catch (const store::PersistenceError& e) {
        finish_job(*control, JobStatus::Failed, std::string("persistence error: ") + e.what());
    } catch (const std::exception& e) {
        finish_job(*control, JobStatus::Failed, e.what());
    }
}

void Orchestrator::run_single_job(JobControl& control, const StartOptions& options) {
    std::size_t total = services_.corpus.count();
    if (options.max_cases > 0) {
        total = std::min(total, options.max_cases);
    }
    update_job(control, [total](ProcessingJob& job) {
        job.status = JobStatus::Processing;
        job.total_cases = total;
        job.total_batches = total;
    });

    for (std::size_t i = 0; i < total; ++i) {
        if (!batch_boundary(control)) {
            return;
        }
        auto cases = services_.corpus.fetch(i, 1);
        if (cases.empty()) {
            break;
        }
        update_job(control, [this, i](ProcessingJob& job) {
            job.current_batch = i + 1;
            job.version = services_.store.version();
        });

        SingleCaseResult result = run_single(cases.front());

        update_job(control, [&result](ProcessingJob& job) {
            if (result.evaluation.ok) {
                ++job.processed_cases;
            } else {
                ++job.failed_cases;
                job.record_error(result.case_id + ": " +
                                 (result.evaluation.errors.empty() ? std::string("evaluator failure")
                                                                   : result.evaluation.errors.front()));
            }
        });

        if (result.ready_for_batch) {
            finish_job(control, JobStatus::Completed,
                       "ready for batch scale after " + std::to_string(result.consecutive_passes) +
                           " consecutive passes");
            return;
        }
    }
    finish_job(control, JobStatus::Completed,
               "corpus exhausted, consecutive passes: " + std::to_string(consecutive_passes()));
}

void Orchestrator::run_batch_job(JobControl& control, const StartOptions& options) {
    std::size_t size = options.sample_size > 0 ? options.sample_size : options_.initial_batch_size;
    std::size_t corpus_size = services_.corpus.count();
    update_job(control, [&options](ProcessingJob& job) { job.total_batches = options.max_cycles; });

    for (std::size_t cycle = 0; cycle < options.max_cycles; ++cycle) {
        if (!batch_boundary(control)) {
            return;
        }
        std::size_t expected = std::min({size, options_.max_batch_size, corpus_size});
        update_job(control, [this, cycle, expected](ProcessingJob& job) {
            job.status = JobStatus::Sampling;
            job.current_batch = cycle + 1;
            job.total_cases += expected;
            job.version = services_.store.version();
        });
        update_job(control, [](ProcessingJob& job) { job.status = JobStatus::Processing; });

        BatchCycleReport report = run_batch_cycle(size);

        update_job(control, [&report, expected](ProcessingJob& job) {
            job.status = JobStatus::Analyzing;
            // Фактическая выборка могла оказаться меньше ожидаемой
            job.total_cases = job.total_cases - expected + report.sample_size;
            job.processed_cases += report.initial.cases - report.initial.failed;
            job.failed_cases += report.initial.failed;
            if (report.initial.failed > 0) {
                job.record_error("cycle " + std::to_string(report.cycle) + ": " +
                                 std::to_string(report.initial.failed) + " evaluator failures");
            }
            if (report.rolled_back) {
                job.record_error("cycle " + std::to_string(report.cycle) + ": rolled back " +
                                 report.promotion.version);
            }
            job.version = report.version_after;
        });

        if (report.next_action == NextAction::Stabilized) {
            finish_job(control, JobStatus::Completed,
                       "stabilized after " + std::to_string(report.no_improvement_count) +
                           " cycles without significant improvement");
            return;
        }
        size = report.next_sample_size;
    }
    finish_job(control, JobStatus::Completed,
               "finished " + std::to_string(options.max_cycles) + " cycles");
}

void Orchestrator::run_full_job(JobControl& control, const StartOptions& options) {
    update_job(control, [](ProcessingJob& job) { job.status = JobStatus::Sampling; });

    std::size_t offset = 0;
    std::size_t processed = 0;
    std::size_t failed = 0;

    if (options.resume_from_checkpoint) {
        if (options_.checkpoint_path.empty()) {
            throw std::invalid_argument("resume requires a checkpoint path");
        }
        auto loaded = load_checkpoint(options_.checkpoint_path);
        if (!loaded) {
            throw std::runtime_error(loaded.error);
        }
        offset = loaded.checkpoint.next_offset;
        processed = loaded.checkpoint.processed_cases;
        failed = loaded.checkpoint.failed_cases;
        if (log_) {
            log_->info("resuming " + loaded.checkpoint.job_id + " from offset " +
                       std::to_string(offset));
        }
    } else {
        if (options.require_readiness) {
            Readiness readiness = check_readiness();
            if (!readiness) {
                std::string reasons;
                for (const auto& r : readiness.reasons) {
                    reasons += (reasons.empty() ? "" : "; ") + r;
                }
                finish_job(control, JobStatus::Failed, "not ready for full processing: " + reasons);
                return;
            }
        }
        DryRunStats stats = run_dry_run();
        DryRunDecision decision = evaluate_dry_run(stats, options_.dry_run);
        if (!decision) {
            finish_job(control, JobStatus::Failed, "dry run failed: " + decision.reason());
            return;
        }
    }

    const std::size_t total = services_.corpus.count();
    const std::size_t batch_size = std::max<std::size_t>(1, options_.full_batch_size);
    update_job(control, [&](ProcessingJob& job) {
        job.status = JobStatus::Processing;
        job.total_cases = total;
        job.processed_cases = processed;
        job.failed_cases = failed;
        job.total_batches = (total + batch_size - 1) / batch_size;
        job.current_batch = offset / batch_size;
    });

    while (offset < total) {
        if (!batch_boundary(control)) {
            return;
        }
        auto cases = services_.corpus.fetch(offset, batch_size);
        if (cases.empty()) {
            break;
        }

        auto snapshot = services_.store.snapshot();
        auto program = services_.engine.prepare(snapshot->rules, std::nullopt, snapshot->version);
        update_job(control, [&snapshot](ProcessingJob& job) {
            ++job.current_batch;
            job.version = snapshot->version;
        });

        auto outcomes = process_cases(cases, *program, options_.max_concurrent_full);

        std::size_t batch_failed = 0;
        for (const auto& o : outcomes) {
            if (options.sink) {
                options.sink->record(o, snapshot->version);
            }
            if (!o.success) {
                ++batch_failed;
            }
        }
        processed += outcomes.size() - batch_failed;
        failed += batch_failed;
        offset += cases.size();

        update_job(control, [&](ProcessingJob& job) {
            job.processed_cases = processed;
            job.failed_cases = failed;
            for (const auto& o : outcomes) {
                if (!o.success) {
                    job.record_error(o.case_id + ": " + o.error);
                }
            }
        });

        if (!options_.checkpoint_path.empty()) {
            Checkpoint cp;
            cp.job_id = control.job.job_id;
            cp.version = snapshot->version;
            cp.next_offset = offset;
            cp.processed_cases = processed;
            cp.failed_cases = failed;
            cp.total_cases = total;
            cp.status = JobStatus::Processing;
            cp.updated_at = std::chrono::system_clock::now();
            save_checkpoint(options_.checkpoint_path, cp);
        }
    }

    update_job(control, [](ProcessingJob& job) { job.status = JobStatus::Analyzing; });
    if (!options_.checkpoint_path.empty()) {
        Checkpoint cp;
        cp.job_id = control.job.job_id;
        cp.version = services_.store.version();
        cp.next_offset = offset;
        cp.processed_cases = processed;
        cp.failed_cases = failed;
        cp.total_cases = total;
        cp.status = JobStatus::Completed;
        cp.updated_at = std::chrono::system_clock::now();
        save_checkpoint(options_.checkpoint_path, cp);
    }
    finish_job(control, JobStatus::Completed,
               "processed " + std::to_string(processed) + ", failed " + std::to_string(failed));
}

}  // namespace lexrefine::orchestrator
