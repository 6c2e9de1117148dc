// ==============================================================================
// job.cpp - Задания обработки и checkpoint полного прогона
// ==============================================================================

#include <lexrefine/job.hpp>
#include <lexrefine/jsonl.hpp>
#include <lexrefine/platform.hpp>

#include <algorithm>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <stdexcept>

namespace lexrefine::orchestrator {

std::string to_string(Scale s) {
    switch (s) {
    case Scale::Single:
        return "single";
    case Scale::Batch:
        return "batch";
    case Scale::Full:
        return "full";
    }
    return "unknown";
}

Scale parse_scale(std::string_view s) {
    if (s == "single") {
        return Scale::Single;
    }
    if (s == "batch") {
        return Scale::Batch;
    }
    if (s == "full") {
        return Scale::Full;
    }
    throw std::invalid_argument("unknown scale: " + std::string(s));
}

std::string to_string(JobStatus s) {
    switch (s) {
    case JobStatus::Pending:
        return "pending";
    case JobStatus::Sampling:
        return "sampling";
    case JobStatus::Processing:
        return "processing";
    case JobStatus::Analyzing:
        return "analyzing";
    case JobStatus::Paused:
        return "paused";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Failed:
        return "failed";
    case JobStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

JobStatus parse_job_status(std::string_view s) {
    for (JobStatus status :
         {JobStatus::Pending, JobStatus::Sampling, JobStatus::Processing, JobStatus::Analyzing,
          JobStatus::Paused, JobStatus::Completed, JobStatus::Failed, JobStatus::Cancelled}) {
        if (s == to_string(status)) {
            return status;
        }
    }
    throw std::invalid_argument("unknown job status: " + std::string(s));
}

bool is_terminal(JobStatus s) {
    return s == JobStatus::Completed || s == JobStatus::Failed || s == JobStatus::Cancelled;
}

// ----------------------------------------------------------------------------
// ProcessingJob
// ----------------------------------------------------------------------------

double ProcessingJob::success_rate() const {
    std::size_t done = processed_cases + failed_cases;
    if (done == 0) {
        return 0.0;
    }
    return static_cast<double>(processed_cases) / static_cast<double>(done);
}

double ProcessingJob::progress_pct() const {
    if (total_cases == 0) {
        return 0.0;
    }
    double pct = static_cast<double>(processed_cases + failed_cases) /
                 static_cast<double>(total_cases) * 100.0;
    return std::min(pct, 100.0);
}

std::optional<TimePoint> ProcessingJob::estimated_completion(TimePoint now) const {
    if (end_time) {
        return end_time;
    }
    std::size_t done = processed_cases + failed_cases;
    if (done == 0 || start_time == TimePoint{} || total_cases <= done) {
        return std::nullopt;
    }
    auto elapsed = now - start_time;
    auto per_case = elapsed / static_cast<long long>(done);
    return now + per_case * static_cast<long long>(total_cases - done);
}

void ProcessingJob::record_error(std::string error) {
    recent_errors.push_back(std::move(error));
    while (recent_errors.size() > MAX_RECENT_ERRORS) {
        recent_errors.pop_front();
    }
}

// ----------------------------------------------------------------------------
// Checkpoint
// ----------------------------------------------------------------------------

namespace {

void add_string(rapidjson::Value& obj, const char* key, const std::string& value,
                rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), alloc);
    obj.AddMember(rapidjson::StringRef(key), v, alloc);
}

std::size_t get_size(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsUint64()) {
        throw std::runtime_error(std::string("missing counter '") + key + "'");
    }
    return static_cast<std::size_t>(it->value.GetUint64());
}

}  // namespace

std::string serialize_checkpoint(const Checkpoint& cp) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    add_string(doc, "job_id", cp.job_id, alloc);
    add_string(doc, "version", cp.version, alloc);
    doc.AddMember("next_offset", static_cast<uint64_t>(cp.next_offset), alloc);
    doc.AddMember("processed_cases", static_cast<uint64_t>(cp.processed_cases), alloc);
    doc.AddMember("failed_cases", static_cast<uint64_t>(cp.failed_cases), alloc);
    doc.AddMember("total_cases", static_cast<uint64_t>(cp.total_cases), alloc);
    add_string(doc, "status", to_string(cp.status), alloc);
    add_string(doc, "updated_at", platform::format_iso8601(cp.updated_at), alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

void save_checkpoint(const std::filesystem::path& path, const Checkpoint& cp) {
    platform::write_file_atomic(path, serialize_checkpoint(cp));
}

CheckpointResult load_checkpoint(const std::filesystem::path& path) {
    CheckpointResult result;
    std::string data;
    try {
        data = platform::read_file(path);
    } catch (const std::runtime_error& e) {
        result.error = e.what();
        return result;
    }

    rapidjson::Document doc;
    doc.Parse(data.c_str(), data.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        result.error = std::string("checkpoint: ") +
                       (doc.HasParseError() ? rapidjson::GetParseError_En(doc.GetParseError())
                                            : "root must be an object");
        return result;
    }

    try {
        Checkpoint& cp = result.checkpoint;
        cp.job_id = io::json_string(doc, "job_id");
        cp.version = io::json_string(doc, "version");
        cp.next_offset = get_size(doc, "next_offset");
        cp.processed_cases = get_size(doc, "processed_cases");
        cp.failed_cases = get_size(doc, "failed_cases");
        cp.total_cases = get_size(doc, "total_cases");
        cp.status = parse_job_status(io::json_string(doc, "status", "processing"));
        std::string updated = io::json_string(doc, "updated_at");
        if (!updated.empty()) {
            cp.updated_at = platform::parse_iso8601(updated);
        }
    } catch (const std::exception& e) {
        result.error = std::string("checkpoint: ") + e.what();
        return result;
    }
    if (result.checkpoint.job_id.empty()) {
        result.error = "checkpoint: missing job_id";
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace lexrefine::orchestrator
