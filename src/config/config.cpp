// ==============================================================================
// config.cpp - Загрузка конфигурации из YAML
// ==============================================================================

#include <lexrefine/config.hpp>

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <stdexcept>
#include <system_error>

namespace lexrefine::config {

std::string Error::format() const {
    if (path.empty()) {
        return message;
    }
    return path + ": " + message;
}

namespace {

void require_ratio(const std::string& key, double value) {
    if (value < 0.0 || value > 1.0) {
        throw std::invalid_argument(key + " must be within [0, 1]");
    }
}

void require_positive(const std::string& key, double value) {
    if (value <= 0.0) {
        throw std::invalid_argument(key + " must be positive");
    }
}

template <typename T>
void read_key(const YAML::Node& section, const char* key, T& target) {
    if (section && section[key]) {
        target = section[key].as<T>();
    }
}

void parse_engine(const YAML::Node& node, rule::ApplyOptions& out) {
    read_key(node, "fact_extraction_enabled", out.fact_extraction_enabled);
}

void parse_patch(const YAML::Node& node, PatchSettings& out, orchestrator::Options& orch) {
    read_key(node, "synthesis_threshold", out.synthesis.threshold);
    read_key(node, "similarity_threshold", out.similarity_threshold);
    read_key(node, "auto_apply_threshold", orch.auto_apply_threshold);

    require_ratio("patch.synthesis_threshold", out.synthesis.threshold);
    require_ratio("patch.similarity_threshold", out.similarity_threshold);
    require_ratio("patch.auto_apply_threshold", orch.auto_apply_threshold);
}

void parse_oscillation(const YAML::Node& node, patch::OscillationOptions& out) {
    if (!node) {
        return;
    }
    if (node["window_minutes"]) {
        out.window = std::chrono::minutes(node["window_minutes"].as<long long>());
    }
    if (node["cooldown_hours"]) {
        out.cooldown = std::chrono::hours(node["cooldown_hours"].as<long long>());
    }
    read_key(node, "max_changes", out.max_changes);

    require_positive("oscillation.window_minutes", static_cast<double>(out.window.count()));
    require_positive("oscillation.max_changes", static_cast<double>(out.max_changes));
}

void parse_gates(const YAML::Node& node, safety::GateThresholds& out) {
    read_key(node, "unit_pass_ratio", out.unit_pass_ratio);
    read_key(node, "min_nrr", out.min_nrr);
    read_key(node, "min_fpr", out.min_fpr);
    read_key(node, "min_ss", out.min_ss);
    read_key(node, "min_token_reduction", out.min_token_reduction);
    read_key(node, "max_processing_time_ms", out.max_processing_time_ms);
    read_key(node, "max_memory_mb", out.max_memory_mb);
    read_key(node, "performance_repeat", out.performance_repeat);

    require_ratio("gates.unit_pass_ratio", out.unit_pass_ratio);
    require_ratio("gates.min_nrr", out.min_nrr);
    require_ratio("gates.min_fpr", out.min_fpr);
    require_ratio("gates.min_ss", out.min_ss);
    require_positive("gates.max_processing_time_ms", out.max_processing_time_ms);
    require_positive("gates.max_memory_mb", out.max_memory_mb);
}

void parse_orchestrator(const YAML::Node& node, orchestrator::Options& out) {
    if (!node) {
        return;
    }
    read_key(node, "consecutive_passes_for_batch", out.consecutive_passes_for_batch);
    read_key(node, "initial_batch_size", out.initial_batch_size);
    read_key(node, "max_batch_size", out.max_batch_size);
    read_key(node, "max_concurrent_batch", out.max_concurrent_batch);
    read_key(node, "max_concurrent_full", out.max_concurrent_full);
    read_key(node, "full_batch_size", out.full_batch_size);
    if (node["evaluator_timeout_ms"]) {
        out.evaluator_timeout =
            std::chrono::milliseconds(node["evaluator_timeout_ms"].as<long long>());
    }
    read_key(node, "stabilize_after", out.stabilize_after);
    read_key(node, "min_quality_improvement", out.min_quality_improvement);
    read_key(node, "min_error_reduction", out.min_error_reduction);
    read_key(node, "top_clusters", out.top_clusters);

    read_key(node, "dry_run_fraction", out.dry_run.sample_fraction);
    read_key(node, "dry_run_batch_size", out.dry_run.batch_size);
    read_key(node, "min_sample_ratio", out.dry_run.min_sample_ratio);
    read_key(node, "max_failure_rate", out.dry_run.max_failure_rate);
    read_key(node, "max_avg_case_seconds", out.dry_run.max_avg_case_seconds);
    read_key(node, "budget_usd", out.dry_run.budget_usd);
    read_key(node, "tokens_per_case", out.dry_run.tokens_per_case);
    read_key(node, "usd_per_1k_tokens", out.dry_run.usd_per_1k_tokens);

    if (node["checkpoint_path"]) {
        out.checkpoint_path = node["checkpoint_path"].as<std::string>();
    }

    require_positive("orchestrator.initial_batch_size", static_cast<double>(out.initial_batch_size));
    require_positive("orchestrator.full_batch_size", static_cast<double>(out.full_batch_size));
    require_positive("orchestrator.evaluator_timeout_ms",
                     static_cast<double>(out.evaluator_timeout.count()));
    if (out.max_batch_size < out.initial_batch_size) {
        throw std::invalid_argument(
            "orchestrator.max_batch_size must not be less than initial_batch_size");
    }
    require_ratio("orchestrator.dry_run_fraction", out.dry_run.sample_fraction);
    require_ratio("orchestrator.min_sample_ratio", out.dry_run.min_sample_ratio);
    require_ratio("orchestrator.max_failure_rate", out.dry_run.max_failure_rate);
}

void parse_rollback(const YAML::Node& node, safety::RollbackOptions& out) {
    read_key(node, "degradation_ratio", out.degradation_ratio);
    read_key(node, "error_rate_ratio", out.error_rate_ratio);

    require_ratio("rollback.degradation_ratio", out.degradation_ratio);
    require_positive("rollback.error_rate_ratio", out.error_rate_ratio);
}

Config parse_root(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument("configuration must be a mapping");
    }

    parse_engine(root["engine"], config.engine);
    parse_patch(root["patch"], config.patch, config.orchestrator);
    parse_oscillation(root["oscillation"], config.oscillation);
    parse_gates(root["gates"], config.gates);
    parse_orchestrator(root["orchestrator"], config.orchestrator);
    parse_rollback(root["rollback"], config.orchestrator.rollback);

    // Один таймаут оценщика для гейта holdout и для обработки документов
    config.gates.evaluator_timeout = config.orchestrator.evaluator_timeout;
    return config;
}

}  // namespace

LoadResult load_from_string(const std::string& yaml, const std::string& origin) {
    LoadResult result;
    try {
        result.config = parse_root(YAML::Load(yaml));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), origin};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), origin};
    }
    return result;
}

LoadResult load(const std::filesystem::path& path) {
    LoadResult result;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.error = Error{"config file does not exist", path.string()};
        return result;
    }
    if (!rule::is_yaml_extension(path)) {
        result.error = Error{"config must have a yaml file extension", path.string()};
        return result;
    }

    try {
        result.config = parse_root(YAML::LoadFile(path.string()));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path.string()};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), path.string()};
    }
    return result;
}

}  // namespace lexrefine::config
