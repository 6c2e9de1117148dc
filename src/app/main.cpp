// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Загрузка конфигурации (--config)
// 3. Создание Writer
// 4. Dispatch команды
// 5. Возврат exit code (0 успех, 1 ошибка выполнения, 2 ошибка использования)
//
// ==============================================================================

#include <lexrefine/cli.hpp>
#include <lexrefine/config.hpp>
#include <lexrefine/corpus.hpp>
#include <lexrefine/engine.hpp>
#include <lexrefine/evaluator.hpp>
#include <lexrefine/orchestrator.hpp>
#include <lexrefine/output.hpp>
#include <lexrefine/patch.hpp>
#include <lexrefine/platform.hpp>
#include <lexrefine/rule.hpp>
#include <lexrefine/safety.hpp>
#include <lexrefine/store.hpp>
#include <lexrefine/version.hpp>

#include <cstdint>
#include <cstdio>
#include <exception>
#include <iostream>
#include <iterator>
#include <memory>
#include <rapidjson/document.h>
#include <type_traits>
#include <variant>

namespace {

using namespace lexrefine;

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ██╗     ███████╗██╗  ██╗██████╗ ███████╗███████╗██╗███╗   ██╗███████╗
    ██║     ██╔════╝╚██╗██╔╝██╔══██╗██╔════╝██╔════╝██║████╗  ██║██╔════╝
    ██║     █████╗   ╚███╔╝ ██████╔╝█████╗  █████╗  ██║██╔██╗ ██║█████╗
    ██║     ██╔══╝   ██╔██╗ ██╔══██╗██╔══╝  ██╔══╝  ██║██║╚██╗██║██╔══╝
    ███████╗███████╗██╔╝ ██╗██║  ██║███████╗██║     ██║██║ ╚████║███████╗
    ╚══════╝╚══════╝╚═╝  ╚═╝╚═╝  ╚═╝╚══════╝╚═╝     ╚═╝╚═╝  ╚═══╝╚══════╝
)";

void print_banner(output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Загрузка входных данных
// ----------------------------------------------------------------------------

bool is_json_extension(const std::filesystem::path& path) {
    return path.extension() == ".json";
}

/// Правила из YAML (файл или директория) или из файла хранилища (.json)
std::optional<std::vector<rule::Rule>> load_rules(const std::filesystem::path& path,
                                                  output::Writer& writer) {
    if (is_json_extension(path)) {
        store::JsonFilePersistence persistence(path);
        auto loaded = persistence.load_latest_version();
        if (!loaded) {
            writer.error("rule store is empty: " + platform::path_to_utf8(path));
            return std::nullopt;
        }
        return loaded->rules;
    }

    rule::LoadResult loaded = rule::load(path);
    if (!loaded) {
        writer.error("failed to load rules: " + loaded.error.format());
        return std::nullopt;
    }
    writer.info("Loaded " + std::to_string(loaded.rules.size()) + " rules from " +
                platform::path_to_utf8(path));
    return std::move(loaded.rules);
}

std::optional<std::vector<corpus::DocumentCase>> load_cases(const std::filesystem::path& path,
                                                            output::Writer& writer) {
    corpus::JsonlCaseSource source(path);
    auto loaded = source.load();
    if (!loaded) {
        writer.error("failed to load documents: " + loaded.error);
        return std::nullopt;
    }
    return source.cases();
}

std::shared_ptr<evaluator::ReplayEvaluator> load_responses(const std::filesystem::path& path,
                                                           output::Writer& writer) {
    auto replay = std::make_shared<evaluator::ReplayEvaluator>();
    auto loaded = replay->load(path);
    if (!loaded) {
        writer.error("failed to load evaluator responses: " + loaded.error);
        return nullptr;
    }
    writer.info("Loaded " + std::to_string(loaded.count) + " evaluator responses");
    return replay;
}

/// Регрессионные и holdout наборы для гейтов
bool configure_gates(safety::SafetyGateRunner& gates, const cli::SourceOptions& sources,
                     output::Writer& writer) {
    if (sources.regression) {
        auto loaded = safety::load_regression_cases(*sources.regression);
        if (!loaded.ok) {
            writer.error("failed to load regression cases: " + loaded.error);
            return false;
        }
        gates.set_regression_cases(std::move(loaded.cases));
    }
    if (sources.holdout) {
        auto cases = load_cases(*sources.holdout, writer);
        if (!cases) {
            return false;
        }
        gates.set_holdout_cases(std::move(*cases));
    }
    return true;
}

// ----------------------------------------------------------------------------
// Runtime - граф компонентов для shakedown / batch / full
// ----------------------------------------------------------------------------

struct Runtime {
    std::unique_ptr<store::RulePersistence> persistence;
    std::unique_ptr<store::RuleStore> store;
    std::unique_ptr<version::VersionManager> versions;
    std::unique_ptr<engine::RuleEngine> engine;
    std::unique_ptr<patch::OscillationGuard> guard;
    std::unique_ptr<patch::PatchSynthesizer> synthesizer;
    std::unique_ptr<patch::PatchGate> patch_gate;
    std::shared_ptr<evaluator::ReplayEvaluator> evaluator;
    std::unique_ptr<safety::SafetyGateRunner> gates;
    std::unique_ptr<corpus::JsonlCaseSource> corpus;
    std::unique_ptr<orchestrator::Orchestrator> orchestrator;
};

std::unique_ptr<Runtime> build_runtime(const cli::SourceOptions& sources,
                                       const std::filesystem::path& corpus_path,
                                       const config::Config& cfg, output::Writer& writer) {
    auto rt = std::make_unique<Runtime>();

    auto rules = load_rules(sources.rules, writer);
    if (!rules) {
        return nullptr;
    }

    if (sources.store) {
        rt->persistence = std::make_unique<store::JsonFilePersistence>(*sources.store);
    } else {
        rt->persistence = std::make_unique<store::MemoryPersistence>();
    }
    rt->store = std::make_unique<store::RuleStore>(*rt->persistence,
                                                   cfg.patch.similarity_threshold, &writer);
    auto current = rt->store->load_latest();
    if (current->rules.empty()) {
        rt->store->replace_all(std::move(*rules), current->version);
    } else {
        writer.info("Resuming rule store " + current->version + " (" +
                    std::to_string(current->rules.size()) + " rules)");
    }

    rt->versions = std::make_unique<version::VersionManager>(rt->store->version());
    rt->engine = std::make_unique<engine::RuleEngine>(cfg.engine, &writer);
    rt->guard = std::make_unique<patch::OscillationGuard>(cfg.oscillation);
    rt->synthesizer =
        std::make_unique<patch::PatchSynthesizer>(*rt->store, cfg.patch.synthesis, &writer);
    rt->patch_gate = std::make_unique<patch::PatchGate>(*rt->store, *rt->guard, &writer);

    rt->evaluator = load_responses(*sources.responses, writer);
    if (!rt->evaluator) {
        return nullptr;
    }
    rt->gates = std::make_unique<safety::SafetyGateRunner>(*rt->engine, rt->evaluator,
                                                           cfg.gates, &writer);
    if (!configure_gates(*rt->gates, sources, writer)) {
        return nullptr;
    }

    rt->corpus = std::make_unique<corpus::JsonlCaseSource>(corpus_path);
    auto loaded = rt->corpus->load();
    if (!loaded) {
        writer.error("failed to load corpus: " + loaded.error);
        return nullptr;
    }
    writer.info("Loaded " + std::to_string(loaded.count) + " documents from " +
                platform::path_to_utf8(corpus_path));

    orchestrator::Services services{*rt->store,       *rt->versions, *rt->engine,
                                    *rt->synthesizer, *rt->patch_gate, *rt->gates,
                                    rt->evaluator,    *rt->corpus,   nullptr,
                                    &writer};
    rt->orchestrator =
        std::make_unique<orchestrator::Orchestrator>(std::move(services), cfg.orchestrator);
    return rt;
}

// ----------------------------------------------------------------------------
// Вывод результатов
// ----------------------------------------------------------------------------

std::string format_double(double v, const char* fmt = "%.3f") {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, v);
    return buf;
}

void print_job(const orchestrator::JobSnapshot& job, output::Writer& writer) {
    output::Table table;
    table.set_headers({"Field", "Value"});
    table.add_row({"Job", job.job_id});
    table.add_row({"Scale", orchestrator::to_string(job.scale)});
    table.add_row({"Status", orchestrator::to_string(job.status)});
    table.add_row({"Version", job.version});
    table.add_row({"Cases", std::to_string(job.processed_cases) + " processed, " +
                                std::to_string(job.failed_cases) + " failed of " +
                                std::to_string(job.total_cases)});
    table.add_row({"Batches",
                   std::to_string(job.current_batch) + " / " + std::to_string(job.total_batches)});
    table.add_row({"Success rate", format_double(job.success_rate() * 100.0, "%.2f%%")});
    table.add_row({"Progress", format_double(job.progress_pct(), "%.1f%%")});
    table.add_row({"Message", job.message});
    table.print(writer);

    for (const auto& e : job.recent_errors) {
        writer.warn(e);
    }
}

void print_cycle(const orchestrator::BatchCycleReport& report, output::Writer& writer) {
    const auto& m = report.final_metrics();
    output::Table table;
    table.set_headers({"Cycle", "Sample", "Version", "NRR", "FPR", "SS", "Errors", "Next"});
    table.add_row({std::to_string(report.cycle), std::to_string(report.sample_size),
                   report.version_before + " -> " + report.version_after,
                   format_double(m.average.nrr), format_double(m.average.fpr),
                   format_double(m.average.ss), format_double(m.error_rate * 100.0, "%.1f%%"),
                   orchestrator::to_string(report.next_action)});
    table.print(writer);
    if (report.rolled_back) {
        for (const auto& reason : report.rollback.reasons) {
            writer.warn("rolled back: " + reason);
        }
    }
}

int job_exit_code(const std::optional<orchestrator::JobSnapshot>& job) {
    return job && job->status == orchestrator::JobStatus::Completed ? 0 : 1;
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_apply(const cli::ApplyCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    auto rules = load_rules(cmd.rules, writer);
    if (!rules) {
        return 1;
    }

    std::optional<rule::RuleType> type_filter;
    if (cmd.type) {
        type_filter = rule::parse_rule_type(*cmd.type);
    }

    std::string input;
    if (cmd.input) {
        input = platform::read_file(*cmd.input);
    } else {
        input.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    engine::RuleEngine engine(cfg.engine, &writer);
    engine::Result result = engine.apply_rules(input, *rules, type_filter);

    for (const auto& e : result.stats.errors) {
        writer.warn(e.format());
    }

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        doc.AddMember("text", rapidjson::Value(result.text.c_str(),
                                           static_cast<rapidjson::SizeType>(result.text.size()),
                                           alloc), alloc);
        doc.AddMember("original_length",
                      static_cast<std::uint64_t>(result.stats.original_length), alloc);
        doc.AddMember("final_length", static_cast<std::uint64_t>(result.stats.final_length),
                      alloc);
        doc.AddMember("applied_rule_count",
                      static_cast<std::uint64_t>(result.stats.applied_rule_count), alloc);
        doc.AddMember("reduction_rate", result.stats.reduction_rate, alloc);
        rapidjson::Value fired(rapidjson::kArrayType);
        for (const auto& f : result.stats.fired) {
            fired.PushBack(rapidjson::Value(f.rule_id.c_str(), alloc), alloc);
        }
        doc.AddMember("fired", fired, alloc);
        writer.write_json_pretty(doc);
        return 0;
    }

    writer.write(output::Stream::Stdout, result.text);
    if (!result.text.empty() && result.text.back() != '\n') {
        writer.write_line(output::Stream::Stdout, "");
    }
    writer.info("Applied " + std::to_string(result.stats.applied_rule_count) + " rules, " +
                std::to_string(result.stats.original_length) + " -> " +
                std::to_string(result.stats.final_length) + " bytes (" +
                format_double(result.stats.reduction_rate * 100.0, "%.1f%%") + " reduction)");
    return 0;
}

int run_lint(const cli::LintCommand& cmd, output::Writer& writer) {
    rule::LintResult result = rule::lint(cmd.path);
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }
    for (const auto& issue : result.issues) {
        writer.error(issue.rule_id + ": " + issue.message);
    }
    writer.info("Validated " + std::to_string(result.rule_count - result.issues.size()) +
                " rules out of " + std::to_string(result.rule_count));
    return result.issues.empty() ? 0 : 1;
}

int run_gates(const cli::GatesCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    auto rules = load_rules(cmd.sources.rules, writer);
    if (!rules) {
        return 1;
    }

    std::shared_ptr<evaluator::Evaluator> evaluator;
    if (cmd.sources.responses) {
        evaluator = load_responses(*cmd.sources.responses, writer);
        if (!evaluator) {
            return 1;
        }
    }

    engine::RuleEngine engine(cfg.engine, &writer);
    safety::SafetyGateRunner gates(engine, evaluator, cfg.gates, &writer);
    if (!configure_gates(gates, cmd.sources, writer)) {
        return 1;
    }

    store::RuleSet candidate{"v1.0.0", std::move(*rules)};
    safety::GateReport report = gates.run_all(candidate);

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        doc.AddMember("version", rapidjson::Value(report.version.c_str(), alloc), alloc);
        doc.AddMember("all_passed", report.all_passed, alloc);
        rapidjson::Value results(rapidjson::kArrayType);
        for (const auto& r : report.results) {
            rapidjson::Value item(rapidjson::kObjectType);
            item.AddMember("gate", rapidjson::Value(safety::to_string(r.gate_type).c_str(), alloc),
                           alloc);
            item.AddMember("passed", r.passed, alloc);
            item.AddMember("score", r.score, alloc);
            rapidjson::Value details;
            r.details.to_rapidjson(details, alloc);
            item.AddMember("details", details, alloc);
            results.PushBack(item, alloc);
        }
        doc.AddMember("results", results, alloc);
        writer.write_json_pretty(doc);
    } else {
        report.to_table().print(writer);
    }

    if (report.all_passed) {
        writer.info("All safety gates passed");
        return 0;
    }
    writer.error("Safety gates failed");
    return 1;
}

int run_shakedown(const cli::ShakedownCommand& cmd, const config::Config& cfg,
                  output::Writer& writer) {
    auto rt = build_runtime(cmd.sources, cmd.corpus, cfg, writer);
    if (!rt) {
        return 1;
    }
    orchestrator::StartOptions options;
    options.max_cases = cmd.max_cases;

    std::string job_id = rt->orchestrator->start(orchestrator::Scale::Single, options);
    auto job = rt->orchestrator->wait(job_id);
    if (job) {
        print_job(*job, writer);
    }
    writer.info("Consecutive passes: " + std::to_string(rt->orchestrator->consecutive_passes()));
    return job_exit_code(job);
}

int run_batch(const cli::BatchCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    auto rt = build_runtime(cmd.sources, cmd.corpus, cfg, writer);
    if (!rt) {
        return 1;
    }
    orchestrator::StartOptions options;
    options.max_cycles = cmd.cycles;
    options.sample_size = cmd.sample_size;

    std::string job_id = rt->orchestrator->start(orchestrator::Scale::Batch, options);
    auto job = rt->orchestrator->wait(job_id);
    if (auto last = rt->orchestrator->last_cycle()) {
        print_cycle(*last, writer);
    }
    if (job) {
        print_job(*job, writer);
    }

    auto readiness = rt->orchestrator->check_readiness();
    if (readiness) {
        writer.info("Ready for full processing");
    } else {
        for (const auto& reason : readiness.reasons) {
            writer.warn("not ready: " + reason);
        }
    }
    return job_exit_code(job);
}

int run_full(const cli::FullCommand& cmd, config::Config cfg, output::Writer& writer) {
    if (cmd.checkpoint) {
        cfg.orchestrator.checkpoint_path = *cmd.checkpoint;
    }
    auto rt = build_runtime(cmd.sources, cmd.corpus, cfg, writer);
    if (!rt) {
        return 1;
    }

    std::unique_ptr<orchestrator::JsonlCaseSink> sink;
    if (cmd.output) {
        sink = std::make_unique<orchestrator::JsonlCaseSink>(*cmd.output);
    }

    orchestrator::StartOptions options;
    options.require_readiness = !cmd.skip_readiness;
    options.resume_from_checkpoint = cmd.resume;
    options.sink = sink.get();

    std::string job_id = rt->orchestrator->start(orchestrator::Scale::Full, options);
    auto job = rt->orchestrator->wait(job_id);
    if (job) {
        print_job(*job, writer);
    }
    if (sink) {
        writer.info("Wrote " + std::to_string(sink->written()) + " results to " +
                    platform::path_to_utf8(*cmd.output));
    }
    return job_exit_code(job);
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    out_cfg.log_path = parse_result.global.log;
    output::Writer writer(out_cfg);

    // Ошибки парсинга выводятся без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 3. Конфигурация
    config::Config cfg;
    if (parse_result.global.config) {
        config::LoadResult loaded = config::load(*parse_result.global.config);
        if (!loaded) {
            writer.error("failed to load config: " + loaded.error.format());
            return 1;
        }
        cfg = std::move(loaded.config);
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ApplyCommand>) {
                return run_apply(cmd, cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_lint(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::GatesCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_gates(cmd, cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::ShakedownCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_shakedown(cmd, cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::BatchCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_batch(cmd, cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::FullCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_full(cmd, cfg, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    // Перехват исключений на границе приложения, формат "[x] <err>"
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
