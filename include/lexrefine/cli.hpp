// ==============================================================================
// lexrefine/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef LEXREFINE_CLI_HPP
#define LEXREFINE_CLI_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lexrefine::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;                       // --no-banner
    int verbose = 0;                              // -v (repeatable)
    bool quiet = false;                           // -q
    std::optional<std::filesystem::path> config;  // --config
    std::optional<std::filesystem::path> log;     // --log
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// apply - применить правила к файлу или stdin
struct ApplyCommand {
    std::filesystem::path rules;                 // -r, --rules
    std::optional<std::string> type;             // --type
    bool json = false;                           // -j, --json
    std::optional<std::filesystem::path> input;  // positional, пусто - stdin
};

/// lint - загрузить и скомпилировать правила
struct LintCommand {
    std::filesystem::path path;
};

/// Источники, общие для gates / shakedown / batch / full
struct SourceOptions {
    std::filesystem::path rules;                      // -r, --rules
    std::optional<std::filesystem::path> responses;   // --responses
    std::optional<std::filesystem::path> store;       // --store
    std::optional<std::filesystem::path> regression;  // --regression
    std::optional<std::filesystem::path> holdout;     // --holdout
};

/// gates - прогнать цепочку safety gates над набором правил
struct GatesCommand {
    SourceOptions sources;
    bool json = false;
};

/// shakedown - по одному документу до готовности к batch
struct ShakedownCommand {
    SourceOptions sources;
    std::filesystem::path corpus;  // --corpus
    std::size_t max_cases = 0;     // --max-cases
};

/// batch - циклы на стратифицированной выборке
struct BatchCommand {
    SourceOptions sources;
    std::filesystem::path corpus;
    std::size_t cycles = 10;       // --cycles
    std::size_t sample_size = 0;   // --sample-size
};

/// full - dry run и полный прогон
struct FullCommand {
    SourceOptions sources;
    std::filesystem::path corpus;
    std::optional<std::filesystem::path> checkpoint;  // --checkpoint
    std::optional<std::filesystem::path> output;      // -o, --output (JSONL)
    bool resume = false;                              // --resume
    bool skip_readiness = false;                      // --skip-readiness
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ApplyCommand, LintCommand, GatesCommand, ShakedownCommand,
                             BatchCommand, FullCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

constexpr const char* VERSION = "0.4.0";

constexpr const char* ABOUT = "Evolve text refinement rules for legal documents";

}  // namespace lexrefine::cli

#endif  // LEXREFINE_CLI_HPP
