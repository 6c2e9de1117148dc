// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер argv: глобальные опции до и после подкоманды,
// значения опций только отдельным аргументом или через "=".
// Ошибки использования возвращаются с exit code 2.
//
// ==============================================================================

#include <lexrefine/cli.hpp>

#include <lexrefine/platform.hpp>

#include <cstring>
#include <stdexcept>
#include <utility>

namespace lexrefine::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string usage_line(const std::string& command) {
    if (command == "apply") {
        return "Usage: lexrefine apply [OPTIONS] --rules <RULES> [FILE]";
    }
    if (command == "lint") {
        return "Usage: lexrefine lint <PATH>";
    }
    if (command == "gates") {
        return "Usage: lexrefine gates [OPTIONS] --rules <RULES>";
    }
    if (command == "shakedown" || command == "batch" || command == "full") {
        return "Usage: lexrefine " + command +
               " [OPTIONS] --rules <RULES> --corpus <CORPUS> --responses <RESPONSES>";
    }
    return "Usage: lexrefine [OPTIONS] <COMMAND>";
}

std::string usage_error(const std::string& message, const std::string& command) {
    return "error: " + message + "\n\n" + usage_line(command) +
           "\n\nFor more information, try '--help'.\n";
}

/// Обход аргументов подкоманды с извлечением значений опций
class ArgCursor {
public:
    ArgCursor(int argc, char** argv, int start, std::string command)
        : argc_(argc), argv_(argv), index_(start), command_(std::move(command)) {}

    bool done() const { return index_ >= argc_; }

    const char* current() const { return argv_[index_]; }

    void advance() { ++index_; }

    int index() const { return index_; }

    /// Совпадение с "-s"/"--long" или "--long=VALUE"
    bool is(const char* short_name, const char* long_name) {
        const char* arg = current();
        inline_value_.reset();
        if ((short_name && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
            return true;
        }
        std::string prefix = std::string(long_name) + "=";
        if (starts_with(arg, prefix.c_str())) {
            inline_value_ = std::string(arg + prefix.size());
            return true;
        }
        return false;
    }

    /// Значение текущей опции. nullopt - ошибка записана в result.
    std::optional<std::string> value(const char* display, ParseResult& result) {
        if (inline_value_) {
            return inline_value_;
        }
        if (index_ + 1 >= argc_) {
            fail(result, std::string("a value is required for '") + display +
                             "' but none was supplied");
            return std::nullopt;
        }
        ++index_;
        return std::string(argv_[index_]);
    }

    std::optional<std::size_t> count_value(const char* display, ParseResult& result) {
        auto raw = value(display, result);
        if (!raw) {
            return std::nullopt;
        }
        try {
            std::size_t pos = 0;
            unsigned long long n = std::stoull(*raw, &pos);
            if (pos != raw->size() || (*raw)[0] == '-') {
                throw std::invalid_argument(*raw);
            }
            return static_cast<std::size_t>(n);
        } catch (const std::exception&) {
            fail(result, "invalid value '" + *raw + "' for '" + display +
                             "': expected a non-negative integer");
            return std::nullopt;
        }
    }

    void fail(ParseResult& result, const std::string& message) const {
        result.ok = false;
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = usage_error(message, command_);
    }

private:
    int argc_;
    char** argv_;
    int index_;
    std::string command_;
    std::optional<std::string> inline_value_;
};

/// Глобальная опция. true если аргумент распознан.
bool parse_global(ArgCursor& cur, ParseResult& result, bool& failed) {
    const char* arg = cur.current();
    if (str_eq(arg, "--no-banner")) {
        result.global.no_banner = true;
        return true;
    }
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        result.global.quiet = true;
        return true;
    }
    if (arg[0] == '-' && arg[1] == 'v' && std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
        result.global.verbose += static_cast<int>(std::strlen(arg + 1));
        return true;
    }
    if (cur.is(nullptr, "--config")) {
        auto v = cur.value("--config <FILE>", result);
        if (!v) {
            failed = true;
            return true;
        }
        result.global.config = platform::path_from_utf8(*v);
        return true;
    }
    if (cur.is(nullptr, "--log")) {
        auto v = cur.value("--log <FILE>", result);
        if (!v) {
            failed = true;
            return true;
        }
        result.global.log = platform::path_from_utf8(*v);
        return true;
    }
    return false;
}

/// Опция источников. true если аргумент распознан.
bool parse_source(ArgCursor& cur, SourceOptions& sources, ParseResult& result, bool& failed) {
    auto path_value = [&](const char* display, auto& target) {
        auto v = cur.value(display, result);
        if (!v) {
            failed = true;
            return;
        }
        target = platform::path_from_utf8(*v);
    };

    if (cur.is("-r", "--rules")) {
        path_value("--rules <RULES>", sources.rules);
    } else if (cur.is(nullptr, "--responses")) {
        path_value("--responses <RESPONSES>", sources.responses);
    } else if (cur.is(nullptr, "--store")) {
        path_value("--store <STORE>", sources.store);
    } else if (cur.is(nullptr, "--regression")) {
        path_value("--regression <FILE>", sources.regression);
    } else if (cur.is(nullptr, "--holdout")) {
        path_value("--holdout <FILE>", sources.holdout);
    } else {
        return false;
    }
    return true;
}

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

void unexpected(ArgCursor& cur, ParseResult& result) {
    cur.fail(result, std::string("unexpected argument '") + cur.current() + "' found");
}

void missing(ArgCursor& cur, ParseResult& result, const char* what) {
    cur.fail(result, std::string("the following required arguments were not provided:\n  ") + what);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("lexrefine ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: lexrefine [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  apply      Apply a rule set to a document\n"
               "  lint       Lint provided rules to ensure that they load and compile\n"
               "  gates      Run the safety gate chain against a rule set\n"
               "  shakedown  Refine rules one document at a time until ready for batches\n"
               "  batch      Run improvement cycles on stratified samples\n"
               "  full       Dry run then process the whole corpus\n"
               "  version    Print version\n"
               "  help       Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "      --no-banner      Hide the banner\n"
               "      --config <FILE>  Load settings from a YAML file\n"
               "      --log <FILE>     Write all messages to a log file\n"
               "  -q, --quiet          Suppress informational output\n"
               "  -v...                Print verbose output\n"
               "  -h, --help           Print help\n"
               "  -V, --version        Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Apply rules to a document:\n"
               "        ./lexrefine apply -r rules/ judgment.txt\n"
               "\n"
               "    Run three batch cycles against a replayed evaluator:\n"
               "        ./lexrefine batch -r rules/ --corpus cases.jsonl "
               "--responses responses.jsonl --cycles 3\n";
    }

    const std::string& cmd = *command;
    if (cmd == "apply") {
        return "Apply a rule set to a document\n"
               "\n"
               "Usage: lexrefine apply [OPTIONS] --rules <RULES> [FILE]\n"
               "\n"
               "Arguments:\n"
               "  [FILE]  Document to refine (default: stdin)\n"
               "\n"
               "Options:\n"
               "  -r, --rules <RULES>  Rule file or directory (YAML) or rule store (JSON)\n"
               "      --type <TYPE>    Only apply rules of this type\n"
               "  -j, --json           Output as JSON\n"
               "  -h, --help           Print help\n";
    }
    if (cmd == "lint") {
        return "Lint provided rules to ensure that they load and compile\n"
               "\n"
               "Usage: lexrefine lint <PATH>\n"
               "\n"
               "Arguments:\n"
               "  <PATH>  The path to a rule file or directory\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    if (cmd == "gates") {
        return "Run the safety gate chain against a rule set\n"
               "\n"
               "Usage: lexrefine gates [OPTIONS] --rules <RULES>\n"
               "\n"
               "Options:\n"
               "  -r, --rules <RULES>          Rule file or directory (YAML)\n"
               "      --regression <FILE>      Regression cases (JSONL)\n"
               "      --holdout <FILE>         Holdout documents (JSONL)\n"
               "      --responses <RESPONSES>  Recorded evaluator responses (JSONL)\n"
               "  -j, --json                   Output as JSON\n"
               "  -h, --help                   Print help\n";
    }
    if (cmd == "shakedown" || cmd == "batch" || cmd == "full") {
        std::string about;
        std::string extra;
        if (cmd == "shakedown") {
            about = "Refine rules one document at a time until ready for batches";
            extra = "      --max-cases <N>          Stop after N documents (default: all)\n";
        } else if (cmd == "batch") {
            about = "Run improvement cycles on stratified samples";
            extra = "      --cycles <N>             Maximum number of cycles [default: 10]\n"
                    "      --sample-size <N>        Initial sample size\n";
        } else {
            about = "Dry run then process the whole corpus";
            extra = "      --checkpoint <FILE>      Checkpoint file written after every batch\n"
                    "      --resume                 Continue from the checkpoint\n"
                    "      --skip-readiness         Do not require batch readiness\n"
                    "  -o, --output <FILE>          Write per-document results (JSONL)\n";
        }
        return about +
               "\n"
               "\n" +
               usage_line(cmd) +
               "\n"
               "\n"
               "Options:\n"
               "  -r, --rules <RULES>          Initial rule file or directory (YAML)\n"
               "      --corpus <CORPUS>        Documents (JSONL)\n"
               "      --responses <RESPONSES>  Recorded evaluator responses (JSONL)\n"
               "      --store <STORE>          Rule store file (JSON)\n"
               "      --regression <FILE>      Regression cases (JSONL)\n"
               "      --holdout <FILE>         Holdout documents (JSONL)\n" +
               extra + "  -h, --help                   Print help\n";
    }
    return "error: unrecognized subcommand '" + cmd + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    ArgCursor top(argc, argv, 1, "");
    bool failed = false;
    for (; !top.done(); top.advance()) {
        const char* arg = top.current();
        if (parse_global(top, result, failed)) {
            if (failed) {
                return result;
            }
            continue;
        }
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
        if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }
        if (arg[0] == '-') {
            unexpected(top, result);
            return result;
        }
        break;
    }

    if (top.done()) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const std::string cmd = top.current();
    ArgCursor args(argc, argv, top.index() + 1, cmd);

    if (cmd == "help") {
        result.ok = true;
        result.command = args.done() ? HelpCommand{} : HelpCommand{std::string(args.current())};
        return result;
    }
    if (cmd == "version") {
        result.ok = true;
        result.command = VersionCommand{};
        return result;
    }

    if (cmd == "apply") {
        ApplyCommand apply;
        for (; !args.done(); args.advance()) {
            const char* arg = args.current();
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{cmd};
                return result;
            }
            if (parse_global(args, result, failed)) {
                if (failed) {
                    return result;
                }
            } else if (args.is("-r", "--rules")) {
                auto v = args.value("--rules <RULES>", result);
                if (!v) {
                    return result;
                }
                apply.rules = platform::path_from_utf8(*v);
            } else if (args.is(nullptr, "--type")) {
                auto v = args.value("--type <TYPE>", result);
                if (!v) {
                    return result;
                }
                apply.type = *v;
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                apply.json = true;
            } else if (arg[0] != '-' && !apply.input) {
                apply.input = platform::path_from_utf8(arg);
            } else {
                unexpected(args, result);
                return result;
            }
        }
        if (apply.rules.empty()) {
            missing(args, result, "--rules <RULES>");
            return result;
        }
        result.ok = true;
        result.command = apply;
        return result;
    }

    if (cmd == "lint") {
        LintCommand lint;
        for (; !args.done(); args.advance()) {
            const char* arg = args.current();
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{cmd};
                return result;
            }
            if (parse_global(args, result, failed)) {
                if (failed) {
                    return result;
                }
            } else if (arg[0] != '-' && lint.path.empty()) {
                lint.path = platform::path_from_utf8(arg);
            } else {
                unexpected(args, result);
                return result;
            }
        }
        if (lint.path.empty()) {
            missing(args, result, "<PATH>");
            return result;
        }
        result.ok = true;
        result.command = lint;
        return result;
    }

    if (cmd == "gates") {
        GatesCommand gates;
        for (; !args.done(); args.advance()) {
            const char* arg = args.current();
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{cmd};
                return result;
            }
            if (parse_global(args, result, failed) ||
                parse_source(args, gates.sources, result, failed)) {
                if (failed) {
                    return result;
                }
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                gates.json = true;
            } else {
                unexpected(args, result);
                return result;
            }
        }
        if (gates.sources.rules.empty()) {
            missing(args, result, "--rules <RULES>");
            return result;
        }
        if (gates.sources.holdout && !gates.sources.responses) {
            args.fail(result, "'--holdout <FILE>' requires '--responses <RESPONSES>'");
            return result;
        }
        result.ok = true;
        result.command = gates;
        return result;
    }

    if (cmd == "shakedown" || cmd == "batch" || cmd == "full") {
        SourceOptions sources;
        std::filesystem::path corpus;
        ShakedownCommand shakedown;
        BatchCommand batch;
        FullCommand full;

        for (; !args.done(); args.advance()) {
            const char* arg = args.current();
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{cmd};
                return result;
            }
            if (parse_global(args, result, failed) ||
                parse_source(args, sources, result, failed)) {
                if (failed) {
                    return result;
                }
                continue;
            }
            if (args.is(nullptr, "--corpus")) {
                auto v = args.value("--corpus <CORPUS>", result);
                if (!v) {
                    return result;
                }
                corpus = platform::path_from_utf8(*v);
            } else if (cmd == "shakedown" && args.is(nullptr, "--max-cases")) {
                auto n = args.count_value("--max-cases <N>", result);
                if (!n) {
                    return result;
                }
                shakedown.max_cases = *n;
            } else if (cmd == "batch" && args.is(nullptr, "--cycles")) {
                auto n = args.count_value("--cycles <N>", result);
                if (!n) {
                    return result;
                }
                batch.cycles = *n;
            } else if (cmd == "batch" && args.is(nullptr, "--sample-size")) {
                auto n = args.count_value("--sample-size <N>", result);
                if (!n) {
                    return result;
                }
                batch.sample_size = *n;
            } else if (cmd == "full" && args.is(nullptr, "--checkpoint")) {
                auto v = args.value("--checkpoint <FILE>", result);
                if (!v) {
                    return result;
                }
                full.checkpoint = platform::path_from_utf8(*v);
            } else if (cmd == "full" && args.is("-o", "--output")) {
                auto v = args.value("--output <FILE>", result);
                if (!v) {
                    return result;
                }
                full.output = platform::path_from_utf8(*v);
            } else if (cmd == "full" && str_eq(arg, "--resume")) {
                full.resume = true;
            } else if (cmd == "full" && str_eq(arg, "--skip-readiness")) {
                full.skip_readiness = true;
            } else {
                unexpected(args, result);
                return result;
            }
        }

        if (sources.rules.empty()) {
            missing(args, result, "--rules <RULES>");
            return result;
        }
        if (corpus.empty()) {
            missing(args, result, "--corpus <CORPUS>");
            return result;
        }
        if (!sources.responses) {
            missing(args, result, "--responses <RESPONSES>");
            return result;
        }
        if (cmd == "batch" && batch.cycles == 0) {
            args.fail(result, "'--cycles <N>' must be at least 1");
            return result;
        }
        if (full.resume && !full.checkpoint) {
            args.fail(result, "'--resume' requires '--checkpoint <FILE>'");
            return result;
        }

        result.ok = true;
        if (cmd == "shakedown") {
            shakedown.sources = std::move(sources);
            shakedown.corpus = std::move(corpus);
            result.command = std::move(shakedown);
        } else if (cmd == "batch") {
            batch.sources = std::move(sources);
            batch.corpus = std::move(corpus);
            result.command = std::move(batch);
        } else {
            full.sources = std::move(sources);
            full.corpus = std::move(corpus);
            result.command = std::move(full);
        }
        return result;
    }

    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message =
        usage_error("unrecognized subcommand '" + cmd + "'", "");
    return result;
}

}  // namespace lexrefine::cli
