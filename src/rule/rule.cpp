// ==============================================================================
// rule.cpp - Правило преобразования текста
// ==============================================================================
//
// Одна стратегия применения на каждый RuleType. Выбор стратегии - switch по
// закрытому enum: новый тип без стратегии не скомпилируется без
// предупреждения -Wswitch.
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <lexrefine/rule.hpp>
#include <set>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace lexrefine::rule {

// ============================================================================
// RuleType string conversion
// ============================================================================

std::string to_string(RuleType t) {
    switch (t) {
    case RuleType::NoiseRemoval:
        return "noise_removal";
    case RuleType::LegalFiltering:
        return "legal_filtering";
    case RuleType::FactExtraction:
        return "fact_extraction";
    case RuleType::RedundancyRemoval:
        return "redundancy_removal";
    case RuleType::PostNormalize:
        return "post_normalize";
    }
    return "unknown";
}

RuleType parse_rule_type(std::string_view s) {
    if (s == "noise_removal")
        return RuleType::NoiseRemoval;
    if (s == "legal_filtering")
        return RuleType::LegalFiltering;
    if (s == "fact_extraction")
        return RuleType::FactExtraction;
    if (s == "redundancy_removal")
        return RuleType::RedundancyRemoval;
    if (s == "post_normalize")
        return RuleType::PostNormalize;
    throw std::invalid_argument("unknown rule type '" + std::string(s) +
                                "', must be: noise_removal, legal_filtering, fact_extraction, "
                                "redundancy_removal or post_normalize");
}

const std::vector<RuleType>& all_rule_types() {
    static const std::vector<RuleType> types = {
        RuleType::NoiseRemoval, RuleType::LegalFiltering, RuleType::FactExtraction,
        RuleType::RedundancyRemoval, RuleType::PostNormalize};
    return types;
}

// ============================================================================
// Error formatting
// ============================================================================

std::string RuleError::format() const {
    return "rule '" + rule_id + "' failed: " + message;
}

std::string Error::format() const {
    std::ostringstream oss;
    oss << "rule error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ============================================================================
// Стратегии применения
// ============================================================================

namespace {

/// Стратегия: (regex, rule, text, applied&) -> new text
using Strategy = std::string (*)(const std::regex&, const Rule&, const std::string&, bool&);

// Замена в формате ECMAScript: '$' удваивается, чтобы текст от
// evaluator не читался как ссылка на группу
std::string literal_format(const std::string& replacement) {
    if (replacement.find('$') == std::string::npos) {
        return replacement;
    }
    std::string out;
    out.reserve(replacement.size() + 4);
    for (char c : replacement) {
        if (c == '$') {
            out += '$';
        }
        out += c;
    }
    return out;
}

// noise_removal, redundancy_removal, post_normalize
std::string apply_substitution(const std::regex& re, const Rule& rule, const std::string& text,
                               bool& applied) {
    std::string result = std::regex_replace(text, re, literal_format(rule.replacement));
    applied = (result != text);
    return result;
}

// legal_filtering: удалить предложения, в которых найден паттерн
std::string apply_legal_filtering(const std::regex& re, const Rule& /*rule*/,
                                  const std::string& text, bool& applied) {
    std::vector<std::string> sentences = split_sentences(text);
    std::vector<std::string> kept;
    kept.reserve(sentences.size());

    applied = false;
    for (auto& sentence : sentences) {
        if (std::regex_search(sentence, re)) {
            applied = true;
        } else {
            kept.push_back(std::move(sentence));
        }
    }

    // Ничего не удалено - текст не трогаем (разделители сохраняются)
    if (!applied) {
        return text;
    }

    std::string result;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            result += ". ";
        }
        result += kept[i];
    }
    return result;
}

// fact_extraction: оставить только совпадения, через пробел
std::string apply_fact_extraction(const std::regex& re, const Rule& /*rule*/,
                                  const std::string& text, bool& applied) {
    std::string result;
    auto begin = std::sregex_iterator(text.begin(), text.end(), re);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        if (it->length(0) == 0) {
            continue;
        }
        if (!result.empty()) {
            result += ' ';
        }
        result += it->str(0);
    }

    if (result.empty()) {
        applied = false;
        return text;
    }
    applied = (result != text);
    return result;
}

Strategy strategy_for(RuleType type) {
    switch (type) {
    case RuleType::NoiseRemoval:
    case RuleType::RedundancyRemoval:
    case RuleType::PostNormalize:
        return &apply_substitution;
    case RuleType::LegalFiltering:
        return &apply_legal_filtering;
    case RuleType::FactExtraction:
        return &apply_fact_extraction;
    }
    return &apply_substitution;
}

}  // namespace

std::regex::flag_type pattern_flags() {
    return std::regex::ECMAScript | std::regex::icase;
}

std::optional<std::string> validate_pattern(const std::string& pattern) {
    if (pattern.empty()) {
        return std::string("empty pattern");
    }
    try {
        std::regex re(pattern, pattern_flags());
        (void)re;
    } catch (const std::regex_error& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

std::vector<std::string> split_sentences(const std::string& text) {
    static const std::regex delimiter(R"([.!?]\s+)");

    std::vector<std::string> sentences;
    std::sregex_token_iterator it(text.begin(), text.end(), delimiter, -1);
    std::sregex_token_iterator end;
    for (; it != end; ++it) {
        sentences.push_back(it->str());
    }
    if (sentences.empty()) {
        sentences.push_back(text);
    }
    return sentences;
}

// ============================================================================
// CompiledRule
// ============================================================================

CompiledRule CompiledRule::compile(const Rule& rule) {
    CompiledRule compiled;
    compiled.rule_ = rule;
    if (rule.pattern.empty()) {
        compiled.compile_error_ = "empty pattern";
        return compiled;
    }
    try {
        compiled.regex_ = std::make_shared<const std::regex>(rule.pattern, pattern_flags());
    } catch (const std::regex_error& e) {
        compiled.compile_error_ = e.what();
    }
    return compiled;
}

ApplyOutcome CompiledRule::apply(const std::string& text, const ApplyOptions& options) const {
    ApplyOutcome outcome;
    outcome.text = text;

    if (!rule_.enabled) {
        return outcome;
    }
    if (rule_.type == RuleType::FactExtraction && !options.fact_extraction_enabled) {
        return outcome;
    }
    if (!regex_) {
        outcome.error = RuleError{rule_.rule_id, "invalid pattern: " + compile_error_};
        return outcome;
    }

    try {
        bool applied = false;
        std::string result = strategy_for(rule_.type)(*regex_, rule_, text, applied);
        outcome.text = std::move(result);
        outcome.applied = applied;
    } catch (const std::regex_error& e) {
        // error_complexity / error_stack на длинных входах
        outcome.text = text;
        outcome.applied = false;
        outcome.error = RuleError{rule_.rule_id, e.what()};
    } catch (const std::length_error& e) {
        outcome.text = text;
        outcome.applied = false;
        outcome.error = RuleError{rule_.rule_id, e.what()};
    }
    return outcome;
}

// ============================================================================
// Rule
// ============================================================================

std::pair<std::string, bool> Rule::apply(const std::string& text) const {
    ApplyOutcome outcome = CompiledRule::compile(*this).apply(text, ApplyOptions{});
    return {std::move(outcome.text), outcome.applied};
}

Rule make_rule(std::string rule_id, RuleType type, std::string pattern, std::string replacement,
               int priority, std::string description) {
    Rule rule;
    rule.rule_id = std::move(rule_id);
    rule.type = type;
    rule.pattern = std::move(pattern);
    rule.replacement = std::move(replacement);
    rule.priority = priority;
    rule.description = std::move(description);
    rule.created_at = std::chrono::system_clock::now();
    rule.updated_at = rule.created_at;
    return rule;
}

// ============================================================================
// YAML loading
// ============================================================================

bool is_yaml_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".yml" || ext == ".yaml";
}

namespace {

Rule parse_rule_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::invalid_argument("rule must be a mapping");
    }

    Rule rule;
    if (node["id"]) {
        rule.rule_id = node["id"].as<std::string>();
    } else if (node["rule_id"]) {
        rule.rule_id = node["rule_id"].as<std::string>();
    } else {
        throw std::invalid_argument("rule is missing 'id'");
    }

    if (!node["type"]) {
        throw std::invalid_argument("rule '" + rule.rule_id + "' is missing 'type'");
    }
    rule.type = parse_rule_type(node["type"].as<std::string>());

    if (!node["pattern"]) {
        throw std::invalid_argument("rule '" + rule.rule_id + "' is missing 'pattern'");
    }
    rule.pattern = node["pattern"].as<std::string>();
    rule.replacement = node["replacement"].as<std::string>("");
    rule.priority = node["priority"].as<int>(0);
    rule.enabled = node["enabled"].as<bool>(true);
    rule.description = node["description"].as<std::string>("");
    rule.performance_score = node["performance_score"].as<double>(0.0);

    rule.created_at = std::chrono::system_clock::now();
    rule.updated_at = rule.created_at;
    return rule;
}

void parse_rules_root(const YAML::Node& root, std::vector<Rule>& out) {
    if (!root || root.IsNull()) {
        return;
    }
    if (root.IsMap() && root["rules"]) {
        const YAML::Node& rules = root["rules"];
        if (!rules.IsSequence()) {
            throw std::invalid_argument("'rules' must be a sequence");
        }
        for (const auto& node : rules) {
            out.push_back(parse_rule_yaml(node));
        }
    } else if (root.IsSequence()) {
        for (const auto& node : root) {
            out.push_back(parse_rule_yaml(node));
        }
    } else {
        out.push_back(parse_rule_yaml(root));
    }
}

}  // namespace

LoadResult load_from_string(const std::string& yaml, const std::string& origin) {
    LoadResult result;
    try {
        parse_rules_root(YAML::Load(yaml), result.rules);
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

    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
            if (entry.is_regular_file() && is_yaml_extension(entry.path())) {
                files.push_back(entry.path());
            }
        }
        // Порядок обхода директории не определён
        std::sort(files.begin(), files.end());
    } else if (std::filesystem::exists(path, ec)) {
        if (!is_yaml_extension(path)) {
            result.error = Error{"rule must have a yaml file extension", path.string()};
            return result;
        }
        files.push_back(path);
    } else {
        result.error = Error{"path does not exist", path.string()};
        return result;
    }

    for (const auto& file : files) {
        try {
            parse_rules_root(YAML::LoadFile(file.string()), result.rules);
        } catch (const YAML::Exception& e) {
            result.error = Error{e.what(), file.string()};
            result.rules.clear();
            return result;
        } catch (const std::exception& e) {
            result.error = Error{e.what(), file.string()};
            result.rules.clear();
            return result;
        }
    }

    result.ok = true;
    return result;
}

LintResult lint(const std::filesystem::path& path) {
    LintResult result;

    LoadResult loaded = load(path);
    if (!loaded.ok) {
        result.error = loaded.error;
        return result;
    }

    result.rule_count = loaded.rules.size();
    std::set<std::string> ids;
    for (const auto& rule : loaded.rules) {
        if (!ids.insert(rule.rule_id).second) {
            result.issues.push_back({rule.rule_id, "duplicate rule id"});
        }
        if (auto problem = validate_pattern(rule.pattern)) {
            result.issues.push_back({rule.rule_id, "invalid pattern: " + *problem});
        }
    }

    result.ok = true;
    return result;
}

}  // namespace lexrefine::rule
