// ==============================================================================
// store.cpp - RuleStore и RulePersistence
// ==============================================================================

#include <lexrefine/output.hpp>
#include <lexrefine/platform.hpp>
#include <lexrefine/store.hpp>

#include <algorithm>
#include <cctype>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <sstream>

namespace lexrefine::store {

// ============================================================================
// RuleSet
// ============================================================================

const rule::Rule* RuleSet::find(const std::string& rule_id) const {
    for (const auto& r : rules) {
        if (r.rule_id == rule_id) {
            return &r;
        }
    }
    return nullptr;
}

std::size_t RuleSet::enabled_count() const {
    return static_cast<std::size_t>(
        std::count_if(rules.begin(), rules.end(), [](const rule::Rule& r) { return r.enabled; }));
}

// ============================================================================
// JSON serialisation
// ============================================================================

namespace {

void add_string(rapidjson::Value& obj, const char* key, const std::string& value,
                rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), alloc);
    obj.AddMember(rapidjson::StringRef(key), v, alloc);
}

std::string get_string(const rapidjson::Value& obj, const char* key, const std::string& fallback) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return fallback;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::string require_string(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        throw PersistenceError(std::string("rule set json: missing string field '") + key + "'");
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

rule::Timestamp get_time(const rapidjson::Value& obj, const char* key) {
    std::string text = get_string(obj, key, "");
    if (text.empty()) {
        return rule::Timestamp{};
    }
    try {
        return platform::parse_iso8601(text);
    } catch (const std::invalid_argument& e) {
        throw PersistenceError(std::string("rule set json: ") + e.what());
    }
}

}  // namespace

std::string serialize_rule_set(const RuleSet& set) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    add_string(doc, "version", set.version, alloc);
    add_string(doc, "saved_at", platform::format_iso8601(std::chrono::system_clock::now()), alloc);

    rapidjson::Value rules(rapidjson::kArrayType);
    for (const auto& r : set.rules) {
        rapidjson::Value obj(rapidjson::kObjectType);
        add_string(obj, "rule_id", r.rule_id, alloc);
        add_string(obj, "type", rule::to_string(r.type), alloc);
        add_string(obj, "pattern", r.pattern, alloc);
        add_string(obj, "replacement", r.replacement, alloc);
        obj.AddMember("priority", r.priority, alloc);
        obj.AddMember("enabled", r.enabled, alloc);
        add_string(obj, "description", r.description, alloc);
        obj.AddMember("performance_score", r.performance_score, alloc);
        obj.AddMember("usage_count", static_cast<uint64_t>(r.usage_count), alloc);
        add_string(obj, "created_at", platform::format_iso8601(r.created_at), alloc);
        add_string(obj, "updated_at", platform::format_iso8601(r.updated_at), alloc);
        rules.PushBack(obj, alloc);
    }
    doc.AddMember("rules", rules, alloc);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

RuleSet deserialize_rule_set(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "rule set json: " << rapidjson::GetParseError_En(doc.GetParseError())
            << " at offset " << doc.GetErrorOffset();
        throw PersistenceError(oss.str());
    }
    if (!doc.IsObject()) {
        throw PersistenceError("rule set json: root must be an object");
    }

    RuleSet set;
    set.version = require_string(doc, "version");

    auto rules_it = doc.FindMember("rules");
    if (rules_it == doc.MemberEnd() || !rules_it->value.IsArray()) {
        throw PersistenceError("rule set json: missing array field 'rules'");
    }

    for (const auto& obj : rules_it->value.GetArray()) {
        if (!obj.IsObject()) {
            throw PersistenceError("rule set json: rule must be an object");
        }
        rule::Rule r;
        r.rule_id = require_string(obj, "rule_id");
        try {
            r.type = rule::parse_rule_type(require_string(obj, "type"));
        } catch (const std::invalid_argument& e) {
            throw PersistenceError(std::string("rule set json: ") + e.what());
        }
        r.pattern = require_string(obj, "pattern");
        r.replacement = get_string(obj, "replacement", "");
        if (obj.HasMember("priority") && obj["priority"].IsInt()) {
            r.priority = obj["priority"].GetInt();
        }
        if (obj.HasMember("enabled") && obj["enabled"].IsBool()) {
            r.enabled = obj["enabled"].GetBool();
        }
        r.description = get_string(obj, "description", "");
        if (obj.HasMember("performance_score") && obj["performance_score"].IsNumber()) {
            r.performance_score = obj["performance_score"].GetDouble();
        }
        if (obj.HasMember("usage_count") && obj["usage_count"].IsUint64()) {
            r.usage_count = obj["usage_count"].GetUint64();
        }
        r.created_at = get_time(obj, "created_at");
        r.updated_at = get_time(obj, "updated_at");
        set.rules.push_back(std::move(r));
    }
    return set;
}

// ============================================================================
// MemoryPersistence
// ============================================================================

MemoryPersistence::MemoryPersistence(RuleSet initial) : stored_(std::move(initial)) {}

std::optional<RuleSet> MemoryPersistence::load_latest_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_;
}

void MemoryPersistence::save_version(const RuleSet& set) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_failure_ && (!failure_predicate_ || failure_predicate_(set))) {
        std::string message = std::move(*pending_failure_);
        pending_failure_.reset();
        failure_predicate_ = nullptr;
        throw PersistenceError(message);
    }
    stored_ = set;
    ++saves_;
}

void MemoryPersistence::fail_next_save(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failure_ = std::move(message);
    failure_predicate_ = nullptr;
}

void MemoryPersistence::fail_save_if(std::function<bool(const RuleSet&)> predicate,
                                     std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_failure_ = std::move(message);
    failure_predicate_ = std::move(predicate);
}

std::size_t MemoryPersistence::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saves_;
}

// ============================================================================
// JsonFilePersistence
// ============================================================================

JsonFilePersistence::JsonFilePersistence(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<RuleSet> JsonFilePersistence::load_latest_version() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }
    std::string data;
    try {
        data = platform::read_file(path_);
    } catch (const std::runtime_error& e) {
        throw PersistenceError(e.what());
    }
    return deserialize_rule_set(data);
}

void JsonFilePersistence::save_version(const RuleSet& set) {
    try {
        platform::write_file_atomic(path_, serialize_rule_set(set));
    } catch (const std::runtime_error& e) {
        throw PersistenceError(e.what());
    }
}

// ============================================================================
// Similarity
// ============================================================================

std::set<std::string> pattern_keywords(const std::string& pattern) {
    static const std::string meta = "(){}[]\\^$.*+?|";

    std::string cleaned;
    cleaned.reserve(pattern.size());
    for (char c : pattern) {
        if (meta.find(c) != std::string::npos) {
            cleaned += ' ';
        } else {
            cleaned += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    std::set<std::string> keywords;
    std::istringstream iss(cleaned);
    std::string word;
    while (iss >> word) {
        // Длина в символах, а не байтах: один слог хангыль - не слово
        if (output::display_width(word) > 1) {
            keywords.insert(word);
        }
    }
    return keywords;
}

double pattern_similarity(const std::string& a, const std::string& b) {
    std::set<std::string> ka = pattern_keywords(a);
    std::set<std::string> kb = pattern_keywords(b);
    if (ka.empty() || kb.empty()) {
        return 0.0;
    }

    std::size_t intersection = 0;
    for (const auto& w : ka) {
        if (kb.count(w) > 0) {
            ++intersection;
        }
    }
    std::size_t union_size = ka.size() + kb.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

// ============================================================================
// RuleStore
// ============================================================================

RuleStore::RuleStore(RulePersistence& persistence, double similarity_threshold,
                     output::Writer* log)
    : persistence_(persistence),
      similarity_threshold_(similarity_threshold),
      log_(log),
      current_(std::make_shared<const RuleSet>(RuleSet{"v1.0.0", {}})) {}

std::shared_ptr<const RuleSet> RuleStore::load_latest() {
    std::optional<RuleSet> loaded = persistence_.load_latest_version();

    std::lock_guard<std::mutex> lock(mutex_);
    if (loaded) {
        current_ = std::make_shared<const RuleSet>(std::move(*loaded));
    } else {
        current_ = std::make_shared<const RuleSet>(RuleSet{"v1.0.0", {}});
    }
    if (log_ != nullptr) {
        log_->debug("loaded rule set " + current_->version + " (" +
                    std::to_string(current_->rules.size()) + " rules)");
    }
    return current_;
}

std::shared_ptr<const RuleSet> RuleStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::string RuleStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_->version;
}

void RuleStore::commit_locked(std::shared_ptr<const RuleSet> next) {
    // Сначала persistence: при исключении current_ остаётся прежним
    persistence_.save_version(*next);
    current_ = std::move(next);
}

void RuleStore::replace_all(std::vector<rule::Rule> rules, const std::string& version) {
    auto next = std::make_shared<RuleSet>();
    next->version = version;
    next->rules = std::move(rules);

    std::lock_guard<std::mutex> lock(mutex_);
    commit_locked(std::move(next));
    if (log_ != nullptr) {
        log_->debug("rule set replaced with " + version);
    }
}

void RuleStore::reset_in_memory(std::shared_ptr<const RuleSet> snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(snapshot);
    if (log_ != nullptr) {
        log_->warn("rule set reset in memory to " + current_->version + " without saving");
    }
}

void RuleStore::upsert_one(const rule::Rule& r) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto next = std::make_shared<RuleSet>(*current_);
    bool replaced = false;
    for (auto& existing : next->rules) {
        if (existing.rule_id == r.rule_id) {
            existing = r;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        next->rules.push_back(r);
    }
    commit_locked(std::move(next));
}

std::optional<rule::Rule> RuleStore::find_duplicate(const rule::Rule& candidate) const {
    auto set = snapshot();

    for (const auto& existing : set->rules) {
        if (!existing.enabled || existing.type != candidate.type ||
            existing.rule_id == candidate.rule_id) {
            continue;
        }
        if (existing.pattern == candidate.pattern) {
            return existing;
        }
    }
    for (const auto& existing : set->rules) {
        if (!existing.enabled || existing.type != candidate.type ||
            existing.rule_id == candidate.rule_id) {
            continue;
        }
        if (pattern_similarity(existing.pattern, candidate.pattern) >= similarity_threshold_) {
            return existing;
        }
    }
    return std::nullopt;
}

std::optional<rule::Rule> RuleStore::find(const std::string& rule_id) const {
    auto set = snapshot();
    if (const rule::Rule* r = set->find(rule_id)) {
        return *r;
    }
    return std::nullopt;
}

std::optional<rule::Rule> RuleStore::find_by_pattern(rule::RuleType type,
                                                     const std::string& pattern) const {
    auto set = snapshot();
    for (const auto& existing : set->rules) {
        if (existing.enabled && existing.type == type && existing.pattern == pattern) {
            return existing;
        }
    }
    return std::nullopt;
}

bool RuleStore::disable(const std::string& rule_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto next = std::make_shared<RuleSet>(*current_);
    bool found = false;
    for (auto& r : next->rules) {
        if (r.rule_id == rule_id) {
            r.enabled = false;
            r.updated_at = std::chrono::system_clock::now();
            found = true;
            break;
        }
    }
    if (!found) {
        return false;
    }
    commit_locked(std::move(next));
    return true;
}

void RuleStore::record_usage(const std::map<std::string, std::uint64_t>& deltas) {
    if (deltas.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<RuleSet>(*current_);
    bool changed = false;
    for (auto& r : next->rules) {
        auto it = deltas.find(r.rule_id);
        if (it != deltas.end() && it->second > 0) {
            r.usage_count += it->second;
            r.updated_at = std::chrono::system_clock::now();
            changed = true;
        }
    }
    if (changed) {
        commit_locked(std::move(next));
    }
}

}  // namespace lexrefine::store
