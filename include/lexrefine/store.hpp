// ==============================================================================
// lexrefine/store.hpp - RuleStore: авторитетный набор правил
// ==============================================================================
//
// Назначение:
// - Единственный владелец текущего RuleSet (load / replace / upsert)
// - Поиск дубликатов: точное (type, pattern) и Jaccard по ключевым словам
// - Интерфейс RulePersistence (full-replace сохранение снимка)
// - JsonFilePersistence (RapidJSON) и MemoryPersistence
//
// Мутации сериализуются мьютексом (single writer). Каждая мутация сначала
// сохраняет полный снимок через RulePersistence и только затем
// атомарно подменяет указатель: при PersistenceError состояние в памяти
// не меняется, исключение пробрасывается вызывающему.
//
// ==============================================================================

#ifndef LEXREFINE_STORE_HPP
#define LEXREFINE_STORE_HPP

#include <lexrefine/rule.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lexrefine::output {
class Writer;
}

namespace lexrefine::store {

// ============================================================================
// RuleSet
// ============================================================================

/// Именованный снимок правил. Порядок правил не значим: движок всегда
/// пересортировывает по priority.
struct RuleSet {
    std::string version;
    std::vector<rule::Rule> rules;

    const rule::Rule* find(const std::string& rule_id) const;

    std::size_t enabled_count() const;
};

// ============================================================================
// Persistence
// ============================================================================

/// Ошибка загрузки/сохранения правил. Единственный класс ошибок, который
/// пробрасывается и останавливает текущий цикл.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RulePersistence {
public:
    virtual ~RulePersistence() = default;

    /// Последний сохранённый снимок; std::nullopt если ничего не сохранено.
    /// Бросает PersistenceError.
    virtual std::optional<RuleSet> load_latest_version() = 0;

    /// Сохранить снимок целиком, заменяя предыдущий. Бросает PersistenceError.
    virtual void save_version(const RuleSet& set) = 0;
};

/// Хранение в памяти (тесты, dry run)
class MemoryPersistence : public RulePersistence {
public:
    MemoryPersistence() = default;
    explicit MemoryPersistence(RuleSet initial);

    std::optional<RuleSet> load_latest_version() override;
    void save_version(const RuleSet& set) override;

    /// Следующее сохранение завершится PersistenceError
    void fail_next_save(std::string message);

    /// Первое сохранение, для которого predicate вернёт true, завершится
    /// PersistenceError
    void fail_save_if(std::function<bool(const RuleSet&)> predicate, std::string message);

    std::size_t save_count() const;

private:
    mutable std::mutex mutex_;
    std::optional<RuleSet> stored_;
    std::optional<std::string> pending_failure_;
    std::function<bool(const RuleSet&)> failure_predicate_;
    std::size_t saves_ = 0;
};

/// JSON файл (запись через временный файл + rename)
class JsonFilePersistence : public RulePersistence {
public:
    explicit JsonFilePersistence(std::filesystem::path path);

    std::optional<RuleSet> load_latest_version() override;
    void save_version(const RuleSet& set) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// RuleSet -> JSON
std::string serialize_rule_set(const RuleSet& set);

/// JSON -> RuleSet. Бросает PersistenceError.
RuleSet deserialize_rule_set(std::string_view json);

// ============================================================================
// Similarity
// ============================================================================

/// Ключевые слова паттерна: метасимволы regex заменяются пробелами,
/// нижний регистр (ASCII), токены длиннее одного байта
std::set<std::string> pattern_keywords(const std::string& pattern);

/// Jaccard по ключевым словам (0 если у одного из паттернов нет слов)
double pattern_similarity(const std::string& a, const std::string& b);

// ============================================================================
// RuleStore
// ============================================================================

class RuleStore {
public:
    static constexpr double DEFAULT_SIMILARITY_THRESHOLD = 0.8;

    explicit RuleStore(RulePersistence& persistence,
                       double similarity_threshold = DEFAULT_SIMILARITY_THRESHOLD,
                       output::Writer* log = nullptr);

    /// Загрузить последний снимок из persistence.
    /// Пустое хранилище -> пустой набор версии "v1.0.0".
    std::shared_ptr<const RuleSet> load_latest();

    /// Текущий снимок (неизменяемый)
    std::shared_ptr<const RuleSet> snapshot() const;

    std::string version() const;

    /// Атомарная замена всего набора
    void replace_all(std::vector<rule::Rule> rules, const std::string& version);

    /// Вернуть снимок в памяти без сохранения. Используется при откате,
    /// когда persistence уже отказала: живой набор не должен содержать
    /// правил, не прошедших гейты.
    void reset_in_memory(std::shared_ptr<const RuleSet> snapshot);

    /// Вставить или заменить правило по rule_id (версия не меняется)
    void upsert_one(const rule::Rule& rule);

    /// Включённое правило того же типа с тем же паттерном или похожим
    /// (Jaccard >= порога). Правило с тем же rule_id не учитывается.
    std::optional<rule::Rule> find_duplicate(const rule::Rule& candidate) const;

    std::optional<rule::Rule> find(const std::string& rule_id) const;

    /// Включённое правило типа type с точно совпадающим паттерном
    std::optional<rule::Rule> find_by_pattern(rule::RuleType type,
                                              const std::string& pattern) const;

    /// Выключить правило (никогда не удаляется). false если не найдено.
    bool disable(const std::string& rule_id);

    /// Увеличить usage_count по результатам batch
    void record_usage(const std::map<std::string, std::uint64_t>& deltas);

    double similarity_threshold() const { return similarity_threshold_; }

private:
    /// Сохранить и подменить снимок; вызывается под mutex_
    void commit_locked(std::shared_ptr<const RuleSet> next);

    RulePersistence& persistence_;
    double similarity_threshold_;
    output::Writer* log_;

    mutable std::mutex mutex_;
    std::shared_ptr<const RuleSet> current_;
};

}  // namespace lexrefine::store

#endif  // LEXREFINE_STORE_HPP
