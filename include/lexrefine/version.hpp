// ==============================================================================
// lexrefine/version.hpp - VersionManager: семантические версии набора правил
// ==============================================================================
//
// Назначение:
// - Разбор и инкремент "vMAJOR.MINOR.PATCH"
// - tag(): запись версии с контрольной суммой содержимого (FNV-1a 64)
// - Линия происхождения (parent_version) для rollback
// - Номер версии выдаётся один раз: после restore() следующий tag()
//   продолжает от наибольшей выданной версии, а не от текущей
// - Отметка стабильных версий со снимком метрик holdout
//
// ==============================================================================

#ifndef LEXREFINE_VERSION_HPP
#define LEXREFINE_VERSION_HPP

#include <lexrefine/rule.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lexrefine::version {

enum class Bump { Major, Minor, Patch };

std::string to_string(Bump b);

/// "major" | "minor" | "patch". Бросает std::invalid_argument.
Bump parse_bump(std::string_view s);

/// Семантическая версия
struct SemVer {
    int major = 1;
    int minor = 0;
    int patch = 0;

    std::string to_string() const;

    SemVer bumped(Bump kind) const;

    bool operator==(const SemVer& o) const {
        return major == o.major && minor == o.minor && patch == o.patch;
    }
    bool operator<(const SemVer& o) const;
};

/// "v1.2.3" -> SemVer. Бросает std::invalid_argument.
SemVer parse_version(std::string_view text);

/// Запись о версии набора правил
struct VersionRecord {
    std::string version;
    std::string parent_version;  // пусто для первой версии
    std::string description;
    std::string checksum;  // FNV-1a 64, 16 hex символов
    std::chrono::system_clock::time_point created_at{};
    bool is_stable = false;
    std::map<std::string, double> performance_snapshot;
    std::vector<rule::Rule> rules;
};

/// FNV-1a 64 над байтами
std::uint64_t fnv1a64(std::string_view data);

/// Каноническое представление: правила отсортированы по rule_id,
/// изменяемые счётчики (usage_count, timestamps) не входят
std::string canonical_form(const std::vector<rule::Rule>& rules);

/// Контрольная сумма содержимого (hex)
std::string checksum(const std::vector<rule::Rule>& rules);

class VersionManager {
public:
    explicit VersionManager(std::string current = "v1.0.0");

    /// Текущая версия
    std::string current() const;

    /// Наибольшая выданная или зарегистрированная версия
    std::string highest() const;

    /// Увеличить компонент наибольшей версии, младшие обнуляются.
    /// Возвращает новую версию и делает её текущей.
    std::string increment_version(Bump kind);

    /// Следующая версия без изменения состояния
    std::string peek_next(Bump kind) const;

    /// Зарегистрировать новую версию: increment_version(kind) + запись
    /// с контрольной суммой; parent = предыдущая текущая (не наибольшая)
    VersionRecord tag(const std::vector<rule::Rule>& rules, const std::string& description,
                      Bump kind = Bump::Minor);

    /// Зарегистрировать уже существующую версию (загрузка из persistence)
    void adopt(const std::string& version, const std::vector<rule::Rule>& rules,
               const std::string& description);

    /// Сделать текущей ранее зарегистрированную версию (rollback).
    /// Наибольшая версия не уменьшается.
    bool restore(const std::string& version);

    void mark_stable(const std::string& version, const std::map<std::string, double>& metrics);

    std::optional<VersionRecord> find(const std::string& version) const;

    std::optional<VersionRecord> parent_of(const std::string& version) const;

    /// Последняя стабильная версия
    std::optional<VersionRecord> latest_stable() const;

    /// Совпадает ли контрольная сумма записи с её содержимым
    static bool verify(const VersionRecord& record);

    std::vector<VersionRecord> history() const;

private:
    mutable std::mutex mutex_;
    SemVer current_;
    SemVer highest_;
    std::vector<VersionRecord> records_;
};

}  // namespace lexrefine::version

#endif  // LEXREFINE_VERSION_HPP
