// ==============================================================================
// lexrefine/corpus.hpp - Корпус судебных документов
// ==============================================================================
//
// Назначение:
// - DocumentCase: документ + метаданные (суд, категория, год)
// - CaseSource: count / fetch(offset, limit) / stratified_sample
// - MemoryCaseSource, JsonlCaseSource (один JSON объект на строку)
// - Стратифицированная выборка по (суд, категория, год), детерминированная
//
// ==============================================================================

#ifndef LEXREFINE_CORPUS_HPP
#define LEXREFINE_CORPUS_HPP

#include <lexrefine/value.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace lexrefine::corpus {

struct DocumentCase {
    std::string case_id;
    std::string court_type;   // 고등법원, 지방법원, ...
    std::string case_type;    // 민사, 형사, 행정, ...
    int year = 0;
    std::string format_type;  // txt, pdf, ...
    std::string content;

    /// Метаданные для оценщика (без текста)
    Value to_metadata() const;
};

/// Страты выборки
struct Strata {
    std::vector<std::string> court_types;
    std::vector<std::string> case_types;
    std::vector<int> years;

    /// 고등법원/지방법원/행정법원, 민사/형사/행정, 2020-2024
    static Strata defaults();
};

/// Разнообразие выборки: (#судов + #категорий + #лет) / 15, не больше 1
double diversity_score(const std::vector<DocumentCase>& cases);

class CaseSource {
public:
    virtual ~CaseSource() = default;

    virtual std::size_t count() const = 0;

    /// Документы [offset, offset + limit); за концом корпуса - пусто
    virtual std::vector<DocumentCase> fetch(std::size_t offset, std::size_t limit) const = 0;

    /// Выборка размера size (или меньше, если корпус меньше)
    virtual std::vector<DocumentCase> stratified_sample(std::size_t size,
                                                        const Strata& strata) const = 0;
};

/// Корпус в памяти
class MemoryCaseSource : public CaseSource {
public:
    MemoryCaseSource() = default;
    explicit MemoryCaseSource(std::vector<DocumentCase> cases);

    void add(DocumentCase c);

    std::size_t count() const override;
    std::vector<DocumentCase> fetch(std::size_t offset, std::size_t limit) const override;

    /// Документы из страт идут первыми; группы (суд, категория, год)
    /// обходятся по кругу в отсортированном порядке ключей. Остаток
    /// добирается документами вне страт.
    std::vector<DocumentCase> stratified_sample(std::size_t size,
                                                const Strata& strata) const override;

    const std::vector<DocumentCase>& cases() const { return cases_; }

private:
    std::vector<DocumentCase> cases_;
};

/// Корпус из JSONL файла: {"case_id", "court_type", "case_type", "year",
/// "format_type", "content"}
class JsonlCaseSource : public MemoryCaseSource {
public:
    struct LoadResult {
        bool ok = false;
        std::size_t count = 0;
        std::string error;

        explicit operator bool() const { return ok; }
    };

    explicit JsonlCaseSource(std::filesystem::path path);

    /// Прочитать файл целиком. Ошибка строки останавливает загрузку.
    LoadResult load();

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace lexrefine::corpus

#endif  // LEXREFINE_CORPUS_HPP
