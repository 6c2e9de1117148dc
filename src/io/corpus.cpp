// ==============================================================================
// corpus.cpp - Корпус судебных документов и стратифицированная выборка
// ==============================================================================

#include <lexrefine/corpus.hpp>
#include <lexrefine/jsonl.hpp>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>
#include <tuple>

namespace lexrefine::corpus {

Value DocumentCase::to_metadata() const {
    Value meta = Value::make_object();
    meta.set("case_id", Value(case_id));
    meta.set("court_type", Value(court_type));
    meta.set("case_type", Value(case_type));
    meta.set("year", Value(year));
    meta.set("format_type", Value(format_type));
    return meta;
}

Strata Strata::defaults() {
    Strata s;
    s.court_types = {"고등법원", "지방법원", "행정법원"};
    s.case_types = {"민사", "형사", "행정"};
    for (int y = 2020; y <= 2024; ++y) {
        s.years.push_back(y);
    }
    return s;
}

double diversity_score(const std::vector<DocumentCase>& cases) {
    if (cases.empty()) {
        return 0.0;
    }
    std::set<std::string> courts;
    std::set<std::string> types;
    std::set<int> years;
    for (const auto& c : cases) {
        courts.insert(c.court_type);
        types.insert(c.case_type);
        years.insert(c.year);
    }
    double score = static_cast<double>(courts.size() + types.size() + years.size()) / 15.0;
    return std::min(score, 1.0);
}

// ----------------------------------------------------------------------------
// MemoryCaseSource
// ----------------------------------------------------------------------------

MemoryCaseSource::MemoryCaseSource(std::vector<DocumentCase> cases) : cases_(std::move(cases)) {}

void MemoryCaseSource::add(DocumentCase c) { cases_.push_back(std::move(c)); }

std::size_t MemoryCaseSource::count() const { return cases_.size(); }

std::vector<DocumentCase> MemoryCaseSource::fetch(std::size_t offset, std::size_t limit) const {
    std::vector<DocumentCase> out;
    if (offset >= cases_.size()) {
        return out;
    }
    std::size_t end = std::min(cases_.size(), offset + limit);
    out.assign(cases_.begin() + static_cast<std::ptrdiff_t>(offset),
               cases_.begin() + static_cast<std::ptrdiff_t>(end));
    return out;
}

namespace {

template <typename T>
bool in_stratum(const std::vector<T>& allowed, const T& value) {
    return allowed.empty() || std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

using GroupKey = std::tuple<std::string, std::string, int>;

/// Обход групп по кругу: по одному документу из каждой группы за проход
void round_robin(const std::map<GroupKey, std::vector<const DocumentCase*>>& groups,
                 std::size_t size, std::vector<DocumentCase>& out) {
    std::size_t depth = 0;
    bool progressed = true;
    while (out.size() < size && progressed) {
        progressed = false;
        for (const auto& [key, members] : groups) {
            if (depth < members.size()) {
                out.push_back(*members[depth]);
                progressed = true;
                if (out.size() >= size) {
                    return;
                }
            }
        }
        ++depth;
    }
}

}  // namespace

std::vector<DocumentCase> MemoryCaseSource::stratified_sample(std::size_t size,
                                                              const Strata& strata) const {
    std::map<GroupKey, std::vector<const DocumentCase*>> inside;
    std::map<GroupKey, std::vector<const DocumentCase*>> outside;

    for (const auto& c : cases_) {
        GroupKey key{c.court_type, c.case_type, c.year};
        bool matches = in_stratum(strata.court_types, c.court_type) &&
                       in_stratum(strata.case_types, c.case_type) &&
                       in_stratum(strata.years, c.year);
        (matches ? inside : outside)[key].push_back(&c);
    }

    std::vector<DocumentCase> out;
    out.reserve(std::min(size, cases_.size()));
    round_robin(inside, size, out);
    if (out.size() < size) {
        round_robin(outside, size, out);
    }
    return out;
}

// ----------------------------------------------------------------------------
// JsonlCaseSource
// ----------------------------------------------------------------------------

namespace {

int json_year(const rapidjson::Value& obj) {
    auto it = obj.FindMember("year");
    if (it == obj.MemberEnd()) {
        return 0;
    }
    if (it->value.IsInt()) {
        return it->value.GetInt();
    }
    if (it->value.IsString()) {
        return static_cast<int>(std::strtol(it->value.GetString(), nullptr, 10));
    }
    return 0;
}

}  // namespace

JsonlCaseSource::JsonlCaseSource(std::filesystem::path path) : path_(std::move(path)) {}

JsonlCaseSource::LoadResult JsonlCaseSource::load() {
    LoadResult result;
    io::JsonlReader reader(path_);
    if (!reader.open()) {
        result.error = reader.last_error()->format();
        return result;
    }

    std::vector<DocumentCase> loaded;
    rapidjson::Document doc;
    while (reader.next(doc)) {
        DocumentCase c;
        c.case_id = io::json_string(doc, "case_id");
        if (c.case_id.empty()) {
            c.case_id = "case_" + std::to_string(reader.line_number());
        }
        c.court_type = io::json_string(doc, "court_type");
        c.case_type = io::json_string(doc, "case_type");
        c.year = json_year(doc);
        c.format_type = io::json_string(doc, "format_type", "txt");
        c.content = io::json_string(doc, "content");
        loaded.push_back(std::move(c));
    }
    if (reader.last_error()) {
        result.error = reader.last_error()->format();
        return result;
    }

    for (auto& c : loaded) {
        add(std::move(c));
    }
    result.ok = true;
    result.count = loaded.size();
    return result;
}

}  // namespace lexrefine::corpus
