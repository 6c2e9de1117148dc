// ==============================================================================
// version.cpp - VersionManager
// ==============================================================================

#include <lexrefine/version.hpp>

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace lexrefine::version {

// ============================================================================
// Bump
// ============================================================================

std::string to_string(Bump b) {
    switch (b) {
    case Bump::Major:
        return "major";
    case Bump::Minor:
        return "minor";
    case Bump::Patch:
        return "patch";
    }
    return "unknown";
}

Bump parse_bump(std::string_view s) {
    if (s == "major")
        return Bump::Major;
    if (s == "minor")
        return Bump::Minor;
    if (s == "patch")
        return Bump::Patch;
    throw std::invalid_argument("unknown version bump, must be: major, minor or patch");
}

// ============================================================================
// SemVer
// ============================================================================

std::string SemVer::to_string() const {
    return "v" + std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(patch);
}

SemVer SemVer::bumped(Bump kind) const {
    SemVer next = *this;
    switch (kind) {
    case Bump::Major:
        next.major++;
        next.minor = 0;
        next.patch = 0;
        break;
    case Bump::Minor:
        next.minor++;
        next.patch = 0;
        break;
    case Bump::Patch:
        next.patch++;
        break;
    }
    return next;
}

bool SemVer::operator<(const SemVer& o) const {
    if (major != o.major)
        return major < o.major;
    if (minor != o.minor)
        return minor < o.minor;
    return patch < o.patch;
}

SemVer parse_version(std::string_view text) {
    auto fail = [&]() {
        return std::invalid_argument("invalid version '" + std::string(text) +
                                     "', expected vMAJOR.MINOR.PATCH");
    };

    if (text.size() < 6 || (text[0] != 'v' && text[0] != 'V')) {
        throw fail();
    }

    int parts[3] = {0, 0, 0};
    size_t idx = 1;
    for (int p = 0; p < 3; ++p) {
        size_t start = idx;
        long value = 0;
        while (idx < text.size() && text[idx] >= '0' && text[idx] <= '9') {
            value = value * 10 + (text[idx] - '0');
            if (value > 1000000) {
                throw fail();
            }
            ++idx;
        }
        if (idx == start) {
            throw fail();
        }
        parts[p] = static_cast<int>(value);
        if (p < 2) {
            if (idx >= text.size() || text[idx] != '.') {
                throw fail();
            }
            ++idx;
        }
    }
    if (idx != text.size()) {
        throw fail();
    }

    return SemVer{parts[0], parts[1], parts[2]};
}

// ============================================================================
// Checksum
// ============================================================================

std::uint64_t fnv1a64(std::string_view data) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (char c : data) {
        hash ^= static_cast<std::uint8_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string canonical_form(const std::vector<rule::Rule>& rules) {
    std::vector<const rule::Rule*> sorted;
    sorted.reserve(rules.size());
    for (const auto& r : rules) {
        sorted.push_back(&r);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const rule::Rule* a, const rule::Rule* b) { return a->rule_id < b->rule_id; });

    // Длина перед каждым полем: разделитель внутри паттерна не создаёт коллизий
    std::string out;
    auto field = [&out](const std::string& value) {
        out += std::to_string(value.size());
        out += ':';
        out += value;
        out += '|';
    };
    for (const rule::Rule* r : sorted) {
        field(r->rule_id);
        field(rule::to_string(r->type));
        field(r->pattern);
        field(r->replacement);
        field(std::to_string(r->priority));
        field(r->enabled ? "1" : "0");
        out += '\n';
    }
    return out;
}

std::string checksum(const std::vector<rule::Rule>& rules) {
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx",
                  static_cast<unsigned long long>(fnv1a64(canonical_form(rules))));
    return std::string(buffer, 16);
}

// ============================================================================
// VersionManager
// ============================================================================

VersionManager::VersionManager(std::string current)
    : current_(parse_version(current)), highest_(current_) {}

std::string VersionManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.to_string();
}

std::string VersionManager::highest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return highest_.to_string();
}

std::string VersionManager::increment_version(Bump kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = highest_.bumped(kind);
    highest_ = current_;
    return current_.to_string();
}

std::string VersionManager::peek_next(Bump kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return highest_.bumped(kind).to_string();
}

VersionRecord VersionManager::tag(const std::vector<rule::Rule>& rules,
                                  const std::string& description, Bump kind) {
    std::lock_guard<std::mutex> lock(mutex_);

    VersionRecord record;
    record.parent_version = current_.to_string();
    current_ = highest_.bumped(kind);
    highest_ = current_;
    record.version = current_.to_string();
    record.description = description;
    record.checksum = checksum(rules);
    record.created_at = std::chrono::system_clock::now();
    record.rules = rules;

    records_.push_back(record);
    return record;
}

void VersionManager::adopt(const std::string& version, const std::vector<rule::Rule>& rules,
                           const std::string& description) {
    SemVer parsed = parse_version(version);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& r : records_) {
        if (r.version == version) {
            current_ = parsed;
            return;
        }
    }

    VersionRecord record;
    record.version = parsed.to_string();
    record.description = description;
    record.checksum = checksum(rules);
    record.created_at = std::chrono::system_clock::now();
    record.rules = rules;
    records_.push_back(std::move(record));
    current_ = parsed;
    if (highest_ < parsed) {
        highest_ = parsed;
    }
}

bool VersionManager::restore(const std::string& version) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& r : records_) {
        if (r.version == version) {
            current_ = parse_version(version);
            return true;
        }
    }
    return false;
}

void VersionManager::mark_stable(const std::string& version,
                                 const std::map<std::string, double>& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& r : records_) {
        if (r.version == version) {
            r.is_stable = true;
            r.performance_snapshot = metrics;
            return;
        }
    }
}

std::optional<VersionRecord> VersionManager::find(const std::string& version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& r : records_) {
        if (r.version == version) {
            return r;
        }
    }
    return std::nullopt;
}

std::optional<VersionRecord> VersionManager::parent_of(const std::string& version) const {
    auto record = find(version);
    if (!record || record->parent_version.empty()) {
        return std::nullopt;
    }
    return find(record->parent_version);
}

std::optional<VersionRecord> VersionManager::latest_stable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->is_stable) {
            return *it;
        }
    }
    return std::nullopt;
}

bool VersionManager::verify(const VersionRecord& record) {
    return checksum(record.rules) == record.checksum;
}

std::vector<VersionRecord> VersionManager::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

}  // namespace lexrefine::version
