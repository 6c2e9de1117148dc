// ==============================================================================
// lexrefine/oscillation.hpp - OscillationGuard: защита от «качелей» правил
// ==============================================================================
//
// Для каждой области правил (rule_type) хранится скользящее окно отметок
// изменений и момент заморозки. Область с >= max_changes изменениями за
// окно замораживается на cooldown.
//
// Протокол для изменяющего кода: check_oscillation(area) == false ->
// изменение -> track_change(area).
//
// ==============================================================================

#ifndef LEXREFINE_OSCILLATION_HPP
#define LEXREFINE_OSCILLATION_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lexrefine::patch {

using TimePoint = std::chrono::system_clock::time_point;

/// Источник времени (подменяется в тестах)
using Clock = std::function<TimePoint()>;

/// system_clock::now
Clock system_clock();

struct OscillationOptions {
    std::chrono::minutes window{60};
    std::chrono::hours cooldown{24};
    std::size_t max_changes = 2;
};

class OscillationGuard {
public:
    explicit OscillationGuard(OscillationOptions options = {}, Clock clock = system_clock());

    /// Отметить изменение области (после успешной мутации)
    void track_change(const std::string& area);

    /// true - область заблокирована (заморожена сейчас или только что)
    bool check_oscillation(const std::string& area);

    /// Снять заморозку вручную
    void unfreeze(const std::string& area);

    /// Заморожена ли область (без побочных эффектов)
    bool is_frozen(const std::string& area) const;

    /// Число изменений в текущем окне
    std::size_t recent_changes(const std::string& area) const;

    const OscillationOptions& options() const { return options_; }

private:
    void prune_locked(std::deque<TimePoint>& window, TimePoint now) const;

    OscillationOptions options_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<TimePoint>> windows_;
    std::map<std::string, TimePoint> frozen_since_;
};

}  // namespace lexrefine::patch

#endif  // LEXREFINE_OSCILLATION_HPP
