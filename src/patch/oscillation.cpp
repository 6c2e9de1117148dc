// ==============================================================================
// oscillation.cpp - OscillationGuard
// ==============================================================================

#include <lexrefine/oscillation.hpp>

namespace lexrefine::patch {

Clock system_clock() {
    return []() { return std::chrono::system_clock::now(); };
}

OscillationGuard::OscillationGuard(OscillationOptions options, Clock clock)
    : options_(options), clock_(std::move(clock)) {}

void OscillationGuard::prune_locked(std::deque<TimePoint>& window, TimePoint now) const {
    while (!window.empty() && now - window.front() > options_.window) {
        window.pop_front();
    }
}

void OscillationGuard::track_change(const std::string& area) {
    const TimePoint now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = windows_[area];
    window.push_back(now);
    prune_locked(window, now);
}

bool OscillationGuard::check_oscillation(const std::string& area) {
    const TimePoint now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto frozen = frozen_since_.find(area);
    if (frozen != frozen_since_.end()) {
        if (now - frozen->second < options_.cooldown) {
            return true;
        }
        frozen_since_.erase(frozen);
    }

    auto it = windows_.find(area);
    if (it == windows_.end()) {
        return false;
    }
    prune_locked(it->second, now);
    if (it->second.size() >= options_.max_changes) {
        frozen_since_[area] = now;
        return true;
    }
    return false;
}

void OscillationGuard::unfreeze(const std::string& area) {
    std::lock_guard<std::mutex> lock(mutex_);
    frozen_since_.erase(area);
    windows_.erase(area);
}

bool OscillationGuard::is_frozen(const std::string& area) const {
    const TimePoint now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto frozen = frozen_since_.find(area);
    return frozen != frozen_since_.end() && now - frozen->second < options_.cooldown;
}

std::size_t OscillationGuard::recent_changes(const std::string& area) const {
    const TimePoint now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(area);
    if (it == windows_.end()) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto& t : it->second) {
        if (now - t <= options_.window) {
            ++count;
        }
    }
    return count;
}

}  // namespace lexrefine::patch
