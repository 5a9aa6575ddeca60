#include "monitor/DownHostRegistry.hpp"

#include <spdlog/spdlog.h>

namespace resetwatch::monitor {

DownHostRegistry::DownHostRegistry(EventCallback onEvent) : onEvent_(std::move(onEvent)) {}

std::optional<core::StatusEvent> DownHostRegistry::report(int team, const std::string& host,
                                                          bool reachable) {
    std::optional<core::StatusEvent> event;
    {
        std::lock_guard lock(mutex_);
        core::DownEntry entry{team, host};

        if (!reachable) {
            if (entries_.insert(entry).second) {
                event = core::StatusEvent{core::StatusEventType::PossibleReset, team, host,
                                          std::chrono::system_clock::now()};
            }
        } else if (entries_.erase(entry) > 0) {
            event = core::StatusEvent{core::StatusEventType::Recovered, team, host,
                                      std::chrono::system_clock::now()};
        }
    }

    if (event) {
        spdlog::debug("Team {} host {} -> {}", team, host, event->typeToString());
        if (onEvent_) {
            onEvent_(*event);
        }
    }
    return event;
}

std::vector<core::DownEntry> DownHostRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    return std::vector<core::DownEntry>(entries_.begin(), entries_.end());
}

bool DownHostRegistry::contains(int team, const std::string& host) const {
    std::lock_guard lock(mutex_);
    return entries_.count(core::DownEntry{team, host}) > 0;
}

std::size_t DownHostRegistry::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool DownHostRegistry::empty() const {
    std::lock_guard lock(mutex_);
    return entries_.empty();
}

void DownHostRegistry::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

} // namespace resetwatch::monitor
