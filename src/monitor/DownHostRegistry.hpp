#pragma once

#include "core/types/DownEntry.hpp"
#include "core/types/StatusEvent.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace resetwatch::monitor {

/**
 * @brief Shared record of which (team, host) pairs are currently down.
 *
 * Every operation is serialized on one mutex. Transition events are
 * delivered after the mutex is released, so the callback may read the
 * registry. Each (template, team) pair is reported by exactly one monitor,
 * which keeps events for a given host in probe order.
 */
class DownHostRegistry {
public:
    using EventCallback = std::function<void(const core::StatusEvent&)>;

    /**
     * @brief Constructs an empty registry.
     * @param onEvent Called for every POSSIBLE RESET / RECOVERED transition.
     */
    explicit DownHostRegistry(EventCallback onEvent = {});

    /**
     * @brief Records the outcome of the latest probe of a host.
     *
     * An unreachable host that is not yet recorded is inserted and raises a
     * PossibleReset event; a recorded host that is reachable again is
     * removed and raises a Recovered event. Repeated outcomes change nothing.
     *
     * @param team Team owning the host.
     * @param host Concrete host address.
     * @param reachable Result of the probe.
     * @return The transition event, if one occurred.
     */
    std::optional<core::StatusEvent> report(int team, const std::string& host, bool reachable);

    /**
     * @brief Copies the current entries.
     * @return Entries ordered by team, then host.
     */
    [[nodiscard]] std::vector<core::DownEntry> snapshot() const;

    [[nodiscard]] bool contains(int team, const std::string& host) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    /**
     * @brief Removes every entry without raising events.
     *
     * Only called before a run starts or after it has fully stopped.
     */
    void clear();

private:
    mutable std::mutex mutex_;
    std::set<core::DownEntry> entries_;
    EventCallback onEvent_;
};

} // namespace resetwatch::monitor
