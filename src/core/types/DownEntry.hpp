#pragma once

#include <compare>
#include <string>

namespace resetwatch::core {

/**
 * @brief A concrete host believed unreachable, keyed by team.
 *
 * Ordering is by team, then host, which is the order used for every
 * status listing.
 */
struct DownEntry {
    int team{0};      ///< Team owning the host
    std::string host; ///< Concrete host address

    auto operator<=>(const DownEntry& other) const = default;
    bool operator==(const DownEntry& other) const = default;
};

} // namespace resetwatch::core
