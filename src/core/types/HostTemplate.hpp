/**
 * @file HostTemplate.hpp
 * @brief Host address templates and team ranges.
 *
 * A host template is an address pattern with a single team placeholder,
 * e.g. "10.{team}.1.5". Substituting a team yields the concrete host that
 * team owns.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace resetwatch::core {

/**
 * @brief Closed, contiguous range of team identifiers [start, end].
 */
struct TeamRange {
    int start{1}; ///< First team (inclusive)
    int end{1};   ///< Last team (inclusive)

    /**
     * @brief Checks that the range is non-empty.
     * @return True if start <= end.
     */
    [[nodiscard]] bool isValid() const { return start <= end; }

    /**
     * @brief Number of teams in the range.
     * @return end - start + 1, or 0 for an invalid range.
     */
    [[nodiscard]] int64_t count() const {
        return isValid() ? static_cast<int64_t>(end) - start + 1 : 0;
    }

    [[nodiscard]] bool contains(int team) const { return team >= start && team <= end; }

    bool operator==(const TeamRange& other) const = default;
};

/**
 * @brief Host address pattern with exactly one team placeholder token.
 *
 * The token is the placeholder name wrapped in braces ("{team}" for the
 * default placeholder). Instances are immutable and always hold a pattern
 * with exactly one token.
 */
class HostTemplate {
public:
    static constexpr const char* kDefaultPlaceholder = "team";

    /**
     * @brief Builds the substitution token for a placeholder name.
     * @param placeholder Placeholder name (e.g. "team").
     * @return The token (e.g. "{team}").
     */
    static std::string tokenFor(const std::string& placeholder);

    /**
     * @brief Parses a template string.
     * @param pattern Address pattern containing the placeholder token once.
     * @param placeholder Placeholder name used in the pattern.
     * @return The template, or nullopt if the token is missing or repeated.
     */
    static std::optional<HostTemplate> parse(const std::string& pattern,
                                             const std::string& placeholder = kDefaultPlaceholder);

    /**
     * @brief Recovers a template from a host discovered for the reference team.
     *
     * The part of @p hostPattern before the token must prefix @p concreteHost,
     * followed by the reference team number. Everything after the team number
     * is taken from the concrete host, so "10.{team}.1.0/24" and "10.5.1.23"
     * (reference team 5) give "10.{team}.1.23".
     *
     * @param concreteHost Host address discovered for the reference team.
     * @param hostPattern Subnet pattern the host was discovered from.
     * @param referenceTeam Team that was substituted for discovery.
     * @param placeholder Placeholder name used in the pattern.
     * @return The template, or nullopt if the host does not match the pattern.
     */
    static std::optional<HostTemplate> fromConcreteHost(const std::string& concreteHost,
                                                        const std::string& hostPattern,
                                                        int referenceTeam,
                                                        const std::string& placeholder = kDefaultPlaceholder);

    /**
     * @brief Substitutes a team into the template.
     * @param team Team identifier.
     * @return The concrete host for that team.
     */
    [[nodiscard]] std::string substitute(int team) const;

    [[nodiscard]] const std::string& pattern() const { return pattern_; }
    [[nodiscard]] const std::string& placeholder() const { return placeholder_; }

    bool operator==(const HostTemplate& other) const = default;

private:
    HostTemplate(std::string pattern, std::string placeholder, std::size_t tokenPos);

    std::string pattern_;
    std::string placeholder_;
    std::size_t tokenPos_{0};
};

} // namespace resetwatch::core
