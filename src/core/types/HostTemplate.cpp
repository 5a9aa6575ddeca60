#include "core/types/HostTemplate.hpp"

namespace resetwatch::core {

HostTemplate::HostTemplate(std::string pattern, std::string placeholder, std::size_t tokenPos)
    : pattern_(std::move(pattern)), placeholder_(std::move(placeholder)), tokenPos_(tokenPos) {}

std::string HostTemplate::tokenFor(const std::string& placeholder) {
    return "{" + placeholder + "}";
}

std::optional<HostTemplate> HostTemplate::parse(const std::string& pattern,
                                                const std::string& placeholder) {
    if (placeholder.empty()) {
        return std::nullopt;
    }

    const auto token = tokenFor(placeholder);
    auto pos = pattern.find(token);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    if (pattern.find(token, pos + token.size()) != std::string::npos) {
        return std::nullopt;
    }

    return HostTemplate(pattern, placeholder, pos);
}

std::optional<HostTemplate> HostTemplate::fromConcreteHost(const std::string& concreteHost,
                                                           const std::string& hostPattern,
                                                           int referenceTeam,
                                                           const std::string& placeholder) {
    auto subnet = parse(hostPattern, placeholder);
    if (!subnet) {
        return std::nullopt;
    }

    const auto token = tokenFor(placeholder);
    const auto prefix = hostPattern.substr(0, subnet->tokenPos_);
    const auto teamText = std::to_string(referenceTeam);

    if (concreteHost.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    if (concreteHost.compare(prefix.size(), teamText.size(), teamText) != 0) {
        return std::nullopt;
    }

    auto remainder = concreteHost.substr(prefix.size() + teamText.size());

    // The character after the team must line up with the pattern, otherwise
    // team 1 would match a host such as "10.15.1.3".
    auto afterToken = subnet->tokenPos_ + token.size();
    if (afterToken < hostPattern.size()) {
        if (remainder.empty() || remainder.front() != hostPattern[afterToken]) {
            return std::nullopt;
        }
    } else if (!remainder.empty()) {
        return std::nullopt;
    }

    return parse(prefix + token + remainder, placeholder);
}

std::string HostTemplate::substitute(int team) const {
    std::string host = pattern_;
    host.replace(tokenPos_, tokenFor(placeholder_).size(), std::to_string(team));
    return host;
}

} // namespace resetwatch::core
