#pragma once

#include <chrono>
#include <string>

namespace resetwatch::core {

enum class StatusEventType : int { PossibleReset = 0, Recovered = 1 };

struct StatusEvent {
    StatusEventType type{StatusEventType::PossibleReset};
    int team{0};
    std::string host;
    std::chrono::system_clock::time_point timestamp;

    [[nodiscard]] std::string typeToString() const;

    bool operator==(const StatusEvent& other) const = default;
};

} // namespace resetwatch::core
