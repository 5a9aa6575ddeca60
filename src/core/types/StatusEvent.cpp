#include "core/types/StatusEvent.hpp"

namespace resetwatch::core {

std::string StatusEvent::typeToString() const {
    switch (type) {
    case StatusEventType::PossibleReset:
        return "PossibleReset";
    case StatusEventType::Recovered:
        return "Recovered";
    }
    return "Unknown";
}

} // namespace resetwatch::core
