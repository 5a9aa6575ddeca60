/**
 * @file IStatusListener.hpp
 * @brief Receiver for host transitions and status digests.
 */

#pragma once

#include "core/types/StatusEvent.hpp"
#include "core/types/StatusReport.hpp"

namespace resetwatch::core {

/**
 * @brief Operator-facing output of the monitoring engine.
 *
 * Called concurrently from every monitor thread, the reporter and the
 * supervisor; implementations must serialize their own output.
 */
class IStatusListener {
public:
    virtual ~IStatusListener() = default;

    /**
     * @brief A host went down or came back.
     * @param event The transition.
     */
    virtual void onStatusEvent(const StatusEvent& event) = 0;

    /**
     * @brief A periodic, interim or final digest is ready.
     * @param report The digest.
     */
    virtual void onStatusReport(const StatusReport& report) = 0;
};

} // namespace resetwatch::core
