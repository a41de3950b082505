#ifndef SCANLINK_DEVICE_STATE_MACHINE_H
#define SCANLINK_DEVICE_STATE_MACHINE_H

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "shared/logging/logger.h"
#include "shared/protocol/messages.h"
#include "transport/transport_interface.h"

namespace scanlink
{
namespace sdk
{

using protocol::DeviceStatus;

enum class TaskAdmission
{
    ADMITTED,
    ALREADY_ACTIVE,
    REJECTED
};

/**
 * @brief Local device lifecycle with server propagation
 *
 * Legal transitions:
 *   OFFLINE -> ONLINE
 *   ONLINE  -> BUSY, OFFLINE
 *   BUSY    -> ONLINE, ERROR, OFFLINE
 *   ERROR   -> ONLINE, OFFLINE
 *
 * Every transition and context update is sent as an update_status message
 * while the state lock is held, so the server sees them in issue order.
 * A failed send is logged; the local state stays authoritative.
 *
 * The same lock guards the set of active scan task ids, so admitting a
 * scan and entering BUSY happen as one step.
 */
class DeviceStateMachine
{
private:
    ITransport &transport;
    DeviceStatus state;
    std::set<std::string> active_tasks;
    mutable std::mutex state_mutex;
    std::shared_ptr<logging::Logger> logger;

    void moveTo(DeviceStatus new_state);
    void sendStatus(DeviceStatus status, const nlohmann::json &context);

public:
    explicit DeviceStateMachine(ITransport &transport);

    /**
     * @brief Move to new_state and report it with context
     *
     * context may carry task_id and user_access_token; they are sent as
     * top-level fields, everything else goes into "data".
     *
     * @throws InvalidStateTransition if the table does not allow the move;
     *         state is unchanged and nothing is sent
     */
    void transition(DeviceStatus new_state, const nlohmann::json &context = nlohmann::json::object());

    /**
     * @brief Re-send the current state with a new context, e.g. progress
     */
    void updateContext(const nlohmann::json &context);

    /**
     * @brief Admit a scan and go ONLINE -> BUSY with context
     *
     * Only an ONLINE device with no active scan admits a task. Nothing is
     * sent unless the task is admitted.
     */
    TaskAdmission beginTask(const std::string &task_id, const nlohmann::json &context);

    /**
     * @brief Retire an admitted scan and return to ONLINE
     *
     * With error_context the device reports ERROR first. Task ids that
     * were never admitted are ignored. Unreachable states are logged.
     */
    void finishTask(const std::string &task_id,
                    const std::optional<nlohmann::json> &error_context = std::nullopt);

    /** Report ERROR for a task that was not admitted; local state is unchanged */
    void rejectTask(const nlohmann::json &context);

    DeviceStatus getState() const;
    bool hasTask(const std::string &task_id) const;
    size_t activeTaskCount() const;

    static bool isLegal(DeviceStatus from, DeviceStatus to);
};

} // namespace sdk
} // namespace scanlink

#endif // SCANLINK_DEVICE_STATE_MACHINE_H
