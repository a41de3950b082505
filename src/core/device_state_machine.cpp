#include "core/device_state_machine.h"

#include "shared/common/errors.h"

namespace scanlink
{
namespace sdk
{

using logging::LogContext;

DeviceStateMachine::DeviceStateMachine(ITransport &transport)
    : transport(transport), state(DeviceStatus::OFFLINE),
      logger(logging::get_logger("DeviceStateMachine"))
{
}

bool DeviceStateMachine::isLegal(DeviceStatus from, DeviceStatus to)
{
    switch (from)
    {
    case DeviceStatus::OFFLINE:
        return to == DeviceStatus::ONLINE;
    case DeviceStatus::ONLINE:
        return to == DeviceStatus::BUSY || to == DeviceStatus::OFFLINE;
    case DeviceStatus::BUSY:
        return to == DeviceStatus::ONLINE || to == DeviceStatus::ERROR || to == DeviceStatus::OFFLINE;
    case DeviceStatus::ERROR:
        return to == DeviceStatus::ONLINE || to == DeviceStatus::OFFLINE;
    }
    return false;
}

void DeviceStateMachine::transition(DeviceStatus new_state, const nlohmann::json &context)
{
    std::lock_guard<std::mutex> lock(state_mutex);

    if (!isLegal(state, new_state))
    {
        throw InvalidStateTransition(protocol::to_string(state), protocol::to_string(new_state));
    }

    moveTo(new_state);
    sendStatus(state, context);
}

void DeviceStateMachine::updateContext(const nlohmann::json &context)
{
    std::lock_guard<std::mutex> lock(state_mutex);
    sendStatus(state, context);
}

TaskAdmission DeviceStateMachine::beginTask(const std::string &task_id, const nlohmann::json &context)
{
    std::lock_guard<std::mutex> lock(state_mutex);

    if (active_tasks.count(task_id) > 0)
    {
        return TaskAdmission::ALREADY_ACTIVE;
    }
    if (state != DeviceStatus::ONLINE || !active_tasks.empty())
    {
        return TaskAdmission::REJECTED;
    }

    active_tasks.insert(task_id);
    moveTo(DeviceStatus::BUSY);
    sendStatus(state, context);
    return TaskAdmission::ADMITTED;
}

void DeviceStateMachine::finishTask(const std::string &task_id, const std::optional<nlohmann::json> &error_context)
{
    std::lock_guard<std::mutex> lock(state_mutex);

    if (active_tasks.erase(task_id) == 0)
    {
        return;
    }

    if (error_context)
    {
        if (isLegal(state, DeviceStatus::ERROR))
        {
            moveTo(DeviceStatus::ERROR);
            sendStatus(state, *error_context);
        }
        else
        {
            logger->warning("Task error not reported",
                            LogContext().add("task_id", task_id).add("state", protocol::to_string(state)));
        }
    }

    if (state == DeviceStatus::ONLINE)
    {
        return;
    }
    if (isLegal(state, DeviceStatus::ONLINE))
    {
        moveTo(DeviceStatus::ONLINE);
        sendStatus(state, nlohmann::json::object());
    }
    else
    {
        logger->warning("Transition skipped",
                        LogContext().add("from", protocol::to_string(state)).add("to", "ONLINE"));
    }
}

void DeviceStateMachine::rejectTask(const nlohmann::json &context)
{
    std::lock_guard<std::mutex> lock(state_mutex);
    sendStatus(DeviceStatus::ERROR, context);
}

DeviceStatus DeviceStateMachine::getState() const
{
    std::lock_guard<std::mutex> lock(state_mutex);
    return state;
}

bool DeviceStateMachine::hasTask(const std::string &task_id) const
{
    std::lock_guard<std::mutex> lock(state_mutex);
    return active_tasks.count(task_id) > 0;
}

size_t DeviceStateMachine::activeTaskCount() const
{
    std::lock_guard<std::mutex> lock(state_mutex);
    return active_tasks.size();
}

// Caller holds state_mutex
void DeviceStateMachine::moveTo(DeviceStatus new_state)
{
    logger->info("State transition",
                 LogContext().add("from", protocol::to_string(state)).add("to", protocol::to_string(new_state)));
    state = new_state;
}

// Caller holds state_mutex
void DeviceStateMachine::sendStatus(DeviceStatus status, const nlohmann::json &context)
{
    protocol::UpdateStatusMessage message;
    message.status = protocol::to_string(status);

    if (context.is_object())
    {
        for (auto it = context.begin(); it != context.end(); ++it)
        {
            if (it.key() == "task_id" || it.key() == "user_access_token")
            {
                if (it->is_string())
                {
                    if (it.key() == "task_id")
                        message.task_id = it->get<std::string>();
                    else
                        message.user_access_token = it->get<std::string>();
                }
                continue;
            }
            message.data[it.key()] = it.value();
        }
    }

    try
    {
        transport.sendText(protocol::encode_message(message));
    }
    catch (const std::exception &e)
    {
        logger->warning("Status update not delivered",
                        LogContext().add("status", message.status).add("error", e.what()));
    }
}

} // namespace sdk
} // namespace scanlink
