#include "core/device_client.h"

#include "shared/common/errors.h"
#include "shared/config/scanlink_config.h"

namespace scanlink
{
namespace sdk
{

using logging::LogContext;

namespace
{
    const unsigned long RECEIVE_POLL_MS = 500;

    nlohmann::json taskContext(const std::string &task_id, const std::string &user_access_token)
    {
        return nlohmann::json{{"task_id", task_id}, {"user_access_token", user_access_token}};
    }
} // namespace

DeviceClient::DeviceClient(const ClientConfig &config, ITransport &transport, ScanCallback scan_callback)
    : config(config), transport(transport), state_machine(transport),
      uploader(transport, config.upload), scan_callback(std::move(scan_callback)),
      running(false), reconnect_requested(false),
      logger(logging::get_logger("DeviceClient"))
{
    uploader.setExhaustedHandler([this](const UploadJob &job, const UploadExhaustedError &error) {
        nlohmann::json context = taskContext(job.task_id, job.user_access_token);
        context["error_message"] = error.what();
        transitionQuietly(DeviceStatus::ERROR, context);
    });
}

DeviceClient::~DeviceClient()
{
    stop();
}

bool DeviceClient::start()
{
    if (running.exchange(true))
    {
        return true;
    }

    if (!connectAndRegister())
    {
        running = false;
        return false;
    }

    uploader.start();
    receive_thread = std::thread(&DeviceClient::listenForCommands, this);
    heartbeat_thread = std::thread(&DeviceClient::heartbeatLoop, this);

    logger->info("Device client started", LogContext().add("device_id", config.endpoint.device_id));
    return true;
}

void DeviceClient::stop()
{
    if (!running.exchange(false))
    {
        return;
    }
    shutdown_cv.notify_all();

    // No new commands are read once the receive loop is joined
    if (receive_thread.joinable())
    {
        receive_thread.join();
    }
    if (heartbeat_thread.joinable())
    {
        heartbeat_thread.join();
    }

    scans.cancelAll();
    scans.waitAll();

    if (state_machine.getState() != DeviceStatus::OFFLINE)
    {
        transitionQuietly(DeviceStatus::OFFLINE);
    }

    uploader.stop();
    transport.disconnect();

    logger->info("Device client stopped", LogContext().add("device_id", config.endpoint.device_id));
}

bool DeviceClient::connectAndRegister()
{
    if (!transport.connect())
    {
        return false;
    }

    if (state_machine.getState() == DeviceStatus::OFFLINE)
    {
        transitionQuietly(DeviceStatus::ONLINE);
    }
    else
    {
        state_machine.updateContext(nlohmann::json::object());
    }

    try
    {
        registerDevice();
    }
    catch (const TransportError &e)
    {
        logger->error("Registration failed", LogContext().add("error", e.what()));
        return false;
    }
    return true;
}

void DeviceClient::registerDevice()
{
    transport.sendText(protocol::encode_message(protocol::RegisterMessage{config.details.to_json()}));
    logger->info("Device registration sent", LogContext().add("device_id", config.endpoint.device_id));
}

void DeviceClient::listenForCommands()
{
    while (running)
    {
        if (reconnect_requested.exchange(false))
        {
            handleConnectionLost();
            continue;
        }

        Frame frame;
        switch (transport.receiveFrame(frame, RECEIVE_POLL_MS))
        {
        case ReceiveResult::FRAME:
            if (frame.type == FrameType::TEXT)
            {
                handleMessage(frame.payload);
            }
            else
            {
                logger->warning("Ignoring binary frame from server", LogContext().add("bytes", frame.payload.size()));
            }
            break;
        case ReceiveResult::TIMEOUT:
            break;
        case ReceiveResult::CLOSED:
            if (running)
            {
                handleConnectionLost();
            }
            break;
        }
    }
}

void DeviceClient::handleConnectionLost()
{
    if (transport.closeCode() == SCANLINK_CLOSE_POLICY_VIOLATION)
    {
        logger->error("Server rejected device credentials",
                      LogContext().add("device_id", config.endpoint.device_id).add("error", SCANLINK_AUTH_FAILURE_REASON));
    }
    else
    {
        logger->warning("Connection lost", LogContext().add("endpoint", transport.getConnectionInfo()));
    }

    if (state_machine.getState() != DeviceStatus::OFFLINE)
    {
        transitionQuietly(DeviceStatus::OFFLINE);
    }
    transport.disconnect();

    while (running)
    {
        if (!waitOrShutdown(config.reconnect_delay))
        {
            return;
        }
        logger->info("Reconnecting", LogContext().add("endpoint", transport.getConnectionInfo()));
        if (connectAndRegister())
        {
            return;
        }
    }
}

void DeviceClient::heartbeatLoop()
{
    while (waitOrShutdown(config.heartbeat_interval))
    {
        if (!transport.isConnected())
        {
            continue;
        }
        try
        {
            transport.sendText(protocol::encode_message(protocol::PingMessage{}));
            logger->debug("Heartbeat sent");
        }
        catch (const TransportError &e)
        {
            logger->warning("Heartbeat failed", LogContext().add("error", e.what()));
            reconnect_requested = true;
        }
    }
}

bool DeviceClient::waitOrShutdown(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(shutdown_mutex);
    return !shutdown_cv.wait_for(lock, duration, [this]() { return !running.load(); });
}

void DeviceClient::handleMessage(const std::string &text)
{
    protocol::Message message;
    try
    {
        message = protocol::decode_message(text);
    }
    catch (const ProtocolError &e)
    {
        logger->error("Received invalid message", LogContext().add("error", e.what()).add("message", text));
        return;
    }

    std::visit(protocol::overloaded{
                   [this](const protocol::StartMessage &m) { handleStartCommand(m.data); },
                   [this](const protocol::FeedbackMessage &m) { handleFeedback(m.message); },
                   [this](const protocol::PongMessage &) { logger->debug("Pong received"); },
                   [this, &text](const auto &) { handleError(text); }},
               message);
}

void DeviceClient::handleStartCommand(const protocol::AcquisitionPayload &payload)
{
    if (!scan_callback)
    {
        logger->error("Scan callback not defined", LogContext().add("task_id", payload.id));
        nlohmann::json context = taskContext(payload.id, payload.access_token);
        context["error_message"] = "Scan callback not defined.";
        state_machine.updateContext(context);
        return;
    }

    nlohmann::json context = taskContext(payload.id, payload.access_token);
    nlohmann::json busy = context;
    busy["progress"] = 0;

    switch (state_machine.beginTask(payload.id, busy))
    {
    case TaskAdmission::ALREADY_ACTIVE:
        logger->warning("Scan already running", LogContext().add("task_id", payload.id));
        return;
    case TaskAdmission::REJECTED:
    {
        std::string reason = state_machine.activeTaskCount() > 0 ? "another scan is running"
                                                                  : protocol::to_string(state_machine.getState());
        logger->error("Cannot start scan", LogContext().add("task_id", payload.id).add("reason", reason));
        context["error_message"] = "Device cannot start a scan while " + reason;
        state_machine.rejectTask(context);
        return;
    }
    case TaskAdmission::ADMITTED:
        break;
    }

    auto outcome = std::make_shared<ScanOutcome>();
    bool started = scans.start(
        payload,
        [this, outcome](const protocol::AcquisitionPayload &p, CancellationToken &token) { *outcome = runScanTask(p, token); },
        [this, outcome](const protocol::AcquisitionPayload &p) { finishScanTask(p, *outcome); });
    if (!started)
    {
        // The previous thread for this id has not been retired yet
        state_machine.finishTask(payload.id);
    }
}

ScanOutcome DeviceClient::runScanTask(const protocol::AcquisitionPayload &payload, CancellationToken &token)
{
    ScanOutcome outcome = runScan(scan_callback, payload, token);
    switch (outcome.result)
    {
    case ScanResult::SUCCEEDED:
        logger->info("Scan task completed", LogContext().add("task_id", payload.id));
        break;
    case ScanResult::CANCELLED:
        logger->warning("Scan task cancelled", LogContext().add("task_id", payload.id));
        break;
    case ScanResult::FAILED:
        logger->error("Scan task failed", LogContext().add("task_id", payload.id).add("error", outcome.message));
        break;
    }
    return outcome;
}

void DeviceClient::finishScanTask(const protocol::AcquisitionPayload &payload, const ScanOutcome &outcome)
{
    if (outcome.result == ScanResult::SUCCEEDED)
    {
        state_machine.finishTask(payload.id);
        return;
    }
    nlohmann::json context = taskContext(payload.id, payload.access_token);
    context["error_message"] = outcome.message;
    state_machine.finishTask(payload.id, context);
}

void DeviceClient::transitionQuietly(DeviceStatus status, const nlohmann::json &context)
{
    try
    {
        state_machine.transition(status, context);
    }
    catch (const InvalidStateTransition &e)
    {
        logger->warning("Transition skipped", LogContext().add("error", e.what()));
    }
}

bool DeviceClient::cancelScan(const std::string &task_id)
{
    return scans.cancel(task_id);
}

void DeviceClient::handleFeedback(const std::string &message)
{
    if (feedback_handler)
    {
        feedback_handler(message);
        return;
    }
    logger->info("Feedback received from server", LogContext().add("message", message));
}

void DeviceClient::handleError(const std::string &message)
{
    if (error_handler)
    {
        error_handler(message);
        return;
    }
    logger->info("Error received from server", LogContext().add("message", message));
}

void DeviceClient::sendScanningStatus(int progress, const std::string &task_id, const std::string &user_access_token)
{
    nlohmann::json context = taskContext(task_id, user_access_token);
    context["progress"] = progress;
    state_machine.updateContext(context);
}

void DeviceClient::sendErrorStatus(const std::string &message, const std::string &task_id,
                                   const std::string &user_access_token)
{
    nlohmann::json context = taskContext(task_id, user_access_token);
    context["error_message"] = message;
    transitionQuietly(DeviceStatus::ERROR, context);
}

void DeviceClient::uploadFileResult(const UploadJob &job)
{
    uploader.enqueue(job);
}

void DeviceClient::uploadFileDirect(const UploadJob &job)
{
    uploader.sendOnce(job);
}

} // namespace sdk
} // namespace scanlink
