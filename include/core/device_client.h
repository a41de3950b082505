#ifndef SCANLINK_DEVICE_CLIENT_H
#define SCANLINK_DEVICE_CLIENT_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/client_config.h"
#include "core/device_state_machine.h"
#include "core/file_uploader.h"
#include "core/scan_task.h"
#include "shared/logging/logger.h"
#include "shared/protocol/messages.h"
#include "transport/transport_interface.h"

namespace scanlink
{
namespace sdk
{

using MessageHandler = std::function<void(const std::string &)>;

/**
 * @brief Device-side session with the device manager
 *
 * Owns three background threads: the receive loop (which also owns
 * reconnection), the heartbeat and the upload worker. Scans run on their
 * own threads through ScanTaskManager.
 */
class DeviceClient
{
private:
    ClientConfig config;
    ITransport &transport;
    DeviceStateMachine state_machine;
    ScanTaskManager scans;
    FileUploader uploader;
    ScanCallback scan_callback;
    MessageHandler feedback_handler;
    MessageHandler error_handler;

    std::atomic<bool> running;
    std::atomic<bool> reconnect_requested;
    std::thread receive_thread;
    std::thread heartbeat_thread;
    std::mutex shutdown_mutex;
    std::condition_variable shutdown_cv;

    std::shared_ptr<logging::Logger> logger;

    void listenForCommands();
    void heartbeatLoop();
    void handleConnectionLost();
    bool waitOrShutdown(std::chrono::milliseconds duration);

    ScanOutcome runScanTask(const protocol::AcquisitionPayload &payload, CancellationToken &token);
    void finishScanTask(const protocol::AcquisitionPayload &payload, const ScanOutcome &outcome);
    void transitionQuietly(DeviceStatus status, const nlohmann::json &context = nlohmann::json::object());

public:
    DeviceClient(const ClientConfig &config, ITransport &transport, ScanCallback scan_callback = ScanCallback());
    ~DeviceClient();

    DeviceClient(const DeviceClient &) = delete;
    DeviceClient &operator=(const DeviceClient &) = delete;

    /**
     * @brief Connect, register and start the background threads
     * @return false if the first connection attempt failed
     */
    bool start();

    /**
     * @brief Cancel scans, report OFFLINE, then close the transport
     */
    void stop();

    /**
     * @brief Connect the transport, go ONLINE and send the registration
     *
     * When the local state is not OFFLINE (a reconnect during a scan) the
     * current state is re-sent instead of transitioning.
     */
    bool connectAndRegister();

    void registerDevice();

    /** Dispatch one inbound text frame */
    void handleMessage(const std::string &text);

    /**
     * @brief Admit and launch a scan
     *
     * A start for a task that is already running is ignored. A start while
     * the device is not ONLINE, or while another scan runs, is reported as
     * ERROR for the rejected task and leaves the running scan untouched.
     */
    void handleStartCommand(const protocol::AcquisitionPayload &payload);
    bool cancelScan(const std::string &task_id);

    void handleFeedback(const std::string &message);
    void handleError(const std::string &message);

    void sendScanningStatus(int progress, const std::string &task_id, const std::string &user_access_token);

    /** Go to ERROR for the task; logged and skipped if ERROR is not reachable */
    void sendErrorStatus(const std::string &message, const std::string &task_id, const std::string &user_access_token);

    /** Queue a result file for the upload worker */
    void uploadFileResult(const UploadJob &job);

    /** Send a file now with a single attempt; throws on failure */
    void uploadFileDirect(const UploadJob &job);

    void setFeedbackHandler(MessageHandler handler) { feedback_handler = std::move(handler); }
    void setErrorHandler(MessageHandler handler) { error_handler = std::move(handler); }
    void setScanCallback(ScanCallback callback) { scan_callback = std::move(callback); }

    DeviceStatus getState() const { return state_machine.getState(); }
    DeviceStateMachine &stateMachine() { return state_machine; }
    FileUploader &fileUploader() { return uploader; }
    ScanTaskManager &scanTasks() { return scans; }
    bool isRunning() const { return running; }
};

} // namespace sdk
} // namespace scanlink

#endif // SCANLINK_DEVICE_CLIENT_H
