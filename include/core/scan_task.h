#ifndef SCANLINK_SCAN_TASK_H
#define SCANLINK_SCAN_TASK_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "shared/common/errors.h"
#include "shared/logging/logger.h"
#include "shared/protocol/messages.h"

namespace scanlink
{
namespace sdk
{

/**
 * @brief Cooperative cancellation signal handed to a scan
 */
class CancellationToken
{
private:
    std::atomic<bool> cancelled;
    std::mutex wait_mutex;
    std::condition_variable wait_cv;

public:
    CancellationToken() : cancelled(false) {}

    void cancel();
    bool isCancelled() const { return cancelled; }

    /** @throws ScanCancelled once cancel() was called */
    void throwIfCancelled() const;

    /**
     * @brief Sleep for up to duration
     * @return false if the wait ended because of cancellation
     */
    bool waitFor(std::chrono::milliseconds duration);
};

class ScanCancelled : public ScanLinkError
{
public:
    ScanCancelled() : ScanLinkError("Scan cancelled") {}
};

enum class ScanResult
{
    SUCCEEDED,
    CANCELLED,
    FAILED
};

struct ScanOutcome
{
    ScanResult result = ScanResult::SUCCEEDED;
    std::string message;
};

/**
 * @brief Device-specific acquisition routine
 *
 * Should check the token between steps. Returning normally after
 * cancellation, or throwing ScanCancelled, both count as cancelled;
 * any other exception counts as a failure.
 */
using ScanCallback = std::function<void(const protocol::AcquisitionPayload &, CancellationToken &)>;

ScanOutcome runScan(const ScanCallback &callback,
                    const protocol::AcquisitionPayload &payload,
                    CancellationToken &token);

/**
 * @brief Active scans of one device keyed by task id
 *
 * Each scan runs on its own thread. A task id is only accepted while no
 * scan with the same id is active. The body runs first, then the entry is
 * removed under the task lock, then the completion hook runs.
 */
class ScanTaskManager
{
public:
    using Body = std::function<void(const protocol::AcquisitionPayload &, CancellationToken &)>;
    using Completion = std::function<void(const protocol::AcquisitionPayload &)>;

private:
    struct ActiveScan
    {
        std::shared_ptr<CancellationToken> token;
        std::thread worker;
    };

    std::map<std::string, ActiveScan> active;
    std::vector<std::thread> finished;
    mutable std::mutex task_mutex;
    std::condition_variable idle_cv;
    std::shared_ptr<logging::Logger> logger;

    void finish(const std::string &task_id);
    void reapFinished();

public:
    ScanTaskManager();
    ~ScanTaskManager();

    /**
     * @return false if a scan with the same task id is already active
     */
    bool start(const protocol::AcquisitionPayload &payload, Body body, Completion completion);

    bool cancel(const std::string &task_id);
    void cancelAll();

    /** Block until no scan is active and all scan threads are joined */
    void waitAll();

    bool isActive(const std::string &task_id) const;
    size_t activeCount() const;
};

} // namespace sdk
} // namespace scanlink

#endif // SCANLINK_SCAN_TASK_H
