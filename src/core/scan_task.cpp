#include "core/scan_task.h"

namespace scanlink
{
namespace sdk
{

using logging::LogContext;

void CancellationToken::cancel()
{
    {
        std::lock_guard<std::mutex> lock(wait_mutex);
        cancelled = true;
    }
    wait_cv.notify_all();
}

void CancellationToken::throwIfCancelled() const
{
    if (cancelled)
    {
        throw ScanCancelled();
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(wait_mutex);
    return !wait_cv.wait_for(lock, duration, [this]() { return cancelled.load(); });
}

ScanOutcome runScan(const ScanCallback &callback,
                    const protocol::AcquisitionPayload &payload,
                    CancellationToken &token)
{
    ScanOutcome outcome;
    try
    {
        callback(payload, token);
        if (token.isCancelled())
        {
            outcome.result = ScanResult::CANCELLED;
            outcome.message = "Scan cancelled";
        }
    }
    catch (const ScanCancelled &e)
    {
        outcome.result = ScanResult::CANCELLED;
        outcome.message = e.what();
    }
    catch (const std::exception &e)
    {
        outcome.result = ScanResult::FAILED;
        outcome.message = e.what();
    }
    return outcome;
}

ScanTaskManager::ScanTaskManager()
    : logger(logging::get_logger("ScanTaskManager"))
{
}

ScanTaskManager::~ScanTaskManager()
{
    cancelAll();
    waitAll();
}

bool ScanTaskManager::start(const protocol::AcquisitionPayload &payload, Body body, Completion completion)
{
    reapFinished();

    std::lock_guard<std::mutex> lock(task_mutex);
    if (active.count(payload.id) > 0)
    {
        logger->warning("Scan already running", LogContext().add("task_id", payload.id));
        return false;
    }

    auto token = std::make_shared<CancellationToken>();
    ActiveScan &scan = active[payload.id];
    scan.token = token;

    // The worker blocks in finish() until this insertion is complete
    scan.worker = std::thread([this, payload, token, body, completion]() {
        body(payload, *token);
        finish(payload.id);
        if (completion)
        {
            completion(payload);
        }
    });

    logger->info("Scan task started", LogContext().add("task_id", payload.id));
    return true;
}

void ScanTaskManager::finish(const std::string &task_id)
{
    {
        std::lock_guard<std::mutex> lock(task_mutex);
        auto it = active.find(task_id);
        if (it != active.end())
        {
            finished.push_back(std::move(it->second.worker));
            active.erase(it);
        }
    }
    idle_cv.notify_all();
}

void ScanTaskManager::reapFinished()
{
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(task_mutex);
        done.swap(finished);
    }
    for (auto &worker : done)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

bool ScanTaskManager::cancel(const std::string &task_id)
{
    std::lock_guard<std::mutex> lock(task_mutex);
    auto it = active.find(task_id);
    if (it == active.end())
    {
        return false;
    }
    it->second.token->cancel();
    logger->info("Cancelled scan task", LogContext().add("task_id", task_id));
    return true;
}

void ScanTaskManager::cancelAll()
{
    std::lock_guard<std::mutex> lock(task_mutex);
    for (auto &[task_id, scan] : active)
    {
        scan.token->cancel();
    }
}

void ScanTaskManager::waitAll()
{
    {
        std::unique_lock<std::mutex> lock(task_mutex);
        idle_cv.wait(lock, [this]() { return active.empty(); });
    }
    reapFinished();
}

bool ScanTaskManager::isActive(const std::string &task_id) const
{
    std::lock_guard<std::mutex> lock(task_mutex);
    return active.count(task_id) > 0;
}

size_t ScanTaskManager::activeCount() const
{
    std::lock_guard<std::mutex> lock(task_mutex);
    return active.size();
}

} // namespace sdk
} // namespace scanlink
