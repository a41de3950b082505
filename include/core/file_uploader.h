#ifndef SCANLINK_FILE_UPLOADER_H
#define SCANLINK_FILE_UPLOADER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "shared/common/errors.h"
#include "shared/config/scanlink_config.h"
#include "shared/logging/logger.h"
#include "shared/protocol/messages.h"
#include "transport/transport_interface.h"

namespace scanlink
{
namespace sdk
{

struct UploadJob
{
    std::string file_path;
    std::string name;
    nlohmann::json device_parameter;
    std::string task_id;
    std::string user_access_token;
};

struct UploadPolicy
{
    int max_attempts = SCANLINK_UPLOAD_MAX_ATTEMPTS;
    std::chrono::milliseconds backoff_unit{SCANLINK_UPLOAD_BACKOFF_UNIT_MS};
    size_t chunk_size = SCANLINK_CHUNK_SIZE;
};

/**
 * @brief Sends result files to the server over the device transport
 *
 * A file goes out as one file-transfer header followed by binary frames of
 * chunk_size bytes. Queued jobs are drained by a single worker thread that
 * retries a failed file from the start. After the n-th failed attempt
 * (counted from 1) it waits backoff_unit * 2^n.
 */
class FileUploader
{
public:
    using ExhaustedHandler = std::function<void(const UploadJob &, const UploadExhaustedError &)>;

private:
    ITransport &transport;
    UploadPolicy policy;
    ExhaustedHandler on_exhausted;

    std::deque<UploadJob> queue;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::atomic<bool> running;
    std::atomic<bool> stopping;
    std::thread worker;

    std::shared_ptr<logging::Logger> logger;

    void workerLoop();
    bool backoff(int attempt);

public:
    /** Wait after the failed attempt with 0-based index attempt */
    static std::chrono::milliseconds backoffDelay(const UploadPolicy &policy, int attempt);

private:

public:
    FileUploader(ITransport &transport, const UploadPolicy &policy = UploadPolicy());
    ~FileUploader();

    void setExhaustedHandler(ExhaustedHandler handler) { on_exhausted = std::move(handler); }

    void start();

    /** Stops the worker; jobs still queued are dropped */
    void stop();

    void enqueue(const UploadJob &job);
    size_t pending();

    /**
     * @brief One attempt at sending a file
     * @throws TransportError on a failed write, std::runtime_error if the file is unreadable
     */
    void sendOnce(const UploadJob &job);

    /**
     * @brief Send with the retry policy
     * @return true on success; on exhaustion the exhausted handler is called
     *         and false returned
     */
    bool sendWithRetry(const UploadJob &job);

    /** Header the next sendOnce() would emit for a file of the given size and digest */
    static protocol::FileTransferHeader buildHeader(const UploadJob &job, uint64_t size_bytes, const std::string &sha256);

    static std::string contentTypeFor(const std::string &file_path);
};

} // namespace sdk
} // namespace scanlink

#endif // SCANLINK_FILE_UPLOADER_H
