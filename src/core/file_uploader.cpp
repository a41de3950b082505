#include "core/file_uploader.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

#include "shared/crypto/crypto_utils.h"

namespace scanlink
{
namespace sdk
{

namespace fs = std::filesystem;
using logging::LogContext;

FileUploader::FileUploader(ITransport &transport, const UploadPolicy &policy)
    : transport(transport), policy(policy), running(false), stopping(false),
      logger(logging::get_logger("FileUploader"))
{
}

FileUploader::~FileUploader()
{
    stop();
}

void FileUploader::start()
{
    if (running.exchange(true))
    {
        return;
    }
    stopping = false;
    worker = std::thread(&FileUploader::workerLoop, this);
}

void FileUploader::stop()
{
    stopping = true;
    if (!running.exchange(false))
    {
        return;
    }
    queue_cv.notify_all();
    if (worker.joinable())
    {
        worker.join();
    }

    std::lock_guard<std::mutex> lock(queue_mutex);
    if (!queue.empty())
    {
        logger->warning("Dropping queued uploads", LogContext().add("count", queue.size()));
        queue.clear();
    }
}

void FileUploader::enqueue(const UploadJob &job)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        queue.push_back(job);
    }
    queue_cv.notify_one();
    logger->info("Upload queued", LogContext().add("task_id", job.task_id).add("file", job.file_path));
}

size_t FileUploader::pending()
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    return queue.size();
}

void FileUploader::workerLoop()
{
    while (running)
    {
        UploadJob job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_cv.wait(lock, [this]() { return !queue.empty() || !running; });
            if (!running)
            {
                return;
            }
            job = std::move(queue.front());
            queue.pop_front();
        }

        try
        {
            sendWithRetry(job);
        }
        catch (const std::exception &e)
        {
            logger->error("Uploader error", LogContext().add("task_id", job.task_id).add("error", e.what()));
        }
    }
}

std::chrono::milliseconds FileUploader::backoffDelay(const UploadPolicy &policy, int attempt)
{
    int exponent = std::min(std::max(attempt + 1, 0), SCANLINK_UPLOAD_MAX_ATTEMPTS_LIMIT);
    return policy.backoff_unit * (1LL << exponent);
}

// Interruptible by stop(); false means the uploader is shutting down
bool FileUploader::backoff(int attempt)
{
    auto delay = backoffDelay(policy, attempt);
    std::unique_lock<std::mutex> lock(queue_mutex);
    return !queue_cv.wait_for(lock, delay, [this]() { return stopping.load(); });
}

bool FileUploader::sendWithRetry(const UploadJob &job)
{
    for (int attempt = 0; attempt < policy.max_attempts; ++attempt)
    {
        try
        {
            sendOnce(job);
            logger->info("Upload finished",
                         LogContext().add("task_id", job.task_id).add("attempt", attempt + 1));
            return true;
        }
        catch (const std::exception &e)
        {
            logger->warning("Upload attempt failed",
                            LogContext()
                                .add("task_id", job.task_id)
                                .add("attempt", attempt + 1)
                                .add("error", e.what()));
        }

        if (attempt + 1 < policy.max_attempts && !backoff(attempt))
        {
            logger->info("Upload abandoned on shutdown", LogContext().add("task_id", job.task_id));
            return false;
        }
    }

    UploadExhaustedError error(policy.max_attempts);
    logger->error(error.what(), LogContext().add("task_id", job.task_id).add("file", job.file_path));
    if (on_exhausted)
    {
        on_exhausted(job, error);
    }
    return false;
}

void FileUploader::sendOnce(const UploadJob &job)
{
    fs::path path(job.file_path);
    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    if (ec)
    {
        throw std::runtime_error("Cannot stat upload file " + job.file_path + ": " + ec.message());
    }

    std::string digest = crypto::sha256_file(job.file_path, policy.chunk_size);
    protocol::FileTransferHeader header = buildHeader(job, size, digest);
    transport.sendText(protocol::encode_message(header));

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("Cannot open upload file " + job.file_path);
    }

    std::vector<char> buffer(policy.chunk_size);
    uint64_t sent = 0;
    while (sent < size)
    {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got <= 0)
        {
            throw std::runtime_error("Upload file shrank while sending: " + job.file_path);
        }
        transport.sendBinary(std::string(buffer.data(), static_cast<size_t>(got)));
        sent += static_cast<uint64_t>(got);
    }

    logger->debug("File streamed",
                  LogContext().add("filename", header.filename).add("bytes", sent).add("sha256", digest));
}

protocol::FileTransferHeader FileUploader::buildHeader(const UploadJob &job, uint64_t size_bytes, const std::string &sha256)
{
    fs::path path(job.file_path);

    std::string filename = job.name.empty() ? path.filename().string() : job.name;
    if (fs::path(filename).extension().empty())
    {
        filename += path.extension().string();
    }

    protocol::FileTransferHeader header;
    header.task_id = job.task_id;
    header.user_access_token = job.user_access_token;
    header.filename = filename;
    header.size_bytes = size_bytes;
    header.content_type = contentTypeFor(job.file_path);
    header.sha256 = sha256;
    header.device_parameter = job.device_parameter;
    return header;
}

std::string FileUploader::contentTypeFor(const std::string &file_path)
{
    if (fs::path(file_path).extension() == ".mrd")
    {
        return SCANLINK_CONTENT_TYPE_MRD;
    }
    return SCANLINK_CONTENT_TYPE_OCTET;
}

} // namespace sdk
} // namespace scanlink
