#include "services/file_transfer_receiver.hpp"

#include <algorithm>
#include <cctype>

#include "shared/common/errors.h"
#include "shared/config/scanlink_config.h"

namespace scanlink
{
    namespace services
    {
        namespace fs = std::filesystem;
        using logging::LogContext;

        namespace
        {
            std::string lower(std::string value)
            {
                std::transform(value.begin(), value.end(), value.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return value;
            }

            std::string json_to_id(const nlohmann::json &value)
            {
                return value.is_string() ? value.get<std::string>() : value.dump();
            }

            // Only the last path component of a device-supplied name is used
            fs::path safe_filename(const std::string &name)
            {
                fs::path filename = fs::path(name).filename();
                if (filename.empty() || filename == "." || filename == "..")
                {
                    return fs::path("upload.bin");
                }
                return filename;
            }
        } // namespace

        const char *to_string(ResultType type)
        {
            switch (type)
            {
            case ResultType::DICOM:
                return "DICOM";
            case ResultType::MRD:
                return "MRD";
            case ResultType::NPY:
                return "NPY";
            case ResultType::CALIBRATION:
                return "CALIBRATION";
            case ResultType::NOT_SET:
                return "NOT_SET";
            }
            return "NOT_SET";
        }

        ResultType result_type_for(const std::string &filename)
        {
            std::string ext = lower(fs::path(filename).extension().string());
            if (ext == ".dcm" || ext == ".dicom")
                return ResultType::DICOM;
            if (ext == ".mrd")
                return ResultType::MRD;
            if (ext == ".npy")
                return ResultType::NPY;
            if (ext == ".json")
                return ResultType::CALIBRATION;
            return ResultType::NOT_SET;
        }

        FileTransferReceiver::FileTransferReceiver(const std::string &device_id,
                                                   ExamService &exam_service,
                                                   const std::string &data_lake_directory,
                                                   FeedbackSink feedback)
            : device_id_(device_id),
              exam_service_(exam_service),
              data_lake_(data_lake_directory),
              feedback_(std::move(feedback)),
              logger_(logging::get_logger("FileTransferReceiver"))
        {
        }

        FileTransferReceiver::~FileTransferReceiver()
        {
            if (session_)
            {
                abort("receiver destroyed");
            }
        }

        uint64_t FileTransferReceiver::bytes_received() const
        {
            return session_ ? session_->received : 0;
        }

        void FileTransferReceiver::begin(const protocol::FileTransferHeader &header)
        {
            if (session_)
            {
                abort("new file-transfer header before completion");
            }

            std::error_code ec;
            if (data_lake_.empty() || !fs::is_directory(data_lake_, ec))
            {
                logger_->error("Data lake directory unavailable", LogContext().add("path", data_lake_.string()));
                feedback_("Data lake directory is not available.");
                return;
            }

            auto session = std::make_unique<TransferSession>();
            session->header = header;

            try
            {
                auto task = exam_service_.get_task(header.task_id, header.user_access_token);
                if (!task)
                {
                    feedback_("Task not found for ID: " + header.task_id);
                    return;
                }
                session->task = *task;
                session->result_id = exam_service_.create_blank_result(header.task_id, header.user_access_token);
            }
            catch (const std::exception &e)
            {
                logger_->error("Cannot prepare file transfer",
                               LogContext().add("device_id", device_id_).add("task_id", header.task_id).add("error", e.what()));
                feedback_(std::string("Failed to prepare file transfer: ") + e.what());
                return;
            }

            if (!session->task.contains("workflow_id") || session->task["workflow_id"].is_null())
            {
                feedback_("Task " + header.task_id + " has no workflow.");
                return;
            }

            session->directory = data_lake_ / json_to_id(session->task["workflow_id"]) / header.task_id / session->result_id;
            fs::create_directories(session->directory, ec);
            if (ec)
            {
                logger_->error("Cannot create result directory",
                               LogContext().add("path", session->directory.string()).add("error", ec.message()));
                feedback_("Failed to create result directory.");
                return;
            }

            session->final_path = session->directory / safe_filename(header.filename);
            session->temp_path = session->final_path;
            session->temp_path += SCANLINK_PART_SUFFIX;

            session->out.open(session->temp_path, std::ios::binary | std::ios::trunc);
            if (!session->out.is_open())
            {
                logger_->error("Cannot open temp file", LogContext().add("path", session->temp_path.string()));
                feedback_("Failed to open upload file.");
                return;
            }

            logger_->info("File transfer started",
                          LogContext()
                              .add("device_id", device_id_)
                              .add("task_id", header.task_id)
                              .add("result_id", session->result_id)
                              .add("size_bytes", header.size_bytes));

            session_ = std::move(session);
            if (header.size_bytes == 0)
            {
                complete();
            }
        }

        void FileTransferReceiver::on_binary(const std::string &chunk)
        {
            if (!session_)
            {
                logger_->warning("Binary frame without active transfer dropped",
                                 LogContext().add("device_id", device_id_).add("bytes", chunk.size()));
                return;
            }

            session_->out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            if (!session_->out)
            {
                abort("write failed");
                feedback_("Failed to write upload data.");
                return;
            }

            session_->hasher.update(chunk);
            session_->received += chunk.size();

            if (session_->received >= session_->header.size_bytes)
            {
                complete();
            }
        }

        void FileTransferReceiver::abort(const std::string &reason)
        {
            if (!session_)
            {
                return;
            }

            std::unique_ptr<TransferSession> session = std::move(session_);
            logger_->warning("File transfer aborted",
                             LogContext()
                                 .add("device_id", device_id_)
                                 .add("task_id", session->header.task_id)
                                 .add("received", session->received)
                                 .add("reason", reason));
            discard(*session);
        }

        void FileTransferReceiver::complete()
        {
            std::unique_ptr<TransferSession> session = std::move(session_);
            session->out.close();

            try
            {
                if (session->received != session->header.size_bytes)
                {
                    throw IncompleteTransferError(session->received, session->header.size_bytes);
                }

                std::string digest = session->hasher.hex_digest();
                if (!session->header.sha256.empty() && lower(session->header.sha256) != digest)
                {
                    throw ChecksumMismatchError();
                }
            }
            catch (const ScanLinkError &e)
            {
                logger_->warning("Upload rejected",
                                 LogContext().add("device_id", device_id_).add("task_id", session->header.task_id).add("error", e.what()));
                discard(*session);
                feedback_(e.what());
                return;
            }

            commit(*session);
        }

        void FileTransferReceiver::commit(TransferSession &session)
        {
            std::error_code ec;
            fs::rename(session.temp_path, session.final_path, ec);
            if (ec)
            {
                logger_->error("Atomic rename failed",
                               LogContext().add("path", session.final_path.string()).add("error", ec.message()));
                discard(session);
                feedback_("Failed to store uploaded file.");
                return;
            }

            nlohmann::json files = nlohmann::json::array({session.final_path.filename().string()});

            const nlohmann::json &parameter = session.header.device_parameter;
            if (!parameter.is_null() && !parameter.empty())
            {
                fs::path sidecar = session.directory / SCANLINK_DEVICE_PARAMETER_FILE;
                std::ofstream out(sidecar);
                out << nlohmann::json{{"device_id", device_id_}, {"parameter", parameter}}.dump(4);
                if (out)
                {
                    files.push_back(sidecar.filename().string());
                }
                else
                {
                    logger_->warning("Device parameter sidecar not written", LogContext().add("path", sidecar.string()));
                }
            }

            const std::string &token = session.header.user_access_token;
            try
            {
                nlohmann::json result{
                    {"type", to_string(result_type_for(session.final_path.filename().string()))},
                    {"directory", session.directory.string()},
                    {"files", files}};
                exam_service_.set_result(session.result_id, result, token);

                session.task["status"] = task_status::FINISHED;
                session.task["progress"] = 100;
                exam_service_.set_task(session.header.task_id, session.task, token);
            }
            catch (const std::exception &e)
            {
                logger_->error("Result bookkeeping failed",
                               LogContext().add("task_id", session.header.task_id).add("error", e.what()));
                feedback_(std::string("File saved but result update failed: ") + e.what());
                return;
            }

            logger_->info("File transfer committed",
                          LogContext()
                              .add("device_id", device_id_)
                              .add("task_id", session.header.task_id)
                              .add("path", session.final_path.string()));
            feedback_("File " + session.result_id + " saved to datalake: " + session.final_path.string());
        }

        void FileTransferReceiver::discard(TransferSession &session)
        {
            if (session.out.is_open())
            {
                session.out.close();
            }
            std::error_code ec;
            fs::remove(session.temp_path, ec);
        }

    } // namespace services
} // namespace scanlink
