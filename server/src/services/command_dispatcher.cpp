#include "services/command_dispatcher.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "shared/common/errors.h"

namespace scanlink
{
    namespace services
    {
        using logging::LogContext;
        using protocol::DeviceStatus;

        namespace
        {
            int clamp_progress(double value)
            {
                if (std::isnan(value))
                    return 0;
                return static_cast<int>(std::lround(std::max(0.0, std::min(100.0, value))));
            }

            // Clamped to [0, 100] before narrowing
            int json_progress(const nlohmann::json &value, int fallback)
            {
                if (value.is_number_unsigned())
                    return value.get<std::uint64_t>() > 100 ? 100 : static_cast<int>(value.get<std::uint64_t>());
                if (value.is_number_integer())
                {
                    std::int64_t progress = value.get<std::int64_t>();
                    return static_cast<int>(std::max<std::int64_t>(0, std::min<std::int64_t>(100, progress)));
                }
                if (value.is_number())
                    return clamp_progress(value.get<double>());
                if (value.is_string())
                {
                    try
                    {
                        return clamp_progress(std::stod(value.get<std::string>()));
                    }
                    catch (const std::exception &)
                    {
                        return fallback;
                    }
                }
                return fallback;
            }
        } // namespace

        CommandDispatcher::CommandDispatcher(const std::string &device_id,
                                             std::shared_ptr<transports::DeviceConnection> connection,
                                             DispatchContext &context)
            : device_id_(device_id),
              connection_(std::move(connection)),
              context_(context),
              receiver_(device_id, context.exam_service, context.data_lake_directory,
                        [this](const std::string &message) { send_feedback(message); }),
              logger_(logging::get_logger("CommandDispatcher"))
        {
        }

        CommandDispatcher::~CommandDispatcher()
        {
            if (!disconnected_)
            {
                on_disconnect();
            }
        }

        void CommandDispatcher::on_text(const std::string &text)
        {
            if (receiver_.active())
            {
                logger_->debug("Text frame ignored during file transfer", LogContext().add("device_id", device_id_));
                return;
            }

            protocol::Message message;
            try
            {
                message = protocol::decode_message(text);
            }
            catch (const ProtocolError &e)
            {
                logger_->warning("Undecodable frame", LogContext().add("device_id", device_id_).add("error", e.what()));
                send_feedback(e.what());
                return;
            }

            std::visit(protocol::overloaded{
                           [this](const protocol::RegisterMessage &m) { handle_register(m); },
                           [this](const protocol::PingMessage &) { handle_ping(); },
                           [this](const protocol::UpdateStatusMessage &m) { handle_update_status(m); },
                           [this](const protocol::FileTransferHeader &m) { handle_file_transfer(m); },
                           [this](const protocol::UnknownMessage &m) { handle_unknown(m.command); },
                           // Server-to-device commands are not accepted from a device
                           [this, &message](const auto &) { handle_unknown(protocol::command_name(message)); }},
                       message);
        }

        void CommandDispatcher::on_binary(const std::string &data)
        {
            receiver_.on_binary(data);
        }

        void CommandDispatcher::on_disconnect()
        {
            if (disconnected_)
            {
                return;
            }
            disconnected_ = true;

            receiver_.abort("connection closed");

            if (!context_.sessions.remove_if_current(device_id_, connection_.get()))
            {
                logger_->info("Superseded connection closed", LogContext().add("device_id", device_id_));
                return;
            }

            context_.liveness.forget(device_id_);
            try
            {
                DeviceUpdate update;
                update.status = DeviceStatus::OFFLINE;
                context_.repository.update_device(device_id_, update);
            }
            catch (const std::exception &e)
            {
                logger_->error("Could not mark device OFFLINE on disconnect",
                               LogContext().add("device_id", device_id_).add("error", e.what()));
            }
            logger_->info("Device disconnected", LogContext().add("device_id", device_id_));
        }

        void CommandDispatcher::handle_register(const protocol::RegisterMessage &message)
        {
            if (!message.data.is_object())
            {
                send_feedback("Invalid device details.");
                return;
            }

            protocol::DeviceDetails details;
            try
            {
                details = protocol::DeviceDetails::from_json(message.data);
            }
            catch (const ProtocolError &e)
            {
                logger_->warning("Rejected device details", LogContext().add("device_id", device_id_).add("error", e.what()));
                send_feedback("Invalid device details.");
                return;
            }

            try
            {
                DeviceUpdate update;
                update.details = details;
                update.status = DeviceStatus::ONLINE;
                if (!context_.repository.update_device(device_id_, update))
                {
                    send_feedback("Failed to persist device details.");
                    return;
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Registration failed", LogContext().add("device_id", device_id_).add("error", e.what()));
                send_feedback(std::string("Error registering device: ") + e.what());
                return;
            }

            logger_->info("Device registered",
                          LogContext().add("device_id", device_id_).add("device_name", details.device_name));
            send_feedback("Device registered successfully");
        }

        void CommandDispatcher::handle_ping()
        {
            context_.liveness.record_heartbeat(device_id_);
            send(protocol::PongMessage{});
        }

        void CommandDispatcher::handle_update_status(const protocol::UpdateStatusMessage &message)
        {
            auto status = protocol::parse_device_status(message.status);
            if (!status)
            {
                send_feedback("Invalid status: " + message.status);
                return;
            }

            try
            {
                DeviceUpdate update;
                update.status = *status;
                context_.repository.update_device(device_id_, update);
            }
            catch (const std::exception &e)
            {
                logger_->error("Device status not persisted",
                               LogContext().add("device_id", device_id_).add("status", protocol::to_string(*status)).add("error", e.what()));
                send_feedback("Error updating device state.");
            }

            if (*status == DeviceStatus::ONLINE || *status == DeviceStatus::OFFLINE)
            {
                send_feedback(std::string("Device ") + protocol::to_string(*status) + " acknowledged.");
                return;
            }

            update_task(*status, message);
        }

        void CommandDispatcher::update_task(DeviceStatus status, const protocol::UpdateStatusMessage &message)
        {
            if (!message.task_id || message.task_id->empty() || !message.user_access_token || message.user_access_token->empty())
            {
                send_feedback("Missing task_id or user_access_token for task update.");
                return;
            }
            const std::string &task_id = *message.task_id;
            const std::string &token = *message.user_access_token;

            std::optional<nlohmann::json> task;
            try
            {
                task = context_.exam_service.get_task(task_id, token);
            }
            catch (const std::exception &e)
            {
                send_feedback(std::string("Error fetching task: ") + e.what());
                return;
            }
            if (!task)
            {
                send_feedback("Task not found for ID: " + task_id);
                return;
            }

            int current = json_progress(task->value("progress", nlohmann::json(0)), 0);
            int progress = current;

            if (status == DeviceStatus::ERROR)
            {
                std::string error_message = "Unspecified device error.";
                if (message.data.is_object() && message.data.contains("error_message") && message.data["error_message"].is_string())
                {
                    error_message = message.data["error_message"].get<std::string>();
                }
                logger_->error("Device reported error",
                               LogContext().add("device_id", device_id_).add("task_id", task_id).add("error", error_message));
                (*task)["status"] = task_status::ERROR;
            }
            else
            {
                if (message.data.is_object() && message.data.contains("progress"))
                {
                    progress = json_progress(message.data["progress"], current);
                }
                progress = std::max(0, std::min(100, progress));
                (*task)["status"] = progress >= 100 ? task_status::FINISHED : task_status::IN_PROGRESS;
            }
            (*task)["progress"] = progress;

            try
            {
                context_.exam_service.set_task(task_id, *task, token);
            }
            catch (const std::exception &e)
            {
                send_feedback(std::string("Could not update task: ") + e.what());
                return;
            }

            logger_->debug("Task updated",
                           LogContext().add("device_id", device_id_).add("task_id", task_id).add("progress", progress));
            send_feedback(std::string("Device ") + protocol::to_string(status) +
                          " update processed (progress=" + std::to_string(progress) + "%).");
        }

        void CommandDispatcher::handle_file_transfer(const protocol::FileTransferHeader &header)
        {
            receiver_.begin(header);
        }

        void CommandDispatcher::handle_unknown(const std::string &command)
        {
            logger_->warning("Unknown command", LogContext().add("device_id", device_id_).add("command", command));
            send_feedback("Unknown command: " + command);
        }

        void CommandDispatcher::send_feedback(const std::string &message)
        {
            send(protocol::FeedbackMessage{message});
        }

        void CommandDispatcher::send(const protocol::Message &message)
        {
            if (!connection_->send_text(protocol::encode_message(message)))
            {
                logger_->warning("Send to device failed",
                                 LogContext().add("device_id", device_id_).add("command", protocol::command_name(message)));
            }
        }

    } // namespace services
} // namespace scanlink
