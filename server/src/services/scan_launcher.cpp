#include "services/scan_launcher.hpp"

#include <algorithm>
#include <cctype>

#include "shared/common/errors.h"

namespace scanlink
{
    namespace services
    {
        using logging::LogContext;

        ScanLauncher::ScanLauncher(DeviceRepository &repository, ExamService &exam_service, SessionRegistry &sessions)
            : repository_(repository),
              exam_service_(exam_service),
              sessions_(sessions),
              logger_(logging::get_logger("ScanLauncher"))
        {
        }

        nlohmann::json ScanLauncher::build_payload(const nlohmann::json &task,
                                                   const nlohmann::json &sequence,
                                                   const std::string &access_token,
                                                   const nlohmann::json &device_parameter)
        {
            nlohmann::json payload = task.is_object() ? task : nlohmann::json::object();
            payload["sequence"] = sequence;
            payload["access_token"] = access_token;
            payload["device_parameter"] = device_parameter.is_object() ? device_parameter : nlohmann::json::object();
            return payload;
        }

        LaunchResult ScanLauncher::launch(const nlohmann::json &task, const std::string &access_token)
        {
            if (!task.is_object() || !task.contains("device_id") || !task["device_id"].is_string())
            {
                return {LaunchResult::Code::NOT_FOUND, "Missing device ID"};
            }
            std::string device_id = task["device_id"].get<std::string>();
            std::transform(device_id.begin(), device_id.end(), device_id.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            std::string task_id = task.value("id", std::string());
            LogContext context = LogContext().add("device_id", device_id).add("task_id", task_id);

            nlohmann::json sequence;
            try
            {
                std::string sequence_id;
                if (task.contains("sequence_id") && !task["sequence_id"].is_null())
                {
                    const auto &value = task["sequence_id"];
                    sequence_id = value.is_string() ? value.get<std::string>() : value.dump();
                }
                if (sequence_id.empty())
                {
                    return {LaunchResult::Code::NOT_FOUND, "Missing sequence ID"};
                }

                auto found = exam_service_.get_sequence(sequence_id, access_token);
                if (!found)
                {
                    return {LaunchResult::Code::NOT_FOUND, "Sequence not found"};
                }
                sequence = *found;
            }
            catch (const CollaboratorError &e)
            {
                logger_->error("Sequence lookup failed", LogContext(context).add("error", e.what()));
                return {LaunchResult::Code::UPSTREAM_FAILURE, e.what()};
            }

            std::optional<DeviceRecord> device;
            try
            {
                device = repository_.get_device(device_id);
            }
            catch (const CollaboratorError &e)
            {
                logger_->error("Device lookup failed", LogContext(context).add("error", e.what()));
                return {LaunchResult::Code::UPSTREAM_FAILURE, e.what()};
            }
            if (!device)
            {
                return {LaunchResult::Code::NOT_FOUND, "Device not found"};
            }

            auto connection = sessions_.lookup(device_id);
            if (!connection)
            {
                logger_->warning("Scan requested for offline device", context);
                return {LaunchResult::Code::DEVICE_OFFLINE, "Device offline."};
            }

            nlohmann::json payload = build_payload(task, sequence, access_token, device->details.parameter);
            nlohmann::json start{{"command", "start"}, {"data", payload}};
            if (!connection->send_text(start.dump()))
            {
                logger_->warning("Start command could not be delivered", context);
                return {LaunchResult::Code::DEVICE_OFFLINE, "Device offline."};
            }

            logger_->info("Start command sent", context);
            return {LaunchResult::Code::SENT, ""};
        }

    } // namespace services
} // namespace scanlink
