#include "messages.h"

#include <algorithm>
#include <cctype>

#include "../common/errors.h"

namespace scanlink {
namespace protocol {

namespace {

const char* kRegister = "register";
const char* kPing = "ping";
const char* kPong = "pong";
const char* kUpdateStatus = "update_status";
const char* kFileTransfer = "file-transfer";
const char* kStart = "start";
const char* kFeedback = "feedback";

// Absent and null both count as missing
std::optional<std::string> optional_string(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (it->is_string())
    {
        return it->get<std::string>();
    }
    return it->dump();
}

std::string required_string(const nlohmann::json& j, const char* key, const std::string& error)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
    {
        throw ProtocolError(error);
    }
    return it->get<std::string>();
}

FileTransferHeader decode_file_transfer(const nlohmann::json& j)
{
    const std::string error = "Invalid file-transfer header.";

    FileTransferHeader header;
    auto task_id = optional_string(j, "task_id");
    auto token = optional_string(j, "user_access_token");
    auto size = j.find("size_bytes");
    if (!task_id || !token || size == j.end() || !size->is_number_integer() ||
        size->get<int64_t>() < 0)
    {
        throw ProtocolError(error);
    }

    header.task_id = *task_id;
    header.user_access_token = *token;
    header.size_bytes = size->get<uint64_t>();
    header.filename = optional_string(j, "filename").value_or("upload.bin");
    header.content_type = optional_string(j, "content_type").value_or("application/octet-stream");
    header.sha256 = optional_string(j, "sha256").value_or("");
    if (j.contains("device_parameter"))
    {
        header.device_parameter = j["device_parameter"];
    }
    return header;
}

} // namespace

const char* to_string(DeviceStatus status)
{
    switch (status)
    {
    case DeviceStatus::OFFLINE:
        return "OFFLINE";
    case DeviceStatus::ONLINE:
        return "ONLINE";
    case DeviceStatus::BUSY:
        return "BUSY";
    case DeviceStatus::ERROR:
        return "ERROR";
    }
    return "OFFLINE";
}

std::optional<DeviceStatus> parse_device_status(const std::string& value)
{
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "OFFLINE")
        return DeviceStatus::OFFLINE;
    if (upper == "ONLINE")
        return DeviceStatus::ONLINE;
    if (upper == "BUSY")
        return DeviceStatus::BUSY;
    if (upper == "ERROR")
        return DeviceStatus::ERROR;
    return std::nullopt;
}

DeviceDetails DeviceDetails::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw ProtocolError("Device details must be an object");
    }

    DeviceDetails details;
    details.device_name = required_string(j, "device_name", "Missing device_name");
    details.serial_number = required_string(j, "serial_number", "Missing serial_number");
    details.manufacturer = required_string(j, "manufacturer", "Missing manufacturer");
    details.modality = required_string(j, "modality", "Missing modality");
    details.site = required_string(j, "site", "Missing site");
    details.ip_address = optional_string(j, "ip_address").value_or("");

    if (j.contains("parameter") && !j["parameter"].is_null())
    {
        if (!j["parameter"].is_object())
        {
            throw ProtocolError("Device parameter must be an object");
        }
        details.parameter = j["parameter"];
    }
    return details;
}

nlohmann::json DeviceDetails::to_json() const
{
    nlohmann::json j{
        {"device_name", device_name},
        {"serial_number", serial_number},
        {"manufacturer", manufacturer},
        {"modality", modality},
        {"site", site},
        {"parameter", parameter}};
    if (!ip_address.empty())
    {
        j["ip_address"] = ip_address;
    }
    return j;
}

AcquisitionPayload AcquisitionPayload::from_json(const nlohmann::json& j)
{
    AcquisitionPayload payload;
    if (!j.is_object())
    {
        return payload;
    }

    payload.raw = j;
    payload.id = optional_string(j, "id").value_or("");
    payload.device_id = optional_string(j, "device_id").value_or("");
    payload.access_token = optional_string(j, "access_token").value_or("");
    if (j.contains("sequence"))
    {
        payload.sequence = j["sequence"];
    }
    if (j.contains("device_parameter") && j["device_parameter"].is_object())
    {
        payload.device_parameter = j["device_parameter"];
    }
    return payload;
}

nlohmann::json AcquisitionPayload::to_json() const
{
    nlohmann::json j = raw.is_object() ? raw : nlohmann::json::object();
    j["id"] = id;
    j["device_id"] = device_id;
    j["access_token"] = access_token;
    j["sequence"] = sequence;
    j["device_parameter"] = device_parameter;
    return j;
}

Message decode_message(const std::string& text)
{
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        throw ProtocolError("Invalid message format.");
    }

    auto command = optional_string(j, "command");
    if (!command)
    {
        throw ProtocolError("Invalid message format.");
    }

    if (*command == kRegister)
    {
        return RegisterMessage{j.contains("data") ? j["data"] : nlohmann::json()};
    }
    if (*command == kPing)
    {
        return PingMessage{};
    }
    if (*command == kPong)
    {
        return PongMessage{};
    }
    if (*command == kUpdateStatus)
    {
        UpdateStatusMessage msg;
        msg.status = optional_string(j, "status").value_or("");
        if (j.contains("data") && j["data"].is_object())
        {
            msg.data = j["data"];
        }
        msg.task_id = optional_string(j, "task_id");
        msg.user_access_token = optional_string(j, "user_access_token");
        return msg;
    }
    if (*command == kFileTransfer)
    {
        return decode_file_transfer(j);
    }
    if (*command == kStart)
    {
        return StartMessage{AcquisitionPayload::from_json(j.value("data", nlohmann::json::object()))};
    }
    if (*command == kFeedback)
    {
        return FeedbackMessage{optional_string(j, "message").value_or("")};
    }
    return UnknownMessage{*command, j};
}

std::string encode_message(const Message& message)
{
    nlohmann::json j = std::visit(
        overloaded{
            [](const RegisterMessage& m) {
                return nlohmann::json{{"command", kRegister}, {"data", m.data}};
            },
            [](const PingMessage&) {
                return nlohmann::json{{"command", kPing}};
            },
            [](const PongMessage&) {
                return nlohmann::json{{"command", kPong}};
            },
            [](const UpdateStatusMessage& m) {
                nlohmann::json out{{"command", kUpdateStatus}, {"status", m.status}, {"data", m.data}};
                out["task_id"] = m.task_id ? nlohmann::json(*m.task_id) : nlohmann::json();
                out["user_access_token"] =
                    m.user_access_token ? nlohmann::json(*m.user_access_token) : nlohmann::json();
                return out;
            },
            [](const FileTransferHeader& m) {
                nlohmann::json out{
                    {"command", kFileTransfer},
                    {"task_id", m.task_id},
                    {"user_access_token", m.user_access_token},
                    {"filename", m.filename},
                    {"size_bytes", m.size_bytes},
                    {"content_type", m.content_type},
                    {"sha256", m.sha256}};
                if (!m.device_parameter.is_null())
                {
                    out["device_parameter"] = m.device_parameter;
                }
                return out;
            },
            [](const StartMessage& m) {
                return nlohmann::json{{"command", kStart}, {"data", m.data.to_json()}};
            },
            [](const FeedbackMessage& m) {
                return nlohmann::json{{"command", kFeedback}, {"message", m.message}};
            },
            [](const UnknownMessage& m) {
                nlohmann::json out = m.raw.is_object() ? m.raw : nlohmann::json::object();
                out["command"] = m.command;
                return out;
            }},
        message);
    return j.dump();
}

std::string command_name(const Message& message)
{
    return std::visit(
        overloaded{
            [](const RegisterMessage&) { return std::string(kRegister); },
            [](const PingMessage&) { return std::string(kPing); },
            [](const PongMessage&) { return std::string(kPong); },
            [](const UpdateStatusMessage&) { return std::string(kUpdateStatus); },
            [](const FileTransferHeader&) { return std::string(kFileTransfer); },
            [](const StartMessage&) { return std::string(kStart); },
            [](const FeedbackMessage&) { return std::string(kFeedback); },
            [](const UnknownMessage& m) { return m.command; }},
        message);
}

} // namespace protocol
} // namespace scanlink
