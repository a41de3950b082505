#ifndef SCANLINK_MESSAGES_H
#define SCANLINK_MESSAGES_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace scanlink {
namespace protocol {

/**
 * @brief Lifecycle state of an acquisition device
 */
enum class DeviceStatus
{
    OFFLINE,
    ONLINE,
    BUSY,
    ERROR
};

const char* to_string(DeviceStatus status);

/**
 * @brief Parse a status name, case-insensitive. Empty for unknown names.
 */
std::optional<DeviceStatus> parse_device_status(const std::string& value);

/**
 * @brief Descriptive device fields sent on registration
 *
 * device_name, serial_number, manufacturer, modality and site are required
 * strings; ip_address is optional; parameter is a free-form JSON object.
 */
struct DeviceDetails
{
    std::string device_name;
    std::string serial_number;
    std::string manufacturer;
    std::string modality;
    std::string site;
    std::string ip_address;
    nlohmann::json parameter = nlohmann::json::object();

    /** @throws ProtocolError when a required field is missing or has the wrong type */
    static DeviceDetails from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

/**
 * @brief Task data delivered with a "start" command
 *
 * The full task object is kept in raw so fields this layer does not
 * interpret reach the scan callback untouched.
 */
struct AcquisitionPayload
{
    std::string id;
    std::string device_id;
    std::string access_token;
    nlohmann::json sequence;
    nlohmann::json device_parameter = nlohmann::json::object();
    nlohmann::json raw = nlohmann::json::object();

    static AcquisitionPayload from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Device -> server

struct RegisterMessage
{
    nlohmann::json data;
};

struct PingMessage
{
};

struct UpdateStatusMessage
{
    std::string status;
    nlohmann::json data = nlohmann::json::object();
    std::optional<std::string> task_id;
    std::optional<std::string> user_access_token;
};

struct FileTransferHeader
{
    std::string task_id;
    std::string user_access_token;
    std::string filename;
    uint64_t size_bytes = 0;
    std::string content_type;
    std::string sha256;
    nlohmann::json device_parameter;
};

// Server -> device

struct PongMessage
{
};

struct StartMessage
{
    AcquisitionPayload data;
};

struct FeedbackMessage
{
    std::string message;
};

/**
 * @brief Any frame whose "command" is not one of the above
 */
struct UnknownMessage
{
    std::string command;
    nlohmann::json raw;
};

using Message = std::variant<RegisterMessage,
                             PingMessage,
                             UpdateStatusMessage,
                             FileTransferHeader,
                             PongMessage,
                             StartMessage,
                             FeedbackMessage,
                             UnknownMessage>;

/**
 * @brief Decode one JSON text frame
 *
 * @throws ProtocolError on invalid JSON, a missing "command" field, or a
 *         file-transfer header lacking task_id, user_access_token or size_bytes
 */
Message decode_message(const std::string& text);

std::string encode_message(const Message& message);

std::string command_name(const Message& message);

/**
 * @brief Helper for std::visit with a set of lambdas
 */
template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace protocol
} // namespace scanlink

#endif // SCANLINK_MESSAGES_H
