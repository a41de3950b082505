#ifndef SCANLINK_CLIENT_CONFIG_H
#define SCANLINK_CLIENT_CONFIG_H

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "core/file_uploader.h"
#include "shared/protocol/messages.h"
#include "transport/websocket_transport.h"

namespace scanlink
{
namespace sdk
{

/**
 * @brief Device-side configuration
 *
 * {
 *   "server":  {"host": "...", "port": 8000, "websocket_path": "/api/v1/device/ws"},
 *   "device":  {"device_id": "<uuid>", "device_token": "..."},
 *   "details": {"device_name": "...", "serial_number": "...", ...},
 *   "timing":  {"heartbeat_interval_s": 15, "reconnect_delay_s": 5},
 *   "upload":  {"max_attempts": 3, "backoff_unit_ms": 1000, "chunk_size": 1048576},
 *   "logging": {"log_level": "INFO", "log_file": ""}
 * }
 */
struct ClientConfig
{
    WebSocketEndpoint endpoint;
    protocol::DeviceDetails details;
    std::chrono::seconds heartbeat_interval{SCANLINK_HEARTBEAT_INTERVAL_S};
    std::chrono::milliseconds reconnect_delay{SCANLINK_RECONNECT_DELAY_S * 1000};
    UploadPolicy upload;
    std::string log_level = "INFO";
    std::string log_file;

    /** @throws std::runtime_error if the file is missing or not valid JSON */
    static std::unique_ptr<ClientConfig> from_file(const std::string &path);

    /** @throws std::invalid_argument if device credentials or details are missing */
    static std::unique_ptr<ClientConfig> from_json(const nlohmann::json &j);

    nlohmann::json to_json() const;
    bool validate() const;
};

} // namespace sdk
} // namespace scanlink

#endif // SCANLINK_CLIENT_CONFIG_H
