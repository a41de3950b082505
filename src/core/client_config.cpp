#include "core/client_config.h"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "shared/crypto/crypto_utils.h"

namespace scanlink
{
namespace sdk
{

std::unique_ptr<ClientConfig> ClientConfig::from_file(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try
    {
        file >> j;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error("Invalid JSON in config file: " + std::string(e.what()));
    }
    return from_json(j);
}

std::unique_ptr<ClientConfig> ClientConfig::from_json(const nlohmann::json &j)
{
    auto config = std::make_unique<ClientConfig>();

    if (j.contains("server"))
    {
        const auto &server = j["server"];
        if (server.contains("host"))
            config->endpoint.host = server["host"];
        if (server.contains("port"))
            config->endpoint.port = server["port"];
        if (server.contains("websocket_path"))
            config->endpoint.path = server["websocket_path"];
    }

    if (!j.contains("device") || !j["device"].contains("device_id") || !j["device"].contains("device_token"))
    {
        throw std::invalid_argument("device.device_id and device.device_token are required");
    }
    config->endpoint.device_id = j["device"]["device_id"];
    config->endpoint.device_token = j["device"]["device_token"];

    if (!j.contains("details"))
    {
        throw std::invalid_argument("details section is required");
    }
    try
    {
        config->details = protocol::DeviceDetails::from_json(j["details"]);
    }
    catch (const ProtocolError &e)
    {
        throw std::invalid_argument(std::string("Invalid device details: ") + e.what());
    }

    if (j.contains("timing"))
    {
        const auto &timing = j["timing"];
        if (timing.contains("heartbeat_interval_s"))
            config->heartbeat_interval = std::chrono::seconds(timing["heartbeat_interval_s"].get<int>());
        if (timing.contains("reconnect_delay_s"))
            config->reconnect_delay = std::chrono::milliseconds(
                static_cast<long>(timing["reconnect_delay_s"].get<double>() * 1000));
    }

    if (j.contains("upload"))
    {
        const auto &upload = j["upload"];
        if (upload.contains("max_attempts"))
            config->upload.max_attempts = upload["max_attempts"];
        if (upload.contains("backoff_unit_ms"))
            config->upload.backoff_unit = std::chrono::milliseconds(upload["backoff_unit_ms"].get<int>());
        if (upload.contains("chunk_size"))
            config->upload.chunk_size = upload["chunk_size"];
    }

    if (j.contains("logging"))
    {
        const auto &logging = j["logging"];
        if (logging.contains("log_level"))
            config->log_level = logging["log_level"];
        if (logging.contains("log_file"))
            config->log_file = logging["log_file"];
    }

    return config;
}

nlohmann::json ClientConfig::to_json() const
{
    return nlohmann::json{
        {"server", {{"host", endpoint.host}, {"port", endpoint.port}, {"websocket_path", endpoint.path}}},
        {"device", {{"device_id", endpoint.device_id}, {"device_token", endpoint.device_token}}},
        {"details", details.to_json()},
        {"timing", {{"heartbeat_interval_s", heartbeat_interval.count()},
                    {"reconnect_delay_s", reconnect_delay.count() / 1000.0}}},
        {"upload", {{"max_attempts", upload.max_attempts},
                    {"backoff_unit_ms", upload.backoff_unit.count()},
                    {"chunk_size", upload.chunk_size}}},
        {"logging", {{"log_level", log_level}, {"log_file", log_file}}}};
}

bool ClientConfig::validate() const
{
    if (!crypto::is_uuid(endpoint.device_id))
    {
        std::cerr << "device_id must be a UUID" << std::endl;
        return false;
    }
    if (endpoint.device_token.empty())
    {
        std::cerr << "device_token cannot be empty" << std::endl;
        return false;
    }
    if (endpoint.port == 0)
    {
        std::cerr << "Invalid server port" << std::endl;
        return false;
    }
    if (heartbeat_interval.count() <= 0)
    {
        std::cerr << "heartbeat_interval_s must be positive" << std::endl;
        return false;
    }
    if (upload.max_attempts < 1 || upload.max_attempts > SCANLINK_UPLOAD_MAX_ATTEMPTS_LIMIT)
    {
        std::cerr << "upload.max_attempts must be between 1 and " << SCANLINK_UPLOAD_MAX_ATTEMPTS_LIMIT << std::endl;
        return false;
    }
    if (upload.chunk_size == 0)
    {
        std::cerr << "upload.chunk_size must be positive" << std::endl;
        return false;
    }
    return true;
}

} // namespace sdk
} // namespace scanlink
