#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace scanlink
{
    namespace core
    {

        // ServerConfig implementation
        void ServerConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("host"))
                host = j["host"];
            if (j.contains("port"))
                port = j["port"];
            if (j.contains("websocket_path"))
                websocket_path = j["websocket_path"];
            if (j.contains("worker_threads"))
                worker_threads = j["worker_threads"];
        }

        nlohmann::json ServerConfig::to_json() const
        {
            return nlohmann::json{
                {"host", host},
                {"port", port},
                {"websocket_path", websocket_path},
                {"worker_threads", worker_threads}};
        }

        // SecurityConfig implementation
        void SecurityConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("hash_iterations"))
                hash_iterations = j["hash_iterations"];
        }

        nlohmann::json SecurityConfig::to_json() const
        {
            return nlohmann::json{{"hash_iterations", hash_iterations}};
        }

        // LivenessConfig implementation
        void LivenessConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("sweep_interval_s"))
                sweep_interval_s = j["sweep_interval_s"];
            if (j.contains("device_timeout_s"))
                device_timeout_s = j["device_timeout_s"];
        }

        nlohmann::json LivenessConfig::to_json() const
        {
            return nlohmann::json{
                {"sweep_interval_s", sweep_interval_s},
                {"device_timeout_s", device_timeout_s}};
        }

        // StorageConfig implementation
        void StorageConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("database_path"))
                database_path = j["database_path"];
            if (j.contains("data_lake_directory") && !j["data_lake_directory"].is_null())
                data_lake_directory = j["data_lake_directory"];
        }

        nlohmann::json StorageConfig::to_json() const
        {
            nlohmann::json j{{"database_path", database_path}};
            if (!data_lake_directory.empty())
            {
                j["data_lake_directory"] = data_lake_directory;
            }
            return j;
        }

        // ExamManagerConfig implementation
        void ExamManagerConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("host"))
                host = j["host"];
            if (j.contains("port"))
                port = j["port"];
        }

        nlohmann::json ExamManagerConfig::to_json() const
        {
            return nlohmann::json{
                {"host", host},
                {"port", port}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("level"))
                level = j["level"];
            if (j.contains("file") && !j["file"].is_null())
                file = j["file"];
            if (j.contains("console"))
                console = j["console"];
            if (j.contains("status_interval_s"))
                status_interval_s = j["status_interval_s"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{
                {"level", level},
                {"console", console},
                {"status_interval_s", status_interval_s}};
            if (!file.empty())
            {
                j["file"] = file;
            }
            return j;
        }

        // ManagerConfig implementation
        std::unique_ptr<ManagerConfig> ManagerConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<ManagerConfig> ManagerConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("configuration must be a JSON object");
            }

            auto config = std::make_unique<ManagerConfig>();
            try
            {
                if (j.contains("server"))
                    config->server.from_json(j["server"]);
                if (j.contains("security"))
                    config->security.from_json(j["security"]);
                if (j.contains("liveness"))
                    config->liveness.from_json(j["liveness"]);
                if (j.contains("storage"))
                    config->storage.from_json(j["storage"]);
                if (j.contains("exam_manager"))
                    config->exam_manager.from_json(j["exam_manager"]);
                if (j.contains("logging"))
                    config->logging.from_json(j["logging"]);
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument("Invalid configuration value: " + std::string(e.what()));
            }

            return config;
        }

        std::unique_ptr<ManagerConfig> ManagerConfig::create_default()
        {
            return std::make_unique<ManagerConfig>();
        }

        nlohmann::json ManagerConfig::to_json() const
        {
            return nlohmann::json{
                {"server", server.to_json()},
                {"security", security.to_json()},
                {"liveness", liveness.to_json()},
                {"storage", storage.to_json()},
                {"exam_manager", exam_manager.to_json()},
                {"logging", logging.to_json()}};
        }

        void ManagerConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        void ManagerConfig::apply_environment()
        {
            const char *data_lake = std::getenv("DATA_LAKE_DIRECTORY");
            if (data_lake && *data_lake)
            {
                storage.data_lake_directory = data_lake;
            }
        }

        bool ManagerConfig::validate() const
        {
            if (server.port == 0)
            {
                std::cerr << "Configuration validation error: server.port must be between 1 and 65535" << std::endl;
                return false;
            }

            if (server.websocket_path.empty() || server.websocket_path[0] != '/')
            {
                std::cerr << "Configuration validation error: server.websocket_path must start with '/'" << std::endl;
                return false;
            }

            if (server.worker_threads < 1)
            {
                std::cerr << "Configuration validation error: server.worker_threads must be at least 1" << std::endl;
                return false;
            }

            if (security.hash_iterations < 1)
            {
                std::cerr << "Configuration validation error: security.hash_iterations must be positive" << std::endl;
                return false;
            }

            if (liveness.sweep_interval_s <= 0 || liveness.device_timeout_s <= 0)
            {
                std::cerr << "Configuration validation error: liveness intervals must be positive" << std::endl;
                return false;
            }

            if (storage.database_path.empty())
            {
                std::cerr << "Configuration validation error: storage.database_path cannot be empty" << std::endl;
                return false;
            }

            if (exam_manager.port == 0)
            {
                std::cerr << "Configuration validation error: exam_manager.port must be between 1 and 65535" << std::endl;
                return false;
            }

            return true;
        }

    } // namespace core
} // namespace scanlink
