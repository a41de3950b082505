#ifndef SCANLINK_SERVER_CONFIG_HPP
#define SCANLINK_SERVER_CONFIG_HPP

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace scanlink
{
    namespace core
    {

        /**
         * HTTP / WebSocket listener configuration
         */
        struct ServerConfig
        {
            std::string host = "0.0.0.0";
            uint16_t port = 8000;
            std::string websocket_path = "/api/v1/device/ws";
            int worker_threads = 4;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Device credential hashing
         */
        struct SecurityConfig
        {
            int hash_iterations = 100000;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Heartbeat timeout sweeping
         */
        struct LivenessConfig
        {
            int sweep_interval_s = 30;
            int device_timeout_s = 60;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Device database and result data lake
         */
        struct StorageConfig
        {
            std::string database_path = "data/devices.db";
            std::string data_lake_directory; // Overridden by DATA_LAKE_DIRECTORY

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Exam manager REST endpoint
         */
        struct ExamManagerConfig
        {
            std::string host = "127.0.0.1";
            uint16_t port = 8004;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string level = "INFO";
            std::string file; // Empty means console output only
            bool console = true;
            int status_interval_s = 60; // 0 disables the periodic status line

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete device manager configuration
         */
        class ManagerConfig
        {
        public:
            ServerConfig server;
            SecurityConfig security;
            LivenessConfig liveness;
            StorageConfig storage;
            ExamManagerConfig exam_manager;
            LoggingConfig logging;

        public:
            ManagerConfig() = default;

            // Factory methods
            static std::unique_ptr<ManagerConfig> from_file(const std::string &config_path);
            static std::unique_ptr<ManagerConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<ManagerConfig> create_default();

            // Serialization
            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            /** DATA_LAKE_DIRECTORY replaces storage.data_lake_directory when set */
            void apply_environment();

            bool validate() const;
        };

    } // namespace core
} // namespace scanlink

#endif // SCANLINK_SERVER_CONFIG_HPP
