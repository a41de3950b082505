#include "core/device_manager.hpp"
#include "core/config.hpp"
#include "api/server.hpp"
#include "services/command_dispatcher.hpp"
#include "services/device_authenticator.hpp"
#include "services/device_repository.hpp"
#include "services/exam_service.hpp"
#include "services/liveness_monitor.hpp"
#include "services/scan_launcher.hpp"
#include "services/session_registry.hpp"
#include "shared/config/scanlink_config.h"
#include <filesystem>

namespace scanlink
{
    namespace core
    {
        using logging::LogContext;

        DeviceManager::DeviceManager(std::unique_ptr<ManagerConfig> config,
                                     std::shared_ptr<services::DeviceRepository> repository,
                                     std::shared_ptr<services::ExamService> exam_service)
            : config_(std::move(config)),
              logger_(logging::get_logger("DeviceManager")),
              repository_(std::move(repository)),
              exam_service_(std::move(exam_service)),
              start_time_(std::chrono::steady_clock::now())
        {
            if (!config_)
            {
                throw std::invalid_argument("Device manager configuration cannot be null");
            }

            logger_->info("Device manager initialized",
                          LogContext()
                              .add("port", config_->server.port)
                              .add("database", config_->storage.database_path)
                              .add("data_lake", config_->storage.data_lake_directory));
        }

        DeviceManager::~DeviceManager()
        {
            stop();
        }

        bool DeviceManager::start()
        {
            if (running_.exchange(true))
            {
                return true; // Already running
            }

            try
            {
                logger_->info("Starting device manager...");

                if (!repository_)
                {
                    std::filesystem::path db_path(config_->storage.database_path);
                    if (db_path.has_parent_path())
                    {
                        std::filesystem::create_directories(db_path.parent_path());
                    }
                    repository_ = std::make_shared<services::SqliteDeviceRepository>(config_->storage.database_path);
                }
                if (!exam_service_)
                {
                    exam_service_ = std::make_shared<services::HttpExamService>(config_->exam_manager.host,
                                                                                config_->exam_manager.port);
                }

                std::error_code ec;
                if (config_->storage.data_lake_directory.empty() ||
                    !std::filesystem::is_directory(config_->storage.data_lake_directory, ec))
                {
                    // Uploads are refused per transfer; the rest of the service still works
                    logger_->warning("Data lake directory not available, file uploads will be rejected",
                                     LogContext().add("path", config_->storage.data_lake_directory));
                }

                authenticator_ = std::make_shared<services::DeviceAuthenticator>(*repository_, config_->security.hash_iterations);
                sessions_ = std::make_shared<services::SessionRegistry>();
                liveness_ = std::make_shared<services::LivenessMonitor>(
                    *repository_,
                    std::chrono::seconds(config_->liveness.device_timeout_s),
                    std::chrono::seconds(config_->liveness.sweep_interval_s));
                launcher_ = std::make_shared<services::ScanLauncher>(*repository_, *exam_service_, *sessions_);

                dispatch_context_.reset(new services::DispatchContext{
                    *repository_, *exam_service_, *liveness_, *sessions_, config_->storage.data_lake_directory});

                liveness_->start();

                api_server_ = std::make_unique<api::ApiServer>(config_->server, launcher_, sessions_, liveness_,
                                                               authenticator_, *dispatch_context_);
                api_server_->start();

                if (config_->logging.status_interval_s > 0)
                {
                    status_thread_ = std::make_unique<std::thread>(&DeviceManager::run_status_monitor, this);
                }

                logger_->info("Device manager started",
                              LogContext()
                                  .add("host", config_->server.host)
                                  .add("port", config_->server.port));
                return true;
            }
            catch (const std::exception &e)
            {
                logger_->error("Failed to start device manager", LogContext().add("error", e.what()));
                stop();
                return false;
            }
        }

        void DeviceManager::stop()
        {
            if (!running_.exchange(false))
            {
                return; // Already stopped
            }

            logger_->info("Stopping device manager...");
            shutdown_cv_.notify_all();

            if (sessions_)
            {
                for (const auto &device_id : sessions_->device_ids())
                {
                    auto connection = sessions_->lookup(device_id);
                    if (connection)
                    {
                        connection->close(SCANLINK_CLOSE_GOING_AWAY, SCANLINK_SHUTDOWN_REASON);
                    }
                }
            }

            if (api_server_)
            {
                api_server_->stop();
            }

            if (status_thread_ && status_thread_->joinable())
            {
                status_thread_->join();
            }

            if (liveness_)
            {
                liveness_->stop();
            }

            logger_->info("Device manager stopped");
        }

        std::map<std::string, std::string> DeviceManager::get_manager_info() const
        {
            auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_time_);
            return {
                {"host", config_->server.host},
                {"port", std::to_string(config_->server.port)},
                {"websocket_path", config_->server.websocket_path},
                {"connected_devices", std::to_string(sessions_ ? sessions_->size() : 0)},
                {"tracked_devices", std::to_string(liveness_ ? liveness_->tracked_count() : 0)},
                {"uptime_seconds", std::to_string(uptime.count())}};
        }

        void DeviceManager::run_status_monitor()
        {
            logger_->debug("Status monitor started");

            while (running_)
            {
                log_status();

                std::unique_lock<std::mutex> lock(shutdown_mutex_);
                shutdown_cv_.wait_for(lock, std::chrono::seconds(config_->logging.status_interval_s),
                                      [this] { return !running_; });
            }
        }

        void DeviceManager::log_status()
        {
            auto info = get_manager_info();
            logger_->info("Device manager status",
                          LogContext()
                              .add("connected_devices", info["connected_devices"])
                              .add("tracked_devices", info["tracked_devices"])
                              .add("uptime_seconds", info["uptime_seconds"]));

            if (logger_->is_enabled(logging::LogLevel::DEBUG) && sessions_)
            {
                for (const auto &device_id : sessions_->device_ids())
                {
                    logger_->debug("Connected device", LogContext().add("device_id", device_id));
                }
            }
        }

    } // namespace core
} // namespace scanlink
