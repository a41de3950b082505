#ifndef SCANLINK_SERVER_DEVICE_MANAGER_HPP
#define SCANLINK_SERVER_DEVICE_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "shared/logging/logger.h"

// Forward declarations
namespace scanlink
{
    namespace core
    {
        class ManagerConfig;
    }
    namespace services
    {
        class DeviceRepository;
        class ExamService;
        class DeviceAuthenticator;
        class SessionRegistry;
        class LivenessMonitor;
        class ScanLauncher;
        struct DispatchContext;
    }
    namespace api
    {
        class ApiServer;
    }
}

namespace scanlink
{
    namespace core
    {

        /**
         * Device manager process
         * Owns the collaborators, the liveness sweeper and the HTTP/WebSocket server
         */
        class DeviceManager
        {
        public:
            /**
             * Repository and exam service default to SQLite and HTTP
             * implementations built from the configuration.
             */
            explicit DeviceManager(std::unique_ptr<ManagerConfig> config,
                                   std::shared_ptr<services::DeviceRepository> repository = nullptr,
                                   std::shared_ptr<services::ExamService> exam_service = nullptr);
            ~DeviceManager();

            bool start();
            void stop();
            bool is_running() const { return running_; }

            const ManagerConfig &config() const { return *config_; }

            std::shared_ptr<services::SessionRegistry> sessions() const { return sessions_; }
            std::shared_ptr<services::LivenessMonitor> liveness() const { return liveness_; }
            std::shared_ptr<services::DeviceAuthenticator> authenticator() const { return authenticator_; }

            std::map<std::string, std::string> get_manager_info() const;

        private:
            void run_status_monitor();
            void log_status();

            std::unique_ptr<ManagerConfig> config_;
            std::shared_ptr<logging::Logger> logger_;

            std::shared_ptr<services::DeviceRepository> repository_;
            std::shared_ptr<services::ExamService> exam_service_;
            std::shared_ptr<services::DeviceAuthenticator> authenticator_;
            std::shared_ptr<services::SessionRegistry> sessions_;
            std::shared_ptr<services::LivenessMonitor> liveness_;
            std::shared_ptr<services::ScanLauncher> launcher_;
            std::unique_ptr<services::DispatchContext> dispatch_context_;
            std::unique_ptr<api::ApiServer> api_server_;

            std::atomic<bool> running_{false};
            std::unique_ptr<std::thread> status_thread_;
            std::mutex shutdown_mutex_;
            std::condition_variable shutdown_cv_;

            std::chrono::steady_clock::time_point start_time_;
        };

    } // namespace core
} // namespace scanlink

#endif // SCANLINK_SERVER_DEVICE_MANAGER_HPP
