#ifndef SCANLINK_SERVER_LIVENESS_MONITOR_HPP
#define SCANLINK_SERVER_LIVENESS_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "services/device_repository.hpp"
#include "shared/logging/logger.h"

namespace scanlink
{
    namespace services
    {

        /**
         * Marks devices OFFLINE when no heartbeat arrived within the timeout
         *
         * Last-seen times come only from record_heartbeat(). A device that
         * has been marked is no longer tracked until its next heartbeat.
         * Transports are never closed here.
         */
        class LivenessMonitor
        {
        public:
            using Clock = std::chrono::steady_clock;

            LivenessMonitor(DeviceRepository &repository,
                            std::chrono::seconds timeout,
                            std::chrono::seconds sweep_interval);
            ~LivenessMonitor();

            void start();
            void stop();
            bool is_running() const { return running_; }

            void record_heartbeat(const std::string &device_id, Clock::time_point now = Clock::now());
            void forget(const std::string &device_id);

            /**
             * One pass over all tracked devices
             * @return ids marked OFFLINE by this pass
             */
            std::vector<std::string> sweep(Clock::time_point now = Clock::now());

            std::optional<Clock::time_point> last_seen(const std::string &device_id) const;
            size_t tracked_count() const;

        private:
            void run();

            DeviceRepository &repository_;
            std::chrono::seconds timeout_;
            std::chrono::seconds sweep_interval_;

            mutable std::mutex last_seen_mutex_;
            std::map<std::string, Clock::time_point> last_seen_;

            std::atomic<bool> running_{false};
            std::unique_ptr<std::thread> sweep_thread_;
            std::mutex shutdown_mutex_;
            std::condition_variable shutdown_cv_;

            std::shared_ptr<logging::Logger> logger_;
        };

    } // namespace services
} // namespace scanlink

#endif // SCANLINK_SERVER_LIVENESS_MONITOR_HPP
