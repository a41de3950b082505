#include "services/liveness_monitor.hpp"

namespace scanlink
{
    namespace services
    {
        using logging::LogContext;

        LivenessMonitor::LivenessMonitor(DeviceRepository &repository,
                                         std::chrono::seconds timeout,
                                         std::chrono::seconds sweep_interval)
            : repository_(repository),
              timeout_(timeout),
              sweep_interval_(sweep_interval),
              logger_(logging::get_logger("LivenessMonitor"))
        {
        }

        LivenessMonitor::~LivenessMonitor()
        {
            stop();
        }

        void LivenessMonitor::start()
        {
            if (running_.exchange(true))
            {
                return;
            }

            logger_->info("Starting liveness monitor",
                          LogContext().add("timeout_s", timeout_.count()).add("interval_s", sweep_interval_.count()));
            sweep_thread_ = std::make_unique<std::thread>(&LivenessMonitor::run, this);
        }

        void LivenessMonitor::stop()
        {
            if (!running_.exchange(false))
            {
                return;
            }

            shutdown_cv_.notify_all();
            if (sweep_thread_ && sweep_thread_->joinable())
            {
                sweep_thread_->join();
            }
            sweep_thread_.reset();
            logger_->info("Liveness monitor stopped");
        }

        void LivenessMonitor::run()
        {
            while (running_)
            {
                {
                    std::unique_lock<std::mutex> lock(shutdown_mutex_);
                    shutdown_cv_.wait_for(lock, sweep_interval_, [this]
                                          { return !running_; });
                }
                if (!running_)
                {
                    break;
                }

                try
                {
                    sweep();
                }
                catch (const std::exception &e)
                {
                    logger_->error("Liveness sweep failed", LogContext().add("error", e.what()));
                }
            }
        }

        void LivenessMonitor::record_heartbeat(const std::string &device_id, Clock::time_point now)
        {
            std::lock_guard<std::mutex> lock(last_seen_mutex_);
            last_seen_[device_id] = now;
        }

        void LivenessMonitor::forget(const std::string &device_id)
        {
            std::lock_guard<std::mutex> lock(last_seen_mutex_);
            last_seen_.erase(device_id);
        }

        std::vector<std::string> LivenessMonitor::sweep(Clock::time_point now)
        {
            std::vector<std::string> stale;
            {
                std::lock_guard<std::mutex> lock(last_seen_mutex_);
                for (auto it = last_seen_.begin(); it != last_seen_.end();)
                {
                    if (now - it->second > timeout_)
                    {
                        stale.push_back(it->first);
                        it = last_seen_.erase(it);
                    }
                    else
                    {
                        ++it;
                    }
                }
            }

            for (const auto &device_id : stale)
            {
                try
                {
                    DeviceUpdate update;
                    update.status = protocol::DeviceStatus::OFFLINE;
                    repository_.update_device(device_id, update);
                    logger_->warning("Device marked OFFLINE after missed heartbeats",
                                     LogContext().add("device_id", device_id));
                }
                catch (const std::exception &e)
                {
                    logger_->error("Failed to mark device OFFLINE",
                                   LogContext().add("device_id", device_id).add("error", e.what()));
                }
            }

            logger_->debug("Liveness sweep complete", LogContext().add("marked", stale.size()));
            return stale;
        }

        std::optional<LivenessMonitor::Clock::time_point> LivenessMonitor::last_seen(const std::string &device_id) const
        {
            std::lock_guard<std::mutex> lock(last_seen_mutex_);
            auto it = last_seen_.find(device_id);
            if (it == last_seen_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        size_t LivenessMonitor::tracked_count() const
        {
            std::lock_guard<std::mutex> lock(last_seen_mutex_);
            return last_seen_.size();
        }

    } // namespace services
} // namespace scanlink
