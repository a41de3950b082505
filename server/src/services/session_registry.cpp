#include "services/session_registry.hpp"

#include <mutex>

#include "shared/config/scanlink_config.h"

namespace scanlink
{
    namespace services
    {
        using logging::LogContext;

        SessionRegistry::SessionRegistry()
            : logger_(logging::get_logger("SessionRegistry"))
        {
        }

        void SessionRegistry::register_session(const std::string &device_id, ConnectionPtr connection)
        {
            ConnectionPtr previous;
            {
                std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
                auto it = sessions_.find(device_id);
                if (it != sessions_.end() && it->second == connection)
                {
                    return;
                }
                if (it != sessions_.end())
                {
                    previous = std::move(it->second);
                    it->second = std::move(connection);
                }
                else
                {
                    sessions_.emplace(device_id, std::move(connection));
                }
            }

            if (previous)
            {
                logger_->warning("Replacing existing session",
                                 LogContext().add("device_id", device_id).add("previous", previous->describe()));
                previous->close(SCANLINK_CLOSE_NORMAL, SCANLINK_SUPERSEDED_REASON);
            }
            else
            {
                logger_->info("Session registered", LogContext().add("device_id", device_id));
            }
        }

        SessionRegistry::ConnectionPtr SessionRegistry::lookup(const std::string &device_id) const
        {
            std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
            auto it = sessions_.find(device_id);
            return it != sessions_.end() ? it->second : nullptr;
        }

        bool SessionRegistry::remove(const std::string &device_id)
        {
            std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
            return sessions_.erase(device_id) > 0;
        }

        bool SessionRegistry::remove_if_current(const std::string &device_id, const transports::DeviceConnection *connection)
        {
            std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
            auto it = sessions_.find(device_id);
            if (it == sessions_.end() || it->second.get() != connection)
            {
                return false;
            }
            sessions_.erase(it);
            return true;
        }

        bool SessionRegistry::is_current(const std::string &device_id, const transports::DeviceConnection *connection) const
        {
            std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
            auto it = sessions_.find(device_id);
            return it != sessions_.end() && it->second.get() == connection;
        }

        size_t SessionRegistry::size() const
        {
            std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
            return sessions_.size();
        }

        std::vector<std::string> SessionRegistry::device_ids() const
        {
            std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
            std::vector<std::string> ids;
            ids.reserve(sessions_.size());
            for (const auto &[device_id, connection] : sessions_)
            {
                ids.push_back(device_id);
            }
            return ids;
        }

    } // namespace services
} // namespace scanlink
