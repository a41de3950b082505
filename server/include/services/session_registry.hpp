#ifndef SCANLINK_SERVER_SESSION_REGISTRY_HPP
#define SCANLINK_SERVER_SESSION_REGISTRY_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "shared/logging/logger.h"
#include "transports/device_connection.hpp"

namespace scanlink
{
    namespace services
    {

        /**
         * Authenticated device id -> live connection
         *
         * One instance is created by the device manager and passed by
         * reference to every component that needs to reach a device.
         */
        class SessionRegistry
        {
        public:
            using ConnectionPtr = std::shared_ptr<transports::DeviceConnection>;

            SessionRegistry();

            /**
             * Insert or replace the session for device_id. A previous
             * connection for the same id is closed after it is replaced.
             */
            void register_session(const std::string &device_id, ConnectionPtr connection);

            ConnectionPtr lookup(const std::string &device_id) const;

            /** Remove unconditionally */
            bool remove(const std::string &device_id);

            /**
             * Remove only while the entry still maps to connection, so a
             * superseded connection shutting down cannot drop its successor.
             */
            bool remove_if_current(const std::string &device_id, const transports::DeviceConnection *connection);

            bool is_current(const std::string &device_id, const transports::DeviceConnection *connection) const;

            size_t size() const;
            std::vector<std::string> device_ids() const;

        private:
            mutable std::shared_mutex sessions_mutex_;
            std::map<std::string, ConnectionPtr> sessions_;
            std::shared_ptr<logging::Logger> logger_;
        };

    } // namespace services
} // namespace scanlink

#endif // SCANLINK_SERVER_SESSION_REGISTRY_HPP
