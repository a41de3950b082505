#ifndef SCANLINK_SERVER_DEVICE_AUTHENTICATOR_HPP
#define SCANLINK_SERVER_DEVICE_AUTHENTICATOR_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "services/device_repository.hpp"
#include "shared/logging/logger.h"

namespace scanlink
{
    namespace services
    {

        /**
         * Verifies device-id / device-token handshake headers
         *
         * Every rejection throws AuthenticationError with the same message.
         * For an unknown id the token is still run through the key derivation
         * against a random salt so the response time does not reveal whether
         * the id exists.
         */
        class DeviceAuthenticator
        {
        public:
            DeviceAuthenticator(DeviceRepository &repository, int hash_iterations);

            /**
             * @return the authenticated device id
             * @throws AuthenticationError
             */
            std::string authenticate(const std::optional<std::string> &device_id,
                                     const std::optional<std::string> &device_token);

            /**
             * Create a device record with a fresh id and token.
             * @return {device_id, device_token}; the token is not stored in clear
             */
            std::pair<std::string, std::string> provision_device(const protocol::DeviceDetails &details);

            int hash_iterations() const { return hash_iterations_; }

        private:
            [[noreturn]] void reject(const std::string &reason, const std::string &device_id);

            DeviceRepository &repository_;
            int hash_iterations_;
            std::shared_ptr<logging::Logger> logger_;
        };

    } // namespace services
} // namespace scanlink

#endif // SCANLINK_SERVER_DEVICE_AUTHENTICATOR_HPP
