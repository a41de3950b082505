#include "services/device_authenticator.hpp"

#include <algorithm>
#include <cctype>

#include "shared/common/errors.h"
#include "shared/config/scanlink_config.h"
#include "shared/crypto/crypto_utils.h"

namespace scanlink
{
    namespace services
    {
        using logging::LogContext;

        DeviceAuthenticator::DeviceAuthenticator(DeviceRepository &repository, int hash_iterations)
            : repository_(repository),
              hash_iterations_(hash_iterations),
              logger_(logging::get_logger("DeviceAuthenticator"))
        {
        }

        std::string DeviceAuthenticator::authenticate(const std::optional<std::string> &device_id,
                                                      const std::optional<std::string> &device_token)
        {
            if (!device_id || !device_token || device_id->empty() || device_token->empty())
            {
                reject("missing credentials", device_id.value_or(""));
            }

            if (!crypto::is_uuid(*device_id))
            {
                reject("malformed device id", *device_id);
            }

            std::string canonical_id = *device_id;
            std::transform(canonical_id.begin(), canonical_id.end(), canonical_id.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            std::optional<DeviceRecord> device;
            try
            {
                device = repository_.get_device(canonical_id);
            }
            catch (const CollaboratorError &e)
            {
                logger_->error("Device lookup failed during handshake",
                               LogContext().add("device_id", canonical_id).add("error", e.what()));
                device.reset();
            }

            if (!device)
            {
                // Same derivation cost as a real check
                std::string dummy_hash = crypto::hash_token(*device_token, crypto::generate_salt(), hash_iterations_);
                (void)crypto::constant_time_equals(dummy_hash, dummy_hash);
                reject("unknown device", canonical_id);
            }

            std::string computed = crypto::hash_token(*device_token, device->salt, hash_iterations_);
            if (!crypto::constant_time_equals(computed, device->token_hash))
            {
                reject("token mismatch", canonical_id);
            }

            logger_->info("Device authenticated", LogContext().add("device_id", canonical_id));
            return canonical_id;
        }

        void DeviceAuthenticator::reject(const std::string &reason, const std::string &device_id)
        {
            logger_->warning("Device authentication rejected",
                             LogContext().add("device_id", device_id).add("reason", reason));
            throw AuthenticationError(SCANLINK_AUTH_FAILURE_REASON);
        }

        std::pair<std::string, std::string> DeviceAuthenticator::provision_device(const protocol::DeviceDetails &details)
        {
            DeviceRecord record;
            record.id = crypto::generate_uuid();
            record.details = details;
            record.status = protocol::DeviceStatus::OFFLINE;
            record.salt = crypto::generate_salt();

            std::string token = crypto::random_hex(32);
            record.token_hash = crypto::hash_token(token, record.salt, hash_iterations_);

            repository_.create_device(record);
            logger_->info("Device provisioned", LogContext().add("device_id", record.id));
            return {record.id, token};
        }

    } // namespace services
} // namespace scanlink
