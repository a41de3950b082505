#ifndef SCANLINK_SERVER_DEVICE_REPOSITORY_HPP
#define SCANLINK_SERVER_DEVICE_REPOSITORY_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "shared/logging/logger.h"
#include "shared/protocol/messages.h"

namespace scanlink
{
    namespace services
    {

        /**
         * Persistent device record, including the credential hash
         */
        struct DeviceRecord
        {
            std::string id;
            protocol::DeviceDetails details;
            protocol::DeviceStatus status = protocol::DeviceStatus::OFFLINE;
            std::string salt;
            std::string token_hash;
            int64_t datetime_created = 0;
            int64_t datetime_updated = 0;
        };

        /**
         * Partial update; only engaged fields are written
         */
        struct DeviceUpdate
        {
            std::optional<protocol::DeviceDetails> details;
            std::optional<protocol::DeviceStatus> status;
        };

        /**
         * Device record access
         *
         * Implementations throw CollaboratorError when the backing store
         * fails; a missing device is reported through the return value.
         */
        class DeviceRepository
        {
        public:
            virtual ~DeviceRepository() = default;

            virtual std::optional<DeviceRecord> get_device(const std::string &device_id) = 0;

            /** @return false if no device with this id exists */
            virtual bool update_device(const std::string &device_id, const DeviceUpdate &update) = 0;

            virtual void create_device(const DeviceRecord &record) = 0;
        };

        /**
         * DeviceRepository on a SQLite database through sqlite_orm
         */
        class SqliteDeviceRepository : public DeviceRepository
        {
        public:
            explicit SqliteDeviceRepository(const std::string &database_path);
            ~SqliteDeviceRepository() override;

            std::optional<DeviceRecord> get_device(const std::string &device_id) override;
            bool update_device(const std::string &device_id, const DeviceUpdate &update) override;
            void create_device(const DeviceRecord &record) override;

            size_t device_count();

        private:
            struct StorageHolder;
            std::unique_ptr<StorageHolder> storage_;
            std::mutex storage_mutex_;
            std::shared_ptr<logging::Logger> logger_;
        };

    } // namespace services
} // namespace scanlink

#endif // SCANLINK_SERVER_DEVICE_REPOSITORY_HPP
