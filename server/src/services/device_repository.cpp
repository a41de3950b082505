#include "services/device_repository.hpp"

#include "database/models.hpp"
#include "shared/common/errors.h"

namespace scanlink
{
    namespace services
    {
        using logging::LogContext;

        struct SqliteDeviceRepository::StorageHolder
        {
            explicit StorageHolder(const std::string &path) : storage(db::initStorage(path)) {}
            db::Storage storage;
        };

        namespace
        {
            DeviceRecord to_record(const db::Device &row)
            {
                DeviceRecord record;
                record.id = row.id;
                record.details.device_name = row.device_name;
                record.details.serial_number = row.serial_number;
                record.details.manufacturer = row.manufacturer;
                record.details.modality = row.modality;
                record.details.site = row.site;
                record.details.ip_address = row.ip_address;
                record.details.parameter = nlohmann::json::parse(row.parameter, nullptr, false);
                if (record.details.parameter.is_discarded())
                {
                    record.details.parameter = nlohmann::json::object();
                }
                record.status = protocol::parse_device_status(row.status).value_or(protocol::DeviceStatus::OFFLINE);
                record.salt = row.salt;
                record.token_hash = row.token_hash;
                record.datetime_created = row.datetime_created;
                record.datetime_updated = row.datetime_updated;
                return record;
            }

            void apply_details(db::Device &row, const protocol::DeviceDetails &details)
            {
                row.device_name = details.device_name;
                row.serial_number = details.serial_number;
                row.manufacturer = details.manufacturer;
                row.modality = details.modality;
                row.site = details.site;
                row.ip_address = details.ip_address;
                row.parameter = details.parameter.dump();
            }
        } // namespace

        SqliteDeviceRepository::SqliteDeviceRepository(const std::string &database_path)
            : logger_(logging::get_logger("DeviceRepository"))
        {
            try
            {
                storage_ = std::make_unique<StorageHolder>(database_path);
                storage_->storage.sync_schema();
            }
            catch (const std::exception &e)
            {
                throw CollaboratorError("Failed to open device database " + database_path + ": " + e.what());
            }
            logger_->info("Device database ready", LogContext().add("path", database_path));
        }

        SqliteDeviceRepository::~SqliteDeviceRepository() = default;

        std::optional<DeviceRecord> SqliteDeviceRepository::get_device(const std::string &device_id)
        {
            std::lock_guard<std::mutex> lock(storage_mutex_);
            try
            {
                auto row = storage_->storage.get_pointer<db::Device>(device_id);
                if (!row)
                {
                    return std::nullopt;
                }
                return to_record(*row);
            }
            catch (const std::system_error &e)
            {
                throw CollaboratorError(std::string("Device lookup failed: ") + e.what());
            }
        }

        bool SqliteDeviceRepository::update_device(const std::string &device_id, const DeviceUpdate &update)
        {
            std::lock_guard<std::mutex> lock(storage_mutex_);
            try
            {
                auto row = storage_->storage.get_pointer<db::Device>(device_id);
                if (!row)
                {
                    return false;
                }

                if (update.details)
                {
                    apply_details(*row, *update.details);
                }
                if (update.status)
                {
                    row->status = protocol::to_string(*update.status);
                }
                row->datetime_updated = db::getCurrentTimestamp();
                storage_->storage.update(*row);
                return true;
            }
            catch (const std::system_error &e)
            {
                throw CollaboratorError(std::string("Device update failed: ") + e.what());
            }
        }

        void SqliteDeviceRepository::create_device(const DeviceRecord &record)
        {
            db::Device row;
            row.id = record.id;
            apply_details(row, record.details);
            row.status = protocol::to_string(record.status);
            row.salt = record.salt;
            row.token_hash = record.token_hash;
            row.datetime_created = record.datetime_created ? record.datetime_created : db::getCurrentTimestamp();
            row.datetime_updated = row.datetime_created;

            std::lock_guard<std::mutex> lock(storage_mutex_);
            try
            {
                storage_->storage.replace(row);
            }
            catch (const std::system_error &e)
            {
                throw CollaboratorError(std::string("Device insert failed: ") + e.what());
            }
            logger_->info("Device record stored", LogContext().add("device_id", record.id));
        }

        size_t SqliteDeviceRepository::device_count()
        {
            std::lock_guard<std::mutex> lock(storage_mutex_);
            return static_cast<size_t>(storage_->storage.count<db::Device>());
        }

    } // namespace services
} // namespace scanlink
