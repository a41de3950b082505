#pragma once

#include <sqlite_orm/sqlite_orm.h>
#include <chrono>
#include <cstdint>
#include <string>

namespace scanlink {
namespace db {

// Device entity for sqlite_orm. Details and parameter are stored as JSON text.
struct Device {
    std::string id;
    std::string device_name;
    std::string serial_number;
    std::string manufacturer;
    std::string modality;
    std::string site;
    std::string ip_address;
    std::string parameter;     // JSON object
    std::string status;        // OFFLINE, ONLINE, BUSY, ERROR
    std::string salt;
    std::string token_hash;
    int64_t datetime_created;
    int64_t datetime_updated;

    Device() : parameter("{}"), status("OFFLINE"), datetime_created(0), datetime_updated(0) {}
};

inline auto initStorage(const std::string& path) {
    using namespace sqlite_orm;

    return make_storage(
        path,
        make_table(
            "devices",
            make_column("id", &Device::id, primary_key()),
            make_column("device_name", &Device::device_name),
            make_column("serial_number", &Device::serial_number),
            make_column("manufacturer", &Device::manufacturer),
            make_column("modality", &Device::modality),
            make_column("site", &Device::site),
            make_column("ip_address", &Device::ip_address, default_value("")),
            make_column("parameter", &Device::parameter, default_value("{}")),
            make_column("status", &Device::status, default_value("OFFLINE")),
            make_column("salt", &Device::salt),
            make_column("token_hash", &Device::token_hash),
            make_column("datetime_created", &Device::datetime_created),
            make_column("datetime_updated", &Device::datetime_updated)
        )
    );
}

using Storage = decltype(initStorage(""));

inline int64_t getCurrentTimestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace db
} // namespace scanlink
