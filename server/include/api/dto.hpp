#pragma once

#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/Types.hpp"

namespace scanlink {
namespace api {

#include OATPP_CODEGEN_BEGIN(DTO)

class HealthDto : public oatpp::DTO {
  DTO_INIT(HealthDto, DTO)

  DTO_FIELD_INFO(status) {
    info->required = true;
  }
  DTO_FIELD(String, status);

  DTO_FIELD(Int32, connectedDevices, "connected_devices");
  DTO_FIELD(Int32, trackedDevices, "tracked_devices");
  DTO_FIELD(Int64, uptime);
};

class DetailDto : public oatpp::DTO {
  DTO_INIT(DetailDto, DTO)

  DTO_FIELD(String, detail);
};

class ScanStartedDto : public oatpp::DTO {
  DTO_INIT(ScanStartedDto, DTO)

  DTO_FIELD(String, status);
  DTO_FIELD(String, taskId, "task_id");
  DTO_FIELD(String, deviceId, "device_id");
};

#include OATPP_CODEGEN_END(DTO)

} // namespace api
} // namespace scanlink
