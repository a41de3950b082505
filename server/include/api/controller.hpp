#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "api/dto.hpp"
#include "services/liveness_monitor.hpp"
#include "services/scan_launcher.hpp"
#include "services/session_registry.hpp"
#include "shared/logging/logger.h"
#include <chrono>
#include <nlohmann/json.hpp>

namespace scanlink {
namespace api {

#include OATPP_CODEGEN_BEGIN(ApiController)

/**
 * Device manager REST endpoints
 * The WebSocket upgrade path is routed separately (see DeviceHandshakeHandler)
 */
class DeviceApiController : public oatpp::web::server::api::ApiController {
private:
  std::chrono::steady_clock::time_point m_startTime;
  std::shared_ptr<services::ScanLauncher> m_launcher;
  std::shared_ptr<services::SessionRegistry> m_sessions;
  std::shared_ptr<services::LivenessMonitor> m_liveness;
  std::shared_ptr<logging::Logger> m_logger;

  std::shared_ptr<OutgoingResponse> detailResponse(const Status& status, const std::string& detail) {
    auto dto = DetailDto::createShared();
    dto->detail = detail;
    return createDtoResponse(status, dto);
  }

  static Status statusFor(services::LaunchResult::Code code) {
    switch (code) {
      case services::LaunchResult::Code::SENT: return Status::CODE_200;
      case services::LaunchResult::Code::NOT_FOUND: return Status::CODE_404;
      case services::LaunchResult::Code::DEVICE_OFFLINE: return Status::CODE_503;
      case services::LaunchResult::Code::UPSTREAM_FAILURE: return Status::CODE_502;
    }
    return Status::CODE_500;
  }

  // "Bearer <token>" -> token; empty when absent or another scheme
  static std::string bearerToken(const oatpp::String& authorization) {
    if (!authorization) {
      return "";
    }
    const std::string value = *authorization;
    const std::string prefix = "Bearer ";
    if (value.size() <= prefix.size() || value.compare(0, prefix.size(), prefix) != 0) {
      return "";
    }
    return value.substr(prefix.size());
  }

public:
  DeviceApiController(const std::shared_ptr<ObjectMapper>& objectMapper,
                      std::shared_ptr<services::ScanLauncher> launcher,
                      std::shared_ptr<services::SessionRegistry> sessions,
                      std::shared_ptr<services::LivenessMonitor> liveness)
    : oatpp::web::server::api::ApiController(objectMapper)
    , m_startTime(std::chrono::steady_clock::now())
    , m_launcher(std::move(launcher))
    , m_sessions(std::move(sessions))
    , m_liveness(std::move(liveness))
    , m_logger(logging::get_logger("DeviceApiController"))
  {}

  static std::shared_ptr<DeviceApiController> createShared(
    const std::shared_ptr<ObjectMapper>& objectMapper,
    std::shared_ptr<services::ScanLauncher> launcher,
    std::shared_ptr<services::SessionRegistry> sessions,
    std::shared_ptr<services::LivenessMonitor> liveness
  ) {
    return std::make_shared<DeviceApiController>(objectMapper, launcher, sessions, liveness);
  }

  ENDPOINT_INFO(startScanViaWebsocket) {
    info->summary = "Start a scan on a connected device";
    info->description = "Sends the acquisition task, its sequence and the device parameters to the device over its WebSocket";
    info->addResponse<Object<ScanStartedDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<DetailDto>>(Status::CODE_401, "application/json");
    info->addResponse<Object<DetailDto>>(Status::CODE_404, "application/json");
    info->addResponse<Object<DetailDto>>(Status::CODE_502, "application/json");
    info->addResponse<Object<DetailDto>>(Status::CODE_503, "application/json");
    info->addTag("devices");
  }
  ENDPOINT("POST", "/api/v1/device/start_scan_via_websocket", startScanViaWebsocket,
           REQUEST(std::shared_ptr<IncomingRequest>, request),
           BODY_STRING(String, body)) {
    // Missing header is a 401
    std::string token = bearerToken(request->getHeader("Authorization"));
    if (token.empty()) {
      auto response = detailResponse(Status::CODE_401, "Not authenticated");
      response->putHeader("WWW-Authenticate", "Bearer");
      return response;
    }

    nlohmann::json task = nlohmann::json::parse(body ? *body : std::string(), nullptr, false);
    if (task.is_discarded() || !task.is_object()) {
      return detailResponse(Status::CODE_400, "Invalid acquisition task");
    }

    services::LaunchResult result = m_launcher->launch(task, token);
    if (!result.ok()) {
      m_logger->warning("start_scan_via_websocket rejected", logging::LogContext().add("detail", result.detail));
      return detailResponse(statusFor(result.code), result.detail);
    }

    auto dto = ScanStartedDto::createShared();
    dto->status = "started";
    dto->taskId = task.value("id", std::string());
    dto->deviceId = task.value("device_id", std::string());
    return createDtoResponse(Status::CODE_200, dto);
  }

  ENDPOINT_INFO(getHealth) {
    info->summary = "Device manager health";
    info->addResponse<Object<HealthDto>>(Status::CODE_200, "application/json");
    info->addTag("health");
  }
  ENDPOINT("GET", "/api/v1/device/health", getHealth) {
    auto dto = HealthDto::createShared();
    dto->status = "ok";
    dto->connectedDevices = static_cast<v_int32>(m_sessions->size());
    dto->trackedDevices = static_cast<v_int32>(m_liveness->tracked_count());

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - m_startTime);
    dto->uptime = static_cast<v_int64>(uptime.count());
    return createDtoResponse(Status::CODE_200, dto);
  }
};

#include OATPP_CODEGEN_END(ApiController)

} // namespace api
} // namespace scanlink
