#pragma once

#include "oatpp/web/server/HttpConnectionHandler.hpp"
#include "oatpp/web/server/HttpRouter.hpp"
#include "oatpp/network/tcp/server/ConnectionProvider.hpp"
#include "oatpp/network/Server.hpp"
#include "oatpp/parser/json/mapping/ObjectMapper.hpp"
#include "oatpp-swagger/Controller.hpp"
#include "oatpp-swagger/Resources.hpp"
#include "oatpp-websocket/ConnectionHandler.hpp"
#include "api/controller.hpp"
#include "core/config.hpp"
#include "services/device_authenticator.hpp"
#include "services/command_dispatcher.hpp"
#include "transports/websocket_endpoint.hpp"
#include "shared/logging/logger.h"
#include <memory>
#include <thread>
#include <chrono>
#include <vector>
#include <atomic>

namespace scanlink {
namespace api {

/**
 * HTTP + WebSocket front end of the device manager
 */
class ApiServer {
private:
  std::shared_ptr<oatpp::network::tcp::server::ConnectionProvider> m_connectionProvider;
  std::shared_ptr<oatpp::web::server::HttpConnectionHandler> m_connectionHandler;
  std::shared_ptr<oatpp::websocket::ConnectionHandler> m_websocketHandler;
  std::shared_ptr<transports::DeviceSocketInstanceListener> m_socketListener;
  std::vector<std::thread> m_workerThreads;
  std::atomic<bool> m_running;

  core::ServerConfig m_config;
  std::shared_ptr<services::ScanLauncher> m_launcher;
  std::shared_ptr<services::SessionRegistry> m_sessions;
  std::shared_ptr<services::LivenessMonitor> m_liveness;
  std::shared_ptr<services::DeviceAuthenticator> m_authenticator;
  services::DispatchContext& m_dispatchContext;
  std::shared_ptr<logging::Logger> m_logger;

public:
  ApiServer(const core::ServerConfig& config,
            std::shared_ptr<services::ScanLauncher> launcher,
            std::shared_ptr<services::SessionRegistry> sessions,
            std::shared_ptr<services::LivenessMonitor> liveness,
            std::shared_ptr<services::DeviceAuthenticator> authenticator,
            services::DispatchContext& dispatchContext)
    : m_running(false)
    , m_config(config)
    , m_launcher(std::move(launcher))
    , m_sessions(std::move(sessions))
    , m_liveness(std::move(liveness))
    , m_authenticator(std::move(authenticator))
    , m_dispatchContext(dispatchContext)
    , m_logger(logging::get_logger("ApiServer")) {}

  ~ApiServer() {
    stop();
  }

  void start() {
    if (m_running.exchange(true)) {
      return;
    }

    auto objectMapper = oatpp::parser::json::mapping::ObjectMapper::createShared();
    auto router = oatpp::web::server::HttpRouter::createShared();

    auto apiController = DeviceApiController::createShared(objectMapper, m_launcher, m_sessions, m_liveness);
    router->addController(apiController);

    // WebSocket upgrade on the configured device path
    m_websocketHandler = oatpp::websocket::ConnectionHandler::createShared();
    m_socketListener = std::make_shared<transports::DeviceSocketInstanceListener>(*m_authenticator, m_dispatchContext);
    m_websocketHandler->setSocketInstanceListener(m_socketListener);
    router->route("GET", m_config.websocket_path.c_str(),
                  std::make_shared<transports::DeviceHandshakeHandler>(m_websocketHandler));

    auto docInfo = oatpp::swagger::DocumentInfo::createShared();
    docInfo->header = oatpp::swagger::DocumentHeader::createShared();
    docInfo->header->title = "ScanLink Device Manager API";
    docInfo->header->description = "Scan launch and health endpoints of the device manager";
    docInfo->header->version = "1.0.0";

    auto swaggerResources = oatpp::swagger::Resources::streamResources(OATPP_SWAGGER_RES_PATH);
    auto swaggerController = oatpp::swagger::Controller::createShared(
      apiController->getEndpoints(),
      docInfo,
      swaggerResources
    );
    router->addController(swaggerController);

    m_connectionProvider = oatpp::network::tcp::server::ConnectionProvider::createShared(
      {m_config.host.c_str(), m_config.port, oatpp::network::Address::IP_4}
    );
    m_connectionHandler = oatpp::web::server::HttpConnectionHandler::createShared(router);

    m_logger->info("HTTP server starting",
                   logging::LogContext()
                     .add("host", m_config.host)
                     .add("port", m_config.port)
                     .add("websocket_path", m_config.websocket_path));

    for (int i = 0; i < m_config.worker_threads; ++i) {
      m_workerThreads.emplace_back([this]() {
        while (m_running) {
          auto connection = m_connectionProvider->get();
          if (connection) {
            m_connectionHandler->handleConnection(connection, nullptr);
          } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
          }
        }
      });
    }

    m_logger->info("HTTP server started", logging::LogContext().add("worker_threads", m_config.worker_threads));
  }

  void stop() {
    if (m_running.exchange(false)) {
      if (m_connectionProvider) {
        m_connectionProvider->stop();
      }

      for (auto& thread : m_workerThreads) {
        if (thread.joinable()) {
          thread.join();
        }
      }
      m_workerThreads.clear();

      if (m_connectionHandler) {
        m_connectionHandler->stop();
      }
      if (m_websocketHandler) {
        m_websocketHandler->stop();
      }

      m_logger->info("HTTP server stopped");
    }
  }

  bool isRunning() const {
    return m_running;
  }

  size_t activeSockets() const {
    return m_socketListener ? m_socketListener->active_sockets() : 0;
  }
};

} // namespace api
} // namespace scanlink
