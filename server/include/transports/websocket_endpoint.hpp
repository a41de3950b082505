#ifndef SCANLINK_SERVER_WEBSOCKET_ENDPOINT_HPP
#define SCANLINK_SERVER_WEBSOCKET_ENDPOINT_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "oatpp-websocket/ConnectionHandler.hpp"
#include "oatpp-websocket/WebSocket.hpp"
#include "oatpp/web/server/HttpRequestHandler.hpp"

#include "services/command_dispatcher.hpp"
#include "services/device_authenticator.hpp"
#include "shared/logging/logger.h"
#include "transports/device_connection.hpp"

namespace scanlink
{
    namespace transports
    {

        /**
         * DeviceConnection over an oatpp WebSocket
         *
         * Writes from the receive thread and from HTTP handlers (start_scan)
         * are serialized. After detach() the socket may be gone and every
         * call is a no-op.
         */
        class WebSocketDeviceConnection : public DeviceConnection
        {
        public:
            WebSocketDeviceConnection(const oatpp::websocket::WebSocket &socket, const std::string &device_id);

            bool send_text(const std::string &text) override;
            void close(uint16_t code, const std::string &reason) override;
            std::string describe() const override;

            void detach();

        private:
            const oatpp::websocket::WebSocket *socket_;
            std::string device_id_;
            std::mutex write_mutex_;
            bool detached_ = false;
        };

        /**
         * Frame listener of one authenticated socket
         *
         * Reassembles fragmented messages and hands complete text and binary
         * messages to the connection's dispatcher.
         */
        class DeviceSocketListener : public oatpp::websocket::WebSocket::Listener
        {
        public:
            DeviceSocketListener(std::shared_ptr<WebSocketDeviceConnection> connection,
                                 std::unique_ptr<services::CommandDispatcher> dispatcher);

            void onPing(const WebSocket &socket, const oatpp::String &message) override;
            void onPong(const WebSocket &socket, const oatpp::String &message) override;
            void onClose(const WebSocket &socket, v_uint16 code, const oatpp::String &message) override;
            void readMessage(const WebSocket &socket, v_uint8 opcode, p_char8 data, oatpp::v_io_size size) override;

            void on_disconnect();

        private:
            std::shared_ptr<WebSocketDeviceConnection> connection_;
            std::unique_ptr<services::CommandDispatcher> dispatcher_;
            std::string buffer_;
            v_uint8 message_opcode_ = 0;
            std::shared_ptr<logging::Logger> logger_;
        };

        /**
         * Authenticates new sockets and attaches their listeners
         *
         * Credentials arrive as the device-id / device-token upgrade
         * parameters. A rejected socket is closed with 1008; an accepted one
         * is registered in the session registry (replacing any previous
         * connection of the same device) and marked ONLINE.
         */
        class DeviceSocketInstanceListener : public oatpp::websocket::ConnectionHandler::SocketInstanceListener
        {
        public:
            DeviceSocketInstanceListener(services::DeviceAuthenticator &authenticator,
                                         services::DispatchContext &context);

            void onAfterCreate(const oatpp::websocket::WebSocket &socket,
                               const std::shared_ptr<const ParameterMap> &params) override;
            void onBeforeDestroy(const oatpp::websocket::WebSocket &socket) override;

            size_t active_sockets() const;

        private:
            services::DeviceAuthenticator &authenticator_;
            services::DispatchContext &context_;

            mutable std::mutex listeners_mutex_;
            std::map<const oatpp::websocket::WebSocket *, std::shared_ptr<DeviceSocketListener>> listeners_;

            std::shared_ptr<logging::Logger> logger_;
        };

        /**
         * HTTP handler performing the WebSocket upgrade on the device path
         */
        class DeviceHandshakeHandler : public oatpp::web::server::HttpRequestHandler
        {
        public:
            explicit DeviceHandshakeHandler(std::shared_ptr<oatpp::websocket::ConnectionHandler> websocket_handler);

            std::shared_ptr<OutgoingResponse> handle(const std::shared_ptr<IncomingRequest> &request) override;

        private:
            std::shared_ptr<oatpp::websocket::ConnectionHandler> websocket_handler_;
        };

    } // namespace transports
} // namespace scanlink

#endif // SCANLINK_SERVER_WEBSOCKET_ENDPOINT_HPP
