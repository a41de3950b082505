#include "transports/websocket_endpoint.hpp"

#include <optional>

#include "oatpp-websocket/Handshaker.hpp"

#include "shared/common/errors.h"
#include "shared/config/scanlink_config.h"

namespace scanlink
{
    namespace transports
    {
        using logging::LogContext;

        namespace
        {
            std::optional<std::string> find_parameter(const std::shared_ptr<const oatpp::network::ConnectionHandler::ParameterMap> &params,
                                                      const char *name)
            {
                if (!params)
                {
                    return std::nullopt;
                }
                auto it = params->find(name);
                if (it == params->end() || !it->second)
                {
                    return std::nullopt;
                }
                return std::string(it->second->c_str(), it->second->size());
            }
        } // namespace

        // WebSocketDeviceConnection

        WebSocketDeviceConnection::WebSocketDeviceConnection(const oatpp::websocket::WebSocket &socket, const std::string &device_id)
            : socket_(&socket), device_id_(device_id)
        {
        }

        bool WebSocketDeviceConnection::send_text(const std::string &text)
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (detached_)
            {
                return false;
            }
            try
            {
                return socket_->sendOneFrameText(oatpp::String(text));
            }
            catch (const std::exception &e)
            {
                logging::get_logger("WebSocketDeviceConnection")
                    ->warning("Write failed", LogContext().add("device_id", device_id_).add("error", e.what()));
                return false;
            }
        }

        void WebSocketDeviceConnection::close(uint16_t code, const std::string &reason)
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (detached_)
            {
                return;
            }
            try
            {
                socket_->sendClose(code, oatpp::String(reason));
            }
            catch (const std::exception &e)
            {
                logging::get_logger("WebSocketDeviceConnection")
                    ->warning("Close failed", LogContext().add("device_id", device_id_).add("error", e.what()));
            }
        }

        std::string WebSocketDeviceConnection::describe() const
        {
            return "websocket:" + device_id_;
        }

        void WebSocketDeviceConnection::detach()
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            detached_ = true;
        }

        // DeviceSocketListener

        DeviceSocketListener::DeviceSocketListener(std::shared_ptr<WebSocketDeviceConnection> connection,
                                                   std::unique_ptr<services::CommandDispatcher> dispatcher)
            : connection_(std::move(connection)),
              dispatcher_(std::move(dispatcher)),
              logger_(logging::get_logger("DeviceSocketListener"))
        {
        }

        void DeviceSocketListener::onPing(const WebSocket &socket, const oatpp::String &message)
        {
            socket.sendPong(message);
        }

        void DeviceSocketListener::onPong(const WebSocket &, const oatpp::String &)
        {
        }

        void DeviceSocketListener::onClose(const WebSocket &, v_uint16 code, const oatpp::String &)
        {
            logger_->debug("Close frame received",
                           LogContext().add("device_id", dispatcher_->device_id()).add("code", code));
        }

        void DeviceSocketListener::readMessage(const WebSocket &, v_uint8 opcode, p_char8 data, oatpp::v_io_size size)
        {
            if (size > 0)
            {
                if (buffer_.empty())
                {
                    message_opcode_ = opcode;
                }
                buffer_.append(reinterpret_cast<const char *>(data), static_cast<size_t>(size));
                return;
            }

            // size == 0 marks the end of a message
            std::string message;
            message.swap(buffer_);
            v_uint8 message_opcode = message.empty() ? opcode : message_opcode_;

            try
            {
                if (message_opcode == oatpp::websocket::Frame::OPCODE_BINARY)
                {
                    dispatcher_->on_binary(message);
                }
                else
                {
                    dispatcher_->on_text(message);
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Message handling failed",
                               LogContext().add("device_id", dispatcher_->device_id()).add("error", e.what()));
            }
        }

        void DeviceSocketListener::on_disconnect()
        {
            connection_->detach();
            dispatcher_->on_disconnect();
        }

        // DeviceSocketInstanceListener

        DeviceSocketInstanceListener::DeviceSocketInstanceListener(services::DeviceAuthenticator &authenticator,
                                                                   services::DispatchContext &context)
            : authenticator_(authenticator),
              context_(context),
              logger_(logging::get_logger("DeviceSocketInstanceListener"))
        {
        }

        void DeviceSocketInstanceListener::onAfterCreate(const oatpp::websocket::WebSocket &socket,
                                                         const std::shared_ptr<const ParameterMap> &params)
        {
            std::string device_id;
            try
            {
                device_id = authenticator_.authenticate(find_parameter(params, SCANLINK_HEADER_DEVICE_ID),
                                                        find_parameter(params, SCANLINK_HEADER_DEVICE_TOKEN));
            }
            catch (const AuthenticationError &e)
            {
                socket.sendClose(SCANLINK_CLOSE_POLICY_VIOLATION, oatpp::String(e.what()));
                return;
            }

            auto connection = std::make_shared<WebSocketDeviceConnection>(socket, device_id);
            auto dispatcher = std::make_unique<services::CommandDispatcher>(device_id, connection, context_);
            auto listener = std::make_shared<DeviceSocketListener>(connection, std::move(dispatcher));

            {
                std::lock_guard<std::mutex> lock(listeners_mutex_);
                listeners_[&socket] = listener;
            }
            socket.setListener(listener);

            context_.sessions.register_session(device_id, connection);
            context_.liveness.record_heartbeat(device_id);
            try
            {
                services::DeviceUpdate update;
                update.status = protocol::DeviceStatus::ONLINE;
                context_.repository.update_device(device_id, update);
            }
            catch (const std::exception &e)
            {
                logger_->error("Could not mark device ONLINE",
                               LogContext().add("device_id", device_id).add("error", e.what()));
            }

            logger_->info("Device connected", LogContext().add("device_id", device_id));
        }

        void DeviceSocketInstanceListener::onBeforeDestroy(const oatpp::websocket::WebSocket &socket)
        {
            std::shared_ptr<DeviceSocketListener> listener;
            {
                std::lock_guard<std::mutex> lock(listeners_mutex_);
                auto it = listeners_.find(&socket);
                if (it == listeners_.end())
                {
                    return;
                }
                listener = it->second;
                listeners_.erase(it);
            }

            socket.setListener(nullptr);
            listener->on_disconnect();
        }

        size_t DeviceSocketInstanceListener::active_sockets() const
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            return listeners_.size();
        }

        // DeviceHandshakeHandler

        DeviceHandshakeHandler::DeviceHandshakeHandler(std::shared_ptr<oatpp::websocket::ConnectionHandler> websocket_handler)
            : websocket_handler_(std::move(websocket_handler))
        {
        }

        std::shared_ptr<DeviceHandshakeHandler::OutgoingResponse>
        DeviceHandshakeHandler::handle(const std::shared_ptr<IncomingRequest> &request)
        {
            auto response = oatpp::websocket::Handshaker::serversideHandshake(request->getHeaders(), websocket_handler_);

            auto parameters = std::make_shared<oatpp::network::ConnectionHandler::ParameterMap>();
            for (const char *name : {SCANLINK_HEADER_DEVICE_ID, SCANLINK_HEADER_DEVICE_TOKEN})
            {
                auto value = request->getHeader(name);
                if (value)
                {
                    (*parameters)[name] = value;
                }
            }
            response->setConnectionUpgradeParameters(parameters);
            return response;
        }

    } // namespace transports
} // namespace scanlink
