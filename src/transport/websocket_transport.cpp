#include "transport/websocket_transport.h"

#include <chrono>

#include "oatpp-websocket/Connector.hpp"
#include "oatpp/network/tcp/client/ConnectionProvider.hpp"

#include "shared/common/errors.h"
#include "shared/config/scanlink_config.h"

namespace scanlink
{
namespace sdk
{

using logging::LogContext;

WebSocketTransport::SocketListener::SocketListener(WebSocketTransport *owner)
    : owner(owner), message_type(FrameType::TEXT)
{
}

void WebSocketTransport::SocketListener::onPing(const WebSocket &socket, const oatpp::String &message)
{
    socket.sendPong(message);
}

void WebSocketTransport::SocketListener::onPong(const WebSocket &socket, const oatpp::String &message)
{
    (void)socket;
    (void)message;
}

void WebSocketTransport::SocketListener::onClose(const WebSocket &socket, v_uint16 code, const oatpp::String &message)
{
    (void)socket;
    owner->logger->info("Server closed connection",
                        LogContext().add("code", code).add("reason", message ? *message : std::string()));
    owner->markClosed(code);
}

void WebSocketTransport::SocketListener::readMessage(const WebSocket &socket, v_uint8 opcode, p_char8 data, oatpp::v_io_size size)
{
    (void)socket;

    if (size == 0)
    {
        // End of message
        Frame frame;
        frame.type = message_type;
        frame.payload.swap(message_buffer);
        owner->enqueue(std::move(frame));
        return;
    }

    if (message_buffer.empty())
    {
        message_type = opcode == oatpp::websocket::Frame::OPCODE_BINARY ? FrameType::BINARY : FrameType::TEXT;
    }
    message_buffer.append(reinterpret_cast<const char *>(data), static_cast<size_t>(size));
}

WebSocketTransport::WebSocketTransport(const WebSocketEndpoint &endpoint)
    : endpoint(endpoint), closed(true), close_code(0), connected(false),
      logger(logging::get_logger("WebSocketTransport"))
{
}

WebSocketTransport::~WebSocketTransport()
{
    disconnect();
}

bool WebSocketTransport::connect()
{
    teardown();

    try
    {
        auto provider = oatpp::network::tcp::client::ConnectionProvider::createShared(
            {endpoint.host, endpoint.port, oatpp::network::Address::IP_4});
        auto connector = oatpp::websocket::Connector::createShared(provider);

        oatpp::websocket::Connector::Headers headers;
        headers.put(SCANLINK_HEADER_DEVICE_ID, oatpp::String(endpoint.device_id));
        headers.put(SCANLINK_HEADER_DEVICE_TOKEN, oatpp::String(endpoint.device_token));

        auto handle = connector->connect(endpoint.path, headers);
        auto ws = oatpp::websocket::WebSocket::createShared(handle, true);
        ws->setListener(std::make_shared<SocketListener>(this));

        {
            std::lock_guard<std::mutex> lock(inbox_mutex);
            inbox.clear();
            closed = false;
        }
        close_code = 0;

        {
            std::lock_guard<std::mutex> lock(socket_mutex);
            socket = ws;
            connection = handle;
        }

        connected = true;
        reader = std::thread([this, ws]() {
            ws->listen();
            markClosed(0);
        });

        logger->info("Connected", LogContext().add("endpoint", getConnectionInfo()));
        return true;
    }
    catch (const std::exception &e)
    {
        logger->error("Connection failed",
                      LogContext().add("endpoint", getConnectionInfo()).add("error", e.what()));
        connected = false;
        return false;
    }
}

void WebSocketTransport::disconnect()
{
    {
        std::lock_guard<std::mutex> lock(socket_mutex);
        if (socket && connected)
        {
            try
            {
                socket->sendClose(SCANLINK_CLOSE_NORMAL, "Client shutdown");
            }
            catch (const std::exception &e)
            {
                logger->debug("Close frame not sent", LogContext().add("error", e.what()));
            }
        }
    }
    teardown();
}

void WebSocketTransport::teardown()
{
    {
        std::lock_guard<std::mutex> lock(socket_mutex);
        if (socket)
        {
            socket->stopListening();
        }
        if (connection.object && connection.invalidator)
        {
            connection.invalidator->invalidate(connection.object);
        }
    }

    if (reader.joinable())
    {
        reader.join();
    }

    std::lock_guard<std::mutex> lock(socket_mutex);
    socket.reset();
    connection = oatpp::provider::ResourceHandle<oatpp::data::stream::IOStream>();
    connected = false;
}

bool WebSocketTransport::isConnected() const
{
    return connected;
}

void WebSocketTransport::sendFrame(const std::string &payload, bool binary)
{
    std::lock_guard<std::mutex> lock(socket_mutex);
    if (!socket || !connected)
    {
        throw TransportError("WebSocket is not connected");
    }

    bool ok = false;
    try
    {
        ok = binary ? socket->sendOneFrameBinary(oatpp::String(payload))
                    : socket->sendOneFrameText(oatpp::String(payload));
    }
    catch (const std::exception &e)
    {
        throw TransportError(std::string("WebSocket write failed: ") + e.what());
    }

    if (!ok)
    {
        throw TransportError("WebSocket write failed");
    }
}

void WebSocketTransport::sendText(const std::string &text)
{
    sendFrame(text, false);
}

void WebSocketTransport::sendBinary(const std::string &data)
{
    sendFrame(data, true);
}

ReceiveResult WebSocketTransport::receiveFrame(Frame &frame, unsigned long timeout_ms)
{
    std::unique_lock<std::mutex> lock(inbox_mutex);
    inbox_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                      [this]() { return !inbox.empty() || closed; });

    if (!inbox.empty())
    {
        frame = std::move(inbox.front());
        inbox.pop_front();
        return ReceiveResult::FRAME;
    }
    return closed ? ReceiveResult::CLOSED : ReceiveResult::TIMEOUT;
}

int WebSocketTransport::closeCode() const
{
    return close_code;
}

std::string WebSocketTransport::getConnectionInfo() const
{
    return "ws://" + endpoint.host + ":" + std::to_string(endpoint.port) + endpoint.path;
}

void WebSocketTransport::enqueue(Frame &&frame)
{
    {
        std::lock_guard<std::mutex> lock(inbox_mutex);
        inbox.push_back(std::move(frame));
    }
    inbox_cv.notify_one();
}

void WebSocketTransport::markClosed(int code)
{
    if (code != 0)
    {
        close_code = code;
    }
    connected = false;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex);
        closed = true;
    }
    inbox_cv.notify_all();
}

} // namespace sdk
} // namespace scanlink
