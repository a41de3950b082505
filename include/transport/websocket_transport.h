#ifndef SCANLINK_WEBSOCKET_TRANSPORT_H
#define SCANLINK_WEBSOCKET_TRANSPORT_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "oatpp-websocket/WebSocket.hpp"
#include "oatpp/core/provider/Provider.hpp"

#include "transport/transport_interface.h"
#include "shared/logging/logger.h"

namespace scanlink
{
namespace sdk
{

struct WebSocketEndpoint
{
    std::string host = "127.0.0.1";
    uint16_t port = 8000;
    std::string path = "/api/v1/device/ws";
    std::string device_id;
    std::string device_token;
};

/**
 * @brief ITransport over an oatpp-websocket client connection
 *
 * The device credentials travel as handshake headers. A reader thread runs
 * the socket's listen loop and queues complete messages for receiveFrame().
 */
class WebSocketTransport : public ITransport
{
private:
    class SocketListener : public oatpp::websocket::WebSocket::Listener
    {
    private:
        WebSocketTransport *owner;
        std::string message_buffer;
        FrameType message_type;

    public:
        explicit SocketListener(WebSocketTransport *owner);

        void onPing(const WebSocket &socket, const oatpp::String &message) override;
        void onPong(const WebSocket &socket, const oatpp::String &message) override;
        void onClose(const WebSocket &socket, v_uint16 code, const oatpp::String &message) override;
        void readMessage(const WebSocket &socket, v_uint8 opcode, p_char8 data, oatpp::v_io_size size) override;
    };

    WebSocketEndpoint endpoint;

    // Guards socket, connection and outbound writes
    mutable std::mutex socket_mutex;
    std::shared_ptr<oatpp::websocket::WebSocket> socket;
    oatpp::provider::ResourceHandle<oatpp::data::stream::IOStream> connection;
    std::thread reader;

    std::mutex inbox_mutex;
    std::condition_variable inbox_cv;
    std::deque<Frame> inbox;
    bool closed;
    std::atomic<int> close_code;
    std::atomic<bool> connected;

    std::shared_ptr<logging::Logger> logger;

    void enqueue(Frame &&frame);
    void markClosed(int code);
    void teardown();
    void sendFrame(const std::string &payload, bool binary);

public:
    explicit WebSocketTransport(const WebSocketEndpoint &endpoint);
    ~WebSocketTransport() override;

    bool connect() override;
    void disconnect() override;
    bool isConnected() const override;

    void sendText(const std::string &text) override;
    void sendBinary(const std::string &data) override;
    ReceiveResult receiveFrame(Frame &frame, unsigned long timeout_ms = 1000) override;

    int closeCode() const override;
    std::string getConnectionInfo() const override;
};

} // namespace sdk
} // namespace scanlink

#endif // SCANLINK_WEBSOCKET_TRANSPORT_H
