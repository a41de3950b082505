#ifndef SCANLINK_TRANSPORT_INTERFACE_H
#define SCANLINK_TRANSPORT_INTERFACE_H

#include <string>

namespace scanlink
{
namespace sdk
{

enum class FrameType
{
    TEXT,
    BINARY
};

struct Frame
{
    FrameType type = FrameType::TEXT;
    std::string payload;
};

enum class ReceiveResult
{
    FRAME,
    TIMEOUT,
    CLOSED
};

/**
 * @brief One bidirectional device-to-server connection
 *
 * connect() and disconnect() return or swallow errors; sendText() and
 * sendBinary() throw TransportError so callers with a retry policy can
 * react. Reconnecting is left to the owner of the receive loop.
 */
class ITransport
{
public:
    virtual ~ITransport() = default;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual void sendText(const std::string &text) = 0;
    virtual void sendBinary(const std::string &data) = 0;

    /**
     * @brief Wait for the next inbound frame
     * @return FRAME with frame filled in, TIMEOUT, or CLOSED once the
     *         connection is gone and every buffered frame was delivered
     */
    virtual ReceiveResult receiveFrame(Frame &frame, unsigned long timeout_ms = 1000) = 0;

    /** Close code sent by the peer, 0 if none was received */
    virtual int closeCode() const = 0;

    virtual std::string getConnectionInfo() const = 0;
};

} // namespace sdk
} // namespace scanlink

#endif // SCANLINK_TRANSPORT_INTERFACE_H
