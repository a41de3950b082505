#ifndef SCANLINK_SERVER_DEVICE_CONNECTION_HPP
#define SCANLINK_SERVER_DEVICE_CONNECTION_HPP

#include <cstdint>
#include <string>

namespace scanlink
{
    namespace transports
    {

        /**
         * Server end of one live device connection
         */
        class DeviceConnection
        {
        public:
            virtual ~DeviceConnection() = default;

            /**
             * Send one text frame
             * @return false if the connection is gone or the write failed
             */
            virtual bool send_text(const std::string &text) = 0;

            /** Send a close frame; the receive loop ends once the peer answers */
            virtual void close(uint16_t code, const std::string &reason) = 0;

            /** Identifier for logs */
            virtual std::string describe() const = 0;
        };

    } // namespace transports
} // namespace scanlink

#endif // SCANLINK_SERVER_DEVICE_CONNECTION_HPP
