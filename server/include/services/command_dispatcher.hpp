#ifndef SCANLINK_SERVER_COMMAND_DISPATCHER_HPP
#define SCANLINK_SERVER_COMMAND_DISPATCHER_HPP

#include <memory>
#include <string>

#include "services/device_repository.hpp"
#include "services/exam_service.hpp"
#include "services/file_transfer_receiver.hpp"
#include "services/liveness_monitor.hpp"
#include "services/session_registry.hpp"
#include "shared/logging/logger.h"
#include "shared/protocol/messages.h"
#include "transports/device_connection.hpp"

namespace scanlink
{
    namespace services
    {

        /**
         * Collaborators shared by every connection's dispatcher
         */
        struct DispatchContext
        {
            DeviceRepository &repository;
            ExamService &exam_service;
            LivenessMonitor &liveness;
            SessionRegistry &sessions;
            std::string data_lake_directory;
        };

        /**
         * Handles the frames of one authenticated device connection
         *
         * Text frames are decoded and routed by command; while a file transfer
         * is active, binary frames feed it and text frames are ignored until
         * the declared size has arrived. Errors are reported to the device as
         * feedback and never end the connection.
         *
         * Called from the connection's receive thread only.
         */
        class CommandDispatcher
        {
        public:
            CommandDispatcher(const std::string &device_id,
                              std::shared_ptr<transports::DeviceConnection> connection,
                              DispatchContext &context);
            ~CommandDispatcher();

            void on_text(const std::string &text);
            void on_binary(const std::string &data);

            /** Abort any transfer and, if still the current session, mark the device OFFLINE */
            void on_disconnect();

            const std::string &device_id() const { return device_id_; }
            bool transfer_active() const { return receiver_.active(); }

        private:
            void handle_register(const protocol::RegisterMessage &message);
            void handle_ping();
            void handle_update_status(const protocol::UpdateStatusMessage &message);
            void handle_file_transfer(const protocol::FileTransferHeader &header);
            void handle_unknown(const std::string &command);

            void update_task(protocol::DeviceStatus status, const protocol::UpdateStatusMessage &message);

            void send_feedback(const std::string &message);
            void send(const protocol::Message &message);

            std::string device_id_;
            std::shared_ptr<transports::DeviceConnection> connection_;
            DispatchContext &context_;
            FileTransferReceiver receiver_;
            bool disconnected_ = false;
            std::shared_ptr<logging::Logger> logger_;
        };

    } // namespace services
} // namespace scanlink

#endif // SCANLINK_SERVER_COMMAND_DISPATCHER_HPP
