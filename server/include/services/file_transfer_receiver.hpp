#ifndef SCANLINK_SERVER_FILE_TRANSFER_RECEIVER_HPP
#define SCANLINK_SERVER_FILE_TRANSFER_RECEIVER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "services/exam_service.hpp"
#include "shared/crypto/crypto_utils.h"
#include "shared/logging/logger.h"
#include "shared/protocol/messages.h"

namespace scanlink
{
    namespace services
    {

        enum class ResultType
        {
            DICOM,
            MRD,
            NPY,
            CALIBRATION,
            NOT_SET
        };

        const char *to_string(ResultType type);

        /** Result type from the file extension (case-insensitive) */
        ResultType result_type_for(const std::string &filename);

        /**
         * Receives one device's uploads into the data lake
         *
         * begin() opens a transfer from a file-transfer header, binary frames
         * are fed to on_binary() until the declared size is reached, then the
         * file is verified and committed:
         *   <data_lake>/<workflow_id>/<task_id>/<result_id>/<filename>
         * Data is written to <filename>.part and renamed only after the size
         * and SHA-256 checks pass, so the final name never refers to a partial
         * file. Outcomes are reported through the feedback sink.
         *
         * Owned by a single connection and driven from its receive thread.
         */
        class FileTransferReceiver
        {
        public:
            using FeedbackSink = std::function<void(const std::string &)>;

            FileTransferReceiver(const std::string &device_id,
                                 ExamService &exam_service,
                                 const std::string &data_lake_directory,
                                 FeedbackSink feedback);
            ~FileTransferReceiver();

            void begin(const protocol::FileTransferHeader &header);
            void on_binary(const std::string &chunk);

            /** Drop the active transfer and delete its temp file */
            void abort(const std::string &reason);

            bool active() const { return session_ != nullptr; }
            uint64_t bytes_received() const;

        private:
            struct TransferSession
            {
                protocol::FileTransferHeader header;
                nlohmann::json task;
                std::string result_id;
                std::filesystem::path directory;
                std::filesystem::path final_path;
                std::filesystem::path temp_path;
                std::ofstream out;
                crypto::Sha256Hasher hasher;
                uint64_t received = 0;
            };

            void complete();
            void commit(TransferSession &session);
            void discard(TransferSession &session);

            std::string device_id_;
            ExamService &exam_service_;
            std::filesystem::path data_lake_;
            FeedbackSink feedback_;
            std::unique_ptr<TransferSession> session_;
            std::shared_ptr<logging::Logger> logger_;
        };

    } // namespace services
} // namespace scanlink

#endif // SCANLINK_SERVER_FILE_TRANSFER_RECEIVER_HPP
