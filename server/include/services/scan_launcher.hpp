#ifndef SCANLINK_SERVER_SCAN_LAUNCHER_HPP
#define SCANLINK_SERVER_SCAN_LAUNCHER_HPP

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "services/device_repository.hpp"
#include "services/exam_service.hpp"
#include "services/session_registry.hpp"
#include "shared/logging/logger.h"

namespace scanlink
{
    namespace services
    {

        /**
         * Outcome of a scan launch, mapped to an HTTP status by the controller
         */
        struct LaunchResult
        {
            enum class Code
            {
                SENT,
                NOT_FOUND,
                DEVICE_OFFLINE,
                UPSTREAM_FAILURE
            };

            Code code = Code::SENT;
            std::string detail;

            bool ok() const { return code == Code::SENT; }
        };

        /**
         * Pushes a "start" command to the device named by an acquisition task
         */
        class ScanLauncher
        {
        public:
            ScanLauncher(DeviceRepository &repository, ExamService &exam_service, SessionRegistry &sessions);

            LaunchResult launch(const nlohmann::json &task, const std::string &access_token);

            /** Task fields plus sequence, access_token and device_parameter */
            static nlohmann::json build_payload(const nlohmann::json &task,
                                                const nlohmann::json &sequence,
                                                const std::string &access_token,
                                                const nlohmann::json &device_parameter);

        private:
            DeviceRepository &repository_;
            ExamService &exam_service_;
            SessionRegistry &sessions_;
            std::shared_ptr<logging::Logger> logger_;
        };

    } // namespace services
} // namespace scanlink

#endif // SCANLINK_SERVER_SCAN_LAUNCHER_HPP
